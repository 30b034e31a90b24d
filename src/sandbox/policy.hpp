#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace codebox::sandbox {

// Immutable allow/deny configuration shared by every execution of an engine.
class Policy {
public:
    // Throws std::invalid_argument for a non-positive limit.
    Policy(std::set<std::string> allowed_imports,
           std::set<std::string> blocked_names,
           double max_execution_seconds,
           std::size_t max_output_chars);

    static std::shared_ptr<const Policy> FromConfig(const codebox::config::SandboxConfig& config);

    const std::set<std::string>& AllowedImports() const { return allowed_imports_; }
    const std::set<std::string>& BlockedNames() const { return blocked_names_; }
    double MaxExecutionSeconds() const { return max_execution_seconds_; }
    std::size_t MaxOutputChars() const { return max_output_chars_; }
    std::chrono::milliseconds ExecutionLimit() const;

    // True when the module or one of its dotted prefixes is allowed.
    bool IsImportAllowed(const std::string& module) const;
    bool IsBlocked(const std::string& name) const;

    // True when `name` must be refused even as an attribute (`x.name`):
    // blocked escape attributes such as `__class__`, blocked module names
    // such as `sys`, and private aliases of either (`random._os`).
    // Blocked callables like `compile` stay usable as methods.
    bool IsBlockedAttribute(const std::string& name) const;

    std::vector<std::string> SortedAllowedImports() const;

private:
    std::set<std::string> allowed_imports_;
    std::set<std::string> blocked_names_;
    double max_execution_seconds_;
    std::size_t max_output_chars_;
};

}  // namespace codebox::sandbox
