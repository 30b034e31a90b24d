#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "sandbox/policy.hpp"

namespace codebox::sandbox {

// `matplotlib.pyplot` is bound as `pyplot`; `math` as `math`.
struct ModuleBinding {
    std::string name;
    std::string module;
};

// Allow-list description of the namespace a snippet runs in. The worker
// materialises it from scratch for every run.
struct ExecutionContext {
    std::vector<std::string> builtins;
    std::vector<ModuleBinding> modules;
    std::vector<std::string> importable;
    // Names the worker refuses in compiled code (see Policy::IsBlockedAttribute).
    std::vector<std::string> guarded;
};

const std::vector<std::string>& SafeBuiltins();

ExecutionContext BuildContext(const Policy& policy);

nlohmann::json ToJson(const ExecutionContext& context);

}  // namespace codebox::sandbox
