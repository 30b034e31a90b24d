#include "sandbox/policy.hpp"

#include <cmath>
#include <stdexcept>

namespace codebox::sandbox {
namespace {

const std::set<std::string> kNamespaceNames = {
    "os", "sys", "subprocess", "shutil", "socket", "ctypes", "importlib",
    "builtins", "signal", "multiprocessing", "threading", "pathlib"
};

bool IsDunder(const std::string& name) {
    return name.size() > 4 && name.rfind("__", 0) == 0 &&
        name.compare(name.size() - 2, 2, "__") == 0;
}

bool IsEscapeAttribute(const std::string& name) {
    return IsDunder(name) || name.rfind("tb_", 0) == 0 || name.rfind("f_", 0) == 0 ||
        name.rfind("gi_", 0) == 0 || name.rfind("cr_", 0) == 0;
}

}  // namespace

Policy::Policy(std::set<std::string> allowed_imports,
               std::set<std::string> blocked_names,
               double max_execution_seconds,
               std::size_t max_output_chars)
    : allowed_imports_(std::move(allowed_imports))
    , blocked_names_(std::move(blocked_names))
    , max_execution_seconds_(max_execution_seconds)
    , max_output_chars_(max_output_chars) {
    if (!(max_execution_seconds_ > 0.0) || !std::isfinite(max_execution_seconds_)) {
        throw std::invalid_argument("max_execution_seconds must be a positive number");
    }
    if (max_output_chars_ == 0) {
        throw std::invalid_argument("max_output_chars must be positive");
    }
}

std::shared_ptr<const Policy> Policy::FromConfig(const codebox::config::SandboxConfig& config) {
    if (config.max_output_chars <= 0) {
        throw std::invalid_argument("max_output_chars must be positive");
    }
    return std::make_shared<const Policy>(
        std::set<std::string>(config.allowed_imports.begin(), config.allowed_imports.end()),
        std::set<std::string>(config.blocked_names.begin(), config.blocked_names.end()),
        config.max_execution_seconds,
        static_cast<std::size_t>(config.max_output_chars));
}

std::chrono::milliseconds Policy::ExecutionLimit() const {
    return std::chrono::milliseconds(static_cast<long long>(std::ceil(max_execution_seconds_ * 1000.0)));
}

bool Policy::IsImportAllowed(const std::string& module) const {
    if (module.empty()) {
        return false;
    }
    if (allowed_imports_.count(module) > 0) {
        return true;
    }
    auto pos = module.find('.');
    while (pos != std::string::npos) {
        if (allowed_imports_.count(module.substr(0, pos)) > 0) {
            return true;
        }
        pos = module.find('.', pos + 1);
    }
    return false;
}

bool Policy::IsBlocked(const std::string& name) const {
    return blocked_names_.count(name) > 0;
}

bool Policy::IsBlockedAttribute(const std::string& name) const {
    const auto reaches = [this](const std::string& candidate) {
        return IsBlocked(candidate) &&
            (IsEscapeAttribute(candidate) || kNamespaceNames.count(candidate) > 0);
    };
    if (reaches(name)) {
        return true;
    }
    if (name.empty() || name[0] != '_' || IsDunder(name)) {
        return false;
    }
    const auto start = name.find_first_not_of('_');
    return start != std::string::npos && reaches(name.substr(start));
}

std::vector<std::string> Policy::SortedAllowedImports() const {
    return std::vector<std::string>(allowed_imports_.begin(), allowed_imports_.end());
}

}  // namespace codebox::sandbox
