#include "sandbox/execution_context.hpp"

namespace codebox::sandbox {

const std::vector<std::string>& SafeBuiltins() {
    static const std::vector<std::string> kBuiltins = {
        "print", "len", "str", "int", "float", "bool", "list", "dict", "tuple",
        "set", "frozenset", "range", "enumerate", "zip", "map", "filter",
        "sorted", "reversed", "sum", "min", "max", "abs", "round", "pow",
        "divmod", "isinstance", "issubclass", "type", "repr", "format", "chr",
        "ord", "hex", "bin", "oct", "all", "any", "iter", "next", "slice",
        "hash", "id", "callable", "bytes", "bytearray", "complex", "object",
        "property", "staticmethod", "classmethod", "super", "NotImplemented",
        "Ellipsis", "__build_class__",
        "BaseException", "Exception", "ArithmeticError", "AssertionError",
        "AttributeError", "IndexError", "KeyError", "LookupError",
        "NameError", "NotImplementedError", "OverflowError", "RuntimeError",
        "StopIteration", "TypeError", "ValueError", "ZeroDivisionError",
        "UnicodeError", "ImportError", "ModuleNotFoundError", "RecursionError"
    };
    return kBuiltins;
}

ExecutionContext BuildContext(const Policy& policy) {
    ExecutionContext context{};
    for (const auto& name : SafeBuiltins()) {
        if (!policy.IsBlocked(name)) {
            context.builtins.push_back(name);
        }
    }
    for (const auto& module : policy.AllowedImports()) {
        const auto dot = module.rfind('.');
        const auto name = dot == std::string::npos ? module : module.substr(dot + 1);
        context.modules.push_back(ModuleBinding{name, module});
        context.importable.push_back(module);
    }
    for (const auto& name : policy.BlockedNames()) {
        if (policy.IsBlockedAttribute(name)) {
            context.guarded.push_back(name);
        }
    }
    return context;
}

nlohmann::json ToJson(const ExecutionContext& context) {
    nlohmann::json modules = nlohmann::json::array();
    for (const auto& binding : context.modules) {
        modules.push_back({{"name", binding.name}, {"module", binding.module}});
    }
    return {
        {"builtins", context.builtins},
        {"modules", modules},
        {"importable", context.importable},
        {"guarded", context.guarded}
    };
}

}  // namespace codebox::sandbox
