#pragma once

#include <string>
#include <vector>

#include "utils/logging.hpp"

namespace codebox::config {

struct SandboxConfig {
    double max_execution_seconds = 10.0;
    int max_output_chars = 10000;
    std::vector<std::string> allowed_imports = {
        "math", "random", "datetime", "json", "csv", "re",
        "collections", "itertools", "functools", "operator",
        "numpy", "pandas", "matplotlib.pyplot", "requests"
    };
    std::vector<std::string> blocked_names = {
        "eval", "exec", "compile", "__import__", "breakpoint",
        "open", "file", "input", "raw_input",
        "exit", "quit", "reload", "os", "sys", "subprocess", "shutil",
        "socket", "ctypes", "importlib", "builtins", "signal",
        "multiprocessing", "threading", "pathlib",
        "globals", "locals", "vars", "dir", "getattr", "setattr",
        "delattr", "hasattr", "help", "memoryview",
        "__builtins__", "__globals__", "__subclasses__", "__bases__",
        "__base__", "__mro__", "__class__", "__code__", "__closure__",
        "__dict__", "__self__", "__getattribute__", "__loader__",
        "__spec__", "__traceback__",
        "tb_frame", "f_globals", "f_builtins", "f_back", "gi_frame", "cr_frame"
    };
    std::string python_executable = "python3";
};

struct ProviderConfig {
    std::string api_key;
    std::string api_base;
};

struct ProvidersConfig {
    ProviderConfig anthropic;
    ProviderConfig openai;
    ProviderConfig openrouter;
    bool use_proxy_for_llm = false;
};

struct GeneratorConfig {
    std::string model = "gpt-3.5-turbo";
    int max_tokens = 1500;
    double temperature = 0.3;
    int timeout_s = 60;
};

struct Config {
    SandboxConfig sandbox;
    GeneratorConfig generator;
    ProvidersConfig providers;
    codebox::utils::LogConfig logging;
};

}  // namespace codebox::config
