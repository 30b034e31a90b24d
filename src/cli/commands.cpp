#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>

#include "config/config_loader.hpp"
#include "nlohmann/json.hpp"
#include "service/coding_service.hpp"
#include "service/json_codec.hpp"
#include "utils/logging.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUnsuccessful = 1;
constexpr int kExitConfig = 2;

void PrintUsage() {
    std::cout << "Usage: codebox_cli execute <file|-> | codebox_cli generate \"task\" | "
                 "codebox_cli run \"task\" | codebox_cli validate \"task\" | codebox_cli stats"
              << std::endl;
}

void PrintJson(const nlohmann::json& json) {
    std::cout << json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

bool ReadSource(const std::string& target, std::string& source) {
    if (target == "-") {
        source.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream input(target, std::ios::binary);
    if (!input.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    source = buffer.str();
    return true;
}

int RunCommand(const codebox::service::CodingService& service,
               const std::string& command,
               const std::string& argument) {
    if (command == "execute") {
        std::string source;
        if (!ReadSource(argument, source)) {
            std::cerr << "[cli] cannot read " << argument << std::endl;
            return kExitUnsuccessful;
        }
        const auto result = service.Execute(source);
        PrintJson(codebox::service::ToJson(result));
        return result.success ? kExitOk : kExitUnsuccessful;
    }
    if (command == "generate") {
        const auto outcome = service.Generate(argument);
        PrintJson(codebox::service::ToJson(outcome));
        return outcome.ok ? kExitOk : kExitUnsuccessful;
    }
    if (command == "run") {
        const auto outcome = service.GenerateAndExecute(argument);
        PrintJson(codebox::service::ToJson(outcome));
        return outcome.ok && outcome.execution.success ? kExitOk : kExitUnsuccessful;
    }
    if (command == "validate") {
        const auto validation = service.Validate(argument);
        PrintJson(codebox::service::ToJson(validation));
        return validation.valid ? kExitOk : kExitUnsuccessful;
    }
    PrintUsage();
    return kExitUnsuccessful;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitUnsuccessful;
    }
    const std::string command = argv[1];
    if (command != "stats" && argc < 3) {
        PrintUsage();
        return kExitUnsuccessful;
    }

    codebox::config::Config config;
    std::unique_ptr<codebox::service::CodingService> service;
    try {
        config = codebox::config::LoadConfig();
        codebox::utils::ConfigureLogging(config.logging);
        service = codebox::service::CodingService::FromConfig(config);
    } catch (const std::exception& ex) {
        std::cerr << "[config] " << ex.what() << std::endl;
        return kExitConfig;
    }

    if (command == "stats") {
        PrintJson(codebox::service::ToJson(service->Stats()));
        return kExitOk;
    }
    return RunCommand(*service, command, argv[2]);
}
