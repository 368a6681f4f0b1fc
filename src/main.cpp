#include "config/config_loader.hpp"
#include "core/orchestrator.hpp"
#include "core/utils.hpp"
#include "executor/code_executor.hpp"
#include "policy/network_policy.hpp"
#include "provider/tool_provider.hpp"
#include "security/security_rule_engine.hpp"
#include "skills/skill_registry.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace execbox;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

void print_usage() {
    std::cerr <<
        "Usage: execbox [--config FILE] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  run [FILE|-]             Validate and execute a Python program\n"
        "  validate [FILE|-]        Run the security rules only\n"
        "  tools                    List generated tool modules\n"
        "  verify <server> <tool>   Check that a tool module exists\n"
        "  skills                   Validate every skill under <workspace>/skills\n"
        "  generate                 Discover tools and regenerate wrappers\n";
}

void print_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

// "-" or no argument reads stdin
std::optional<std::string> read_source(const std::vector<std::string>& args) {
    if (args.empty() || args[0] == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    }
    std::ifstream in(args[0], std::ios::binary);
    if (!in) {
        utils::log::error(std::format("Cannot read {}", args[0]));
        return std::nullopt;
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

// Disk-only executor for inventory commands; no provider is contacted
CodeExecutor make_offline_executor(const SandboxConfig& config) {
    return CodeExecutor(to_executor_config(config),
                        NetworkPolicy::from_provider_endpoint(config.provider.endpoint,
                                                              config.policy.allowed_endpoints));
}

int cmd_validate(const std::vector<std::string>& args) {
    const auto source = read_source(args);
    if (!source) return kExitUsage;

    const SecurityRuleEngine engine;
    const auto result = engine.validate(*source);
    print_json(result.to_json());
    if (result.blocked) {
        utils::log::warn(std::format("Blocked:\n{}", result.format_violations()));
        return kExitFailed;
    }
    return kExitOk;
}

int cmd_run(const SandboxConfig& config, const std::vector<std::string>& args) {
    const auto source = read_source(args);
    if (!source) return kExitUsage;

    Orchestrator orchestrator(config);
    orchestrator.startup();
    const auto outcome = orchestrator.validate_then_execute(*source);
    orchestrator.tokenizer()->clear();

    print_json(outcome.to_json());
    return outcome.success() ? kExitOk : kExitFailed;
}

int cmd_generate(const SandboxConfig& config) {
    Orchestrator orchestrator(config);
    orchestrator.startup();
    const auto& report = orchestrator.generation_report();
    print_json(report);
    return report.contains("error") ? kExitFailed : kExitOk;
}

int cmd_tools(const SandboxConfig& config) {
    const auto executor = make_offline_executor(config);
    const auto tools = executor.list_available_tools();
    print_json(tools);
    return tools["errors"].empty() ? kExitOk : kExitFailed;
}

int cmd_verify(const SandboxConfig& config, const std::vector<std::string>& args) {
    if (args.size() != 2) {
        print_usage();
        return kExitUsage;
    }
    const auto executor = make_offline_executor(config);
    const auto check = executor.verify_tool_exists(args[0], args[1]);
    print_json(check);
    return check.value("exists", false) ? kExitOk : kExitFailed;
}

int cmd_skills(const SandboxConfig& config) {
    const SkillRegistry registry(std::filesystem::path(config.workspace.root) / "skills");
    const auto report = registry.validate_all();
    print_json(report);
    for (const auto& [name, validation] : report.items()) {
        if (!validation.value("valid", false)) return kExitFailed;
    }
    return kExitOk;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_file = "config/sandbox.toml";
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                print_usage();
                return kExitUsage;
            }
            config_file = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return kExitOk;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage();
        return kExitUsage;
    }
    const std::string command = positional.front();
    const std::vector<std::string> args(positional.begin() + 1, positional.end());

    // validate needs no configuration
    if (command == "validate") {
        return cmd_validate(args);
    }

    SandboxConfig config;
    if (std::filesystem::exists(config_file)) {
        auto loaded = ConfigLoader::load_from_file(config_file);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return kExitUsage;
        }
        config = std::move(loaded.config);
    } else {
        utils::log::warn(std::format("Config file {} not found, using defaults", config_file));
    }

    for (const auto& var : ConfigLoader::apply_env_overrides(config)) {
        utils::log::info(std::format("Applied environment override {}", var));
    }
    if (const auto errors = ConfigLoader::validate_config(config); !errors.empty()) {
        for (const auto& err : errors) utils::log::error(err);
        return kExitUsage;
    }
    utils::log::set_level(*utils::log::parse_level(config.logging.level));

    try {
        if (command == "run") return cmd_run(config, args);
        if (command == "generate") return cmd_generate(config);
        if (command == "tools") return cmd_tools(config);
        if (command == "verify") return cmd_verify(config, args);
        if (command == "skills") return cmd_skills(config);
    } catch (const UnknownProviderError& e) {
        utils::log::error(std::format("Configuration error: {}", e.what()));
        return kExitUsage;
    } catch (const ProviderNotImplementedError& e) {
        utils::log::error(std::format("Configuration error: {}", e.what()));
        return kExitUsage;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitFailed;
    }

    utils::log::error(std::format("Unknown command '{}'", command));
    print_usage();
    return kExitUsage;
}
