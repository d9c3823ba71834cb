/*
 * Copyright (C) 2026 Codyard
 *
 * This file is part of PushGate.
 *
 * PushGate is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * PushGate is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with PushGate. If not, see <https://www.gnu.org/licenses/\>.
 */
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "gates/gate_pipeline.h"
#include "policy/push_policy.h"
#include "services/command_service.h"
#include "support/config_manager.h"
#include "support/errors.h"
#include "support/state_store.h"
#include "utils/log_path.h"

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace pushgate;

namespace {

const char* kUsage =
    "Usage: pushgate <command> [options]\n"
    "\n"
    "Commands:\n"
    "  check          Evaluate push rules and print the decision JSON\n"
    "      --command <raw>   Raw command line being checked\n"
    "      --stdin           Read a hook payload {\"tool_input\":{\"command\":...},\"cwd\":...}\n"
    "  status         Show pending cleanup and the last janitor run\n"
    "  audit          Show audit entry counts per event type\n"
    "  config [key=value ...] [--json]\n"
    "                 Show the host config, or update and save the given keys\n"
    "  render-policy <file> [--json]\n"
    "                 Print the canonical rendering of a policy file\n"
    "\n"
    "Common options:\n"
    "  --repo <dir>     Repository root (default: current directory)\n"
    "  --policy <file>  Policy document (default: from config, push-rules.md)\n"
    "  --config <file>  Host config (default: <repo>/.specify/pushgate.json)\n"
    "  --log-file <f>   Mirror diagnostics into a file\n";

struct CliOptions {
    std::string subcommand;
    std::string command;
    bool hasCommand = false;
    bool readStdin = false;
    bool asJson = false;
    std::string repo;
    std::string policy;
    std::string config;
    std::string logFile;
    std::vector<std::string> positional;
};

bool ParseArgs(int argc, char** argv, CliOptions& options, std::string& error) {
    if (argc < 2) {
        error = "missing command";
        return false;
    }
    options.subcommand = argv[1];

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto takeValue = [&](std::string& target) {
            if (i + 1 >= argc) {
                error = "option " + arg + " needs a value";
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--command") {
            if (!takeValue(options.command)) {
                return false;
            }
            options.hasCommand = true;
        } else if (arg == "--stdin") {
            options.readStdin = true;
        } else if (arg == "--json") {
            options.asJson = true;
        } else if (arg == "--repo") {
            if (!takeValue(options.repo)) {
                return false;
            }
        } else if (arg == "--policy") {
            if (!takeValue(options.policy)) {
                return false;
            }
        } else if (arg == "--config") {
            if (!takeValue(options.config)) {
                return false;
            }
        } else if (arg == "--log-file") {
            if (!takeValue(options.logFile)) {
                return false;
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            error = "unknown option " + arg;
            return false;
        } else {
            options.positional.push_back(arg);
        }
    }
    return true;
}

// "git push", "git -C dir push", "cd x && git push origin HEAD"
bool IsGitPush(const std::string& command) {
    std::istringstream stream(command);
    std::vector<std::string> tokens{std::istream_iterator<std::string>(stream),
                                    std::istream_iterator<std::string>()};
    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& word = tokens[i];
        bool isGit = word == "git" || (word.size() > 4 && word.compare(word.size() - 4, 4, "/git") == 0);
        if (!isGit) {
            continue;
        }
        size_t j = i + 1;
        while (j < tokens.size() && tokens[j][0] == '-') {
            const std::string& option = tokens[j];
            j += (option == "-C" || option == "-c") ? 2 : 1;
        }
        if (j < tokens.size() && tokens[j] == "push") {
            return true;
        }
    }
    return false;
}

struct Environment {
    std::string repoRoot;
    GateConfig config;
    std::string policyPath;
    std::string stateDir;
};

Environment ResolveEnvironment(const CliOptions& options, const std::string& repoOverride) {
    Environment env;
    std::string repo = !repoOverride.empty() ? repoOverride : options.repo;
    if (repo.empty()) {
        std::error_code ec;
        repo = fs::current_path(ec).string();
    }
    env.repoRoot = repo;

    std::string configPath = options.config.empty()
        ? ResolveRepoPath(env.repoRoot, ConfigManager::kDefaultConfigPath)
        : options.config;
    ConfigManager configManager(configPath);
    try {
        configManager.load();
    } catch (const std::exception& e) {
        LogLine(std::string("Warning: ") + e.what() + "; using default settings");
    }
    env.config = configManager.snapshot();

    env.policyPath = options.policy.empty()
        ? ResolveRepoPath(env.repoRoot, env.config.policy_file)
        : ResolveRepoPath(env.repoRoot, options.policy);
    env.stateDir = ResolveRepoPath(env.repoRoot, env.config.state_dir);
    return env;
}

void PrintDecision(const Decision& decision) {
    std::cout << decisionToJson(decision).dump() << std::endl;
}

int RunCheck(const CliOptions& options) {
    try {
        std::string rawCommand = options.command;
        bool haveCommand = options.hasCommand;
        std::string payloadCwd;

        if (options.readStdin) {
            std::string input((std::istreambuf_iterator<char>(std::cin)),
                              std::istreambuf_iterator<char>());
            json payload = json::parse(input, nullptr, false);
            if (payload.is_discarded() || !payload.is_object()) {
                LogLine("Hook payload is not a JSON object; nothing to check");
                PrintDecision(Decision{DecisionKind::Allow, "No command to check", std::nullopt});
                return 0;
            }
            if (payload.contains("tool_input") && payload["tool_input"].is_object() &&
                payload["tool_input"].contains("command") &&
                payload["tool_input"]["command"].is_string()) {
                rawCommand = payload["tool_input"]["command"].get<std::string>();
                haveCommand = true;
            }
            if (payload.contains("cwd") && payload["cwd"].is_string()) {
                payloadCwd = payload["cwd"].get<std::string>();
            }
        }

        if (haveCommand && !IsGitPush(rawCommand)) {
            PrintDecision(Decision{DecisionKind::Allow, "Not a git push command", std::nullopt});
            return 0;
        }

        Environment env = ResolveEnvironment(options, options.repo.empty() ? payloadCwd : options.repo);

        ExecutionContext context;
        context.raw_command = rawCommand;
        context.repo_root = env.repoRoot;
        context.policy_path = env.policyPath;
        context.state_dir = env.stateDir;
        context.command_timeout_seconds = env.config.command_timeout_seconds;
        const char* active = std::getenv(kNestedEnvVar);
        context.nested = active != nullptr && std::string(active) == "1";

        StateStore stateStore(env.stateDir);
        CommandService commandService(static_cast<size_t>(env.config.max_output_bytes));
        PipelineOptions pipelineOptions;
        pipelineOptions.audit_enabled = env.config.audit_enabled;
        pipelineOptions.show_cleanup_notice = env.config.show_cleanup_notice;

        GatePipeline pipeline(&stateStore, commandService.executor(), pipelineOptions);
        PipelineRun run = pipeline.run(context);
        PrintDecision(run.decision);
    } catch (const std::exception& e) {
        LogLine(std::string("Push gate internal error: ") + e.what());
        PrintDecision(Decision{DecisionKind::Allow, "Push gate could not run",
                               std::string("Internal error: ") + e.what()});
    }
    return 0;
}

int RunStatus(const CliOptions& options) {
    Environment env = ResolveEnvironment(options, "");
    StateStore stateStore(env.stateDir);

    PendingCleanupLedger ledger = stateStore.readLedger();
    std::cout << "State directory: " << env.stateDir << "\n";
    std::cout << "Pending cleanup: " << ledger.summary() << "\n";
    for (const auto& branch : ledger.pending_branches) {
        std::cout << "  branch   " << branch.name;
        if (branch.pr_number > 0) {
            std::cout << " (PR #" << branch.pr_number << ")";
        }
        std::cout << "\n";
    }
    for (const auto& entry : ledger.non_compliant_branches) {
        std::cout << "  naming   " << entry.first;
        if (!entry.second.empty()) {
            std::cout << ": " << entry.second;
        }
        std::cout << "\n";
    }
    for (const auto& worktree : ledger.pending_worktrees) {
        std::cout << "  worktree " << worktree.path;
        if (!worktree.branch.empty()) {
            std::cout << " [" << worktree.branch << "]";
        }
        std::cout << "\n";
    }

    auto hours = stateStore.hoursSinceLastRun();
    if (hours) {
        std::cout << "Last janitor run: " << std::fixed << std::setprecision(1)
                  << *hours << " hour(s) ago\n";
    } else {
        std::cout << "Last janitor run: never\n";
    }
    return 0;
}

int RunAudit(const CliOptions& options) {
    Environment env = ResolveEnvironment(options, "");
    StateStore stateStore(env.stateDir);

    json counts = json::object();
    for (const auto& entry : stateStore.auditStats()) {
        counts[entry.first] = entry.second;
    }
    std::cout << counts.dump(2) << std::endl;
    return 0;
}

int RunConfig(const CliOptions& options) {
    std::string repo = options.repo;
    if (repo.empty()) {
        std::error_code ec;
        repo = fs::current_path(ec).string();
    }
    std::string configPath = options.config.empty()
        ? ResolveRepoPath(repo, ConfigManager::kDefaultConfigPath)
        : options.config;

    ConfigManager configManager(configPath);
    try {
        configManager.load();
        for (const auto& assignment : options.positional) {
            configManager.applySetting(assignment);
        }
        if (!options.positional.empty()) {
            configManager.save();
            LogLine("Saved host config: " + configPath);
        }
    } catch (const std::exception& e) {
        std::cerr << "pushgate: " << e.what() << std::endl;
        return 1;
    }

    if (options.asJson) {
        std::cout << configToJson(configManager.snapshot()).dump(2) << std::endl;
        return 0;
    }
    std::cout << "Config file: " << configPath << "\n";
    std::cout << "policy_file: " << configManager.getPolicyFile() << "\n";
    std::cout << "state_dir: " << configManager.getStateDir() << "\n";
    std::cout << "command_timeout_seconds: " << configManager.getCommandTimeoutSeconds() << "\n";
    std::cout << "max_output_bytes: " << configManager.getMaxOutputBytes() << "\n";
    std::cout << "audit_enabled: " << (configManager.isAuditEnabled() ? "true" : "false") << "\n";
    std::cout << "show_cleanup_notice: " << (configManager.isCleanupNoticeEnabled() ? "true" : "false") << "\n";
    return 0;
}

int RunRenderPolicy(const CliOptions& options) {
    std::string path = options.positional.empty() ? options.policy : options.positional.front();
    if (path.empty()) {
        std::cerr << "render-policy needs a policy file\n";
        return 2;
    }
    try {
        PushPolicy policy = loadPolicy(path);
        if (options.asJson) {
            std::cout << policyToJson(policy).dump(2) << std::endl;
        } else {
            std::cout << renderPolicyMarkdown(policy);
        }
    } catch (const PolicyError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions options;
    std::string error;
    if (!ParseArgs(argc, argv, options, error)) {
        std::cerr << "pushgate: " << error << "\n\n" << kUsage;
        return 2;
    }
    if (!options.logFile.empty()) {
        SetLogFile(options.logFile);
    }

    if (options.subcommand == "check") {
        return RunCheck(options);
    }
    if (options.subcommand == "status") {
        return RunStatus(options);
    }
    if (options.subcommand == "audit") {
        return RunAudit(options);
    }
    if (options.subcommand == "config") {
        return RunConfig(options);
    }
    if (options.subcommand == "render-policy") {
        return RunRenderPolicy(options);
    }
    if (options.subcommand == "--help" || options.subcommand == "-h" || options.subcommand == "help") {
        std::cout << kUsage;
        return 0;
    }
    std::cerr << "pushgate: unknown command '" << options.subcommand << "'\n\n" << kUsage;
    return 2;
}
