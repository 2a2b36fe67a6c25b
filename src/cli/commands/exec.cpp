#include "../bridge_cli.hpp"
#include "../theme.hpp"
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <iostream>
#include <fmt/format.h>

namespace {

// --denylist may be repeated or comma separated
std::vector<std::string> split_denylist(const std::vector<std::string>& items) {
    std::vector<std::string> out;
    for (const auto& item : items) {
        for (auto& part : split_list(item, ",")) out.push_back(part);
    }
    return out;
}

void print_command_output(const std::string& output) {
    std::cout << "\n--- Command Output ---\n";
    std::cout << output;
    if (!output.empty() && output.back() != '\n') std::cout << "\n";
    std::cout << "--- End Output ---\n\n";
}

int report_ssh_outcome(BaseCLI& cli, const ExecOutcome& outcome) {
    if (!cli.json_output) print_command_output(outcome.output);

    if (outcome.exit_code != 0) {
        return cli.report_error("CommandFailed",
                                fmt::format("Command failed with exit code {}", outcome.exit_code),
                                EXIT_GENERAL_ERROR);
    }

    if (cli.json_output) {
        Json::Value data(Json::objectValue);
        data["status"] = "success";
        data["method"] = "ssh_tunnel";
        data["returncode"] = outcome.exit_code;
        data["output"] = outcome.output;
        cli.print_json(data);
    } else {
        std::cout << theme::ok("Command completed successfully (via SSH)");
    }
    return EXIT_OK;
}

int report_workflow_outcome(BaseCLI& cli, const ExecRequest& request,
                            const ExecOutcome& outcome) {
    if (outcome.triggered_only) {
        if (cli.json_output) {
            Json::Value data(Json::objectValue);
            data["status"] = "triggered";
            data["request_id"] = outcome.request_id;
            data["command"] = request.command;
            cli.print_json(data);
        } else {
            std::cout << theme::step("Workflow dispatched; not waiting for completion");
        }
        return EXIT_OK;
    }

    if (!cli.json_output && !outcome.output.empty()) print_command_output(outcome.output);

    if (!outcome.success()) {
        std::string conclusion = outcome.conclusion.empty() ? outcome.status : outcome.conclusion;
        if (cli.json_output) {
            return cli.report_error("BridgeActionFailed", "Action failed: " + conclusion,
                                    EXIT_GENERAL_ERROR, outcome.html_url);
        }
        return cli.report_error("BridgeActionFailed",
                                fmt::format("Action failed: {} (see {})", conclusion,
                                            outcome.html_url),
                                EXIT_GENERAL_ERROR);
    }

    if (cli.json_output) {
        Json::Value data(Json::objectValue);
        data["status"] = "success";
        data["request_id"] = outcome.request_id;
        data["run_id"] = outcome.run_id;
        data["artifact_downloaded"] = !request.download_dir.empty();
        data["output"] = outcome.output;
        Json::Value files(Json::arrayValue);
        for (const auto& p : outcome.downloaded) files.append(p.string());
        data["downloaded_files"] = files;
        cli.print_json(data);
    } else {
        std::cout << theme::ok("Action completed successfully");
        if (!outcome.html_url.empty()) std::cout << theme::kv("Workflow", outcome.html_url);
        if (!request.download_dir.empty()) {
            std::cout << theme::kv("Artifacts",
                                   fmt::format("{} file(s) in {}", outcome.downloaded.size(),
                                               request.download_dir.string()));
        }
    }
    return EXIT_OK;
}

} // namespace

int do_exec(BaseCLI& cli, ArgReader& args) {
    ExecRequest request;
    request.denylist = split_denylist(args.options({"--denylist"}));
    request.artifact_paths = args.options({"--artifact-path"});
    if (auto dir = args.option({"--download"})) request.download_dir = *dir;
    request.wait = !args.flag({"--no-wait"});
    args.flag({"--wait"});
    if (auto t = args.int_option({"--timeout"})) request.timeout_secs = *t;
    bool no_tunnel = args.flag({"--no-tunnel"});

    auto positionals = args.positionals();
    if (positionals.size() != 1) {
        throw std::invalid_argument(
            "Usage: bridgectl exec <command> [--artifact-path P]... [--denylist X]... "
            "[--download DIR] [--no-wait] [--timeout N] [--no-tunnel]");
    }
    request.command = positionals[0];

    const auto& remote = cli.config().remote();
    if (remote.target_dir.empty()) {
        throw ConfigError("Remote target_dir is not configured (set BRIDGECTL_TARGET_DIR)");
    }

    if (!cli.json_output) {
        std::cout << theme::kv("Command", request.command);
        std::cout << theme::kv("Work dir", remote.target_dir);
        if (!request.artifact_paths.empty()) {
            std::cout << theme::kv("Artifacts", join(request.artifact_paths, ", "));
        }
    }

    ExecOutcome outcome = cli.router(no_tunnel).exec(request);
    if (outcome.transport == "ssh") return report_ssh_outcome(cli, outcome);
    return report_workflow_outcome(cli, request, outcome);
}

void register_exec_commands(BaseCLI& cli) {
    cli.add_command("exec", do_exec, "Run a command in the remote target dir");
}
