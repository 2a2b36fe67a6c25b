#include "../bridge_cli.hpp"
#include "../theme.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <iostream>
#include <fmt/format.h>

namespace {

// ── Local git ───────────────────────────────────────────────

std::string git_query(const std::vector<std::string>& args, const std::string& what) {
    auto result = platform::run_capture("git", args, bridge_log_path());
    if (result.exit_code != 0) {
        throw BridgeError(fmt::format("Failed to get {} (git {} exited with {})",
                                      what, join(args, " "), result.exit_code));
    }
    std::string out = result.output;
    trim(out);
    return out;
}

std::string current_branch() {
    return git_query({"rev-parse", "--abbrev-ref", "HEAD"}, "current branch");
}

std::string current_commit() {
    return git_query({"rev-parse", "HEAD"}, "current commit");
}

std::string commit_subject() {
    return git_query({"log", "-1", "--format=%s"}, "commit message");
}

bool has_uncommitted_changes() {
    return !git_query({"status", "--porcelain"}, "working tree status").empty();
}

void push_branch(const std::string& remote, const std::string& branch) {
    // stderr left attached so git's own progress and errors reach the user
    auto result = platform::run_capture("git", {"push", remote, branch});
    if (result.exit_code != 0) {
        throw BridgeError(fmt::format("Failed to push {} to {}", branch, remote));
    }
}

bool confirm(const std::string& question) {
    std::cerr << theme::step(question + " [y/N]");
    std::string answer;
    if (!std::getline(std::cin, answer)) return false;
    trim(answer);
    return answer == "y" || answer == "Y" || answer == "yes";
}

std::string short_sha(const std::string& sha) {
    return sha.substr(0, 7);
}

} // namespace

int do_sync(BaseCLI& cli, ArgReader& args) {
    auto branch_opt = args.option({"--branch", "-b"});
    auto remote_opt = args.option({"--remote", "-r"});
    bool no_push = args.flag({"--no-push"});
    bool force = args.flag({"--force", "-f"});
    bool wait = !args.flag({"--no-wait"});
    args.flag({"--wait"});
    auto timeout = args.int_option({"--timeout"});
    bool no_tunnel = args.flag({"--no-tunnel"});

    if (!args.positionals().empty()) {
        throw std::invalid_argument(
            "Usage: bridgectl sync [--branch B] [--remote R] [--no-push] [--force] "
            "[--no-wait] [--timeout N] [--no-tunnel]");
    }

    const auto& remote_settings = cli.config().remote();
    if (remote_settings.target_dir.empty()) {
        throw ConfigError("Remote target_dir is not configured (set BRIDGECTL_TARGET_DIR)");
    }

    std::string branch = branch_opt ? *branch_opt : current_branch();
    std::string remote = remote_opt ? *remote_opt : remote_settings.default_remote;

    if (has_uncommitted_changes()) {
        if (cli.json_output) {
            return cli.report_error("ValidationError", "Uncommitted changes detected",
                                    EXIT_GENERAL_ERROR,
                                    "Commit or stash your changes before syncing");
        }
        std::cerr << theme::warn("You have uncommitted changes.");
        std::cerr << theme::step("These will NOT be synced. Commit or stash first.");
        if (!confirm("Continue anyway?")) return EXIT_GENERAL_ERROR;
    }

    std::string commit_sha = current_commit();
    std::string commit_msg = commit_subject();

    if (!no_push) {
        if (!cli.json_output) std::cout << theme::step(fmt::format("Pushing {} to {}...", branch, remote));
        push_branch(remote, branch);
    }

    SyncRequest request;
    request.branch = branch;
    request.commit_sha = commit_sha;
    request.force = force;
    request.wait = wait;
    if (timeout) request.timeout_secs = *timeout;

    SyncOutcome outcome = cli.router(no_tunnel).sync(request);

    if (!outcome.success) {
        return cli.report_error("SyncError", outcome.error.empty() ? "Sync failed" : outcome.error,
                                EXIT_GENERAL_ERROR, outcome.html_url);
    }

    std::string method = outcome.transport == "ssh" ? "ssh_tunnel" : "workflow";

    if (outcome.triggered_only) {
        if (cli.json_output) {
            Json::Value data(Json::objectValue);
            data["status"] = "triggered";
            data["method"] = method;
            data["branch"] = branch;
            data["remote"] = remote;
            data["commit"] = short_sha(commit_sha);
            data["commit_full"] = commit_sha;
            data["run_id"] = outcome.run_id;
            cli.print_json(data);
        } else {
            if (!no_push) std::cout << theme::ok(fmt::format("Pushed {} to {}", branch, remote));
            std::cout << theme::ok("Triggered sync workflow" +
                                   (outcome.run_id.empty() ? "" : " (run " + outcome.run_id + ")"));
            std::cout << theme::kv("Commit", short_sha(commit_sha) + " - " + commit_msg);
        }
        return EXIT_OK;
    }

    std::string synced = outcome.synced_sha.empty() ? commit_sha : outcome.synced_sha;
    if (cli.json_output) {
        Json::Value data(Json::objectValue);
        data["status"] = "success";
        data["method"] = method;
        data["branch"] = branch;
        data["remote"] = remote;
        data["commit"] = short_sha(commit_sha);
        data["commit_full"] = commit_sha;
        data["synced_sha"] = synced;
        data["message"] = commit_msg;
        data["target_dir"] = remote_settings.target_dir;
        if (!outcome.html_url.empty()) data["html_url"] = outcome.html_url;
        cli.print_json(data);
    } else {
        std::cout << theme::ok(fmt::format("Synced branch '{}' ({}) to {}", branch,
                                           short_sha(synced), remote_settings.target_dir));
        std::cout << theme::kv("Commit", commit_msg);
        std::cout << theme::kv("Method", outcome.transport == "ssh" ? "SSH tunnel" : "Actions workflow");
        if (synced != commit_sha && outcome.transport == "ssh") {
            std::cout << theme::warn(fmt::format("Remote HEAD {} differs from local {}",
                                                 short_sha(synced), short_sha(commit_sha)));
        }
    }
    return EXIT_OK;
}

void register_sync_commands(BaseCLI& cli) {
    cli.add_command("sync", do_sync, "Push the branch and update the remote checkout");
}
