#include "../bridge_cli.hpp"
#include "../theme.hpp"
#include <core/errors.hpp>
#include <core/job_status.hpp>
#include <core/json_util.hpp>
#include <core/utils.hpp>
#include <managers/bulk_refresh.hpp>
#include <iostream>
#include <chrono>
#include <set>
#include <fmt/format.h>

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

const char* event_name(FollowEvent::Kind kind) {
    switch (kind) {
        case FollowEvent::Kind::InitialContent: return "initial_content";
        case FollowEvent::Kind::NewContent:     return "new_content";
        case FollowEvent::Kind::FinalContent:   return "final_content";
        case FollowEvent::Kind::Waiting:        return "waiting";
        case FollowEvent::Kind::Warning:        return "warning";
        case FollowEvent::Kind::Completed:      return "job_completed";
        case FollowEvent::Kind::Interrupted:    return "interrupted";
    }
    return "unknown";
}

// ── Follow ──────────────────────────────────────────────────

int follow_job(BaseCLI& cli, const JobRecord& job, int tail, bool refresh, int interval,
               bool no_tunnel) {
    StoredJobStatus status(cli.job_store());
    bool waiting_line = false;

    auto sink = [&](const FollowEvent& ev) {
        if (cli.json_output) {
            Json::Value data(Json::objectValue);
            data["event"] = event_name(ev.kind);
            data["job_id"] = job.job_id;
            if (!ev.content.empty()) {
                data["content"] = ev.content;
                data["bytes_added"] = static_cast<Json::UInt64>(ev.content.size());
            }
            if (!ev.message.empty()) data["message"] = ev.message;
            if (!ev.status.empty()) data["status"] = ev.status;
            cli.print_json(data);
            return;
        }

        if (waiting_line && ev.kind != FollowEvent::Kind::Waiting) {
            std::cerr << "\n";
            waiting_line = false;
        }
        switch (ev.kind) {
            case FollowEvent::Kind::InitialContent:
            case FollowEvent::Kind::NewContent:
            case FollowEvent::Kind::FinalContent:
                std::cout << ev.content << std::flush;
                break;
            case FollowEvent::Kind::Waiting:
                std::cerr << "\r" << ev.message << std::flush;
                waiting_line = true;
                break;
            case FollowEvent::Kind::Warning:
                std::cerr << "\n" << theme::warn(ev.message);
                break;
            case FollowEvent::Kind::Completed:
                std::cout << "\n" << theme::info("Job completed with status: " + ev.status);
                break;
            case FollowEvent::Kind::Interrupted:
                std::cout << "\n" << theme::step(ev.message);
                break;
        }
    };

    if (!cli.json_output) {
        std::cerr << theme::step(fmt::format("Following log for job {} (Ctrl+C to stop)",
                                             job.job_id));
        std::cerr << theme::kv("Log file", job.log_path);
    }

    std::string final_status = cli.router(no_tunnel).follow(
        job.job_id, job.log_path, tail > 0 ? tail : DEFAULT_FOLLOW_TAIL_LINES, refresh,
        cli.log_cache(), status, sink, std::chrono::seconds(interval));

    if (final_status.empty()) return EXIT_OK;          // interrupted or never started
    return is_succeeded_job_status(final_status) ? EXIT_OK : EXIT_GENERAL_ERROR;
}

// ── Bulk ────────────────────────────────────────────────────

int bulk_update(BaseCLI& cli, const std::set<std::string>& statuses, int limit, bool refresh) {
    auto report = refresh_logs(cli.job_store(), cli.log_cache(), cli.actions(), statuses,
                               limit, refresh, cli.actions_url());

    if (cli.json_output) {
        Json::Value updated(Json::arrayValue);
        for (const auto& u : report.updated) {
            Json::Value item(Json::objectValue);
            item["job_id"] = u.job_id;
            item["log_path"] = u.log_path.string();
            updated.append(item);
        }
        Json::Value errors(Json::arrayValue);
        for (const auto& e : report.errors) {
            Json::Value item(Json::objectValue);
            item["job_id"] = e.job_id;
            item["error"] = e.error;
            errors.append(item);
        }
        Json::Value payload(Json::objectValue);
        payload["updated"] = updated;
        payload["errors"] = errors;
        payload["skipped_no_log_path"] = json_string_array(report.skipped_no_log_path);
        payload["processed"] = static_cast<Json::UInt64>(report.processed);
        payload["fetched"] = static_cast<Json::UInt64>(report.updated.size());
        payload["refresh"] = refresh;
        payload["status_filter"] =
            json_string_array(std::vector<std::string>(statuses.begin(), statuses.end()));
        payload["limit"] = limit;
        if (report.ok()) {
            cli.print_json(payload);
            return EXIT_OK;
        }
        Json::Value out(Json::objectValue);
        out["success"] = false;
        out["data"] = payload;
        std::cout << write_json(out, "  ") << "\n";
        return EXIT_GENERAL_ERROR;
    }

    if (report.processed == 0) {
        std::cout << "No cached jobs matched the filter.\n";
        return EXIT_OK;
    }

    std::string label;
    if (!statuses.empty()) {
        label = fmt::format(" with status in [{}]",
                            join(std::vector<std::string>(statuses.begin(), statuses.end()), ", "));
    }
    std::cout << fmt::format("Updating logs for {} cached job(s){} (refresh={})\n",
                             report.processed, label, refresh ? "true" : "false");

    if (!report.updated.empty()) {
        std::cout << "\nFetched:\n";
        for (const auto& u : report.updated) {
            std::cout << fmt::format("- {}: {}\n", u.job_id, u.log_path.string());
        }
    }
    if (!report.skipped_no_log_path.empty()) {
        std::cout << "\nSkipped (no log_path in cache): "
                  << join(report.skipped_no_log_path, ", ") << "\n";
    }
    if (!report.ok()) {
        std::cout << "\nErrors:\n";
        for (const auto& e : report.errors) {
            std::cout << fmt::format("- {}: {}\n", e.job_id, e.error);
        }
        return EXIT_GENERAL_ERROR;
    }

    std::cout << "\nDone.\n";
    return EXIT_OK;
}

// ── Single read ─────────────────────────────────────────────

int print_log(BaseCLI& cli, const JobRecord& job, int tail, int head, bool refresh,
              bool no_tunnel) {
    LogReadRequest request;
    request.job_id = job.job_id;
    request.remote_path = job.log_path;
    request.tail_lines = tail;
    request.head_lines = head;
    request.refresh = refresh;

    cli.notice(fmt::format("Fetching log for job {}...", job.job_id));
    LogReadOutcome outcome = cli.router(no_tunnel).read_log(request, cli.log_cache());

    if (outcome.fetch.no_new_content()) {
        cli.notice("No new content. If log was rotated, use --refresh.");
    }

    bool sliced = tail > 0 || head > 0;
    auto lines = split_lines(outcome.content);

    if (cli.json_output) {
        Json::Value data(Json::objectValue);
        data["job_id"] = job.job_id;
        data["log_path"] = job.log_path;
        data["method"] = outcome.transport == "ssh" ? "ssh_tunnel" : "workflow";
        if (outcome.transport != "ssh") data["cache_path"] = outcome.fetch.path.string();
        if (sliced) {
            data["lines"] = json_string_array(lines);
            data["count"] = static_cast<Json::UInt64>(lines.size());
        } else {
            data["content"] = outcome.content;
            data["size_bytes"] = static_cast<Json::UInt64>(outcome.content.size());
        }
        cli.print_json(data);
        return EXIT_OK;
    }

    if (tail > 0) {
        std::cout << fmt::format("=== Last {} lines ===\n\n", lines.size());
    } else if (head > 0) {
        std::cout << fmt::format("=== First {} lines ===\n\n", lines.size());
    }
    std::cout << outcome.content;
    if (!outcome.content.empty() && outcome.content.back() != '\n') std::cout << "\n";
    return EXIT_OK;
}

} // namespace

int do_logs(BaseCLI& cli, ArgReader& args) {
    int tail = args.int_option({"--tail", "-n"}).value_or(0);
    int head = args.int_option({"--head"}).value_or(0);
    bool path_only = args.flag({"--path"});
    bool refresh = args.flag({"--refresh"});
    bool follow = args.flag({"--follow", "-f"});
    int interval = args.int_option({"--interval"}).value_or(FOLLOW_INTERVAL_SECS);
    auto statuses = args.options({"--status", "-s"});
    int limit = args.int_option({"--limit", "-m"}).value_or(0);
    bool no_tunnel = args.flag({"--no-tunnel"});

    auto positionals = args.positionals();
    if (positionals.size() > 1) {
        throw std::invalid_argument(
            "Usage: bridgectl logs [JOB_ID] [--tail N] [--head N] [--path] [--refresh] "
            "[--follow] [--interval S] [--status S]... [--limit N] [--no-tunnel]");
    }
    if (interval <= 0) throw std::invalid_argument("--interval must be at least 1 second");

    if (positionals.empty()) {
        if (tail > 0 || head > 0 || path_only || follow) {
            return cli.report_error("InvalidUsage",
                                    "--tail, --head, --path and --follow require a JOB_ID",
                                    EXIT_VALIDATION_ERROR);
        }
        std::set<std::string> filter;
        if (!statuses.empty()) filter = expand_status_aliases(statuses);
        return bulk_update(cli, filter, limit, refresh);
    }

    const std::string& job_id = positionals[0];
    auto job = cli.job_store().get_job(job_id);
    if (!job) {
        return cli.report_error("JobNotFound", "Job not found: " + job_id, EXIT_LOG_NOT_FOUND);
    }
    if (job->log_path.empty()) {
        return cli.report_error("LogNotFound", "No log file found for job " + job_id,
                                EXIT_LOG_NOT_FOUND);
    }

    if (path_only) {
        if (cli.json_output) {
            Json::Value data(Json::objectValue);
            data["job_id"] = job_id;
            data["log_path"] = job->log_path;
            cli.print_json(data);
        } else {
            std::cout << job->log_path << "\n";
        }
        return EXIT_OK;
    }

    if (follow) return follow_job(cli, *job, tail, refresh, interval, no_tunnel);
    return print_log(cli, *job, tail, head, refresh, no_tunnel);
}

// Refresh cached logs for active jobs (PENDING / RUNNING / QUEUING unless
// --status says otherwise).
int do_logs_refresh(BaseCLI& cli, ArgReader& args) {
    auto statuses = args.options({"--status", "-s"});
    int limit = args.int_option({"--limit", "-m"}).value_or(0);
    bool refresh = args.flag({"--refresh"});

    if (!args.positionals().empty()) {
        throw std::invalid_argument(
            "Usage: bridgectl logs-refresh [--status S]... [--limit N] [--refresh]");
    }
    return bulk_update(cli, expand_status_aliases(statuses), limit, refresh);
}

void register_logs_commands(BaseCLI& cli) {
    cli.add_command("logs", do_logs, "Show, follow or bulk-refresh job logs");
    cli.add_command("logs-refresh", do_logs_refresh, "Refresh cached logs of active jobs");
}
