#include "workflow_dispatcher.hpp"
#include <core/errors.hpp>
#include <core/json_util.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace {

std::string json_to_string(const Json::Value& v) {
    if (v.isNull()) return "";
    if (v.isObject() || v.isArray()) return write_json(v);
    return json_scalar_string(v);
}

Json::Value inputs_to_json(const WorkflowInputs& inputs) {
    Json::Value out(Json::objectValue);
    for (const auto& [key, value] : inputs) out[key] = value;
    return out;
}

RunOutcome outcome_of(const WorkflowRun& run) {
    return {run.id, run.status, run.conclusion.empty() ? run.status : run.conclusion,
            run.html_url};
}

} // namespace

WorkflowRun WorkflowRun::from_json(const Json::Value& j) {
    WorkflowRun run;
    if (!j.isObject()) return run;
    run.id = json_to_string(j["id"]);
    run.status = json_to_string(j["status"]);
    run.conclusion = json_to_string(j["conclusion"]);
    run.html_url = json_to_string(j["html_url"]);
    run.event_payload = json_to_string(j["event_payload"]);
    return run;
}

WorkflowInputs WorkflowRun::inputs() const {
    WorkflowInputs out;
    if (event_payload.empty()) return out;
    Json::Value payload;
    if (!parse_json(event_payload, payload) || !payload.isObject()) return out;
    const Json::Value& inputs = payload["inputs"];
    if (!inputs.isObject()) return out;
    for (const auto& key : inputs.getMemberNames()) {
        out[key] = json_to_string(inputs[key]);
    }
    return out;
}

bool is_terminal_status(const std::string& status) {
    return status == "completed" || status == "success" || status == "failure";
}

bool inputs_match(const WorkflowInputs& actual, const WorkflowInputs& expected) {
    for (const auto& [key, value] : expected) {
        if (value.empty()) continue;
        auto it = actual.find(key);
        std::string got = (it == actual.end()) ? "" : it->second;
        if (got != value) return false;
    }
    return true;
}

std::optional<long> extract_total_count(const Json::Value& response) {
    if (!response.isObject()) return std::nullopt;
    for (const char* key : {"total_count", "total", "count"}) {
        const Json::Value& field = response[key];
        if (field.isNull()) continue;
        if (field.isIntegral()) {
            long v = static_cast<long>(field.asInt64());
            if (v) return v;
            continue;
        }
        if (field.isString()) {
            try {
                long v = std::stol(field.asString());
                if (v) return v;
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    }
    return std::nullopt;
}

// ── WorkflowDispatcher ───────────────────────────────────────

WorkflowDispatcher::WorkflowDispatcher(ForgeSession& session) : session_(session) {}

void WorkflowDispatcher::trigger(const std::string& workflow_file, const WorkflowInputs& inputs,
                                 const std::string& ref) {
    std::string url = fmt::format("{}/workflows/{}/dispatches", session_.api_base(), workflow_file);
    Json::Value body(Json::objectValue);
    body["ref"] = ref.empty() ? session_.ref() : ref;
    body["inputs"] = inputs_to_json(inputs);

    bridge_log(fmt::format("Dispatch {} inputs={}", workflow_file, write_json(body["inputs"])));
    try {
        session_.client().request_json("POST", url, body);
    } catch (const ForgeError& e) {
        throw ForgeError(fmt::format("Failed to trigger workflow: {}", e.what()), e.status());
    }
}

WorkflowRun WorkflowDispatcher::get_run(const std::string& run_id) {
    std::string url = fmt::format("{}/runs/{}", session_.api_base(), run_id);
    try {
        return WorkflowRun::from_json(session_.client().request_json("GET", url));
    } catch (const ForgeError& e) {
        throw ForgeError(fmt::format("Failed to get workflow run: {}", e.what()), e.status());
    }
}

std::optional<WorkflowRun> WorkflowDispatcher::find_run(const WorkflowInputs& expected, int limit,
                                                        const RunFilter& accept) {
    auto& client = session_.client();
    auto scan = [&](const Json::Value& response) -> std::optional<WorkflowRun> {
        if (!response.isObject()) return std::nullopt;
        const Json::Value& runs = response["workflow_runs"];
        if (!runs.isArray()) return std::nullopt;
        for (const auto& r : runs) {
            WorkflowRun run = WorkflowRun::from_json(r);
            WorkflowInputs inputs = run.inputs();
            if (inputs.empty() || !inputs_match(inputs, expected)) continue;
            if (accept(run)) return run;
        }
        return std::nullopt;
    };

    std::string base = session_.api_base() + "/runs?";
    Json::Value first = client.request_json("GET", base + client.pagination_params(limit, 1));
    if (auto run = scan(first)) return run;

    // Some forges list oldest first, which puts the newest run on the last page.
    auto total = extract_total_count(first);
    if (total && *total > limit) {
        long last_page = (*total + limit - 1) / limit;
        Json::Value last = client.request_json(
            "GET", base + client.pagination_params(limit, static_cast<int>(last_page)));
        if (auto run = scan(last)) return run;
    }
    return std::nullopt;
}

std::string WorkflowDispatcher::correlate(const WorkflowInputs& expected, int limit) {
    auto any = [](const WorkflowRun&) { return true; };
    const auto& clock = session_.clock();

    for (int attempt = 0; attempt < CORRELATE_ATTEMPTS; attempt++) {
        try {
            if (auto run = find_run(expected, limit, any)) {
                bridge_log(fmt::format("Correlated run {} (attempt {})", run->id, attempt + 1));
                return run->id;
            }
        } catch (const ForgeError& e) {
            bridge_log(fmt::format("Correlate attempt {} failed: {}", attempt + 1, e.what()));
        }
        if (attempt + 1 < CORRELATE_ATTEMPTS) {
            clock.sleep(std::chrono::milliseconds(CORRELATE_RETRY_MS));
        }
    }
    bridge_log("Correlate: no matching run found");
    return "";
}

std::string WorkflowDispatcher::trigger_and_correlate(const std::string& workflow_file,
                                                      const WorkflowInputs& inputs,
                                                      const std::string& ref) {
    trigger(workflow_file, inputs, ref);
    session_.clock().sleep(std::chrono::milliseconds(DISPATCH_SETTLE_MS));
    return correlate(inputs);
}

RunOutcome WorkflowDispatcher::wait_for_completion(const std::string& run_id, int timeout_secs) {
    const auto& clock = session_.clock();
    auto limit = std::chrono::seconds(std::max(MIN_DEADLINE_SECS, timeout_secs));
    auto start = clock.now();

    while (true) {
        if (clock.now() - start > limit) {
            throw TimeoutError(fmt::format(
                "Workflow run {} timed out after {} seconds. "
                "To increase the timeout, set BRIDGECTL_REMOTE_TIMEOUT=<seconds>",
                run_id, limit.count()));
        }

        WorkflowRun run = get_run(run_id);
        if (run.id.empty()) run.id = run_id;
        if (is_terminal_status(run.status)) {
            return outcome_of(run);
        }
        clock.sleep(std::chrono::milliseconds(RUN_POLL_INTERVAL_MS));
    }
}

RunOutcome WorkflowDispatcher::wait_for_request(const std::string& request_id, int timeout_secs) {
    const auto& clock = session_.clock();
    auto limit = std::chrono::seconds(std::max(MIN_DEADLINE_SECS, timeout_secs));
    auto start = clock.now();
    auto terminal = [](const WorkflowRun& r) { return is_terminal_status(r.status); };

    while (true) {
        if (clock.now() - start > limit) {
            throw TimeoutError(fmt::format(
                "Bridge action {} timed out after {} seconds. "
                "To increase the timeout, set BRIDGECTL_BRIDGE_TIMEOUT=<seconds>",
                request_id, limit.count()));
        }

        try {
            if (auto run = find_run({{"request_id", request_id}}, RUN_PAGE_LIMIT, terminal)) {
                return outcome_of(*run);
            }
        } catch (const ForgeError& e) {
            bridge_log(fmt::format("Run search for {} failed: {}", request_id, e.what()));
        }
        clock.sleep(std::chrono::milliseconds(RUN_POLL_INTERVAL_MS));
    }
}
