#pragma once

#include <string>
#include <map>
#include <vector>
#include <optional>
#include <functional>
#include <json/json.h>
#include "forge_session.hpp"

using WorkflowInputs = std::map<std::string, std::string>;

struct WorkflowRun {
    std::string id;
    std::string status;
    std::string conclusion;
    std::string html_url;
    std::string event_payload;      // JSON text; "inputs" holds the dispatch inputs

    static WorkflowRun from_json(const Json::Value& j);

    // Decoded event_payload.inputs, stringified. Empty when absent or malformed.
    WorkflowInputs inputs() const;
};

// Terminal observation of a run.
struct RunOutcome {
    std::string run_id;
    std::string status;
    std::string conclusion;         // falls back to status when the forge omits it
    std::string html_url;

    bool succeeded() const { return conclusion == "success"; }
};

// completed / success / failure (both forges use some of these as status).
bool is_terminal_status(const std::string& status);

// True when every non-empty value in `expected` equals the same key in `actual`.
bool inputs_match(const WorkflowInputs& actual, const WorkflowInputs& expected);

// "total_count", "total" or "count", whichever the forge sends.
std::optional<long> extract_total_count(const Json::Value& response);

class WorkflowDispatcher {
public:
    explicit WorkflowDispatcher(ForgeSession& session);

    // POST a workflow_dispatch. A 204/empty response is expected.
    void trigger(const std::string& workflow_file, const WorkflowInputs& inputs,
                 const std::string& ref = "");

    // Search recent runs (first page, then the last page when the history
    // spans more than one) for one whose inputs match. Retried a few times
    // to ride out dispatch propagation delay. Returns "" when not found.
    std::string correlate(const WorkflowInputs& expected, int limit = RUN_PAGE_LIMIT);

    // trigger(), settle briefly, then correlate() on the same inputs.
    std::string trigger_and_correlate(const std::string& workflow_file,
                                      const WorkflowInputs& inputs,
                                      const std::string& ref = "");

    WorkflowRun get_run(const std::string& run_id);

    // Poll a known run until terminal. TimeoutError once elapsed > timeout.
    RunOutcome wait_for_completion(const std::string& run_id, int timeout_secs);

    // Poll by request_id, re-running the run search each tick, until a
    // terminal matching run appears. TimeoutError once elapsed > timeout.
    RunOutcome wait_for_request(const std::string& request_id, int timeout_secs);

private:
    using RunFilter = std::function<bool(const WorkflowRun&)>;

    // One pass over page 1 and, if needed, the last page.
    std::optional<WorkflowRun> find_run(const WorkflowInputs& expected, int limit,
                                        const RunFilter& accept);

    ForgeSession& session_;
};
