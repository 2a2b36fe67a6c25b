#pragma once

#include <string>
#include <set>
#include <vector>

// Job states as the scheduler reports them. Two spellings are in use:
// upper-case ("RUNNING") and snake_case API names ("job_running").

// SUCCEEDED / FAILED / CANCELLED in either spelling (plus job_stopped).
bool is_terminal_job_status(const std::string& status);

bool is_succeeded_job_status(const std::string& status);

// Every spelling of each requested status. Unknown names pass through
// unchanged. An empty request expands the active set
// (PENDING, RUNNING, QUEUING).
std::set<std::string> expand_status_aliases(const std::vector<std::string>& statuses);
