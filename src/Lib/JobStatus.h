//
// Server side job (minion) states
//

#ifndef LRR_CLIENT_JOBSTATUS_H
#define LRR_CLIENT_JOBSTATUS_H

#include <optional>
#include <string>

enum class eJobOutcome {
    Finished,
    Failed,
    // The poll was cut short by cancellation, a denied connection or a failed status query
    Indeterminate
};

// "finished" and "failed" are terminal, anything else (including no state at all) is still pending
inline auto parseJobState(const std::string& state) -> std::optional<eJobOutcome> {
    if (state == "finished") {
        return eJobOutcome::Finished;
    }

    if (state == "failed") {
        return eJobOutcome::Failed;
    }

    return std::nullopt;
}

#endif //LRR_CLIENT_JOBSTATUS_H
