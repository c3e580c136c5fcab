#pragma once

#include <optional>
#include <core/types.hpp>

// Enumerates and transfers items for one run. Implementations must poll the
// run state between items (never mid-item) and stop after the current item on
// Paused or Cancelled. Items in resume_from->processed_item_ids are not
// processed again. Throwing aborts the run; the orchestrator reports it.
class TransferEngine {
public:
    virtual ~TransferEngine() = default;

    virtual TransferResult run(const TransferOptions& options,
                               const EventCallback& on_event,
                               const RunStatePoll& poll_run_state,
                               const std::optional<SessionCheckpoint>& resume_from) = 0;

    // Forget what the destination is known to hold, forcing a full resync.
    virtual Result<void> clear_destination_state(const TransferOptions& options) = 0;
};
