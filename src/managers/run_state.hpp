#pragma once

#include <atomic>
#include <core/types.hpp>

// Live "current intent" signal shared between the orchestrator (writer) and
// the transfer engine (reader, polled between items). Not a request queue:
// a later store() simply overwrites an earlier one.
class RunStateFlag {
public:
    RunStateFlag() = default;
    explicit RunStateFlag(RunState initial) : state_(static_cast<int>(initial)) {}

    void store(RunState s) { state_.store(static_cast<int>(s), std::memory_order_release); }
    RunState load() const { return static_cast<RunState>(state_.load(std::memory_order_acquire)); }

    // Poll callback for TransferEngine::run.
    RunStatePoll poller() const {
        return [this]() { return load(); };
    }

private:
    std::atomic<int> state_{static_cast<int>(RunState::Cancelled)};
};

const char* run_state_name(RunState s);
