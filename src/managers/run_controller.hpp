#pragma once

#include <core/types.hpp>

// The part of the session orchestrator the scheduler drives.
class RunController {
public:
    virtual ~RunController() = default;

    virtual bool is_running() const = 0;
    virtual bool has_resumable_session() = 0;
    virtual Result<void> start() = 0;
    virtual Result<void> resume() = 0;
};
