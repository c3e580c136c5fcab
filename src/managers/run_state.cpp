#include "run_state.hpp"

const char* run_state_name(RunState s) {
    switch (s) {
    case RunState::Running:   return "running";
    case RunState::Paused:    return "paused";
    case RunState::Cancelled: return "cancelled";
    }
    return "cancelled";
}
