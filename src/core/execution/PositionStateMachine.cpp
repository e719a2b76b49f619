#include "core/execution/PositionStateMachine.h"

namespace scalpengine {
namespace core {
namespace execution {

namespace {
bool targetFor(PositionEvent event, PositionState& target) {
    switch (event) {
        case PositionEvent::ENTRY_FILLED: target = PositionState::OPEN; return true;
        case PositionEvent::ENTRY_FAILED: target = PositionState::FAILED; return true;
        case PositionEvent::EXIT_TRIGGERED: target = PositionState::EXIT_REQUESTED; return true;
        case PositionEvent::EXIT_FILLED: target = PositionState::CLOSED; return true;
        case PositionEvent::EXIT_FAILED: target = PositionState::OPEN; return true;
        case PositionEvent::EXIT_ABANDONED: target = PositionState::FAILED; return true;
    }
    return false;
}

PositionState expectedSource(PositionEvent event) {
    switch (event) {
        case PositionEvent::ENTRY_FILLED:
        case PositionEvent::ENTRY_FAILED:
            return PositionState::NEW;
        case PositionEvent::EXIT_TRIGGERED:
            return PositionState::OPEN;
        case PositionEvent::EXIT_FILLED:
        case PositionEvent::EXIT_FAILED:
        case PositionEvent::EXIT_ABANDONED:
            return PositionState::EXIT_REQUESTED;
    }
    return PositionState::NEW;
}
} // namespace

const char* toString(PositionState state) {
    switch (state) {
        case PositionState::NEW: return "NEW";
        case PositionState::OPEN: return "OPEN";
        case PositionState::EXIT_REQUESTED: return "EXIT_REQUESTED";
        case PositionState::CLOSED: return "CLOSED";
        case PositionState::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

const char* toString(PositionEvent event) {
    switch (event) {
        case PositionEvent::ENTRY_FILLED: return "ENTRY_FILLED";
        case PositionEvent::ENTRY_FAILED: return "ENTRY_FAILED";
        case PositionEvent::EXIT_TRIGGERED: return "EXIT_TRIGGERED";
        case PositionEvent::EXIT_FILLED: return "EXIT_FILLED";
        case PositionEvent::EXIT_FAILED: return "EXIT_FAILED";
        case PositionEvent::EXIT_ABANDONED: return "EXIT_ABANDONED";
    }
    return "UNKNOWN";
}

PositionTransitionResult PositionStateMachine::transition(PositionState current, PositionEvent event) {
    PositionTransitionResult result;
    result.state = current;

    PositionState target = current;
    if (!targetFor(event, target)) {
        result.reason = "unknown event";
        return result;
    }

    if (current != expectedSource(event) || !canTransition(current, target)) {
        result.reason = std::string(toString(event)) + " not allowed in " + toString(current);
        return result;
    }

    result.accepted = true;
    result.state = target;
    return result;
}

bool PositionStateMachine::canTransition(PositionState from, PositionState to) {
    switch (from) {
        case PositionState::NEW:
            return to == PositionState::OPEN || to == PositionState::FAILED;
        case PositionState::OPEN:
            return to == PositionState::EXIT_REQUESTED;
        case PositionState::EXIT_REQUESTED:
            return to == PositionState::CLOSED || to == PositionState::OPEN || to == PositionState::FAILED;
        case PositionState::CLOSED:
        case PositionState::FAILED:
            return false;
    }
    return false;
}

bool PositionStateMachine::isTerminal(PositionState state) {
    return state == PositionState::CLOSED || state == PositionState::FAILED;
}

} // namespace execution
} // namespace core
} // namespace scalpengine
