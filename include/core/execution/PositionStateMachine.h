#pragma once

#include <string>

namespace scalpengine {
namespace core {
namespace execution {

enum class PositionState {
    NEW,
    OPEN,
    EXIT_REQUESTED,
    CLOSED,
    FAILED
};

enum class PositionEvent {
    ENTRY_FILLED,
    ENTRY_FAILED,
    EXIT_TRIGGERED,
    EXIT_FILLED,
    EXIT_FAILED,      // 재시도를 위해 OPEN 으로 복귀
    EXIT_ABANDONED    // 연속 실패 한도 초과
};

const char* toString(PositionState state);
const char* toString(PositionEvent event);

struct PositionTransitionResult {
    bool accepted = false;
    PositionState state = PositionState::NEW;
    std::string reason;
};

// 포지션 상태 전이 규칙 (허용되지 않은 전이는 accepted=false, state 는 그대로)
class PositionStateMachine {
public:
    static PositionTransitionResult transition(PositionState current, PositionEvent event);
    static bool canTransition(PositionState from, PositionState to);
    static bool isTerminal(PositionState state);
};

} // namespace execution
} // namespace core
} // namespace scalpengine
