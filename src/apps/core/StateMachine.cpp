#include "apps/core/StateMachine.hpp"

StateMachine::StateMachine()
    : state(SessionState::UPLOAD) {}

bool StateMachine::update(SessionEvent event) {
    if (event == SessionEvent::RESET) {
        state = SessionState::UPLOAD;
        return true;
    }

    switch (state) {
        case SessionState::UPLOAD:
        case SessionState::RESULT:
            // A new file restarts processing from either idle phase.
            if (event == SessionEvent::FILE_SELECTED) {
                state = SessionState::PROCESSING;
                return true;
            }
            return false;

        case SessionState::PROCESSING:
            if (event == SessionEvent::ANALYSIS_COMPLETED) {
                state = SessionState::RESULT;
                return true;
            }
            if (event == SessionEvent::ANALYSIS_FAILED) {
                state = SessionState::UPLOAD;
                return true;
            }
            return false;

        default:
            return false;
    }
}

SessionState StateMachine::getState() const {
    return state;
}

const char* StateMachine::getStateName() const {
    return StateName(state);
}

const char* StateMachine::StateName(SessionState s) {
    switch (s) {
        case SessionState::UPLOAD:     return "UPLOAD";
        case SessionState::PROCESSING: return "PROCESSING";
        case SessionState::RESULT:     return "RESULT";
        default:                       return "UNKNOWN";
    }
}

const char* StateMachine::EventName(SessionEvent e) {
    switch (e) {
        case SessionEvent::FILE_SELECTED:      return "FILE_SELECTED";
        case SessionEvent::ANALYSIS_COMPLETED: return "ANALYSIS_COMPLETED";
        case SessionEvent::ANALYSIS_FAILED:    return "ANALYSIS_FAILED";
        case SessionEvent::RESET:              return "RESET";
        default:                               return "UNKNOWN";
    }
}
