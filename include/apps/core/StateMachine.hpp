#pragma once
#include "types.hpp"

// Upload -> Processing -> Result, driven by explicit events.
class StateMachine {
public:
    StateMachine();

    // Returns false when the event does not apply in the current state
    // (state unchanged).
    bool update(SessionEvent event);

    SessionState getState() const;
    const char* getStateName() const;

    static const char* StateName(SessionState s);
    static const char* EventName(SessionEvent e);

private:
    SessionState state;
};
