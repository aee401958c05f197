#pragma once
#include <cstdint>

// Phases of one analysis session, as a front end presents them.
enum class SessionState : uint8_t {
    UPLOAD,        // waiting for an image
    PROCESSING,    // pipeline running
    RESULT,        // report available
};

enum class SessionEvent : uint8_t {
    FILE_SELECTED,
    ANALYSIS_COMPLETED,
    ANALYSIS_FAILED,
    RESET,
};
