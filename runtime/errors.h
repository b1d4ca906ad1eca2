#pragma once
#include <stdexcept>

namespace tether {
    // Raised when scheduled-only functionality is used on a thread with no running event_loop.
    class no_running_loop : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Raised by event_loop::run_until_complete when the calling thread already runs a loop.
    class loop_already_running : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class loop_closed : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class pool_stopped : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Raised when the result of a cancelled background task is requested.
    class task_cancelled : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Raised when a result is requested from a background task that has not finished.
    class invalid_task_state : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };
}
