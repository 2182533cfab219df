#pragma once

#include <atomic>

namespace squirrel {
namespace runtime {

// Turns SIGINT/SIGTERM into a polled shutdown flag
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Clears the flag (tests)
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace squirrel
