#pragma once

#include <atomic>

namespace greenhouse {
namespace runtime {

// Turns SIGINT/SIGTERM into flags polled by Runtime::run()
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Number of the last signal caught, 0 if none
    static int last_signal();

    // Clear a pending request (tests, restart after a handled stop)
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
    static std::atomic<int> last_signal_;
};

}  // namespace runtime
}  // namespace greenhouse
