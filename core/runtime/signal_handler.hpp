#pragma once

#include <atomic>

namespace nodegate {
namespace runtime {

// Process-wide SIGINT/SIGTERM flag polled by the runtime loop
class SignalHandler {
public:
    static void install();
    static bool is_shutdown_requested();

    // Tests and in-process shutdown
    static void request_shutdown();
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace nodegate
