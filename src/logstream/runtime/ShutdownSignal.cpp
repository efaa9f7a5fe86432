#include <logstream/runtime/ShutdownSignal.hpp>

namespace LS::Runtime {

namespace {
std::atomic<bool> g_should_stop{false};
static_assert(std::atomic<bool>::is_always_lock_free);
} // namespace

auto shutdown_flag() -> std::atomic<bool>& {
    return g_should_stop;
}

void RequestShutdown() {
    g_should_stop.store(true);
}

auto ShutdownRequested() -> bool {
    return g_should_stop.load();
}

void ResetShutdownFlag() {
    g_should_stop.store(false);
}

} // namespace LS::Runtime
