#pragma once
#include <functional>
#include <map>
#include <vector>
#include <mutex>
#include <csignal>

namespace SignalManager {

using SignalCallback = std::function<void(int)>;

// Callbacks run in registration order when the signal arrives
void register_signal(int signum, SignalCallback cb);
void setup();

// Restore the default disposition of every registered signal and drop the callbacks
void reset();

// Calls reset() when it goes out of scope
class CallbackGuard {
public:
    CallbackGuard() = default;
    ~CallbackGuard() { reset(); }

    CallbackGuard(const CallbackGuard&) = delete;
    CallbackGuard& operator=(const CallbackGuard&) = delete;
};

// While alive, SIGINT sets a flag and interrupts blocking reads (no SA_RESTART)
// instead of reaching the registered callbacks.
class InterruptScope {
public:
    InterruptScope();
    ~InterruptScope();

    InterruptScope(const InterruptScope&) = delete;
    InterruptScope& operator=(const InterruptScope&) = delete;

    bool interrupted() const;

private:
    struct sigaction previous_;
};

}
