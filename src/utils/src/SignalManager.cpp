#include "SignalManager.hpp"
#include <cstring>

namespace SignalManager {

static std::map<int, std::vector<SignalCallback>> callbacks;
static std::mutex cb_mutex;
static volatile std::sig_atomic_t interrupt_flag = 0;

void signal_handler(int signum) {
    std::lock_guard<std::mutex> lock(cb_mutex);
    auto it = callbacks.find(signum);
    if (it != callbacks.end()) {
        for (auto& cb : it->second) {
            cb(signum);
        }
    }
}

static void interrupt_handler(int) {
    interrupt_flag = 1;
}

void register_signal(int signum, SignalCallback cb) {
    std::lock_guard<std::mutex> lock(cb_mutex);
    callbacks[signum].push_back(std::move(cb));
}

void setup() {
    std::lock_guard<std::mutex> lock(cb_mutex);
    for (const auto& kv : callbacks) {
        struct sigaction action;
        std::memset(&action, 0, sizeof(action));
        action.sa_handler = signal_handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = SA_RESTART;
        sigaction(kv.first, &action, nullptr);
    }
}

void reset() {
    std::lock_guard<std::mutex> lock(cb_mutex);
    for (const auto& kv : callbacks) {
        std::signal(kv.first, SIG_DFL);
    }
    callbacks.clear();
}

InterruptScope::InterruptScope() {
    interrupt_flag = 0;

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = interrupt_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, &previous_);
}

InterruptScope::~InterruptScope() {
    sigaction(SIGINT, &previous_, nullptr);
}

bool InterruptScope::interrupted() const {
    return interrupt_flag != 0;
}

}
