#include "runtime/SignalScope.hpp"
#include "runtime/Runner.hpp"

#include <atomic>
#include <csignal>

using namespace fc::runtime;

namespace {

std::atomic<Runner*> activeRunner{nullptr};

void signalHandler(int) {
    if (auto* runner = activeRunner.load()) runner->interrupt();
}

}

SignalScope::SignalScope(Runner& runner) {
    activeRunner.store(&runner);
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

SignalScope::~SignalScope() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    activeRunner.store(nullptr);
}

Runner* SignalScope::active() { return activeRunner.load(); }
