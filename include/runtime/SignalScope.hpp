#pragma once

namespace fc::runtime {

class Runner;

// Routes SIGINT and SIGTERM to runner.interrupt() while alive. The destructor restores
// the default handlers before the runner can go away, including during unwinding.
// One scope at a time.
class SignalScope {
public:
    explicit SignalScope(Runner& runner);
    ~SignalScope();

    SignalScope(const SignalScope&) = delete;
    SignalScope& operator=(const SignalScope&) = delete;

    static Runner* active();
};

}
