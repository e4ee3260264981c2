#pragma once

#include "events/Event.hpp"

#include <memory>
#include <spdlog/spdlog.h>

namespace fc::events {

struct EventSink {
    virtual ~EventSink() = default;
    virtual void emit(const Event& event) = 0;
};

// Visible events go to the component logger (console + file), the rest to the
// file-only journal.
class LogSink final : public EventSink {
public:
    LogSink(std::shared_ptr<spdlog::logger> component, std::shared_ptr<spdlog::logger> journal);

    void emit(const Event& event) override;

private:
    std::shared_ptr<spdlog::logger> component_;
    std::shared_ptr<spdlog::logger> journal_;
};

}
