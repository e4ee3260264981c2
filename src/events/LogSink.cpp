#include "events/EventSink.hpp"

#include <stdexcept>
#include <utility>

using namespace fc::events;

LogSink::LogSink(std::shared_ptr<spdlog::logger> component, std::shared_ptr<spdlog::logger> journal)
    : component_(std::move(component)), journal_(std::move(journal)) {
    if (!component_ || !journal_) throw std::invalid_argument("LogSink requires both loggers");
}

void LogSink::emit(const Event& event) {
    const auto& logger = event.visible ? component_ : journal_;

    spdlog::level::level_enum lvl = spdlog::level::info;
    if (event.kind == Event::Kind::ERROR) lvl = spdlog::level::err;
    else if (event.kind == Event::Kind::WARNING) lvl = spdlog::level::warn;

    logger->log(lvl, "{}", event.toString());
}
