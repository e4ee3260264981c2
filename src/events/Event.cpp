#include "events/Event.hpp"

#include <format>
#include <utility>

using namespace fc::events;

std::string_view fc::events::to_string(const Event::Kind kind) {
    switch (kind) {
    case Event::Kind::FILE_COPIED: return "FILE_COPIED";
    case Event::Kind::FILE_SKIPPED: return "FILE_SKIPPED";
    case Event::Kind::FILE_RENAMED: return "FILE_RENAMED";
    case Event::Kind::DIR_CREATED: return "DIR_CREATED";
    case Event::Kind::DIR_RENAMED: return "DIR_RENAMED";
    case Event::Kind::DIR_DELETED: return "DIR_DELETED";
    case Event::Kind::WARNING: return "WARNING";
    case Event::Kind::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

bool fc::events::defaultVisibility(const Event::Kind kind) {
    switch (kind) {
    case Event::Kind::DIR_RENAMED:
    case Event::Kind::DIR_DELETED:
    case Event::Kind::WARNING:
    case Event::Kind::ERROR:
        return true;
    default:
        return false;
    }
}

Event fc::events::makeEvent(const Event::Kind kind, std::string detail,
                            std::filesystem::path source, std::filesystem::path destination) {
    return {
        .kind = kind,
        .source = std::move(source),
        .destination = std::move(destination),
        .detail = std::move(detail),
        .visible = defaultVisibility(kind)
    };
}

std::string Event::toString() const {
    return std::format("{}: {}", fc::events::to_string(kind), detail);
}
