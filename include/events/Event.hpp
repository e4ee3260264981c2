#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace fc::events {

struct Event {
    enum class Kind {
        FILE_COPIED,
        FILE_SKIPPED,
        FILE_RENAMED,
        DIR_CREATED,
        DIR_RENAMED,
        DIR_DELETED,
        WARNING,
        ERROR
    };

    Kind kind{Kind::ERROR};
    std::filesystem::path source{};
    std::filesystem::path destination{};
    std::string detail{};
    bool visible = false; // reaches the console, not just the log file

    [[nodiscard]] std::string toString() const;
};

std::string_view to_string(Event::Kind kind);

// Console visibility the tool has always used: conflicts, deletions and failures
// are shown, routine copies only go to the log file.
bool defaultVisibility(Event::Kind kind);

Event makeEvent(Event::Kind kind, std::string detail,
                std::filesystem::path source = {}, std::filesystem::path destination = {});

}
