#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace fc::merge::model {

// Counters for one engine run. Only the engine's own control flow touches them.
struct Stats {
    uintmax_t directories_created{}, directories_renamed{};
    uintmax_t files_copied{}, files_renamed{}, files_skipped{};
    uintmax_t errors{};

    friend bool operator==(const Stats&, const Stats&) = default;
};

void to_json(nlohmann::json& j, const Stats& s);

}
