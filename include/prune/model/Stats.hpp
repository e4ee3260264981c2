#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace fc::prune::model {

struct Stats {
    uintmax_t directories_deleted{};
    uintmax_t errors{};

    Stats& operator+=(const Stats& other) {
        directories_deleted += other.directories_deleted;
        errors += other.errors;
        return *this;
    }

    friend bool operator==(const Stats&, const Stats&) = default;
};

void to_json(nlohmann::json& j, const Stats& s);

}
