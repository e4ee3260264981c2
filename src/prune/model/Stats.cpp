#include "prune/model/Stats.hpp"

#include <nlohmann/json.hpp>

void fc::prune::model::to_json(nlohmann::json& j, const Stats& s) {
    j = {
        {"directories_deleted", s.directories_deleted},
        {"errors", s.errors}
    };
}
