#include "merge/model/Stats.hpp"

#include <nlohmann/json.hpp>

void fc::merge::model::to_json(nlohmann::json& j, const Stats& s) {
    j = {
        {"directories_created", s.directories_created},
        {"directories_renamed", s.directories_renamed},
        {"files_copied", s.files_copied},
        {"files_renamed", s.files_renamed},
        {"files_skipped", s.files_skipped},
        {"errors", s.errors}
    };
}
