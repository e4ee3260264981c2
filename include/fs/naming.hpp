#pragma once

#include "fs/model/Entry.hpp"
#include "fs/model/Result.hpp"

#include <filesystem>
#include <string>

namespace fc::fs {

struct Backend;

// "report.pdf", 3 -> "report_3.pdf" for files; "Photos.old", 3 -> "Photos.old_3" for directories.
std::string siblingName(const std::filesystem::path& base, unsigned int counter, model::NameKind kind);

// Returns base when nothing lives there, otherwise the first free sibling starting at _2.
// Checked against the live filesystem on every call.
model::Result<std::filesystem::path> availableName(const Backend& backend,
                                                   const std::filesystem::path& base,
                                                   model::NameKind kind);

}
