#include "fs/naming.hpp"
#include "fs/Backend.hpp"

#include <format>

using namespace fc::fs;
using namespace fc::fs::model;

std::string fc::fs::siblingName(const std::filesystem::path& base, const unsigned int counter, const NameKind kind) {
    if (kind == NameKind::Directory)
        return std::format("{}_{}", base.filename().string(), counter);

    // std::filesystem gives ".bashrc" an empty extension, which is what we want here.
    return std::format("{}_{}{}", base.stem().string(), counter, base.extension().string());
}

Result<std::filesystem::path> fc::fs::availableName(const Backend& backend,
                                                    const std::filesystem::path& base,
                                                    const NameKind kind) {
    const auto taken = backend.exists(base);
    if (!taken) return taken.error();
    if (!*taken) return base;

    const auto parent = base.parent_path();
    for (unsigned int counter = 2;; ++counter) {
        auto candidate = parent / siblingName(base, counter, kind);
        const auto exists = backend.exists(candidate);
        if (!exists) return exists.error();
        if (!*exists) return candidate;
    }
}
