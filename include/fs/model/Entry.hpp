#pragma once

#include <filesystem>
#include <string_view>

namespace fc::fs::model {

enum class EntryType { File, Directory, Symlink, Other };

struct Entry {
    std::filesystem::path path;
    EntryType type{EntryType::Other};

    [[nodiscard]] bool isDirectory() const { return type == EntryType::Directory; }
};

// Naming policies differ: files keep their extension, directories suffix the whole name.
enum class NameKind { File, Directory };

std::string_view to_string(EntryType type);

}
