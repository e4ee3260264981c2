#include "fs/model/Entry.hpp"

std::string_view fc::fs::model::to_string(const EntryType type) {
    switch (type) {
    case EntryType::File: return "file";
    case EntryType::Directory: return "directory";
    case EntryType::Symlink: return "symlink";
    case EntryType::Other: return "other";
    }
    return "unknown";
}
