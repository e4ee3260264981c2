#pragma once

#include "events/EventSink.hpp"
#include "fs/LocalBackend.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

namespace fc::test {

namespace stdfs = std::filesystem;

// Keeps every event so tests can assert on what the engine and pruner reported.
struct RecordingSink : events::EventSink {
    std::vector<events::Event> recorded;

    void emit(const events::Event& event) override { recorded.push_back(event); }

    [[nodiscard]] std::size_t count(const events::Event::Kind kind) const {
        return static_cast<std::size_t>(std::ranges::count_if(recorded, [&](const auto& e) { return e.kind == kind; }));
    }

    [[nodiscard]] std::vector<std::string> details(const events::Event::Kind kind) const {
        std::vector<std::string> out;
        for (const auto& e : recorded)
            if (e.kind == kind) out.push_back(e.detail);
        return out;
    }
};

// LocalBackend with injectable failures. Root can read anything, so permission bits are no use here.
struct FaultyBackend : fs::LocalBackend {
    std::set<stdfs::path> unlistable;
    std::set<stdfs::path> uncopyable;
    std::set<stdfs::path> unhashable;
    std::set<stdfs::path> undeletable;

    [[nodiscard]] fs::model::Result<std::vector<fs::model::Entry>> list(const stdfs::path& dir) const override {
        if (unlistable.contains(dir)) return fs::model::Error{fs::model::ErrorKind::PermissionDenied, dir, "injected"};
        return LocalBackend::list(dir);
    }

    [[nodiscard]] fs::model::Result<crypto::hash::Digest> digest(const stdfs::path& path) const override {
        if (unhashable.contains(path)) return fs::model::Error{fs::model::ErrorKind::HashFailure, path, "injected"};
        return LocalBackend::digest(path);
    }

    fs::model::Status copyFile(const stdfs::path& from, const stdfs::path& to) override {
        if (uncopyable.contains(from)) return fs::model::Error{fs::model::ErrorKind::IOFailure, from, "injected"};
        return LocalBackend::copyFile(from, to);
    }

    fs::model::Status removeDirectory(const stdfs::path& path) override {
        if (undeletable.contains(path)) return fs::model::Error{fs::model::ErrorKind::PermissionDenied, path, "injected"};
        return LocalBackend::removeDirectory(path);
    }
};

class TreeFixture : public ::testing::Test {
protected:
    stdfs::path root;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = stdfs::temp_directory_path() /
               (std::string("fc_test_") + info->test_suite_name() + "_" + info->name() + "_" + std::to_string(::getpid()));
        stdfs::remove_all(root);
        stdfs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        stdfs::remove_all(root, ec);
    }

    static void writeFile(const stdfs::path& path, const std::string& content) {
        stdfs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    static std::string readFile(const stdfs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    // Every path below dir, relative, sorted. Directories end in '/'.
    static std::vector<std::string> tree(const stdfs::path& dir) {
        std::vector<std::string> out;
        if (!stdfs::exists(dir)) return out;
        for (const auto& entry : stdfs::recursive_directory_iterator(dir)) {
            auto rel = entry.path().lexically_relative(dir).generic_string();
            if (entry.is_directory()) rel += '/';
            out.push_back(std::move(rel));
        }
        std::ranges::sort(out);
        return out;
    }

    static std::size_t fileCount(const stdfs::path& dir) {
        std::size_t n = 0;
        for (const auto& entry : stdfs::recursive_directory_iterator(dir))
            if (entry.is_regular_file()) ++n;
        return n;
    }
};

}
