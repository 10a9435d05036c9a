// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <uplift/disk/file_payload.hpp>
#include <filesystem>
#include <fstream>
#include <string>

using namespace uplift::disk;

namespace {

// Temporary file removed on scope exit
struct TempFile {
    explicit TempFile(const std::string& name, std::size_t size) {
        path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        for (std::size_t i = 0; i < size; ++i) {
            out.put(static_cast<char>(i % 251));
        }
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    std::filesystem::path path;
};

} // namespace

TEST_CASE("content_type_for maps extensions", "[disk]") {
    CHECK(content_type_for("/videos/holiday.mp4") == "video/mp4");
    CHECK(content_type_for("CLIP.MOV") == "video/quicktime");
    CHECK(content_type_for("notes.txt") == "text/plain");
    CHECK(content_type_for("archive.tar.xyz") == "application/octet-stream");
    CHECK(content_type_for("no_extension") == "application/octet-stream");
    CHECK(content_type_for("trailing.") == "application/octet-stream");
    CHECK(content_type_for("dir.mp4/file") == "application/octet-stream");
}

TEST_CASE("FilePayload reads byte ranges", "[disk]") {
    TempFile file("uplift_payload_test.mp4", 10'000);

    auto payload = FilePayload::open(file.path.string());
    REQUIRE(payload);
    auto& p = **payload;

    CHECK(p.size() == 10'000);
    CHECK(p.name() == "uplift_payload_test.mp4");
    CHECK(p.content_type() == "video/mp4");

    SECTION("Middle of the file") {
        auto bytes = p.read(1000, 500);
        REQUIRE(bytes);
        REQUIRE(bytes->size() == 500);
        for (std::size_t i = 0; i < bytes->size(); ++i) {
            CHECK(std::to_integer<int>((*bytes)[i]) == static_cast<int>((1000 + i) % 251));
        }
    }

    SECTION("Up to the last byte") {
        auto bytes = p.read(9'000, 1'000);
        REQUIRE(bytes);
        CHECK(bytes->size() == 1'000);
    }

    SECTION("Past the end is a short read") {
        auto bytes = p.read(9'500, 1'000);
        REQUIRE_FALSE(bytes);
        CHECK(bytes.error() == DiskErrc::short_read);

        auto beyond = p.read(20'000, 1);
        REQUIRE_FALSE(beyond);
        CHECK(beyond.error() == DiskErrc::short_read);
    }
}

TEST_CASE("FilePayload open failures", "[disk]") {
    SECTION("Missing file") {
        auto payload = FilePayload::open("/nonexistent/uplift/missing.bin");
        REQUIRE_FALSE(payload);
        CHECK(payload.error() == DiskErrc::file_not_found);
    }

    SECTION("Empty path") {
        auto payload = FilePayload::open("");
        REQUIRE_FALSE(payload);
        CHECK(payload.error() == DiskErrc::invalid_path);
    }

    SECTION("Directory") {
        auto payload = FilePayload::open(std::filesystem::temp_directory_path().string());
        REQUIRE_FALSE(payload);
        CHECK(payload.error() == DiskErrc::not_a_file);
    }
}
