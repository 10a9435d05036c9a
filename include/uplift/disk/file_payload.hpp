// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <uplift/core/payload.hpp>
#include <uplift/disk/error.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace uplift::disk {

// Guess a MIME type from the file extension; octet-stream when unknown
[[nodiscard]] std::string content_type_for(std::string_view path);

// Payload backed by a file on disk, read with positional reads.
// Reads do not move a shared file offset, so concurrent chunk reads are safe.
class FilePayload final : public core::Payload {
public:
    [[nodiscard]] static std::expected<std::shared_ptr<FilePayload>, std::error_code>
    open(std::string_view path) noexcept;

    ~FilePayload() override;

    FilePayload(const FilePayload&) = delete;
    FilePayload& operator=(const FilePayload&) = delete;

    [[nodiscard]] const std::string& name() const noexcept override { return name_; }
    [[nodiscard]] std::uint64_t size() const noexcept override { return size_; }
    [[nodiscard]] const std::string& content_type() const noexcept override { return content_type_; }

    [[nodiscard]] std::expected<std::vector<std::byte>, std::error_code>
    read(std::uint64_t offset, std::size_t length) const noexcept override;

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    FilePayload() = default;

    int fd_{-1};
    std::string path_;
    std::string name_;
    std::string content_type_;
    std::uint64_t size_{0};
};

} // namespace uplift::disk
