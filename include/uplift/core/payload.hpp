// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace uplift::core {

// Read-only binary source for one upload
class Payload {
public:
    virtual ~Payload() = default;

    [[nodiscard]] virtual const std::string& name() const noexcept = 0;
    [[nodiscard]] virtual std::uint64_t size() const noexcept = 0;
    [[nodiscard]] virtual const std::string& content_type() const noexcept = 0;

    // Read [offset, offset + length); short reads past the end are an error
    [[nodiscard]] virtual std::expected<std::vector<std::byte>, std::error_code>
    read(std::uint64_t offset, std::size_t length) const noexcept = 0;
};

using PayloadHandle = std::shared_ptr<const Payload>;

// In-memory payload, used by tests and dry runs
class MemoryPayload final : public Payload {
public:
    MemoryPayload(std::string name, std::vector<std::byte> data,
                  std::string content_type = "application/octet-stream");

    // Payload of `size` bytes with a repeating byte pattern
    [[nodiscard]] static std::shared_ptr<MemoryPayload>
    filled(std::string name, std::uint64_t size,
           std::string content_type = "application/octet-stream");

    [[nodiscard]] const std::string& name() const noexcept override { return name_; }
    [[nodiscard]] std::uint64_t size() const noexcept override { return data_.size(); }
    [[nodiscard]] const std::string& content_type() const noexcept override { return content_type_; }

    [[nodiscard]] std::expected<std::vector<std::byte>, std::error_code>
    read(std::uint64_t offset, std::size_t length) const noexcept override;

private:
    std::string name_;
    std::vector<std::byte> data_;
    std::string content_type_;
};

} // namespace uplift::core
