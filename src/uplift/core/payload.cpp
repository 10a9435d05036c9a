// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplift/core/payload.hpp>
#include <uplift/core/error.hpp>
#include <algorithm>
#include <new>

namespace uplift::core {

MemoryPayload::MemoryPayload(std::string name, std::vector<std::byte> data,
                             std::string content_type)
    : name_(std::move(name))
    , data_(std::move(data))
    , content_type_(std::move(content_type)) {
}

std::shared_ptr<MemoryPayload> MemoryPayload::filled(std::string name, std::uint64_t size,
                                                     std::string content_type) {
    std::vector<std::byte> data(static_cast<std::size_t>(size));
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::byte>(i % 251);
    }
    return std::make_shared<MemoryPayload>(std::move(name), std::move(data), std::move(content_type));
}

std::expected<std::vector<std::byte>, std::error_code>
MemoryPayload::read(std::uint64_t offset, std::size_t length) const noexcept {
    if (offset > data_.size() || length > data_.size() - offset) {
        return std::unexpected(make_error_code(UploadErrc::read_failed));
    }
    try {
        auto first = data_.begin() + static_cast<std::ptrdiff_t>(offset);
        return std::vector<std::byte>(first, first + static_cast<std::ptrdiff_t>(length));
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

} // namespace uplift::core
