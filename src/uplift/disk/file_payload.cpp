// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplift/disk/file_payload.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <new>
#include <utility>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace uplift::disk {

namespace {

std::error_code errno_to_error_code(int err) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:         return make_error_code(DiskErrc::access_denied);
        case ENAMETOOLONG:
        case ENOTDIR:
        case ELOOP:         return make_error_code(DiskErrc::invalid_path);
        case EISDIR:        return make_error_code(DiskErrc::not_a_file);
        case ENOMEM:        return make_error_code(DiskErrc::allocation_failed);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        default:            return make_error_code(DiskErrc::read_error);
    }
}

std::string base_name(std::string_view path) {
    auto slash = path.find_last_of('/');
    return std::string(slash == std::string_view::npos ? path : path.substr(slash + 1));
}

struct MimeEntry {
    std::string_view extension;
    std::string_view type;
};

constexpr std::array<MimeEntry, 14> MIME_TYPES{{
    {"mp4",  "video/mp4"},
    {"m4v",  "video/x-m4v"},
    {"mov",  "video/quicktime"},
    {"webm", "video/webm"},
    {"mkv",  "video/x-matroska"},
    {"avi",  "video/x-msvideo"},
    {"mp3",  "audio/mpeg"},
    {"wav",  "audio/wav"},
    {"png",  "image/png"},
    {"jpg",  "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"pdf",  "application/pdf"},
    {"json", "application/json"},
    {"txt",  "text/plain"},
}};

} // namespace

std::string content_type_for(std::string_view path) {
    auto name = base_name(path);
    auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 == name.size()) {
        return "application/octet-stream";
    }

    std::string ext = name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = std::find_if(MIME_TYPES.begin(), MIME_TYPES.end(),
                           [&](const MimeEntry& e) { return e.extension == ext; });
    return it == MIME_TYPES.end() ? "application/octet-stream" : std::string(it->type);
}

//=============================================================================
// FilePayload
//=============================================================================

std::expected<std::shared_ptr<FilePayload>, std::error_code>
FilePayload::open(std::string_view path) noexcept {
    if (path.empty()) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }

    try {
        std::shared_ptr<FilePayload> file(new FilePayload());
        file->path_ = std::string(path);

        file->fd_ = ::open(file->path_.c_str(), O_RDONLY | O_CLOEXEC);
        if (file->fd_ < 0) {
            return std::unexpected(errno_to_error_code(errno));
        }

        struct stat st{};
        if (::fstat(file->fd_, &st) != 0) {
            return std::unexpected(errno_to_error_code(errno));
        }
        if (!S_ISREG(st.st_mode)) {
            return std::unexpected(make_error_code(DiskErrc::not_a_file));
        }

        file->size_ = static_cast<std::uint64_t>(st.st_size);
        file->name_ = base_name(path);
        file->content_type_ = content_type_for(path);
        return file;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::allocation_failed));
    }
}

FilePayload::~FilePayload() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

std::expected<std::vector<std::byte>, std::error_code>
FilePayload::read(std::uint64_t offset, std::size_t length) const noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }
    if (offset > size_ || length > size_ - offset) {
        return std::unexpected(make_error_code(DiskErrc::short_read));
    }

    std::vector<std::byte> buffer;
    try {
        buffer.resize(length);
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::allocation_failed));
    }

    std::size_t done = 0;
    while (done < length) {
        auto n = ::pread(fd_, buffer.data() + done, length - done,
                         static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_to_error_code(errno));
        }
        if (n == 0) {
            // File shrank after open
            return std::unexpected(make_error_code(DiskErrc::short_read));
        }
        done += static_cast<std::size_t>(n);
    }
    return buffer;
}

} // namespace uplift::disk
