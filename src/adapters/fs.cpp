#include "fs.hpp"

#include <cerrno>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace pcopy::adapters::fs {

namespace {

// Закрывает дескриптор при выходе из области видимости
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) ::close(fd_);
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] auto get() const -> int { return fd_; }
    [[nodiscard]] auto valid() const -> bool { return fd_ >= 0; }

    // close() на файле назначения может вернуть отложенную ошибку записи
    [[nodiscard]] auto close() -> int {
        const int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

auto read_some(int fd, char* buf, std::size_t len) -> ssize_t {
    for (;;) {
        const ssize_t n = ::read(fd, buf, len);
        if (n < 0 && errno == EINTR) continue;
        return n;
    }
}

auto write_all(int fd, const char* buf, std::size_t len) -> bool {
    while (len > 0) {
        const ssize_t n = ::write(fd, buf, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        buf += n;
        len -= static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace

auto classify(const std::filesystem::path& path) -> infra::Result<EntryInfo> {
    struct stat sb {};
    if (::lstat(path.c_str(), &sb) == -1) {
        const int err = errno;
        // ENOTDIR: компонент пути не каталог, записи нет
        if (err == ENOTDIR) {
            return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
                                   fmt::format("Cannot stat {}: not found", path.string()), path));
        }
        return std::unexpected(infra::from_errno(err, fmt::format("Cannot stat {}", path.string()), path));
    }

    if (S_ISREG(sb.st_mode)) {
        return EntryInfo{.kind = core::EntryKind::File, .size = static_cast<std::uint64_t>(sb.st_size)};
    }
    if (S_ISDIR(sb.st_mode)) {
        return EntryInfo{.kind = core::EntryKind::Directory};
    }
    if (S_ISLNK(sb.st_mode)) {
        std::error_code ec;
        auto target = std::filesystem::read_symlink(path, ec);
        if (ec) {
            return std::unexpected(infra::from_error_code(ec,
                                   fmt::format("Cannot read link {}", path.string()), path));
        }
        return EntryInfo{.kind = core::EntryKind::Symlink, .link_target = std::move(target)};
    }

    return std::unexpected(infra::make_error(infra::ErrorCode::UnsupportedType,
                           fmt::format("Unsupported file type: {}", path.string()), path));
}

auto copy_regular_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    std::size_t buffer_size,
    const ProgressFn& on_chunk,
    std::stop_token st
) -> infra::Result<std::uint64_t> {
    FileDescriptor in{::open(src.c_str(), O_RDONLY | O_CLOEXEC)};
    if (!in.valid()) {
        const int err = errno;
        return std::unexpected(infra::from_errno(err, "Cannot open source", src));
    }

    FileDescriptor out{::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)};
    if (!out.valid()) {
        const int err = errno;
        return std::unexpected(infra::from_errno(err, "Cannot create destination", dst));
    }

    std::vector<char> buffer(buffer_size);
    std::uint64_t copied = 0;

    for (;;) {
        const ssize_t n = read_some(in.get(), buffer.data(), buffer.size());
        if (n < 0) {
            const int err = errno;
            return std::unexpected(infra::Error{infra::ErrorCode::IOFailure,
                                   fmt::format("Read failed: {}", std::generic_category().message(err)),
                                   src, err});
        }
        if (n == 0) break;

        if (!write_all(out.get(), buffer.data(), static_cast<std::size_t>(n))) {
            const int err = errno;
            // ENOSPC, EPIPE и прочее — IOFailure; конфликт здесь невозможен
            return std::unexpected(infra::Error{infra::ErrorCode::IOFailure,
                                   fmt::format("Write failed: {}", std::generic_category().message(err)),
                                   dst, err});
        }
        copied += static_cast<std::uint64_t>(n);
        if (on_chunk) on_chunk(static_cast<std::uint64_t>(n));

        if (st.stop_requested()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
                                   fmt::format("Interrupted after {} bytes", copied), dst));
        }
    }

    if (out.close() == -1) {
        const int err = errno;
        return std::unexpected(infra::Error{infra::ErrorCode::IOFailure,
                               fmt::format("Close failed: {}", std::generic_category().message(err)),
                               dst, err});
    }
    return copied;
}

auto copy_symlink(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult {
    std::error_code ec;
    const auto target = std::filesystem::read_symlink(src, ec);
    if (ec) {
        return std::unexpected(infra::from_error_code(ec, "Cannot read link", src));
    }

    if (::symlink(target.c_str(), dst.c_str()) == 0) {
        return {};
    }

    const int err = errno;
    if (err == EEXIST) {
        auto existing = std::filesystem::read_symlink(dst, ec);
        if (!ec && existing == target) {
            spdlog::debug("Link {} already points to {}", dst.string(), target.string());
            return {};
        }
        return std::unexpected(infra::Error{infra::ErrorCode::DestinationConflict,
                               "Cannot create link: destination exists",
                               dst, err});
    }
    return std::unexpected(infra::from_errno(err, "Cannot create link", dst));
}

auto create_directory(const std::filesystem::path& dst) -> infra::VoidResult {
    if (::mkdir(dst.c_str(), 0755) == 0) {
        return {};
    }

    const int err = errno;
    if (err == EEXIST) {
        struct stat sb {};
        // stat, не lstat: ссылка на каталог годится как каталог
        if (::stat(dst.c_str(), &sb) == 0 && S_ISDIR(sb.st_mode)) {
            return {};
        }
        return std::unexpected(infra::Error{infra::ErrorCode::DestinationConflict,
                               "Cannot create directory: a non-directory exists at this path",
                               dst, err});
    }
    return std::unexpected(infra::from_errno(err, "Cannot create directory", dst));
}

} // namespace pcopy::adapters::fs
