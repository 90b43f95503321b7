#include "fs.hpp"

#include <cerrno>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>
#include <fmt/core.h>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace antig::adapters::fs {

namespace {

constexpr std::size_t buffer_size = 64 * 1024;

class UniqueFd {
public:
    explicit UniqueFd(int fd = -1) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    [[nodiscard]] int get() const { return fd_; }
    [[nodiscard]] bool valid() const { return fd_ >= 0; }

    // close() на записываемом файле может сообщить об отложенной ошибке записи
    auto close() -> int {
        int rc = 0;
        if (fd_ >= 0) {
            rc = ::close(fd_);
            fd_ = -1;
        }
        return rc;
    }

    void reset() { (void)close(); }

private:
    int fd_;
};

auto last_error() -> std::error_code {
    return {errno, std::system_category()};
}

// O_NONBLOCK: open() на FIFO без писателя иначе не вернётся
auto open_source(const std::filesystem::path& src) -> infra::Result<UniqueFd> {
    UniqueFd fd{::open(src.c_str(), O_RDONLY | O_CLOEXEC | O_NONBLOCK)};
    if (!fd.valid()) {
        return std::unexpected(infra::error_from_code(
            last_error(), fmt::format("cannot open `{}` for reading.", src.string())));
    }

    struct stat sb{};
    if (::fstat(fd.get(), &sb) == -1) {
        return std::unexpected(infra::error_from_code(
            last_error(), fmt::format("cannot stat `{}`.", src.string())));
    }
    if (!S_ISREG(sb.st_mode)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Io,
            fmt::format("`{}` is not a regular file.", src.string())));
    }
    return fd;
}

auto create_destination(const std::filesystem::path& dst) -> infra::Result<UniqueFd> {
    UniqueFd fd{::open(dst.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644)};
    if (!fd.valid()) {
        return std::unexpected(infra::error_from_code(
            last_error(), fmt::format("cannot create `{}`.", dst.string())));
    }
    return fd;
}

auto write_all(int fd, const char* data, std::size_t size) -> std::error_code {
    while (size > 0) {
        const ssize_t written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            return last_error();
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
    return {};
}

// Недописанный файл удаляем, чтобы он не выглядел готовым
auto fail_and_remove(const std::filesystem::path& dst, const std::error_code& ec,
                     std::string_view what) -> infra::Error {
    std::error_code ignored;
    std::filesystem::remove(dst, ignored);
    return infra::error_from_code(ec, fmt::format("{} `{}`.", what, dst.string()));
}

} // namespace

auto select_strategy(std::uintmax_t file_size) -> CopyStrategy {
    if (file_size < 1'000'000) return CopyStrategy::Buffered;   // < 1 MB
    return CopyStrategy::MMap;
}

// =============== Buffered I/O ===============
auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::Result<std::uint64_t> {
    auto in = open_source(src);
    if (!in) return std::unexpected(std::move(in.error()));

    auto out = create_destination(dst);
    if (!out) return std::unexpected(std::move(out.error()));

    std::vector<char> buffer(buffer_size);
    std::uint64_t total = 0;
    for (;;) {
        const ssize_t n = ::read(in->get(), buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            auto ec = last_error();
            out->reset();
            return std::unexpected(fail_and_remove(dst, ec, "read failed while copying into"));
        }
        if (n == 0) break;
        if (auto ec = write_all(out->get(), buffer.data(), static_cast<std::size_t>(n))) {
            out->reset();
            return std::unexpected(fail_and_remove(dst, ec, "write failed for"));
        }
        total += static_cast<std::uint64_t>(n);
    }

    if (out->close() != 0) {
        return std::unexpected(fail_and_remove(dst, last_error(), "close failed for"));
    }
    return total;
}

// =============== Memory-mapped I/O ===============
auto copy_file_mmap(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::Result<std::uint64_t> {
    auto in = open_source(src);
    if (!in) return std::unexpected(std::move(in.error()));

    struct stat sb{};
    if (::fstat(in->get(), &sb) == -1) {
        return std::unexpected(infra::error_from_code(
            last_error(), fmt::format("cannot stat `{}`.", src.string())));
    }
    const auto size = static_cast<std::size_t>(sb.st_size);
    if (size == 0) {
        return copy_file_buffered(src, dst);
    }

    void* src_map = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, in->get(), 0);
    if (src_map == MAP_FAILED) {
        // Не все файловые системы поддерживают mmap
        return copy_file_buffered(src, dst);
    }
    (void)::madvise(src_map, size, MADV_SEQUENTIAL);

    auto out = create_destination(dst);
    if (!out) {
        ::munmap(src_map, size);
        return std::unexpected(std::move(out.error()));
    }

    auto ec = write_all(out->get(), static_cast<const char*>(src_map), size);
    ::munmap(src_map, size);
    if (ec) {
        out->reset();
        return std::unexpected(fail_and_remove(dst, ec, "write failed for"));
    }
    if (out->close() != 0) {
        return std::unexpected(fail_and_remove(dst, last_error(), "close failed for"));
    }
    return static_cast<std::uint64_t>(size);
}

// =============== Unified copy_file ===============
auto copy_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    CopyStrategy strategy
) -> infra::Result<std::uint64_t> {
    switch (strategy) {
        case CopyStrategy::MMap:
            return copy_file_mmap(src, dst);
        case CopyStrategy::Buffered:
        default:
            return copy_file_buffered(src, dst);
    }
}

auto copy_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::Result<std::uint64_t> {
    std::error_code ec;
    const auto size = std::filesystem::file_size(src, ec);
    // Нерегулярный источник отвергнет open_source()
    return copy_file(src, dst, ec ? CopyStrategy::Buffered : select_strategy(size));
}

} // namespace antig::adapters::fs
