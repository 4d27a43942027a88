#include "persist/atomic_file.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "util/log.hpp"

namespace persist {
namespace {

constexpr std::string_view kTempMarker = ".snapgate-tmp.";

std::atomic<std::uint64_t> g_temp_counter{0};

std::string make_temp_name(const std::filesystem::path& target) {
    std::string name = target.filename().string();
    name += kTempMarker;
    name += std::to_string(static_cast<long long>(::getpid()));
    name += '.';
    name += std::to_string(g_temp_counter.fetch_add(1, std::memory_order_relaxed));
    return (target.parent_path() / name).string();
}

IoResult write_all(int fd, std::string_view data) noexcept {
    const char* p = data.data();
    std::size_t left = data.size();
    while (left > 0) {
        const ssize_t ret = ::write(fd, p, left);
        if (ret < 0) {
            if (errno == EINTR) {
                continue;
            }
            return {false, errno};
        }
        p += ret;
        left -= static_cast<std::size_t>(ret);
    }
    return {true, 0};
}

IoResult sync_directory(const std::filesystem::path& dir) noexcept {
    const std::string d = dir.empty() ? std::string(".") : dir.string();
    const int fd = ::open(d.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return {false, errno};
    }
    IoResult res{true, 0};
    if (::fsync(fd) != 0 && errno != EINVAL) {
        res = {false, errno};
    }
    ::close(fd);
    return res;
}

IoResult write_temp(const std::string& tmp, std::string_view data) noexcept {
    const int fd = ::open(tmp.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return {false, errno};
    }
    IoResult res = write_all(fd, data);
    if (res.ok && ::fsync(fd) != 0) {
        res = {false, errno};
    }
    if (::close(fd) != 0 && res.ok) {
        res = {false, errno};
    }
    return res;
}

} // namespace

bool atomic_write(const std::filesystem::path& target, std::string_view data, core::EngineError& err) {
    const auto dir = target.parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            err.set(core::ErrorKind::StorageIO, "Failed to create directory", dir, ec.value());
            SNAPGATE_LOG_ERROR("mkdir %s failed: %s", dir.string().c_str(), ec.message().c_str());
            return false;
        }
    }

    const std::string tmp = make_temp_name(target);
    IoResult res = write_temp(tmp, data);
    if (!res.ok) {
        ::unlink(tmp.c_str());
        err.set(core::ErrorKind::StorageIO, "Failed to write temp file", tmp, res.error_code);
        SNAPGATE_LOG_ERROR("write %s failed: %s", tmp.c_str(), std::strerror(res.error_code));
        return false;
    }
    if (::rename(tmp.c_str(), target.c_str()) != 0) {
        const int e = errno;
        ::unlink(tmp.c_str());
        err.set(core::ErrorKind::StorageIO, "Failed to rename temp file into place", target, e);
        SNAPGATE_LOG_ERROR("rename %s -> %s failed: %s", tmp.c_str(), target.c_str(), std::strerror(e));
        return false;
    }
    res = sync_directory(dir);
    if (!res.ok) {
        err.set(core::ErrorKind::StorageIO, "Failed to sync directory", dir, res.error_code);
        SNAPGATE_LOG_ERROR("fsync dir %s failed: %s", dir.string().c_str(), std::strerror(res.error_code));
        return false;
    }
    return true;
}

ReadStatus read_file(const std::filesystem::path& path, std::string& out, core::EngineError& err) {
    out.clear();
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int e = errno;
        if (e == ENOENT) {
            return ReadStatus::NotFound;
        }
        err.set(core::ErrorKind::StorageIO, "Failed to open file", path, e);
        return ReadStatus::Error;
    }
    struct stat st {};
    if (::fstat(fd, &st) == 0 && st.st_size > 0) {
        out.reserve(static_cast<std::size_t>(st.st_size));
    }
    char buf[64 * 1024];
    while (true) {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int e = errno;
            ::close(fd);
            err.set(core::ErrorKind::StorageIO, "Failed to read file", path, e);
            return ReadStatus::Error;
        }
        if (n == 0) {
            break;
        }
        out.append(buf, static_cast<std::size_t>(n));
    }
    ::close(fd);
    return ReadStatus::Ok;
}

RemoveStatus remove_file(const std::filesystem::path& path, core::EngineError& err) {
    if (::unlink(path.c_str()) != 0) {
        const int e = errno;
        if (e == ENOENT) {
            return RemoveStatus::NotFound;
        }
        err.set(core::ErrorKind::StorageIO, "Failed to remove file", path, e);
        SNAPGATE_LOG_ERROR("unlink %s failed: %s", path.c_str(), std::strerror(e));
        return RemoveStatus::Error;
    }
    const IoResult res = sync_directory(path.parent_path());
    if (!res.ok) {
        err.set(core::ErrorKind::StorageIO, "Failed to sync directory", path.parent_path(), res.error_code);
        return RemoveStatus::Error;
    }
    return RemoveStatus::Removed;
}

bool file_exists(const std::filesystem::path& path) noexcept {
    struct stat st {};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool is_temp_name(std::string_view filename) noexcept {
    return filename.find(kTempMarker) != std::string_view::npos;
}

} // namespace persist
