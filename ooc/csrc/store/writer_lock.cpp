#include "ooc/store/writer_lock.hpp"
#include "ooc/core/error.hpp"
#include "ooc/core/log.hpp"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <system_error>
#include <utility>

namespace ooc::store {

namespace {

// -1 when the lock file is missing or unreadable
long read_lock_pid(const std::filesystem::path& lock_path) {
    std::ifstream in(lock_path);
    long pid = -1;
    if (!(in >> pid)) {
        return -1;
    }
    return pid;
}

bool lock_owner_alive(const std::filesystem::path& lock_path) {
    const long pid = read_lock_pid(lock_path);
    if (pid > 0) {
        return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
    }
    // No pid: the owner may still be writing it, or died before it could
    std::error_code ec;
    const auto written = std::filesystem::last_write_time(lock_path, ec);
    if (ec) {
        return false;
    }
    return std::filesystem::file_time_type::clock::now() - written < kEmptyLockGrace;
}

enum class LockResult { Acquired, Held, Stale };

LockResult create_lock_file(const std::filesystem::path& lock_path) {
    int fd = ::open(lock_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (errno == EEXIST) {
            return lock_owner_alive(lock_path) ? LockResult::Held : LockResult::Stale;
        }
        throw IOError("Failed to create lock file " + lock_path.string() + ": " + std::strerror(errno));
    }
    const std::string pid = std::to_string(static_cast<long>(::getpid())) + "\n";
    ssize_t n = ::write(fd, pid.data(), pid.size());
    ::close(fd);
    if (n != static_cast<ssize_t>(pid.size())) {
        std::error_code ec;
        std::filesystem::remove(lock_path, ec);
        throw IOError("Failed to write lock file " + lock_path.string());
    }
    return LockResult::Acquired;
}

} // namespace

std::string writer_key(const std::filesystem::path& destination) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(destination, ec);
    if (ec) {
        return destination.lexically_normal().string();
    }
    auto canon = std::filesystem::weakly_canonical(abs, ec);
    auto key = (ec ? abs.lexically_normal() : canon).string();
    while (key.size() > 1 && key.back() == '/') {
        key.pop_back();
    }
    return key;
}

bool lock_file_held(const std::filesystem::path& dir) {
    const auto lock_path = dir / kLockFileName;
    std::error_code ec;
    if (!std::filesystem::exists(lock_path, ec)) {
        return false;
    }
    return lock_owner_alive(lock_path);
}

// =============================================================================
// WriterLock
// =============================================================================

WriterLock WriterLock::acquire(const std::filesystem::path& destination) {
    const std::string key = writer_key(destination);
    if (!WriterRegistry::instance().try_acquire(key)) {
        throw ConcurrentWriteError(destination.string());
    }

    WriterLock lock;
    lock.key_ = key;    // from here on the destructor releases the registry slot

    std::error_code ec;
    std::filesystem::create_directories(destination, ec);
    OOC_CHECK_IO(!ec, "Failed to create destination " + destination.string() + ": " + ec.message());

    const auto lock_path = destination / kLockFileName;
    LockResult result = create_lock_file(lock_path);
    if (result == LockResult::Stale) {
        OOC_LOG_WARN("Removing stale lock file %s", lock_path.c_str());
        std::filesystem::remove(lock_path, ec);
        OOC_CHECK_IO(!ec, "Failed to remove stale lock file " + lock_path.string());
        result = create_lock_file(lock_path);
    }
    if (result != LockResult::Acquired) {
        throw ConcurrentWriteError(destination.string());
    }

    lock.dir_ = destination;
    return lock;
}

WriterLock::WriterLock(WriterLock&& other) noexcept
    : key_(std::exchange(other.key_, std::string()))
    , dir_(std::exchange(other.dir_, std::filesystem::path()))
{}

WriterLock& WriterLock::operator=(WriterLock&& other) noexcept {
    if (this != &other) {
        release();
        key_ = std::exchange(other.key_, std::string());
        dir_ = std::exchange(other.dir_, std::filesystem::path());
    }
    return *this;
}

void WriterLock::release() noexcept {
    if (!dir_.empty()) {
        std::error_code ec;
        std::filesystem::remove(dir_ / kLockFileName, ec);
        if (ec) {
            OOC_LOG_WARN("Failed to remove lock file in %s: %s", dir_.c_str(), ec.message().c_str());
        }
        dir_.clear();
    }
    if (!key_.empty()) {
        WriterRegistry::instance().release(key_);
        key_.clear();
    }
}

} // namespace ooc::store
