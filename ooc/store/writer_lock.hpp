#pragma once

#include "ooc/core/macros.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_set>

// =============================================================================
// FILE: ooc/store/writer_lock.hpp
// BRIEF: Exclusive writer ownership of a dataset directory
//
// Two layers:
//   - WriterRegistry: process-wide set of destinations with an active writer
//   - Lock file:      `.ooc.lock` created with O_CREAT|O_EXCL, holding the pid
//                     of the owning process
//
// A lock file is stale when its pid is dead, or when it holds no pid and is
// older than kEmptyLockGrace (the owner died between create and write).
// =============================================================================

namespace ooc::store {

inline constexpr const char* kLockFileName = ".ooc.lock";
inline constexpr std::chrono::seconds kEmptyLockGrace{10};

class WriterRegistry {
public:
    static WriterRegistry& instance() {
        static WriterRegistry registry;
        return registry;
    }

    /// False if `key` already has a writer.
    bool try_acquire(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_.insert(key).second;
    }

    void release(const std::string& key) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(key);
    }

    OOC_NODISCARD bool is_active(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_.count(key) != 0;
    }

private:
    WriterRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_set<std::string> active_;
};

/// Normalized registry key for a destination directory.
std::string writer_key(const std::filesystem::path& destination);

/// True if `dir` has a lock file whose owning process is still running.
bool lock_file_held(const std::filesystem::path& dir);

/// Move-only ownership of a destination. Creates the directory if needed.
class WriterLock {
public:
    WriterLock() noexcept = default;

    /// Throws ConcurrentWriteError if another writer, in this process or
    /// another, holds the destination; IOError if the directory or lock
    /// file cannot be created.
    static WriterLock acquire(const std::filesystem::path& destination);

    ~WriterLock() { release(); }

    WriterLock(WriterLock&& other) noexcept;
    WriterLock& operator=(WriterLock&& other) noexcept;

    WriterLock(const WriterLock&) = delete;
    WriterLock& operator=(const WriterLock&) = delete;

    OOC_NODISCARD bool owns() const noexcept { return !key_.empty(); }
    OOC_NODISCARD const std::filesystem::path& directory() const noexcept { return dir_; }

    /// Remove the lock file and leave the registry.
    void release() noexcept;

private:
    std::string key_;
    std::filesystem::path dir_;
};

} // namespace ooc::store
