#pragma once
// One reentrant lock per session id, created lazily. Constructed once and
// shared by every component that touches the same state directory.

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace harvest {

class SessionLockTable {
public:
    SessionLockTable() = default;
    SessionLockTable(const SessionLockTable&) = delete;
    SessionLockTable& operator=(const SessionLockTable&) = delete;

    // The returned mutex lives as long as the table
    std::recursive_mutex& lock_for(const std::string& session_id);

    // Convenience: acquire the session lock for the lifetime of the guard
    [[nodiscard]] std::unique_lock<std::recursive_mutex> acquire(const std::string& session_id) {
        return std::unique_lock<std::recursive_mutex>(lock_for(session_id));
    }

    size_t size() const;

private:
    mutable std::mutex registry_mutex_;
    std::map<std::string, std::unique_ptr<std::recursive_mutex>> locks_;
};

} // namespace harvest
