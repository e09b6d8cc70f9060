#include "session_lock_table.hpp"

namespace harvest {

std::recursive_mutex& SessionLockTable::lock_for(const std::string& session_id) {
    std::lock_guard<std::mutex> guard(registry_mutex_);
    auto& slot = locks_[session_id];
    if (!slot) slot = std::make_unique<std::recursive_mutex>();
    return *slot;
}

size_t SessionLockTable::size() const {
    std::lock_guard<std::mutex> guard(registry_mutex_);
    return locks_.size();
}

} // namespace harvest
