#include "size/SizeCache.h"

namespace treenav {

SizeState SizeCache::state(const std::string& path) const {
    auto it = entries_.find(path);
    if (it == entries_.end()) {
        return SIZE_ABSENT;
    }
    return it->second.has_value() ? SIZE_RESOLVED : SIZE_PENDING;
}

std::optional<uint64_t> SizeCache::bytes(const std::string& path) const {
    auto it = entries_.find(path);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SizeCache::markPending(const std::string& path) {
    return entries_.emplace(path, std::nullopt).second;
}

void SizeCache::resolve(const std::string& path, uint64_t bytes) {
    entries_[path] = bytes;
}

} // namespace treenav
