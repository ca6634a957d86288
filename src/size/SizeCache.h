#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace treenav {

enum SizeState {
    SIZE_ABSENT = 0,
    SIZE_PENDING,
    SIZE_RESOLVED
};

// ============================================================================
// SizeCache - recursive byte totals of directories, per session
//
// An entry is created pending when a size is first requested and becomes
// resolved when the worker reports. Entries are never removed. Only the
// interactive thread touches the cache.
// ============================================================================

class SizeCache {
public:
    SizeState state(const std::string& path) const;
    bool contains(const std::string& path) const { return entries_.count(path) > 0; }

    // Resolved size, if any.
    std::optional<uint64_t> bytes(const std::string& path) const;

    // Create a pending entry. Returns false if the path already has one.
    bool markPending(const std::string& path);

    void resolve(const std::string& path, uint64_t bytes);

    size_t size() const { return entries_.size(); }

private:
    std::unordered_map<std::string, std::optional<uint64_t>> entries_;
};

} // namespace treenav
