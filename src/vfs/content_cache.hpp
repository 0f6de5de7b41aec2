#pragma once

#include "core/types.hpp"

#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace nbfs::vfs {

/// Size-bounded LRU of rendered file contents. Keys combine the canonical
/// path with the owning notebook's load timestamp, so a reloaded notebook
/// never hits stale content.
class ContentCache {
public:
    using Content = std::shared_ptr<const std::string>;

    static constexpr size_t DEFAULT_MAX_ENTRIES = 64;
    static constexpr u64 DEFAULT_MAX_BYTES = 64ull * 1024 * 1024;

    /// max_entries == 0 disables caching.
    explicit ContentCache(size_t max_entries = DEFAULT_MAX_ENTRIES,
                          u64 max_bytes = DEFAULT_MAX_BYTES);

    static std::string make_key(std::string_view path,
                                fs::file_time_type loaded);

    /// Returns nullptr on a miss.
    Content find(const std::string& key);

    /// Content larger than the byte budget is not stored.
    void insert(const std::string& key, Content content);

    void clear();

    size_t size() const;
    u64 total_bytes() const;

private:
    struct Entry {
        std::string key;
        Content content;
    };

    void evict_locked();

    size_t max_entries_;
    u64 max_bytes_;

    mutable std::mutex mutex_;
    std::list<Entry> lru_; // front = most recently used
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
    u64 total_bytes_ = 0;
};

} // namespace nbfs::vfs
