#include "vfs/content_cache.hpp"

namespace nbfs::vfs {

ContentCache::ContentCache(size_t max_entries, u64 max_bytes)
    : max_entries_(max_entries), max_bytes_(max_bytes) {}

std::string ContentCache::make_key(std::string_view path,
                                   fs::file_time_type loaded) {
    std::string key(path);
    key += '@';
    key += std::to_string(loaded.time_since_epoch().count());
    return key;
}

ContentCache::Content ContentCache::find(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
        return nullptr;
    }
    lru_.splice(lru_.begin(), lru_, it->second);
    return it->second->content;
}

void ContentCache::insert(const std::string& key, Content content) {
    if (max_entries_ == 0 || !content || content->size() > max_bytes_) {
        return;
    }

    std::lock_guard lock(mutex_);
    auto it = index_.find(key);
    if (it != index_.end()) {
        total_bytes_ -= it->second->content->size();
        lru_.erase(it->second);
        index_.erase(it);
    }

    total_bytes_ += content->size();
    lru_.push_front({key, std::move(content)});
    index_[key] = lru_.begin();
    evict_locked();
}

void ContentCache::evict_locked() {
    while (!lru_.empty() &&
           (lru_.size() > max_entries_ || total_bytes_ > max_bytes_)) {
        auto& victim = lru_.back();
        total_bytes_ -= victim.content->size();
        index_.erase(victim.key);
        lru_.pop_back();
    }
}

void ContentCache::clear() {
    std::lock_guard lock(mutex_);
    lru_.clear();
    index_.clear();
    total_bytes_ = 0;
}

size_t ContentCache::size() const {
    std::lock_guard lock(mutex_);
    return lru_.size();
}

u64 ContentCache::total_bytes() const {
    std::lock_guard lock(mutex_);
    return total_bytes_;
}

} // namespace nbfs::vfs
