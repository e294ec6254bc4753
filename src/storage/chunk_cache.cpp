#include "relaysave/storage/chunk_cache.hpp"

namespace relaysave::storage {

std::vector<ChunkRecord> ChunkCache::snapshot(const ChunkCacheKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ChunkRecord> chunks;
    
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return chunks;
    }
    
    chunks.reserve(it->second.chunks.size());
    for (const auto& [index, record] : it->second.chunks) {
        chunks.push_back(record);
    }
    return chunks;
}

size_t ChunkCache::distinct_count(const ChunkCacheKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it == entries_.end() ? 0 : it->second.chunks.size();
}

bool ChunkCache::contains(const ChunkCacheKey& key, std::uint32_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it != entries_.end() && it->second.chunks.count(index) > 0;
}

bool ChunkCache::insert_if_absent(const ChunkCacheKey& key, ChunkRecord record, size_t& out_distinct_count) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& chunks = entries_[key].chunks;
    auto index = record.index;
    bool inserted = chunks.emplace(index, std::move(record)).second;
    out_distinct_count = chunks.size();
    return inserted;
}

bool ChunkCache::try_begin(const ChunkCacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entries_[key];
    if (entry.in_flight) {
        return false;
    }
    entry.in_flight = true;
    return true;
}

void ChunkCache::finish(const ChunkCacheKey& key) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second.in_flight = false;
            if (it->second.chunks.empty()) {
                entries_.erase(it);
            }
        }
    }
    in_flight_done_.notify_all();
}

bool ChunkCache::is_in_flight(const ChunkCacheKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    return it != entries_.end() && it->second.in_flight;
}

bool ChunkCache::wait_while_in_flight(const ChunkCacheKey& key, const core::CancellationToken& cancel,
                                      std::chrono::milliseconds check_interval) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        auto it = entries_.find(key);
        if (it == entries_.end() || !it->second.in_flight) {
            return true;
        }
        if (cancel.is_cancelled()) {
            return false;
        }
        in_flight_done_.wait_for(lock, check_interval);
    }
}

std::uint64_t ChunkCache::add_listener(const ChunkCacheKey& key, ProgressCallback callback) {
    if (!callback) {
        return 0;
    }
    
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    auto id = ++next_listener_id_;
    listeners_[key][id] = std::move(callback);
    return id;
}

void ChunkCache::remove_listener(const ChunkCacheKey& key, std::uint64_t id) {
    if (id == 0) {
        return;
    }
    
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    auto it = listeners_.find(key);
    if (it == listeners_.end()) {
        return;
    }
    
    it->second.erase(id);
    if (it->second.empty()) {
        listeners_.erase(it);
    }
}

void ChunkCache::notify_progress(const ChunkCacheKey& key, size_t fetched, size_t total) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    auto it = listeners_.find(key);
    if (it == listeners_.end()) {
        return;
    }
    
    for (const auto& [id, callback] : it->second) {
        callback(fetched, total);
    }
}

size_t ChunkCache::listener_count(const ChunkCacheKey& key) const {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    auto it = listeners_.find(key);
    return it == listeners_.end() ? 0 : it->second.size();
}

void ChunkCache::evict(const ChunkCacheKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }
    
    if (it->second.in_flight) {
        it->second.chunks.clear();
    } else {
        entries_.erase(it);
    }
}

void ChunkCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.in_flight) {
            it->second.chunks.clear();
            ++it;
        } else {
            it = entries_.erase(it);
        }
    }
}

size_t ChunkCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}
