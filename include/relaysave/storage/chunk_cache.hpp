#pragma once

#include "../core/cancellation.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

namespace relaysave::storage {

struct ChunkRecord {
    std::uint32_t index = 0;
    std::string record_id;
    std::string content;
    std::string encryption = "none";
};

using ProgressCallback = std::function<void(size_t fetched, size_t total)>;

struct ChunkCacheKey {
    std::string owner_key;
    std::string content_hash;
    
    bool operator<(const ChunkCacheKey& other) const {
        return std::tie(owner_key, content_hash) < std::tie(other.owner_key, other.content_hash);
    }
    
    std::string to_string() const { return owner_key + ":" + content_hash; }
};

// Chunks collected per (owner key, content hash) for the lifetime of a
// session, plus the in-flight marker that lets one collector run per key
// and the progress listeners of everyone waiting on that key. All
// operations are thread safe.
class ChunkCache {
public:
    ChunkCache() = default;
    
    ChunkCache(const ChunkCache&) = delete;
    ChunkCache& operator=(const ChunkCache&) = delete;
    
    // Sorted by index.
    std::vector<ChunkRecord> snapshot(const ChunkCacheKey& key) const;
    
    size_t distinct_count(const ChunkCacheKey& key) const;
    bool contains(const ChunkCacheKey& key, std::uint32_t index) const;
    
    // First record for an index wins. out_distinct_count is the count after
    // the call either way.
    bool insert_if_absent(const ChunkCacheKey& key, ChunkRecord record, size_t& out_distinct_count);
    
    // True when the caller became the collector for the key.
    bool try_begin(const ChunkCacheKey& key);
    void finish(const ChunkCacheKey& key);
    bool is_in_flight(const ChunkCacheKey& key) const;
    
    // Blocks until no collection runs for the key. False when the token was
    // cancelled first.
    bool wait_while_in_flight(const ChunkCacheKey& key, const core::CancellationToken& cancel,
                              std::chrono::milliseconds check_interval = std::chrono::milliseconds(50));
    
    // Listeners of a key hear every insert made by whichever collector runs
    // it. Returns 0 and registers nothing for an empty callback.
    std::uint64_t add_listener(const ChunkCacheKey& key, ProgressCallback callback);
    void remove_listener(const ChunkCacheKey& key, std::uint64_t id);
    // Callbacks run on the calling thread without the chunk lock held.
    void notify_progress(const ChunkCacheKey& key, size_t fetched, size_t total);
    size_t listener_count(const ChunkCacheKey& key) const;
    
    // Drops collected chunks; an in-flight marker survives until finish().
    void evict(const ChunkCacheKey& key);
    void clear();
    
    // Number of keys holding chunks or running a collection.
    size_t size() const;

private:
    struct Entry {
        std::map<std::uint32_t, ChunkRecord> chunks;
        bool in_flight = false;
    };
    
    mutable std::mutex mutex_;
    std::condition_variable in_flight_done_;
    std::map<ChunkCacheKey, Entry> entries_;
    
    mutable std::mutex listeners_mutex_;
    std::map<ChunkCacheKey, std::map<std::uint64_t, ProgressCallback>> listeners_;
    std::uint64_t next_listener_id_ = 0;
};

}
