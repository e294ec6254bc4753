#pragma once

#include "../storage/chunk_cache.hpp"
#include "../storage/manifest.hpp"
#include "../storage/storage_types.hpp"
#include "../network/record_source.hpp"
#include "../core/cancellation.hpp"
#include "../core/config.hpp"
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace relaysave::transfer {

using ProgressCallback = storage::ProgressCallback;

struct CollectorOptions {
    std::chrono::milliseconds poll_interval{100};
    // Collection stops once no new chunk arrived for this long
    std::chrono::milliseconds inactivity_timeout{5000};
    std::chrono::milliseconds max_duration{300000};
    size_t id_batch_size = 200;
    size_t worker_threads = 2;
    
    static CollectorOptions from_config(const core::Config& config);
};

enum class CollectionOutcome {
    Complete,
    Inactive,
    CeilingReached,
    ShutDown
};

const char* to_string(CollectionOutcome outcome);

// Gathers the chunk records of one file from a live subscription, then by
// record id for hinted indices still missing. One collection runs per
// (owner key, content hash) at a time on the collector's own workers;
// concurrent callers wait for it, and a cancelled caller only stops waiting.
class ChunkCollector {
public:
    ChunkCollector(network::RecordSource& source, storage::ChunkCache& cache,
                   CollectorOptions options = {});
    ~ChunkCollector();
    
    ChunkCollector(const ChunkCollector&) = delete;
    ChunkCollector& operator=(const ChunkCollector&) = delete;
    
    // out_chunks is sorted by index with at most one record per index. It
    // may hold fewer than total_chunks records; that is not an error here.
    storage::FetchResult collect(const std::string& owner_key,
                                 const std::string& content_hash,
                                 std::uint32_t total_chunks,
                                 const std::vector<storage::ChunkInfo>& chunk_hints,
                                 const std::vector<std::string>& endpoints,
                                 const ProgressCallback& on_progress,
                                 const core::CancellationToken& cancel,
                                 std::vector<storage::ChunkRecord>& out_chunks);
    
    // Index from the "chunk" tag, else from the last ':' segment of the
    // "d" tag.
    static std::optional<std::uint32_t> parse_chunk_index(const network::Record& record);
    
    const CollectorOptions& options() const { return options_; }

private:
    struct Collection;
    
    network::RecordSource& source_;
    storage::ChunkCache& cache_;
    CollectorOptions options_;
    
    std::atomic<bool> shutting_down_;
    boost::asio::thread_pool pool_;
    
    void run_collection(const Collection& collection);
    CollectionOutcome await_subscription(const Collection& collection);
    void fetch_hinted_chunks(const Collection& collection);
    void accept_record(const Collection& collection, const network::Record& record,
                       const std::map<std::string, std::uint32_t>* index_by_id);
};

}
