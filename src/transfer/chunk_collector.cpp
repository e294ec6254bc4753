#include "relaysave/transfer/chunk_collector.hpp"
#include "relaysave/core/logger.hpp"
#include <boost/asio/post.hpp>
#include <algorithm>
#include <charconv>
#include <mutex>
#include <set>
#include <thread>

namespace relaysave::transfer {

namespace {

struct SeenRecords {
    std::mutex mutex;
    std::set<std::string> ids;
};

std::optional<std::uint32_t> parse_leading_number(const std::string& text) {
    const char* first = text.data();
    const char* last = first + text.size();
    while (first != last && (*first == ' ' || *first == '\t')) {
        ++first;
    }
    
    std::uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr == first) {
        return std::nullopt;
    }
    return value;
}

}

struct ChunkCollector::Collection {
    storage::ChunkCacheKey key;
    std::uint32_t total_chunks = 0;
    std::vector<storage::ChunkInfo> hints;
    std::vector<std::string> endpoints;
    std::shared_ptr<SeenRecords> seen;
};

CollectorOptions CollectorOptions::from_config(const core::Config& config) {
    using std::chrono::milliseconds;
    CollectorOptions options;
    options.poll_interval = config.get_milliseconds("collector.poll_interval_ms", milliseconds(100), milliseconds(1));
    options.inactivity_timeout = config.get_milliseconds("collector.inactivity_timeout_ms", milliseconds(5000));
    options.max_duration = config.get_milliseconds("collector.max_duration_ms", milliseconds(300000));
    options.id_batch_size = static_cast<size_t>(std::max(1, config.get_int("collector.id_batch_size", 200)));
    return options;
}

const char* to_string(CollectionOutcome outcome) {
    switch (outcome) {
        case CollectionOutcome::Complete: return "complete";
        case CollectionOutcome::Inactive: return "inactivity timeout";
        case CollectionOutcome::CeilingReached: return "duration ceiling reached";
        case CollectionOutcome::ShutDown: return "shut down";
    }
    return "unknown";
}

ChunkCollector::ChunkCollector(network::RecordSource& source, storage::ChunkCache& cache,
                               CollectorOptions options)
    : source_(source)
    , cache_(cache)
    , options_(options)
    , shutting_down_(false)
    , pool_(std::max<size_t>(options.worker_threads, 1)) {
}

ChunkCollector::~ChunkCollector() {
    shutting_down_ = true;
    pool_.join();
}

std::optional<std::uint32_t> ChunkCollector::parse_chunk_index(const network::Record& record) {
    auto chunk_tag = record.tag_value(network::tag_name::CHUNK_INDEX);
    if (chunk_tag && !chunk_tag->empty()) {
        if (auto index = parse_leading_number(*chunk_tag)) {
            return index;
        }
    }
    
    auto identifier = record.tag_value(network::tag_name::IDENTIFIER);
    if (!identifier) {
        return std::nullopt;
    }
    
    auto separator = identifier->rfind(':');
    return parse_leading_number(separator == std::string::npos ? *identifier
                                                                : identifier->substr(separator + 1));
}

storage::FetchResult ChunkCollector::collect(const std::string& owner_key,
                                             const std::string& content_hash,
                                             std::uint32_t total_chunks,
                                             const std::vector<storage::ChunkInfo>& chunk_hints,
                                             const std::vector<std::string>& endpoints,
                                             const ProgressCallback& on_progress,
                                             const core::CancellationToken& cancel,
                                             std::vector<storage::ChunkRecord>& out_chunks) {
    storage::ChunkCacheKey key{owner_key, content_hash};
    
    if (cancel.is_cancelled()) {
        return storage::FetchResult(storage::FetchError::CANCELLED, "Cancelled before collection");
    }
    
    size_t cached = cache_.distinct_count(key);
    if (cached > 0 && on_progress) {
        on_progress(cached, total_chunks);
    }
    
    auto listener = cache_.add_listener(key, on_progress);
    bool started_collection = false;
    bool cancelled = false;
    
    while (true) {
        if (cache_.distinct_count(key) >= total_chunks) {
            LOG_DEBUG("All {} chunks of {} cached", total_chunks, content_hash);
            break;
        }
        
        // A collection this call started has ended incomplete; no retry.
        if (started_collection) {
            break;
        }
        
        if (cache_.try_begin(key)) {
            started_collection = true;
            LOG_DEBUG("Collecting {} chunks of {} from {} endpoint(s)", total_chunks, content_hash,
                      endpoints.size());
            
            Collection collection{key, total_chunks, chunk_hints, endpoints, std::make_shared<SeenRecords>()};
            boost::asio::post(pool_, [this, collection]() {
                run_collection(collection);
            });
        } else {
            LOG_DEBUG("Joining collection already running for {}", content_hash);
        }
        
        if (!cache_.wait_while_in_flight(key, cancel)) {
            cancelled = true;
            break;
        }
    }
    
    cache_.remove_listener(key, listener);
    
    if (cancelled) {
        LOG_INFO("Stopped waiting for chunks of {}: cancelled", content_hash);
        return storage::FetchResult(storage::FetchError::CANCELLED, "Chunk collection cancelled");
    }
    
    out_chunks = cache_.snapshot(key);
    LOG_DEBUG("Returning {}/{} chunks of {}", out_chunks.size(), total_chunks, content_hash);
    return storage::FetchResult();
}

void ChunkCollector::run_collection(const Collection& collection) {
    try {
        auto outcome = await_subscription(collection);
        size_t count = cache_.distinct_count(collection.key);
        LOG_INFO("Chunk subscription for {} ended: {} ({}/{} chunks)", collection.key.content_hash,
                 to_string(outcome), count, collection.total_chunks);
        
        if (count < collection.total_chunks && outcome != CollectionOutcome::ShutDown) {
            fetch_hinted_chunks(collection);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Chunk collection for {} failed: {}", collection.key.content_hash, e.what());
    }
    
    cache_.finish(collection.key);
}

CollectionOutcome ChunkCollector::await_subscription(const Collection& collection) {
    network::RecordFilter filter;
    filter.with_kind(network::record_kind::CHUNK)
          .with_author(collection.key.owner_key)
          .with_tag(network::tag_name::CONTENT_HASH, collection.key.content_hash);
    
    network::SubscriptionHandlers handlers;
    handlers.on_record = [this, &collection](const network::Record& record) {
        accept_record(collection, record, nullptr);
    };
    handlers.on_end_of_initial_results = [&collection]() {
        LOG_DEBUG("End of stored chunk records for {}", collection.key.content_hash);
    };
    
    auto subscription = source_.subscribe(collection.endpoints, filter, std::move(handlers));
    if (!subscription) {
        LOG_WARN("Could not subscribe to chunks of {}", collection.key.content_hash);
        return CollectionOutcome::Inactive;
    }
    
    auto start = std::chrono::steady_clock::now();
    auto last_progress = start;
    size_t last_count = cache_.distinct_count(collection.key);
    CollectionOutcome outcome;
    
    while (true) {
        size_t count = cache_.distinct_count(collection.key);
        auto now = std::chrono::steady_clock::now();
        
        if (count > last_count) {
            last_count = count;
            last_progress = now;
        }
        
        if (count >= collection.total_chunks) {
            outcome = CollectionOutcome::Complete;
            break;
        }
        if (shutting_down_) {
            outcome = CollectionOutcome::ShutDown;
            break;
        }
        if (now - last_progress >= options_.inactivity_timeout) {
            outcome = CollectionOutcome::Inactive;
            break;
        }
        if (now - start >= options_.max_duration) {
            outcome = CollectionOutcome::CeilingReached;
            break;
        }
        
        std::this_thread::sleep_for(options_.poll_interval);
    }
    
    subscription->close();
    return outcome;
}

void ChunkCollector::fetch_hinted_chunks(const Collection& collection) {
    std::map<std::string, std::uint32_t> index_by_id;
    std::vector<std::string> ids;
    
    for (const auto& hint : collection.hints) {
        if (hint.record_id.empty() || hint.index >= collection.total_chunks) {
            continue;
        }
        if (cache_.contains(collection.key, hint.index)) {
            continue;
        }
        if (index_by_id.emplace(hint.record_id, hint.index).second) {
            ids.push_back(hint.record_id);
        }
    }
    
    if (ids.empty()) {
        return;
    }
    
    LOG_INFO("Looking up {} missing chunks of {} by record id", ids.size(), collection.key.content_hash);
    
    size_t batch_size = std::max<size_t>(options_.id_batch_size, 1);
    for (size_t offset = 0; offset < ids.size(); offset += batch_size) {
        if (shutting_down_) {
            return;
        }
        
        auto last = std::min(offset + batch_size, ids.size());
        network::RecordFilter filter;
        filter.with_kind(network::record_kind::CHUNK)
              .with_author(collection.key.owner_key)
              .with_ids(std::vector<std::string>(ids.begin() + offset, ids.begin() + last));
        
        std::vector<network::Record> records;
        if (!source_.query(collection.endpoints, filter, records)) {
            LOG_WARN("Record id batch {}-{} failed", offset, last);
            continue;
        }
        
        LOG_DEBUG("Record id batch {}-{} returned {} records", offset, last, records.size());
        for (const auto& record : records) {
            accept_record(collection, record, &index_by_id);
        }
    }
}

void ChunkCollector::accept_record(const Collection& collection, const network::Record& record,
                                   const std::map<std::string, std::uint32_t>* index_by_id) {
    {
        std::lock_guard<std::mutex> lock(collection.seen->mutex);
        if (!collection.seen->ids.insert(record.id).second) {
            return;
        }
    }
    
    auto index = parse_chunk_index(record);
    if (!index && index_by_id) {
        auto it = index_by_id->find(record.id);
        if (it != index_by_id->end()) {
            index = it->second;
        }
    }
    
    if (!index) {
        LOG_TRACE("Skipping record {} without a chunk index", record.id);
        return;
    }
    if (*index >= collection.total_chunks) {
        LOG_DEBUG("Skipping record {}: index {} outside {} chunks", record.id, *index, collection.total_chunks);
        return;
    }
    
    storage::ChunkRecord chunk;
    chunk.index = *index;
    chunk.record_id = record.id;
    chunk.content = record.content;
    auto encryption = record.tag_value(network::tag_name::ENCRYPTION);
    if (encryption && !encryption->empty()) {
        chunk.encryption = *encryption;
    }
    
    size_t distinct = 0;
    if (cache_.insert_if_absent(collection.key, std::move(chunk), distinct)) {
        cache_.notify_progress(collection.key, distinct, collection.total_chunks);
    }
}

}
