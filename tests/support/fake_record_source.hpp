#pragma once

#include "relaysave/network/record_source.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace relaysave::test {

// In-memory record source. Limits are ignored so callers see every replica.
// Subscriptions replay matching records on their own thread, optionally
// spaced out by delivery_delay, then signal the end of initial results.
class FakeRecordSource : public network::RecordSource {
public:
    class FakeSubscription : public network::Subscription {
    public:
        FakeSubscription(std::vector<network::Record> records, network::SubscriptionHandlers handlers,
                         std::chrono::milliseconds delay)
            : closed_(false) {
            worker_ = std::thread([this, records = std::move(records), handlers = std::move(handlers), delay]() {
                for (const auto& record : records) {
                    auto deadline = std::chrono::steady_clock::now() + delay;
                    while (!closed_ && std::chrono::steady_clock::now() < deadline) {
                        std::this_thread::sleep_for(std::chrono::milliseconds(1));
                    }
                    if (closed_) {
                        return;
                    }
                    if (handlers.on_record) {
                        handlers.on_record(record);
                    }
                }
                if (!closed_ && handlers.on_end_of_initial_results) {
                    handlers.on_end_of_initial_results();
                }
            });
        }

        ~FakeSubscription() override { close(); }

        void close() override {
            closed_ = true;
            std::lock_guard<std::mutex> lock(join_mutex_);
            if (worker_.joinable()) {
                worker_.join();
            }
        }

        bool is_closed() const override { return closed_; }

    private:
        std::atomic<bool> closed_;
        std::mutex join_mutex_;
        std::thread worker_;
    };

    void add(network::Record record) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(std::move(record));
    }

    bool query(const std::vector<std::string>& endpoints,
               const network::RecordFilter& filter,
               std::vector<network::Record>& out_records) override {
        std::lock_guard<std::mutex> lock(mutex_);
        query_filters_.push_back(filter);
        query_endpoints_.push_back(endpoints);

        out_records.clear();
        if (fail_queries_) {
            return false;
        }
        for (const auto& record : records_) {
            if (filter.matches(record)) {
                out_records.push_back(record);
            }
        }
        return true;
    }

    std::unique_ptr<network::Subscription> subscribe(const std::vector<std::string>& endpoints,
                                                     const network::RecordFilter& filter,
                                                     network::SubscriptionHandlers handlers) override {
        std::vector<network::Record> matching;
        std::chrono::milliseconds delay;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            subscribe_filters_.push_back(filter);
            subscribe_endpoints_.push_back(endpoints);
            if (!hidden_from_subscriptions_) {
                for (const auto& record : records_) {
                    if (filter.matches(record)) {
                        matching.push_back(record);
                    }
                }
            }
            delay = delivery_delay_;
        }
        return std::make_unique<FakeSubscription>(std::move(matching), std::move(handlers), delay);
    }

    void set_delivery_delay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delivery_delay_ = delay;
    }

    // Subscriptions deliver nothing; only id queries find records.
    void hide_from_subscriptions(bool hidden) {
        std::lock_guard<std::mutex> lock(mutex_);
        hidden_from_subscriptions_ = hidden;
    }

    void fail_queries(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_queries_ = fail;
    }

    size_t query_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return query_filters_.size();
    }

    size_t subscribe_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribe_filters_.size();
    }

    std::vector<network::RecordFilter> query_filters() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return query_filters_;
    }

    std::vector<std::vector<std::string>> subscribe_endpoints() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscribe_endpoints_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<network::Record> records_;
    std::vector<network::RecordFilter> query_filters_;
    std::vector<std::vector<std::string>> query_endpoints_;
    std::vector<network::RecordFilter> subscribe_filters_;
    std::vector<std::vector<std::string>> subscribe_endpoints_;
    std::chrono::milliseconds delivery_delay_{0};
    bool hidden_from_subscriptions_ = false;
    bool fail_queries_ = false;
};

inline network::Record make_record(const std::string& id, const std::string& author, std::uint32_t kind,
                                   std::int64_t created_at, std::vector<network::Tag> tags,
                                   std::string content) {
    network::Record record;
    record.id = id;
    record.author = author;
    record.kind = kind;
    record.created_at = created_at;
    record.tags = std::move(tags);
    record.content = std::move(content);
    return record;
}

inline network::Record make_chunk_record(const std::string& id, const std::string& author,
                                         const std::string& file_hash, std::uint32_t index,
                                         std::string content, const std::string& encryption = "none") {
    return make_record(id, author, network::record_kind::CHUNK, 1700000000 + index, {
        {"d", file_hash + ":" + std::to_string(index)},
        {"x", file_hash},
        {"chunk", std::to_string(index)},
        {"encryption", encryption}
    }, std::move(content));
}

inline network::Record make_manifest_record(const std::string& id, const std::string& author,
                                            const std::string& file_hash, std::int64_t created_at,
                                            const nlohmann::json& manifest) {
    return make_record(id, author, network::record_kind::MANIFEST, created_at, {
        {"d", file_hash},
        {"x", file_hash}
    }, manifest.dump());
}

}
