#pragma once

#include "record_source.hpp"
#include <boost/asio/thread_pool.hpp>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

struct sqlite3;

namespace relaysave::network {

struct ImportStats {
    size_t imported = 0;
    size_t duplicates = 0;
    size_t skipped = 0;
};

// Local, persistent record source. Subscriptions replay stored matches on a
// worker pool, signal the end of initial results, then receive records as
// they are published until closed.
class RecordStore : public RecordSource {
public:
    explicit RecordStore(const std::filesystem::path& db_path, size_t worker_threads = 2);
    ~RecordStore() override;
    
    RecordStore(const RecordStore&) = delete;
    RecordStore& operator=(const RecordStore&) = delete;
    
    bool initialize();
    
    // False when the id is already stored or the insert failed.
    bool publish(const Record& record);
    
    // One record JSON object per line. Malformed lines are skipped.
    bool import_file(const std::filesystem::path& path, ImportStats& out_stats);
    
    size_t count();
    
    bool query(const std::vector<std::string>& endpoints,
               const RecordFilter& filter,
               std::vector<Record>& out_records) override;
    
    std::unique_ptr<Subscription> subscribe(const std::vector<std::string>& endpoints,
                                            const RecordFilter& filter,
                                            SubscriptionHandlers handlers) override;

private:
    struct SubscriptionState;
    class StoreSubscription;
    
    std::filesystem::path db_path_;
    sqlite3* db_;
    std::mutex db_mutex_;
    
    std::vector<std::weak_ptr<SubscriptionState>> subscriptions_;
    std::mutex subscriptions_mutex_;
    
    boost::asio::thread_pool pool_;
    
    bool create_tables();
    bool insert_record(const Record& record, bool& out_inserted);
    bool select_records(const RecordFilter& filter, std::vector<Record>& out_records);
    
    static void deliver(const std::shared_ptr<SubscriptionState>& state, const Record& record);
};

}
