#include "relaysave/network/record_store.hpp"
#include "relaysave/core/logger.hpp"
#include <boost/asio/post.hpp>
#include <sqlite3.h>
#include <fstream>
#include <sstream>
#include <algorithm>

namespace relaysave::network {

namespace {

std::string placeholders(size_t count) {
    std::string result;
    for (size_t i = 0; i < count; ++i) {
        result += (i == 0) ? "?" : ",?";
    }
    return result;
}

}

struct RecordStore::SubscriptionState {
    RecordFilter filter;
    SubscriptionHandlers handlers;
    std::mutex mutex;
    bool closed = false;
};

class RecordStore::StoreSubscription : public Subscription {
public:
    explicit StoreSubscription(std::shared_ptr<SubscriptionState> state)
        : state_(std::move(state)) {}
    
    ~StoreSubscription() override {
        close();
    }
    
    void close() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->closed = true;
    }
    
    bool is_closed() const override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->closed;
    }

private:
    std::shared_ptr<SubscriptionState> state_;
};

RecordStore::RecordStore(const std::filesystem::path& db_path, size_t worker_threads)
    : db_path_(db_path), db_(nullptr), pool_(std::max<size_t>(worker_threads, 1)) {
}

RecordStore::~RecordStore() {
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        for (auto& weak : subscriptions_) {
            if (auto state = weak.lock()) {
                std::lock_guard<std::mutex> state_lock(state->mutex);
                state->closed = true;
            }
        }
        subscriptions_.clear();
    }
    
    pool_.join();
    
    if (db_) {
        sqlite3_close(db_);
    }
}

bool RecordStore::initialize() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    
    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to open record store {}: {}", db_path_.string(), sqlite3_errmsg(db_));
        return false;
    }
    
    return create_tables();
}

bool RecordStore::create_tables() {
    const char* create_records_table = R"(
        CREATE TABLE IF NOT EXISTS records (
            id TEXT PRIMARY KEY,
            author TEXT NOT NULL,
            kind INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            tags TEXT NOT NULL,
            content TEXT NOT NULL
        );
    )";
    
    const char* create_indexes = R"(
        CREATE INDEX IF NOT EXISTS idx_records_author_kind ON records(author, kind);
        CREATE INDEX IF NOT EXISTS idx_records_created_at ON records(created_at);
    )";
    
    char* error_msg = nullptr;
    
    int result = sqlite3_exec(db_, create_records_table, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to create records table: {}", error_msg ? error_msg : "unknown");
        sqlite3_free(error_msg);
        return false;
    }
    
    result = sqlite3_exec(db_, create_indexes, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to create record indexes: {}", error_msg ? error_msg : "unknown");
        sqlite3_free(error_msg);
        return false;
    }
    
    return true;
}

bool RecordStore::publish(const Record& record) {
    bool inserted = false;
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        if (!insert_record(record, inserted) || !inserted) {
            return false;
        }
    }
    
    std::vector<std::shared_ptr<SubscriptionState>> targets;
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        auto expired = std::remove_if(subscriptions_.begin(), subscriptions_.end(),
            [](const std::weak_ptr<SubscriptionState>& weak) { return weak.expired(); });
        subscriptions_.erase(expired, subscriptions_.end());
        
        for (auto& weak : subscriptions_) {
            auto state = weak.lock();
            if (state && state->filter.matches(record)) {
                targets.push_back(std::move(state));
            }
        }
    }
    
    for (auto& state : targets) {
        boost::asio::post(pool_, [state, record]() {
            deliver(state, record);
        });
    }
    
    return true;
}

bool RecordStore::insert_record(const Record& record, bool& out_inserted) {
    out_inserted = false;
    if (!db_) {
        return false;
    }
    
    const char* insert_sql = R"(
        INSERT OR IGNORE INTO records (id, author, kind, created_at, tags, content)
        VALUES (?, ?, ?, ?, ?, ?);
    )";
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to prepare insert: {}", sqlite3_errmsg(db_));
        return false;
    }
    
    auto tags = nlohmann::json(record.tags).dump();
    
    sqlite3_bind_text(stmt, 1, record.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, record.author.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 3, record.kind);
    sqlite3_bind_int64(stmt, 4, record.created_at);
    sqlite3_bind_text(stmt, 5, tags.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, record.content.c_str(), -1, SQLITE_TRANSIENT);
    
    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        LOG_ERROR("Failed to store record {}: {}", record.id, sqlite3_errmsg(db_));
        return false;
    }
    
    out_inserted = sqlite3_changes(db_) > 0;
    return true;
}

bool RecordStore::import_file(const std::filesystem::path& path, ImportStats& out_stats) {
    out_stats = ImportStats{};
    
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Cannot open {}", path.string());
        return false;
    }
    
    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        
        Record record;
        try {
            record = Record::from_json(nlohmann::json::parse(line));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Skipping line {} of {}: {}", line_number, path.string(), e.what());
            out_stats.skipped++;
            continue;
        }
        
        if (publish(record)) {
            out_stats.imported++;
        } else {
            out_stats.duplicates++;
        }
    }
    
    LOG_INFO("Imported {} records from {} ({} duplicates, {} skipped)",
             out_stats.imported, path.string(), out_stats.duplicates, out_stats.skipped);
    return true;
}

size_t RecordStore::count() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return 0;
    }
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM records;", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    
    size_t total = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return total;
}

bool RecordStore::query(const std::vector<std::string>& endpoints,
                        const RecordFilter& filter,
                        std::vector<Record>& out_records) {
    LOG_TRACE("Store query via {} endpoint(s): {}", endpoints.size(), filter.describe());
    return select_records(filter, out_records);
}

bool RecordStore::select_records(const RecordFilter& filter, std::vector<Record>& out_records) {
    out_records.clear();
    
    std::ostringstream sql;
    sql << "SELECT id, author, kind, created_at, tags, content FROM records WHERE 1 = 1";
    if (!filter.kinds.empty()) {
        sql << " AND kind IN (" << placeholders(filter.kinds.size()) << ")";
    }
    if (!filter.authors.empty()) {
        sql << " AND author IN (" << placeholders(filter.authors.size()) << ")";
    }
    sql << " ORDER BY created_at DESC, rowid DESC;";
    auto statement = sql.str();
    
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) {
        return false;
    }
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, statement.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Failed to prepare query: {}", sqlite3_errmsg(db_));
        return false;
    }
    
    int parameter = 1;
    for (auto kind : filter.kinds) {
        sqlite3_bind_int64(stmt, parameter++, kind);
    }
    for (const auto& author : filter.authors) {
        sqlite3_bind_text(stmt, parameter++, author.c_str(), -1, SQLITE_TRANSIENT);
    }
    
    int result;
    while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
        Record record;
        record.id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        record.author = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        record.kind = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 2));
        record.created_at = sqlite3_column_int64(stmt, 3);
        record.content = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 5));
        
        try {
            nlohmann::json::parse(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 4)))
                .get_to(record.tags);
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Stored record {} has unreadable tags: {}", record.id, e.what());
            continue;
        }
        
        if (!filter.matches(record)) {
            continue;
        }
        
        out_records.push_back(std::move(record));
        if (filter.limit && out_records.size() >= *filter.limit) {
            result = SQLITE_DONE;
            break;
        }
    }
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        LOG_ERROR("Query failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    
    return true;
}

std::unique_ptr<Subscription> RecordStore::subscribe(const std::vector<std::string>& endpoints,
                                                     const RecordFilter& filter,
                                                     SubscriptionHandlers handlers) {
    auto state = std::make_shared<SubscriptionState>();
    state->filter = filter;
    state->filter.limit.reset();
    state->handlers = std::move(handlers);
    
    {
        std::lock_guard<std::mutex> lock(subscriptions_mutex_);
        subscriptions_.push_back(state);
    }
    
    LOG_DEBUG("Subscription opened via {} endpoint(s): {}", endpoints.size(), filter.describe());
    
    boost::asio::post(pool_, [this, state]() {
        std::vector<Record> stored;
        if (!select_records(state->filter, stored)) {
            LOG_WARN("Replay failed for subscription {}", state->filter.describe());
        }
        
        for (const auto& record : stored) {
            deliver(state, record);
        }
        
        std::lock_guard<std::mutex> lock(state->mutex);
        if (!state->closed && state->handlers.on_end_of_initial_results) {
            state->handlers.on_end_of_initial_results();
        }
    });
    
    return std::make_unique<StoreSubscription>(state);
}

void RecordStore::deliver(const std::shared_ptr<SubscriptionState>& state, const Record& record) {
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->closed || !state->handlers.on_record) {
        return;
    }
    
    try {
        state->handlers.on_record(record);
    } catch (const std::exception& e) {
        LOG_ERROR("Record handler failed for {}: {}", record.id, e.what());
    }
}

}
