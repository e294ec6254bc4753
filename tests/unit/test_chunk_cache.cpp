#include <gtest/gtest.h>
#include "relaysave/storage/chunk_cache.hpp"
#include <atomic>
#include <utility>
#include <vector>
#include <thread>

using namespace relaysave::storage;
using relaysave::core::CancellationToken;

namespace {

ChunkRecord chunk(std::uint32_t index, const std::string& content) {
    ChunkRecord record;
    record.index = index;
    record.record_id = "record-" + std::to_string(index) + "-" + content;
    record.content = content;
    return record;
}

}

class ChunkCacheTest : public ::testing::Test {
protected:
    ChunkCache cache_;
    ChunkCacheKey key_{"owner", "hash"};
};

TEST_F(ChunkCacheTest, FirstRecordPerIndexWins) {
    size_t count = 0;

    EXPECT_TRUE(cache_.insert_if_absent(key_, chunk(1, "first"), count));
    EXPECT_EQ(count, 1u);
    EXPECT_FALSE(cache_.insert_if_absent(key_, chunk(1, "second"), count));
    EXPECT_EQ(count, 1u);

    auto chunks = cache_.snapshot(key_);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].content, "first");
}

TEST_F(ChunkCacheTest, SnapshotIsSortedByIndex) {
    size_t count = 0;
    for (std::uint32_t index : {4u, 0u, 2u, 1u}) {
        cache_.insert_if_absent(key_, chunk(index, "c"), count);
    }

    auto chunks = cache_.snapshot(key_);
    ASSERT_EQ(chunks.size(), 4u);
    EXPECT_EQ(chunks[0].index, 0u);
    EXPECT_EQ(chunks[1].index, 1u);
    EXPECT_EQ(chunks[2].index, 2u);
    EXPECT_EQ(chunks[3].index, 4u);

    EXPECT_TRUE(cache_.contains(key_, 2));
    EXPECT_FALSE(cache_.contains(key_, 3));
    EXPECT_EQ(cache_.distinct_count(key_), 4u);
}

TEST_F(ChunkCacheTest, KeysAreIndependent) {
    size_t count = 0;
    ChunkCacheKey other_owner{"someone", "hash"};

    cache_.insert_if_absent(key_, chunk(0, "mine"), count);
    cache_.insert_if_absent(other_owner, chunk(0, "theirs"), count);

    EXPECT_EQ(cache_.snapshot(key_)[0].content, "mine");
    EXPECT_EQ(cache_.snapshot(other_owner)[0].content, "theirs");
    EXPECT_EQ(cache_.size(), 2u);
    EXPECT_EQ(key_.to_string(), "owner:hash");
}

TEST_F(ChunkCacheTest, OneCollectorPerKey) {
    EXPECT_TRUE(cache_.try_begin(key_));
    EXPECT_TRUE(cache_.is_in_flight(key_));
    EXPECT_FALSE(cache_.try_begin(key_));

    cache_.finish(key_);
    EXPECT_FALSE(cache_.is_in_flight(key_));
    // Nothing was collected, so the entry is gone
    EXPECT_EQ(cache_.size(), 0u);

    EXPECT_TRUE(cache_.try_begin(key_));
    cache_.finish(key_);
}

TEST_F(ChunkCacheTest, WaitReturnsWhenCollectionFinishes) {
    ASSERT_TRUE(cache_.try_begin(key_));

    std::thread collector([this]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        size_t count = 0;
        cache_.insert_if_absent(key_, chunk(0, "late"), count);
        cache_.finish(key_);
    });

    CancellationToken cancel;
    EXPECT_TRUE(cache_.wait_while_in_flight(key_, cancel));
    EXPECT_EQ(cache_.distinct_count(key_), 1u);

    collector.join();
}

TEST_F(ChunkCacheTest, WaitStopsOnCancel) {
    ASSERT_TRUE(cache_.try_begin(key_));

    CancellationToken cancel;
    std::thread canceller([cancel]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        cancel.cancel();
    });

    EXPECT_FALSE(cache_.wait_while_in_flight(key_, cancel, std::chrono::milliseconds(5)));
    EXPECT_TRUE(cache_.is_in_flight(key_));

    canceller.join();
    cache_.finish(key_);
}

TEST_F(ChunkCacheTest, WaitWithoutCollectionReturnsImmediately) {
    CancellationToken cancel;
    cancel.cancel();
    EXPECT_TRUE(cache_.wait_while_in_flight(key_, cancel));
}

TEST_F(ChunkCacheTest, EvictKeepsInFlightMarker) {
    size_t count = 0;
    ASSERT_TRUE(cache_.try_begin(key_));
    cache_.insert_if_absent(key_, chunk(0, "a"), count);

    cache_.evict(key_);
    EXPECT_EQ(cache_.distinct_count(key_), 0u);
    EXPECT_TRUE(cache_.is_in_flight(key_));
    EXPECT_FALSE(cache_.try_begin(key_));

    cache_.finish(key_);
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(ChunkCacheTest, ClearDropsEverythingButRunningCollections) {
    size_t count = 0;
    ChunkCacheKey running{"owner", "running"};

    cache_.insert_if_absent(key_, chunk(0, "a"), count);
    ASSERT_TRUE(cache_.try_begin(running));
    cache_.insert_if_absent(running, chunk(0, "b"), count);

    cache_.clear();
    EXPECT_EQ(cache_.distinct_count(key_), 0u);
    EXPECT_EQ(cache_.distinct_count(running), 0u);
    EXPECT_EQ(cache_.size(), 1u);
    EXPECT_TRUE(cache_.is_in_flight(running));

    cache_.finish(running);
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(ChunkCacheTest, ConcurrentInsertsCountEachIndexOnce) {
    std::atomic<int> inserted{0};
    std::vector<std::thread> writers;

    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([this, t, &inserted]() {
            for (std::uint32_t index = 0; index < 100; ++index) {
                size_t count = 0;
                if (cache_.insert_if_absent(key_, chunk(index, "writer" + std::to_string(t)), count)) {
                    inserted++;
                }
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    EXPECT_EQ(inserted.load(), 100);
    EXPECT_EQ(cache_.distinct_count(key_), 100u);
}

TEST_F(ChunkCacheTest, ListenersHearProgressForTheirKeyOnly) {
    std::vector<std::pair<size_t, size_t>> heard;
    size_t other_calls = 0;

    auto id = cache_.add_listener(key_, [&](size_t fetched, size_t total) {
        heard.emplace_back(fetched, total);
    });
    cache_.add_listener({"owner", "other"}, [&](size_t, size_t) { ++other_calls; });
    EXPECT_NE(id, 0u);
    EXPECT_EQ(cache_.listener_count(key_), 1u);

    cache_.notify_progress(key_, 1, 4);
    cache_.notify_progress(key_, 2, 4);
    cache_.remove_listener(key_, id);
    cache_.notify_progress(key_, 3, 4);

    EXPECT_EQ(heard, (std::vector<std::pair<size_t, size_t>>{{1, 4}, {2, 4}}));
    EXPECT_EQ(other_calls, 0u);
    EXPECT_EQ(cache_.listener_count(key_), 0u);
}

TEST_F(ChunkCacheTest, EmptyListenerIsNotRegistered) {
    EXPECT_EQ(cache_.add_listener(key_, nullptr), 0u);
    EXPECT_EQ(cache_.listener_count(key_), 0u);
    cache_.remove_listener(key_, 0);
    cache_.notify_progress(key_, 1, 1);
}

TEST_F(ChunkCacheTest, ListenersSurviveEvictAndClear) {
    size_t calls = 0;
    cache_.add_listener(key_, [&](size_t, size_t) { ++calls; });

    cache_.evict(key_);
    cache_.clear();
    cache_.notify_progress(key_, 1, 2);

    EXPECT_EQ(calls, 1u);
}
