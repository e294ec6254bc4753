#include <gtest/gtest.h>
#include "relaysave/storage/file_index.hpp"
#include "support/fake_record_source.hpp"

namespace relaysave::storage::test {

using relaysave::test::FakeRecordSource;
using relaysave::test::make_record;

namespace {

const std::string OWNER = "owner-key";

nlohmann::json index_page(std::uint32_t archive_number, std::uint32_t total_archives,
                          const std::vector<std::string>& file_names) {
    nlohmann::json entries = nlohmann::json::array();
    for (size_t i = 0; i < file_names.size(); ++i) {
        entries.push_back({
            {"file_hash", "hash-" + file_names[i]},
            {"file_name", file_names[i]},
            {"file_size", 1000 + i},
            {"uploaded_at", 1700000000 + static_cast<std::int64_t>(i)},
            {"encryption", i % 2 == 0 ? "none" : "nip44"}
        });
    }
    return {
        {"version", 2},
        {"entries", entries},
        {"archive_number", archive_number},
        {"total_archives", total_archives}
    };
}

network::Record index_record(const std::string& id, const std::string& identifier, std::int64_t created_at,
                             const std::string& content) {
    return make_record(id, OWNER, network::record_kind::INDEX, created_at, {{"d", identifier}}, content);
}

}

class IndexResolverTest : public ::testing::Test {
protected:
    FakeRecordSource source_;
    IndexResolver resolver_{source_, {"wss://relay.example"}};
};

TEST(IndexPageTest, ParsesEntries) {
    FileIndexPage page;
    auto result = parse_index_page(index_page(0, 3, {"a.txt", "b.bin"}).dump(), page);

    ASSERT_TRUE(result.success()) << result.message;
    EXPECT_EQ(page.version, 2);
    EXPECT_EQ(page.total_archives, 3u);
    ASSERT_EQ(page.entries.size(), 2u);
    EXPECT_EQ(page.entries[0].file_name, "a.txt");
    EXPECT_EQ(page.entries[0].encryption, EncryptionMode::None);
    EXPECT_EQ(page.entries[1].encryption, EncryptionMode::Sealed);
    EXPECT_EQ(page.entries[1].file_size, 1001u);
}

TEST(IndexPageTest, RejectsOtherVersions) {
    auto content = index_page(0, 0, {"a.txt"});
    content["version"] = 1;

    FileIndexPage page;
    EXPECT_EQ(parse_index_page(content.dump(), page).error, FetchError::UNSUPPORTED_VERSION);
}

TEST(IndexPageTest, MalformedContentIsParseError) {
    FileIndexPage page;
    EXPECT_EQ(parse_index_page("not json", page).error, FetchError::PARSE_ERROR);
    EXPECT_EQ(parse_index_page(R"({"version":2})", page).error, FetchError::PARSE_ERROR);

    auto unknown_mode = index_page(0, 0, {"a.txt"});
    unknown_mode["entries"][0]["encryption"] = "rot13";
    EXPECT_EQ(parse_index_page(unknown_mode.dump(), page).error, FetchError::PARSE_ERROR);
}

TEST(IndexPageTest, IdentifierForPage) {
    EXPECT_EQ(IndexResolver::identifier_for_page(1, 0), "nostrsave-index");
    EXPECT_EQ(IndexResolver::identifier_for_page(1, 5), "nostrsave-index");
    EXPECT_EQ(IndexResolver::identifier_for_page(2, 3), "nostrsave-index-archive-3");
    EXPECT_EQ(IndexResolver::identifier_for_page(4, 3), "nostrsave-index-archive-1");
    EXPECT_EQ(IndexResolver::identifier_for_page(5, 3), "");
    EXPECT_EQ(IndexResolver::identifier_for_page(0, 3), "");
    EXPECT_EQ(IndexResolver::identifier_for_page(2, 0), "");
}

TEST_F(IndexResolverTest, ResolvesCurrentPage) {
    source_.add(index_record("current", "nostrsave-index", 100, index_page(0, 0, {"a.txt"}).dump()));

    FileIndexPage page;
    auto result = resolver_.resolve(OWNER, 1, page);
    ASSERT_TRUE(result.success()) << result.message;
    ASSERT_EQ(page.entries.size(), 1u);
    EXPECT_EQ(page.entries[0].file_name, "a.txt");

    auto filters = source_.query_filters();
    ASSERT_EQ(filters.size(), 1u);
    EXPECT_EQ(filters[0].kinds, std::vector<std::uint32_t>{network::record_kind::INDEX});
    EXPECT_EQ(filters[0].authors, std::vector<std::string>{OWNER});
    EXPECT_EQ(filters[0].tags.at("d"), std::vector<std::string>{"nostrsave-index"});
    EXPECT_EQ(filters[0].limit.value_or(0), 1u);
}

TEST_F(IndexResolverTest, NewestReplicaWins) {
    source_.add(index_record("newer", "nostrsave-index", 200, index_page(0, 0, {"new.txt"}).dump()));
    source_.add(index_record("older", "nostrsave-index", 100, index_page(0, 0, {"old.txt"}).dump()));

    FileIndexPage page;
    ASSERT_TRUE(resolver_.resolve(OWNER, 1, page));
    ASSERT_EQ(page.entries.size(), 1u);
    EXPECT_EQ(page.entries[0].file_name, "new.txt");
}

TEST_F(IndexResolverTest, ArchivePageMapsFromTotal) {
    source_.add(index_record("current", "nostrsave-index", 300, index_page(0, 2, {"current.txt"}).dump()));
    source_.add(index_record("arch2", "nostrsave-index-archive-2", 200, index_page(2, 2, {"second.txt"}).dump()));
    source_.add(index_record("arch1", "nostrsave-index-archive-1", 100, index_page(1, 2, {"first.txt"}).dump()));

    FileIndexPage page;
    ASSERT_TRUE(resolver_.resolve(OWNER, 2, page));
    EXPECT_EQ(page.entries.at(0).file_name, "second.txt");

    ASSERT_TRUE(resolver_.resolve(OWNER, 3, page));
    EXPECT_EQ(page.entries.at(0).file_name, "first.txt");

    EXPECT_EQ(resolver_.resolve(OWNER, 4, page).error, FetchError::NOT_FOUND);
}

TEST_F(IndexResolverTest, ArchivePageWithKnownTotalSkipsCurrentLookup) {
    source_.add(index_record("arch1", "nostrsave-index-archive-1", 100, index_page(1, 1, {"first.txt"}).dump()));

    FileIndexPage page;
    ASSERT_TRUE(resolver_.resolve_with_total(OWNER, 2, 1, page));
    EXPECT_EQ(page.entries.at(0).file_name, "first.txt");
    EXPECT_EQ(source_.query_count(), 1u);
}

TEST_F(IndexResolverTest, MissingRecordIsNotFound) {
    FileIndexPage page;
    EXPECT_EQ(resolver_.resolve(OWNER, 1, page).error, FetchError::NOT_FOUND);
    EXPECT_EQ(resolver_.resolve(OWNER, 2, page).error, FetchError::NOT_FOUND);
    EXPECT_EQ(resolver_.resolve(OWNER, 0, page).error, FetchError::NOT_FOUND);

    source_.fail_queries(true);
    EXPECT_EQ(resolver_.resolve(OWNER, 1, page).error, FetchError::NOT_FOUND);
}

TEST_F(IndexResolverTest, UnparseableContentIsNotFound) {
    source_.add(index_record("broken", "nostrsave-index", 100, "{truncated"));

    FileIndexPage page;
    EXPECT_EQ(resolver_.resolve(OWNER, 1, page).error, FetchError::NOT_FOUND);
}

TEST_F(IndexResolverTest, OtherVersionIsReported) {
    auto content = index_page(0, 0, {"a.txt"});
    content["version"] = 1;
    source_.add(index_record("v1", "nostrsave-index", 100, content.dump()));

    FileIndexPage page;
    auto result = resolver_.resolve(OWNER, 1, page);
    EXPECT_EQ(result.error, FetchError::UNSUPPORTED_VERSION);
    EXPECT_NE(result.message.find("version 1"), std::string::npos);
}

}
