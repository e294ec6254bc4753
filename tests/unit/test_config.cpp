#include <gtest/gtest.h>
#include "relaysave/core/config.hpp"
#include "relaysave/transfer/chunk_collector.hpp"
#include <fstream>
#include <filesystem>

using namespace relaysave::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = "test_relaysave_config.txt";
    }
    
    void TearDown() override {
        Config::instance().clear();
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
    }
    
    std::string test_file;
};

TEST_F(ConfigTest, SetAndGet) {
    auto& config = Config::instance();
    
    config.set("store.path", "records.db");
    
    auto value = config.get("store.path");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "records.db");
}

TEST_F(ConfigTest, GetNonExistent) {
    EXPECT_FALSE(Config::instance().get("nonexistent.key").has_value());
}

TEST_F(ConfigTest, GetTypedValues) {
    auto& config = Config::instance();
    
    config.set("bool.true", "true");
    config.set("bool.false", "false");
    config.set("int.value", "42");
    config.set("string.value", "hello world");
    
    EXPECT_TRUE(config.get_bool("bool.true"));
    EXPECT_FALSE(config.get_bool("bool.false"));
    EXPECT_EQ(config.get_int("int.value"), 42);
    EXPECT_EQ(config.get_string("string.value"), "hello world");
}

TEST_F(ConfigTest, MalformedValuesFallBack) {
    auto& config = Config::instance();
    config.set("int.value", "42ms");
    config.set("bool.value", "maybe");

    EXPECT_EQ(config.get_int("int.value", 7), 7);
    EXPECT_TRUE(config.get_bool("bool.value", true));
    EXPECT_FALSE(config.get_bool("bool.value", false));
}

TEST_F(ConfigTest, MillisecondsClampToMinimum) {
    auto& config = Config::instance();
    config.set("collector.poll_interval_ms", "-5");

    EXPECT_EQ(config.get_milliseconds("collector.poll_interval_ms", std::chrono::milliseconds(100),
                                      std::chrono::milliseconds(1)),
              std::chrono::milliseconds(1));
    EXPECT_EQ(config.get_milliseconds("missing", std::chrono::milliseconds(250)),
              std::chrono::milliseconds(250));
}

TEST_F(ConfigTest, DefaultValues) {
    auto& config = Config::instance();
    
    EXPECT_FALSE(config.get_bool("nonexistent", false));
    EXPECT_TRUE(config.get_bool("nonexistent", true));
    EXPECT_EQ(config.get_int("nonexistent", 123), 123);
    EXPECT_EQ(config.get_string("nonexistent", "default"), "default");
}

TEST_F(ConfigTest, SetDefaults) {
    auto& config = Config::instance();
    config.set_defaults();
    
    EXPECT_EQ(config.get_string("log.level"), "info");
    EXPECT_EQ(config.get_int("collector.poll_interval_ms"), 100);
    EXPECT_EQ(config.get_int("collector.inactivity_timeout_ms"), 5000);
    EXPECT_EQ(config.get_int("collector.max_duration_ms"), 300000);
    EXPECT_EQ(config.get_int("collector.id_batch_size"), 200);
    EXPECT_FALSE(config.get_bool("fetch.verify_hashes", true));
    EXPECT_EQ(config.get_list("relays.default").size(), 4u);
}

TEST_F(ConfigTest, DefaultsKeepExistingValues) {
    auto& config = Config::instance();
    config.set("store.path", "mine.db");
    config.set_defaults();

    EXPECT_EQ(config.get_string("store.path"), "mine.db");
    EXPECT_EQ(config.get_string("log.file"), "relaysave.log");
}

TEST_F(ConfigTest, GetList) {
    auto& config = Config::instance();
    config.set("relays.default", " wss://a.example , ,wss://b.example,");
    
    auto relays = config.get_list("relays.default");
    ASSERT_EQ(relays.size(), 2u);
    EXPECT_EQ(relays[0], "wss://a.example");
    EXPECT_EQ(relays[1], "wss://b.example");
    
    EXPECT_TRUE(config.get_list("missing").empty());
}

TEST_F(ConfigTest, LoadFromFile) {
    std::ofstream file(test_file);
    file << "# Comment line\n";
    file << "store.path=records.db\n";
    file << "log.level = debug \n";
    file << "fetch.verify_hashes=true\n";
    file << "collector.id_batch_size=50\n";
    file << "no separator here\n";
    file << "   \n";
    file.close();
    
    auto& config = Config::instance();
    EXPECT_TRUE(config.load_from_file(test_file));
    
    EXPECT_EQ(config.get_string("store.path"), "records.db");
    EXPECT_EQ(config.get_string("log.level"), "debug");
    EXPECT_TRUE(config.get_bool("fetch.verify_hashes"));
    EXPECT_EQ(config.get_int("collector.id_batch_size"), 50);
    EXPECT_FALSE(config.get("no separator here").has_value());
}

TEST_F(ConfigTest, SaveToFile) {
    auto& config = Config::instance();
    config.set("test.key1", "value1");
    config.set("test.key2", "value2");
    config.set("log.level", "warn");
    
    EXPECT_TRUE(config.save_to_file(test_file));
    EXPECT_TRUE(std::filesystem::exists(test_file));
    
    Config new_config;
    EXPECT_TRUE(new_config.load_from_file(test_file));
    EXPECT_EQ(new_config.get_string("test.key1"), "value1");
    EXPECT_EQ(new_config.get_string("test.key2"), "value2");
    EXPECT_EQ(new_config.get_string("log.level"), "warn");
}

TEST_F(ConfigTest, CollectorOptionsFromConfig) {
    auto& config = Config::instance();
    config.set_defaults();
    config.set("collector.inactivity_timeout_ms", "250");
    config.set("collector.id_batch_size", "0");
    
    auto options = relaysave::transfer::CollectorOptions::from_config(config);
    EXPECT_EQ(options.poll_interval, std::chrono::milliseconds(100));
    EXPECT_EQ(options.inactivity_timeout, std::chrono::milliseconds(250));
    EXPECT_EQ(options.max_duration, std::chrono::milliseconds(300000));
    EXPECT_EQ(options.id_batch_size, 1u);
}
