#include <gtest/gtest.h>
#include "selfcrypt/core/config.hpp"
#include "selfcrypt/storage/storage_config.hpp"
#include "selfcrypt/transfer/client_config.hpp"
#include <fstream>
#include <filesystem>

using namespace selfcrypt::core;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        test_file = "test_selfcrypt_config.txt";
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
    
    config.set("test.key", "test_value");
    
    auto value = config.get("test.key");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "test_value");
    EXPECT_TRUE(config.has("test.key"));
}

TEST_F(ConfigTest, GetNonExistent) {
    auto& config = Config::instance();
    
    EXPECT_FALSE(config.get("nonexistent.key").has_value());
    EXPECT_FALSE(config.has("nonexistent.key"));
}

TEST_F(ConfigTest, GetTypedValues) {
    auto& config = Config::instance();
    
    config.set("bool.true", "true");
    config.set("bool.yes", "YES");
    config.set("bool.false", "false");
    config.set("int.value", "42");
    config.set("uint64.value", "10737418240");
    config.set("string.value", "hello world");
    
    EXPECT_TRUE(config.get_bool("bool.true"));
    EXPECT_TRUE(config.get_bool("bool.yes"));
    EXPECT_FALSE(config.get_bool("bool.false"));
    EXPECT_EQ(config.get_int("int.value"), 42);
    EXPECT_EQ(config.get_uint64("uint64.value"), 10737418240ULL);
    EXPECT_EQ(config.get_string("string.value"), "hello world");
}

TEST_F(ConfigTest, MalformedNumbersFallBack) {
    auto& config = Config::instance();
    
    config.set("int.bad", "12abc");
    config.set("uint64.negative", "-5");
    config.set("uint64.empty", "");
    
    EXPECT_EQ(config.get_int("int.bad", 7), 7);
    EXPECT_EQ(config.get_uint64("uint64.negative", 9), 9u);
    EXPECT_EQ(config.get_uint64("uint64.empty", 3), 3u);
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
    
    EXPECT_EQ(config.get_uint64("selfcrypt.max_chunk_size"), 1048576u);
    EXPECT_EQ(config.get_uint64("selfcrypt.min_chunk_size"), 1024u);
    EXPECT_EQ(config.get_uint64("network.max_attempts"), 5u);
    EXPECT_TRUE(config.get_bool("network.skip_existing"));
    EXPECT_EQ(config.get_string("log.level"), "info");
}

TEST_F(ConfigTest, LoadFromFile) {
    std::ofstream file(test_file);
    file << "# Comment line\n";
    file << "key1=value1\n";
    file << "key2 = value2 \n";
    file << "\n";
    file << "bool.setting=true\n";
    file << "int.setting=100\n";
    file.close();
    
    auto& config = Config::instance();
    EXPECT_TRUE(config.load_from_file(test_file));
    
    EXPECT_EQ(config.get_string("key1"), "value1");
    EXPECT_EQ(config.get_string("key2"), "value2");
    EXPECT_TRUE(config.get_bool("bool.setting"));
    EXPECT_EQ(config.get_int("int.setting"), 100);
}

TEST_F(ConfigTest, LoadMissingFileFails) {
    EXPECT_FALSE(Config::instance().load_from_file("does_not_exist.conf"));
}

TEST_F(ConfigTest, SaveToFile) {
    auto& config = Config::instance();
    config.set("test.key1", "value1");
    config.set("test.key2", "value2");
    
    EXPECT_TRUE(config.save_to_file(test_file));
    EXPECT_TRUE(std::filesystem::exists(test_file));
    
    Config new_config;
    EXPECT_TRUE(new_config.load_from_file(test_file));
    EXPECT_EQ(new_config.get_string("test.key1"), "value1");
    EXPECT_EQ(new_config.get_string("test.key2"), "value2");
}

TEST_F(ConfigTest, ClientConfigFromDefaults) {
    Config config;
    config.set_defaults();
    
    auto client = selfcrypt::transfer::ClientConfig::from_config(config);
    
    EXPECT_EQ(client.encryption.chunking.max_chunk_size, 1024u * 1024u);
    EXPECT_EQ(client.encryption.chunking.min_chunk_size, 1024u);
    EXPECT_EQ(client.encryption.max_inline_map_bytes, 32u * 1024u);
    EXPECT_EQ(client.encryption.max_map_depth, 8u);
    EXPECT_EQ(client.network.retry.max_attempts, 5u);
    EXPECT_EQ(client.network.retry.initial_backoff.count(), 50);
    EXPECT_EQ(client.network.retry.max_backoff.count(), 2000);
    EXPECT_EQ(client.network.max_concurrent_requests, 8u);
    EXPECT_TRUE(client.network.skip_existing);
    EXPECT_EQ(client.worker_threads, 0u);
    EXPECT_TRUE(client.verify_checksum);
    EXPECT_TRUE(client.validate());
}

TEST_F(ConfigTest, ClientConfigOverrides) {
    Config config;
    config.set("selfcrypt.max_chunk_size", "4096");
    config.set("selfcrypt.min_chunk_size", "256");
    config.set("network.max_attempts", "2");
    config.set("network.skip_existing", "false");
    config.set("client.worker_threads", "3");
    
    auto client = selfcrypt::transfer::ClientConfig::from_config(config);
    
    EXPECT_EQ(client.encryption.chunking.max_chunk_size, 4096u);
    EXPECT_EQ(client.encryption.chunking.min_chunk_size, 256u);
    EXPECT_EQ(client.network.retry.max_attempts, 2u);
    EXPECT_FALSE(client.network.skip_existing);
    EXPECT_EQ(client.worker_threads, 3u);
    EXPECT_TRUE(client.validate());
}

TEST_F(ConfigTest, ClientConfigRejectsNonsense) {
    Config config;
    config.set("selfcrypt.max_chunk_size", "1000");
    config.set("selfcrypt.min_chunk_size", "800");
    EXPECT_FALSE(selfcrypt::transfer::ClientConfig::from_config(config).validate());
    
    Config zero_requests;
    zero_requests.set("network.max_concurrent_requests", "0");
    EXPECT_FALSE(selfcrypt::transfer::ClientConfig::from_config(zero_requests).validate());
    
    Config inverted_backoff;
    inverted_backoff.set("network.initial_backoff_ms", "500");
    inverted_backoff.set("network.max_backoff_ms", "100");
    EXPECT_FALSE(selfcrypt::transfer::ClientConfig::from_config(inverted_backoff).validate());
}

TEST_F(ConfigTest, StorageConfigFromConfig) {
    Config config;
    config.set("storage.root", "store_root");
    config.set("storage.max_size", "1048576");
    
    auto storage = selfcrypt::storage::StorageConfig::from_config(config);
    
    EXPECT_EQ(storage.chunk_directory, std::filesystem::path("store_root") / "chunks");
    EXPECT_EQ(storage.database_path, std::filesystem::path("store_root") / "chunks.db");
    EXPECT_EQ(storage.max_storage_size, 1048576u);
}
