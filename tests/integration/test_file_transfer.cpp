#include <gtest/gtest.h>
#include "selfcrypt/storage/memory_chunk_store.hpp"
#include "selfcrypt/transfer/data_client.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <vector>

using namespace selfcrypt;
using namespace selfcrypt::transfer;

class FileTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "selfcrypt_file_transfer_test";
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);
        
        config_.network.retry.initial_backoff = std::chrono::milliseconds(1);
        config_.network.retry.max_backoff = std::chrono::milliseconds(4);
    }
    
    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }
    
    std::vector<std::uint8_t> create_test_file(const std::string& filename, size_t size) {
        std::mt19937 rng(42);
        std::vector<std::uint8_t> data(size);
        for (auto& byte : data) {
            byte = static_cast<std::uint8_t>(rng() & 0xFF);
        }
        
        std::ofstream file(test_dir_ / filename, std::ios::binary);
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        return data;
    }
    
    std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        return std::vector<std::uint8_t>((std::istreambuf_iterator<char>(file)),
                                         std::istreambuf_iterator<char>());
    }
    
    std::filesystem::path test_dir_;
    ClientConfig config_;
    storage::MemoryChunkStore store_;
};

TEST_F(FileTransferTest, UploadAndDownloadFile) {
    auto data = create_test_file("large.bin", 3 * 1024 * 1024 + 4321);
    DataClient client(store_, config_);
    
    storage::DataMap map;
    ASSERT_TRUE(client.upload_file(test_dir_ / "large.bin", map));
    EXPECT_EQ(map.total_size, data.size());
    
    auto output = test_dir_ / "restored.bin";
    ASSERT_TRUE(client.download_to_file(map, output));
    EXPECT_EQ(read_file(output), data);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "restored.bin.partial"));
}

TEST_F(FileTransferTest, FileAndBufferUploadsAgree) {
    auto data = create_test_file("same.bin", 2 * 1024 * 1024 + 99);
    DataClient client(store_, config_);
    
    storage::DataMap from_file;
    storage::DataMap from_buffer;
    ASSERT_TRUE(client.upload_file(test_dir_ / "same.bin", from_file));
    ASSERT_TRUE(client.upload(data, from_buffer));
    
    EXPECT_EQ(from_file, from_buffer);
}

TEST_F(FileTransferTest, SmallFilesStayInline) {
    auto data = create_test_file("small.txt", 100);
    DataClient client(store_, config_);
    
    storage::DataMap map;
    ASSERT_TRUE(client.upload_file(test_dir_ / "small.txt", map));
    EXPECT_TRUE(map.is_inline());
    EXPECT_EQ(map.content, data);
    EXPECT_EQ(store_.chunk_count(), 0u);
    
    auto output = test_dir_ / "small_restored.txt";
    ASSERT_TRUE(client.download_to_file(map, output));
    EXPECT_EQ(read_file(output), data);
}

TEST_F(FileTransferTest, EmptyFile) {
    create_test_file("empty.bin", 0);
    DataClient client(store_, config_);
    
    storage::DataMap map;
    ASSERT_TRUE(client.upload_file(test_dir_ / "empty.bin", map));
    EXPECT_TRUE(map.is_inline());
    EXPECT_EQ(map.total_size, 0u);
    
    auto output = test_dir_ / "empty_restored.bin";
    ASSERT_TRUE(client.download_to_file(map, output));
    EXPECT_TRUE(std::filesystem::exists(output));
    EXPECT_EQ(std::filesystem::file_size(output), 0u);
}

TEST_F(FileTransferTest, MissingFileIsRejected) {
    DataClient client(store_, config_);
    
    storage::DataMap map;
    EXPECT_EQ(client.upload_file(test_dir_ / "missing.bin", map).error, core::ErrorCode::INVALID_ARGUMENT);
}

TEST_F(FileTransferTest, FailedDownloadLeavesNoFile) {
    create_test_file("data.bin", 512 * 1024);
    DataClient client(store_, config_);
    
    storage::DataMap map;
    ASSERT_TRUE(client.upload_file(test_dir_ / "data.bin", map));
    map.checksum[5] ^= 0x20;
    
    auto output = test_dir_ / "never.bin";
    EXPECT_EQ(client.download_to_file(map, output).error, core::ErrorCode::ASSEMBLY_INTEGRITY);
    EXPECT_FALSE(std::filesystem::exists(output));
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "never.bin.partial"));
}

TEST_F(FileTransferTest, StreamingDownloadToSink) {
    auto data = create_test_file("stream.bin", 1024 * 1024 + 1);
    DataClient client(store_, config_);
    
    storage::DataMap map;
    ASSERT_TRUE(client.upload_file(test_dir_ / "stream.bin", map));
    
    std::vector<std::uint8_t> received;
    size_t pieces = 0;
    ASSERT_TRUE(client.download_to(map, [&](std::span<const std::uint8_t> bytes) {
        pieces++;
        received.insert(received.end(), bytes.begin(), bytes.end());
        return core::Result();
    }));
    
    EXPECT_EQ(pieces, map.chunk_count());
    EXPECT_EQ(received, data);
}
