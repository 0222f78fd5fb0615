#include <gtest/gtest.h>
#include "../utils/test_utils.hpp"
#include "chunkdfs_client.hpp"
#include "chunking.hpp"
#include <algorithm>
#include <filesystem>
#include <thread>

class FullSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        download_temp_ = std::make_unique<test_utils::TempDirectory>();

        // Six storage nodes, one chunk each
        datanodes_ = test_utils::startDataNodes(6);
        ASSERT_EQ(datanodes_.size(), 6u) << "Failed to start DataNodes";

        coordinator_ = std::make_unique<test_utils::TestCoordinator>(test_utils::addressesOf(datanodes_));
        ASSERT_TRUE(coordinator_->start()) << "Failed to start coordinator";

        client_ = std::make_unique<ChunkDfsClient>(test_utils::createChannel(coordinator_->address()));
    }

    void TearDown() override {
        if (coordinator_) {
            coordinator_->stop();
        }
        for (auto& datanode : datanodes_) {
            datanode->stop();
        }
    }

    // Uploads `data` from a temp file and downloads it back
    std::vector<char> roundTrip(const std::vector<char>& data, const std::string& name) {
        test_utils::TempFile file;
        file.write(data);

        auto info = client_->UploadFile(file.path());
        EXPECT_TRUE(info.has_value());
        if (!info) return {};

        std::string download_path = download_temp_->file_path(name);
        EXPECT_TRUE(client_->DownloadFile(info->id(), download_path));
        return test_utils::readFileBytes(download_path);
    }

    size_t totalStoredChunks() {
        size_t total = 0;
        for (auto& datanode : datanodes_) {
            total += datanode->store().list().size();
        }
        return total;
    }

    std::unique_ptr<test_utils::TempDirectory> download_temp_;
    std::vector<std::unique_ptr<test_utils::TestDataNode>> datanodes_;
    std::unique_ptr<test_utils::TestCoordinator> coordinator_;
    std::unique_ptr<ChunkDfsClient> client_;
};

TEST_F(FullSystemTest, SmallFileUploadDownload) {
    std::string content = "Hello ChunkDFS! This is a test file for end-to-end testing.";
    test_utils::TempFile test_file(content);

    auto info = client_->UploadFile(test_file.path(), "text/plain");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->original_name(), std::filesystem::path(test_file.path()).filename().string());
    EXPECT_EQ(info->size(), static_cast<int64_t>(content.size()));
    EXPECT_EQ(info->chunk_count(), 6);

    // Each node holds exactly one chunk of the file
    for (auto& datanode : datanodes_) {
        EXPECT_EQ(datanode->store().list().size(), 1u);
    }

    std::string download_path = download_temp_->file_path("small.txt");
    ASSERT_TRUE(client_->DownloadFile(info->id(), download_path));

    EXPECT_EQ(test_utils::readFileBytes(download_path), test_utils::readFileBytes(test_file.path()));
}

TEST_F(FullSystemTest, DownloadWithoutOutputPathUsesStoredName) {
    auto data = test_utils::generateRandomData(4096);
    test_utils::TempFile test_file;
    test_file.write(data);

    auto info = client_->UploadFile(test_file.path());
    ASSERT_TRUE(info.has_value());

    // Downloads into the working directory under the stored base name
    const std::filesystem::path previous = std::filesystem::current_path();
    std::filesystem::current_path(download_temp_->path());
    bool downloaded = client_->DownloadFile(info->id());
    std::filesystem::current_path(previous);

    ASSERT_TRUE(downloaded);
    std::string expected_path = download_temp_->file_path(info->original_name());
    ASSERT_TRUE(std::filesystem::exists(expected_path));
    EXPECT_EQ(test_utils::readFileBytes(expected_path), data);
}

TEST_F(FullSystemTest, RoundTripAcrossSizes) {
    // 1003 is not a multiple of the chunk count
    for (size_t size : {size_t(1), size_t(10), size_t(1000), size_t(1003)}) {
        auto data = test_utils::generateRandomData(size);
        EXPECT_EQ(roundTrip(data, "size_" + std::to_string(size)), data) << "size " << size;
    }
}

TEST_F(FullSystemTest, LargeFileAcrossNodes) {
    // Chunks larger than gRPC's default 4 MiB message cap
    auto data = test_utils::generateRandomData(30 * 1024 * 1024);
    EXPECT_EQ(roundTrip(data, "large.bin"), data);
}

TEST_F(FullSystemTest, EmptyFileHandling) {
    auto downloaded = roundTrip({}, "empty.bin");
    EXPECT_TRUE(downloaded.empty());
}

TEST_F(FullSystemTest, BinaryFileHandling) {
    std::vector<char> data;
    for (int i = 0; i < 4096; ++i) {
        data.push_back(static_cast<char>(i % 256));
    }
    EXPECT_EQ(roundTrip(data, "binary.bin"), data);
}

TEST_F(FullSystemTest, MultipleFilesSequential) {
    std::vector<std::string> ids;
    std::vector<std::vector<char>> contents;

    for (int i = 0; i < 5; ++i) {
        contents.push_back(test_utils::generatePatternData(500 + i * 123, "file" + std::to_string(i)));
        test_utils::TempFile file;
        file.write(contents.back());
        auto info = client_->UploadFile(file.path());
        ASSERT_TRUE(info.has_value());
        ids.push_back(info->id());
    }

    auto listed = client_->ListFiles();
    ASSERT_TRUE(listed.has_value());
    std::vector<std::string> sorted_ids = ids;
    std::sort(sorted_ids.begin(), sorted_ids.end());
    std::sort(listed->begin(), listed->end());
    EXPECT_EQ(*listed, sorted_ids);

    for (size_t i = 0; i < ids.size(); ++i) {
        std::string download_path = download_temp_->file_path("multi_" + std::to_string(i));
        ASSERT_TRUE(client_->DownloadFile(ids[i], download_path));
        EXPECT_EQ(test_utils::readFileBytes(download_path), contents[i]);
    }
}

TEST_F(FullSystemTest, SameFileUploadedTwiceGetsDistinctIds) {
    test_utils::TempFile file("identical content");

    auto first = client_->UploadFile(file.path());
    auto second = client_->UploadFile(file.path());
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    EXPECT_NE(first->id(), second->id());
    EXPECT_EQ(first->checksum(), second->checksum());
    EXPECT_EQ(totalStoredChunks(), 12u);
}

TEST_F(FullSystemTest, FileInfoMatchesUpload) {
    auto data = test_utils::generateRandomData(6000);
    test_utils::TempFile file;
    file.write(data);

    auto uploaded = client_->UploadFile(file.path());
    ASSERT_TRUE(uploaded.has_value());

    auto info = client_->GetFileInfo(uploaded->id());
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->checksum(), chunking::sha256Hex(data));
    EXPECT_EQ(info->size(), 6000);
    ASSERT_EQ(info->chunks_size(), 6);
    for (int i = 0; i < 6; ++i) {
        EXPECT_EQ(info->chunks(i).index(), i);
        EXPECT_EQ(info->chunks(i).size(), 1000);
        EXPECT_EQ(info->chunks(i).id(), chunking::makeChunkId(uploaded->id(), i));
    }
}

TEST_F(FullSystemTest, DeleteThenDownloadFails) {
    test_utils::TempFile file("to be deleted");
    auto info = client_->UploadFile(file.path());
    ASSERT_TRUE(info.has_value());

    EXPECT_TRUE(client_->DeleteFile(info->id()));
    EXPECT_EQ(totalStoredChunks(), 0u);

    std::string download_path = download_temp_->file_path("deleted.txt");
    EXPECT_FALSE(client_->DownloadFile(info->id(), download_path));
    EXPECT_FALSE(std::filesystem::exists(download_path));
    EXPECT_FALSE(client_->GetFileInfo(info->id()).has_value());
    EXPECT_FALSE(client_->DeleteFile(info->id()));
}

TEST_F(FullSystemTest, NonExistentFileDownload) {
    std::string download_path = download_temp_->file_path("missing.txt");
    EXPECT_FALSE(client_->DownloadFile("nonexistent-file-id", download_path));
    EXPECT_FALSE(std::filesystem::exists(download_path));
}

TEST_F(FullSystemTest, MissingLocalFileIsNotUploaded) {
    EXPECT_FALSE(client_->UploadFile("/nonexistent/chunkdfs/file.txt").has_value());
    auto listed = client_->ListFiles();
    ASSERT_TRUE(listed.has_value());
    EXPECT_TRUE(listed->empty());
}

TEST_F(FullSystemTest, HealthyClusterReportsHealthy) {
    auto health = client_->Health();
    ASSERT_TRUE(health.has_value());
    EXPECT_EQ(health->status(), "healthy");
    EXPECT_EQ(health->healthy_servers(), 6);
    EXPECT_EQ(health->total_servers(), 6);
}

TEST_F(FullSystemTest, LostNodeFailsDownloadButNotMetadata) {
    test_utils::TempFile file(std::string(6000, 'z'));
    auto info = client_->UploadFile(file.path());
    ASSERT_TRUE(info.has_value());

    datanodes_[3]->stop();

    std::string download_path = download_temp_->file_path("lost.bin");
    EXPECT_FALSE(client_->DownloadFile(info->id(), download_path));
    EXPECT_FALSE(std::filesystem::exists(download_path));
    EXPECT_TRUE(client_->GetFileInfo(info->id()).has_value());

    auto health = client_->Health();
    ASSERT_TRUE(health.has_value());
    EXPECT_EQ(health->status(), "degraded");
    EXPECT_EQ(health->healthy_servers(), 5);
}

TEST_F(FullSystemTest, ConcurrentClients) {
    const int num_clients = 4;
    std::vector<std::thread> threads;
    std::atomic<int> success_count{0};

    for (int c = 0; c < num_clients; ++c) {
        threads.emplace_back([this, c, &success_count]() {
            ChunkDfsClient client(test_utils::createChannel(coordinator_->address()));
            auto data = test_utils::generateRandomData(20000 + c * 333);
            test_utils::TempFile file;
            file.write(data);

            auto info = client.UploadFile(file.path());
            if (!info) return;

            std::string download_path = download_temp_->file_path("client_" + std::to_string(c));
            if (client.DownloadFile(info->id(), download_path) &&
                test_utils::readFileBytes(download_path) == data) {
                success_count++;
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(success_count.load(), num_clients);
}

// A cluster whose placement list includes a node nobody is listening on
class UnreachableNodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        datanodes_ = test_utils::startDataNodes(5);
        ASSERT_EQ(datanodes_.size(), 5u) << "Failed to start DataNodes";

        std::vector<std::string> addresses = test_utils::addressesOf(datanodes_);
        addresses.insert(addresses.begin() + 2, test_utils::unreachableAddress());

        coordinator_ = std::make_unique<test_utils::TestCoordinator>(
            addresses, CoordinatorOptions(), std::chrono::milliseconds(1000));
        ASSERT_TRUE(coordinator_->start()) << "Failed to start coordinator";

        client_ = std::make_unique<ChunkDfsClient>(test_utils::createChannel(coordinator_->address()));
    }

    void TearDown() override {
        if (coordinator_) {
            coordinator_->stop();
        }
        for (auto& datanode : datanodes_) {
            datanode->stop();
        }
    }

    std::vector<std::unique_ptr<test_utils::TestDataNode>> datanodes_;
    std::unique_ptr<test_utils::TestCoordinator> coordinator_;
    std::unique_ptr<ChunkDfsClient> client_;
};

TEST_F(UnreachableNodeTest, UploadFailsAndRegistersNothing) {
    test_utils::TempFile file(std::string(600, 'u'));

    EXPECT_FALSE(client_->UploadFile(file.path()).has_value());

    auto listed = client_->ListFiles();
    ASSERT_TRUE(listed.has_value());
    EXPECT_TRUE(listed->empty());

    // Chunks stored before the failure stay on the healthy nodes
    size_t stored = 0;
    for (auto& datanode : datanodes_) {
        stored += datanode->store().list().size();
    }
    EXPECT_EQ(stored, 5u);
}

TEST_F(UnreachableNodeTest, HealthIsDegraded) {
    auto health = client_->Health();
    ASSERT_TRUE(health.has_value());
    EXPECT_EQ(health->status(), "degraded");
    EXPECT_EQ(health->healthy_servers(), 5);
    EXPECT_EQ(health->total_servers(), 6);
}
