#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "transfer_test_support.hpp"
#include "coffer/transfer/download_orchestrator.hpp"
#include "coffer/transfer/filesystem_cache.hpp"
#include "coffer/transfer/upload_orchestrator.hpp"
#include <atomic>
#include <mutex>

using namespace coffer::transfer;
using coffer::core::ErrorCode;
using coffer::core::Result;
using coffer::storage::ROOT_HANDLE;
using coffer::test::MockTransferApi;
using coffer::test::TestVault;
using ::testing::_;
using ::testing::AtLeast;
using ::testing::Invoke;
using ::testing::NiceMock;

namespace {
    constexpr std::uint64_t FIVE_MIB = 5ULL * 1024 * 1024;

    // Hands out its data until a chosen read, then fails
    class FailingByteSource : public ByteSource {
    public:
        FailingByteSource(std::vector<std::uint8_t> data, int fail_on_read)
            : inner_(std::move(data)), remaining_(fail_on_read) {}

        Result read_next(size_t count, std::vector<std::uint8_t>& out_data) override {
            if (remaining_-- == 0) {
                return Result(ErrorCode::IO_ERROR, "Disk went away");
            }
            return inner_.read_next(count, out_data);
        }

    private:
        MemoryByteSource inner_;
        int remaining_;
    };
}

class UploadOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        vault_ = std::make_unique<TestVault>("coffer_upload_orchestrator_test");
        api_ = std::make_shared<NiceMock<MockTransferApi>>(vault_->api);
        options_.retune_interval = std::chrono::milliseconds(20);
    }

    void TearDown() override {
        api_.reset();
        vault_.reset();
    }

    UploadRequest make_request(const std::vector<std::uint8_t>& data, const std::string& name = "report.pdf") {
        UploadRequest request;
        request.file_name = name;
        request.file_size = data.size();
        request.source = std::make_shared<MemoryByteSource>(data);
        request.date_added = 1700000000;
        return request;
    }

    std::unique_ptr<TestVault> vault_;
    std::shared_ptr<NiceMock<MockTransferApi>> api_;
    UploadOptions options_;
    FilesystemCache cache_;
};

TEST_F(UploadOrchestratorTest, ConcurrencyLimitFollowsThroughput) {
    EXPECT_EQ(UploadOrchestrator::concurrency_limit(0, 5'000'000, 4), 1u);
    EXPECT_EQ(UploadOrchestrator::concurrency_limit(4'999'999, 5'000'000, 4), 1u);
    EXPECT_EQ(UploadOrchestrator::concurrency_limit(10'000'000, 5'000'000, 4), 2u);
    EXPECT_EQ(UploadOrchestrator::concurrency_limit(17'000'000, 5'000'000, 4), 3u);
    EXPECT_EQ(UploadOrchestrator::concurrency_limit(1'000'000'000, 5'000'000, 4), 4u);
    EXPECT_EQ(UploadOrchestrator::concurrency_limit(1'000'000'000, 5'000'000, 0), 1u);
}

TEST_F(UploadOrchestratorTest, UploadsMultiChunkFile) {
    auto data = coffer::test::random_bytes(FIVE_MIB);
    UploadOrchestrator orchestrator(api_, vault_->keys, options_, &cache_);

    std::mutex progress_mutex;
    std::vector<TransferProgress> reports;
    auto result = orchestrator.upload(make_request(data), {}, [&](const TransferProgress& progress) {
        std::lock_guard<std::mutex> lock(progress_mutex);
        reports.push_back(progress);
    });

    ASSERT_EQ(result.status, TransferStatus::FINISHED) << result.result.to_string();
    EXPECT_TRUE(result.result.success());
    EXPECT_EQ(result.entry.name, "report.pdf");
    EXPECT_EQ(result.entry.size, FIVE_MIB);
    EXPECT_EQ(result.entry.parent_handle, std::string(ROOT_HANDLE));
    EXPECT_EQ(result.entry.date_added, 1700000000);
    EXPECT_FALSE(result.entry.is_folder);

    // Stored exactly as the format predicts
    auto path = vault_->config.get_file_path(result.entry.handle);
    ASSERT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(std::filesystem::file_size(path), 5243016u);
    EXPECT_EQ(vault_->uploads->active_upload_count(), 0u);

    ASSERT_TRUE(cache_.find(result.entry.handle).has_value());

    // One report per chunk plus the final one, counts strictly increasing
    ASSERT_EQ(reports.size(), 4u);
    for (size_t i = 1; i + 1 < reports.size(); ++i) {
        EXPECT_GT(reports[i].bytes_transferred, reports[i - 1].bytes_transferred);
    }
    EXPECT_EQ(reports.back().status, TransferStatus::FINISHED);
    EXPECT_EQ(reports.back().bytes_transferred, FIVE_MIB);
    EXPECT_EQ(reports.back().total_bytes, FIVE_MIB);
    EXPECT_EQ(reports.back().handle, result.entry.handle);

    DownloadOrchestrator downloader(vault_->api);
    auto downloaded = downloader.download_to_buffer(result.entry, vault_->keys.signing_keys().public_key);
    ASSERT_EQ(downloaded.status, TransferStatus::FINISHED) << downloaded.result.to_string();
    EXPECT_EQ(downloaded.data, data);
}

TEST_F(UploadOrchestratorTest, UploadsEmptyFile) {
    UploadOrchestrator orchestrator(api_, vault_->keys, options_);
    EXPECT_CALL(*api_, upload_chunk(_, _, _)).Times(0);

    auto result = orchestrator.upload(make_request({}, "empty.txt"));
    ASSERT_EQ(result.status, TransferStatus::FINISHED) << result.result.to_string();
    EXPECT_EQ(result.entry.size, 0u);
    EXPECT_EQ(std::filesystem::file_size(vault_->config.get_file_path(result.entry.handle)), 4u);
}

TEST_F(UploadOrchestratorTest, StoredMetadataDecryptsToRequest) {
    UploadOrchestrator orchestrator(api_, vault_->keys, options_);
    auto result = orchestrator.upload(make_request(coffer::test::random_bytes(1000), "notes.txt"));
    ASSERT_EQ(result.status, TransferStatus::FINISHED);

    coffer::storage::LookupResult found;
    ASSERT_TRUE(vault_->directory->lookup(result.entry.handle, found).success());

    coffer::storage::FilesystemEntry entry;
    ASSERT_TRUE(FilesystemCache::decode_record(found.record, vault_->keys.master_key(), vault_->codec, entry).success());
    EXPECT_EQ(entry.name, "notes.txt");
    EXPECT_EQ(entry.date_added, 1700000000);
    EXPECT_EQ(entry.size, 1000u);
    EXPECT_EQ(entry.file_crypt_key, result.entry.file_crypt_key);
    EXPECT_EQ(entry.signature, result.entry.signature);
}

TEST_F(UploadOrchestratorTest, CancelBeforeStartIsCancelled) {
    UploadOrchestrator orchestrator(api_, vault_->keys, options_);
    EXPECT_CALL(*api_, upload_chunk(_, _, _)).Times(0);
    EXPECT_CALL(*api_, cancel_upload(_)).Times(1);
    EXPECT_CALL(*api_, finalise_upload(_)).Times(0);

    TransferStatus last_status = TransferStatus::WAITING;
    auto result = orchestrator.upload(make_request(coffer::test::random_bytes(FIVE_MIB)),
        []() { return true; },
        [&](const TransferProgress& progress) { last_status = progress.status; });

    EXPECT_EQ(result.status, TransferStatus::CANCELLED);
    EXPECT_TRUE(result.result.success());
    EXPECT_EQ(last_status, TransferStatus::CANCELLED);
    EXPECT_EQ(vault_->uploads->active_upload_count(), 0u);
}

TEST_F(UploadOrchestratorTest, CancelMidwayDiscardsServerUpload) {
    options_.max_concurrent_chunks = 1;
    UploadOrchestrator orchestrator(api_, vault_->keys, options_, &cache_);
    EXPECT_CALL(*api_, finalise_upload(_)).Times(0);

    std::atomic<int> chunks_done{0};
    auto result = orchestrator.upload(make_request(coffer::test::random_bytes(FIVE_MIB)),
        [&]() { return chunks_done.load() >= 1; },
        [&](const TransferProgress& progress) {
            if (progress.status == TransferStatus::TRANSFERRING) {
                chunks_done++;
            }
        });

    EXPECT_EQ(result.status, TransferStatus::CANCELLED);
    EXPECT_LT(chunks_done.load(), 3);
    EXPECT_EQ(vault_->uploads->active_upload_count(), 0u);
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(UploadOrchestratorTest, OversizedMetadataFailsBeforeStarting) {
    UploadOrchestrator orchestrator(api_, vault_->keys, options_);
    EXPECT_CALL(*api_, start_upload(_, _)).Times(0);

    auto result = orchestrator.upload(make_request(coffer::test::random_bytes(10), std::string(2000, 'n')));
    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.result.error, ErrorCode::METADATA_TOO_LARGE);
}

TEST_F(UploadOrchestratorTest, RejectsInvalidRequests) {
    UploadOrchestrator orchestrator(api_, vault_->keys, options_);
    EXPECT_CALL(*api_, start_upload(_, _)).Times(0);

    auto request = make_request(coffer::test::random_bytes(10));
    request.file_size = coffer::storage::MAX_FILE_SIZE + 1;
    EXPECT_EQ(orchestrator.upload(request).result.error, ErrorCode::INVALID_ARGUMENT);

    request = make_request(coffer::test::random_bytes(10));
    request.parent_handle = "nope";
    EXPECT_EQ(orchestrator.upload(request).result.error, ErrorCode::INVALID_ARGUMENT);

    request = make_request(coffer::test::random_bytes(10));
    request.source.reset();
    EXPECT_EQ(orchestrator.upload(request).result.error, ErrorCode::INVALID_ARGUMENT);
}

TEST_F(UploadOrchestratorTest, ShortSourceFailsWithIoError) {
    UploadOrchestrator orchestrator(api_, vault_->keys, options_);
    EXPECT_CALL(*api_, cancel_upload(_)).Times(1);
    EXPECT_CALL(*api_, finalise_upload(_)).Times(0);

    auto request = make_request(coffer::test::random_bytes(FIVE_MIB));
    request.source = std::make_shared<FailingByteSource>(coffer::test::random_bytes(FIVE_MIB), 1);

    auto result = orchestrator.upload(request);
    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.result.error, ErrorCode::IO_ERROR);
    EXPECT_EQ(vault_->uploads->active_upload_count(), 0u);
}

TEST_F(UploadOrchestratorTest, RateLimitedChunkFailsUpload) {
    UploadOrchestrator orchestrator(api_, vault_->keys, options_);
    ON_CALL(*api_, upload_chunk(_, _, _)).WillByDefault(
        Invoke([this](const std::string& handle, std::int64_t chunk_id, std::span<const std::uint8_t> data) {
            if (chunk_id == 1) {
                return Result(ErrorCode::RATE_LIMITED, "slow down");
            }
            return api_->real().upload_chunk(handle, chunk_id, data);
        }));
    EXPECT_CALL(*api_, upload_chunk(_, _, _)).Times(AtLeast(1));
    EXPECT_CALL(*api_, cancel_upload(_)).Times(1);

    auto result = orchestrator.upload(make_request(coffer::test::random_bytes(FIVE_MIB)));
    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.result.error, ErrorCode::RATE_LIMITED);
    EXPECT_EQ(vault_->uploads->active_upload_count(), 0u);
}

TEST_F(UploadOrchestratorTest, UploadIntoFolder) {
    vault_->store_folder("FolderAAAAAAAAA1", "docs");
    UploadOrchestrator orchestrator(api_, vault_->keys, options_);

    auto request = make_request(coffer::test::random_bytes(100));
    request.parent_handle = "FolderAAAAAAAAA1";
    auto result = orchestrator.upload(request);
    ASSERT_EQ(result.status, TransferStatus::FINISHED);
    EXPECT_EQ(result.entry.parent_handle, "FolderAAAAAAAAA1");

    request = make_request(coffer::test::random_bytes(100));
    request.parent_handle = "MissingFolderAA1";
    result = orchestrator.upload(request);
    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.result.error, ErrorCode::NOT_FOUND);
    EXPECT_EQ(vault_->uploads->active_upload_count(), 0u);
}
