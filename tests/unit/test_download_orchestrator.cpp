#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "transfer_test_support.hpp"
#include "coffer/transfer/download_orchestrator.hpp"
#include "coffer/transfer/download_sink.hpp"
#include <atomic>
#include <iterator>
#include <new>

using namespace coffer::transfer;
using coffer::core::ErrorCode;
using coffer::core::Result;
using coffer::crypto::CHUNK_DATA_SIZE;
using coffer::storage::FilesystemEntry;
using coffer::test::MockTransferApi;
using coffer::test::TestVault;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;

namespace {
    constexpr std::uint64_t FIVE_MIB = 5ULL * 1024 * 1024;

    std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    void write_file(const std::filesystem::path& path, const std::uint8_t* data, size_t size) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    }
}

class DownloadOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        vault_ = std::make_unique<TestVault>("coffer_download_orchestrator_test");
        api_ = std::make_shared<NiceMock<MockTransferApi>>(vault_->api);
        orchestrator_ = std::make_unique<DownloadOrchestrator>(api_);

        data_ = coffer::test::random_bytes(FIVE_MIB);
        entry_ = vault_->store_file(HANDLE, data_);
        destination_ = vault_->base_dir / "out" / "report.pdf";
    }

    void TearDown() override {
        orchestrator_.reset();
        api_.reset();
        vault_.reset();
    }

    const coffer::crypto::Ed25519PublicKey& owner_key() const {
        return vault_->keys.signing_keys().public_key;
    }

    std::filesystem::path partial_path() const {
        auto path = destination_;
        path += FileDownloadSink::PARTIAL_SUFFIX;
        return path;
    }

    static constexpr const char* HANDLE = "DownloadAAAAAAA1";

    std::unique_ptr<TestVault> vault_;
    std::shared_ptr<NiceMock<MockTransferApi>> api_;
    std::unique_ptr<DownloadOrchestrator> orchestrator_;
    std::vector<std::uint8_t> data_;
    FilesystemEntry entry_;
    std::filesystem::path destination_;
};

TEST_F(DownloadOrchestratorTest, BufferedDownload) {
    std::vector<TransferProgress> reports;
    auto result = orchestrator_->download_to_buffer(entry_, owner_key(), {}, [&](const TransferProgress& progress) {
        reports.push_back(progress);
    });

    ASSERT_EQ(result.status, TransferStatus::FINISHED) << result.result.to_string();
    EXPECT_EQ(result.handle, HANDLE);
    EXPECT_EQ(result.data, data_);

    ASSERT_EQ(reports.size(), 4u);
    EXPECT_EQ(reports[0].bytes_transferred, CHUNK_DATA_SIZE);
    EXPECT_EQ(reports[1].bytes_transferred, 2 * CHUNK_DATA_SIZE);
    EXPECT_EQ(reports[2].bytes_transferred, FIVE_MIB);
    EXPECT_EQ(reports[3].status, TransferStatus::FINISHED);
    EXPECT_EQ(reports[3].type, TransferType::DOWNLOAD);
}

TEST_F(DownloadOrchestratorTest, StreamsIntoFileSink) {
    FileDownloadSink sink(destination_);
    auto result = orchestrator_->download_to_sink(entry_, owner_key(), sink);

    ASSERT_EQ(result.status, TransferStatus::FINISHED) << result.result.to_string();
    EXPECT_TRUE(result.data.empty());
    EXPECT_EQ(read_file(destination_), data_);
    EXPECT_FALSE(std::filesystem::exists(partial_path()));
}

TEST_F(DownloadOrchestratorTest, EmptyFile) {
    auto empty = vault_->store_file("EmptyFileAAAAAA1", {});
    EXPECT_CALL(*api_, download_chunk(_, _, _)).Times(0);

    auto result = orchestrator_->download_to_buffer(empty, owner_key());
    ASSERT_EQ(result.status, TransferStatus::FINISHED) << result.result.to_string();
    EXPECT_TRUE(result.data.empty());
}

TEST_F(DownloadOrchestratorTest, ResumesFromPartialFile) {
    // One whole chunk plus a torn tail already on disk
    std::filesystem::create_directories(destination_.parent_path());
    write_file(partial_path(), data_.data(), CHUNK_DATA_SIZE + 1000);

    EXPECT_CALL(*api_, download_chunk(HANDLE, 0, _)).Times(0);
    EXPECT_CALL(*api_, download_chunk(HANDLE, 1, _)).Times(1);
    EXPECT_CALL(*api_, download_chunk(HANDLE, 2, _)).Times(1);

    std::vector<TransferProgress> reports;
    FileDownloadSink sink(destination_);
    auto result = orchestrator_->download_to_sink(entry_, owner_key(), sink, {},
        [&](const TransferProgress& progress) { reports.push_back(progress); });

    ASSERT_EQ(result.status, TransferStatus::FINISHED) << result.result.to_string();
    EXPECT_EQ(read_file(destination_), data_);
    ASSERT_FALSE(reports.empty());
    EXPECT_EQ(reports.front().bytes_transferred, 2 * CHUNK_DATA_SIZE);
}

TEST_F(DownloadOrchestratorTest, CorruptPartialFileFailsVerification) {
    std::filesystem::create_directories(destination_.parent_path());
    auto corrupt = std::vector<std::uint8_t>(data_.begin(), data_.begin() + CHUNK_DATA_SIZE);
    corrupt[100] ^= 0xFF;
    write_file(partial_path(), corrupt.data(), corrupt.size());

    FileDownloadSink sink(destination_);
    auto result = orchestrator_->download_to_sink(entry_, owner_key(), sink);

    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.result.error, ErrorCode::SIGNATURE_MISMATCH);
    EXPECT_FALSE(std::filesystem::exists(partial_path()));
    EXPECT_FALSE(std::filesystem::exists(destination_));
}

TEST_F(DownloadOrchestratorTest, WrongSignatureAbortsSink) {
    auto tampered = entry_;
    tampered.signature[0] ^= 0x01;

    FileDownloadSink sink(destination_);
    auto result = orchestrator_->download_to_sink(tampered, owner_key(), sink);

    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.result.error, ErrorCode::SIGNATURE_MISMATCH);
    EXPECT_FALSE(std::filesystem::exists(partial_path()));
    EXPECT_FALSE(std::filesystem::exists(destination_));
}

TEST_F(DownloadOrchestratorTest, ForeignSigningKeyIsRejected) {
    coffer::crypto::KeyManager stranger;
    ASSERT_TRUE(stranger.generate_keys().success());

    auto result = orchestrator_->download_to_buffer(entry_, stranger.signing_keys().public_key);
    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.result.error, ErrorCode::SIGNATURE_MISMATCH);
    EXPECT_TRUE(result.data.empty());
}

TEST_F(DownloadOrchestratorTest, TamperedCiphertextFailsAuthentication) {
    {
        std::fstream file(vault_->config.get_file_path(HANDLE), std::ios::binary | std::ios::in | std::ios::out);
        file.seekp(static_cast<std::streamoff>(coffer::storage::encrypted_chunk_offset(1) + 500));
        file.put('\x5A');
    }

    auto result = orchestrator_->download_to_buffer(entry_, owner_key());
    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.result.error, ErrorCode::AUTHENTICATION_FAILED);
}

TEST_F(DownloadOrchestratorTest, SwappedChunkIsIdMismatch) {
    ON_CALL(*api_, download_chunk(_, _, _)).WillByDefault(
        Invoke([this](const std::string& handle, std::int64_t chunk_id, std::vector<std::uint8_t>& out) {
            // Serve chunk 0 wherever chunk 1 was asked for
            return api_->real().download_chunk(handle, chunk_id == 1 ? 0 : chunk_id, out);
        }));

    auto result = orchestrator_->download_to_buffer(entry_, owner_key());
    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.result.error, ErrorCode::CHUNK_ID_MISMATCH);
}

TEST_F(DownloadOrchestratorTest, ShortChunkIsSizeMismatch) {
    auto wrong_size = entry_;
    wrong_size.size = FIVE_MIB - 1;

    auto result = orchestrator_->download_to_buffer(wrong_size, owner_key());
    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.result.error, ErrorCode::CHUNK_SIZE_MISMATCH);
}

TEST_F(DownloadOrchestratorTest, CancelAbortsSink) {
    std::atomic<int> chunks{0};
    TransferStatus last_status = TransferStatus::WAITING;

    FileDownloadSink sink(destination_);
    auto result = orchestrator_->download_to_sink(entry_, owner_key(), sink,
        [&]() { return chunks.load() >= 1; },
        [&](const TransferProgress& progress) {
            if (progress.status == TransferStatus::TRANSFERRING) {
                chunks++;
            }
            last_status = progress.status;
        });

    EXPECT_EQ(result.status, TransferStatus::CANCELLED);
    EXPECT_TRUE(result.result.success());
    EXPECT_EQ(chunks.load(), 1);
    EXPECT_EQ(last_status, TransferStatus::CANCELLED);
    EXPECT_FALSE(std::filesystem::exists(partial_path()));
    EXPECT_FALSE(std::filesystem::exists(destination_));
}

TEST_F(DownloadOrchestratorTest, FoldersAndBadHandlesAreRejected) {
    EXPECT_CALL(*api_, download_chunk(_, _, _)).Times(0);

    FilesystemEntry folder;
    folder.handle = "FolderAAAAAAAAA1";
    folder.is_folder = true;
    EXPECT_EQ(orchestrator_->download_to_buffer(folder, owner_key()).result.error,
              ErrorCode::FOLDER_HAS_NO_PHYSICAL_FILE);

    auto root = entry_;
    root.handle = std::string(coffer::storage::ROOT_HANDLE);
    EXPECT_EQ(orchestrator_->download_to_buffer(root, owner_key()).result.error, ErrorCode::INVALID_ARGUMENT);

    auto huge = entry_;
    huge.size = coffer::storage::MAX_FILE_SIZE + 1;
    EXPECT_EQ(orchestrator_->download_to_buffer(huge, owner_key()).result.error, ErrorCode::INVALID_ARGUMENT);
}

TEST_F(DownloadOrchestratorTest, DownloadManyKeepsOrder) {
    auto small = coffer::test::random_bytes(3000, 7);
    auto medium = coffer::test::random_bytes(CHUNK_DATA_SIZE + 17, 9);
    auto small_entry = vault_->store_file("SmallAAAAAAAAAA1", small);
    auto medium_entry = vault_->store_file("MediumAAAAAAAAA1", medium);

    FilesystemEntry folder;
    folder.handle = "FolderAAAAAAAAA1";
    folder.is_folder = true;

    auto results = orchestrator_->download_many({medium_entry, folder, entry_, small_entry}, owner_key(), 3);
    ASSERT_EQ(results.size(), 4u);

    EXPECT_EQ(results[0].status, TransferStatus::FINISHED);
    EXPECT_EQ(results[0].data, medium);
    EXPECT_EQ(results[1].status, TransferStatus::FAILED);
    EXPECT_EQ(results[1].result.error, ErrorCode::FOLDER_HAS_NO_PHYSICAL_FILE);
    EXPECT_EQ(results[2].status, TransferStatus::FINISHED);
    EXPECT_EQ(results[2].data, data_);
    EXPECT_EQ(results[3].status, TransferStatus::FINISHED);
    EXPECT_EQ(results[3].handle, "SmallAAAAAAAAAA1");
    EXPECT_EQ(results[3].data, small);
}

TEST_F(DownloadOrchestratorTest, OversizedRecordFailsWithoutReservingItsSize) {
    // A record claiming the largest allowed size for a 5 MiB stored file
    auto oversized = entry_;
    oversized.size = coffer::storage::MAX_FILE_SIZE;

    auto result = orchestrator_->download_to_buffer(oversized, owner_key());
    EXPECT_EQ(result.status, TransferStatus::FAILED);
    EXPECT_EQ(result.result.error, ErrorCode::CHUNK_SIZE_MISMATCH);
    EXPECT_TRUE(result.data.empty());

    auto results = orchestrator_->download_many({oversized, entry_}, owner_key(), 2);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].status, TransferStatus::FAILED);
    EXPECT_EQ(results[0].result.error, ErrorCode::CHUNK_SIZE_MISMATCH);
    EXPECT_EQ(results[1].status, TransferStatus::FINISHED);
    EXPECT_EQ(results[1].data, data_);
}

TEST_F(DownloadOrchestratorTest, DownloadManyReportsAllocationFailure) {
    EXPECT_CALL(*api_, download_chunk(HANDLE, _, _))
        .WillRepeatedly(Invoke([](const std::string&, std::int64_t, std::vector<std::uint8_t>&) -> Result {
            throw std::bad_alloc();
        }));

    auto results = orchestrator_->download_many({entry_}, owner_key(), 1);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].status, TransferStatus::FAILED);
    EXPECT_EQ(results[0].result.error, ErrorCode::IO_ERROR);
    EXPECT_EQ(results[0].handle, HANDLE);
}
