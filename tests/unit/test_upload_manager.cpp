#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "transfer_test_support.hpp"
#include "coffer/transfer/upload_manager.hpp"
#include <atomic>
#include <future>
#include <map>
#include <set>
#include <thread>

using namespace coffer::transfer;
using coffer::core::Result;
using coffer::test::MockTransferApi;
using coffer::test::TestVault;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;

class UploadManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        vault_ = std::make_unique<TestVault>("coffer_upload_manager_test");
        api_ = std::make_shared<NiceMock<MockTransferApi>>(vault_->api);
        orchestrator_ = std::make_shared<UploadOrchestrator>(api_, vault_->keys);
    }

    void TearDown() override {
        orchestrator_.reset();
        api_.reset();
        vault_.reset();
    }

    UploadRequest make_request(const std::string& name, size_t size = 4096) {
        UploadRequest request;
        request.file_name = name;
        request.file_size = size;
        request.source = std::make_shared<MemoryByteSource>(coffer::test::random_bytes(size));
        return request;
    }

    std::unique_ptr<TestVault> vault_;
    std::shared_ptr<NiceMock<MockTransferApi>> api_;
    std::shared_ptr<UploadOrchestrator> orchestrator_;
};

TEST_F(UploadManagerTest, RunsEveryQueuedUpload) {
    std::mutex results_mutex;
    std::map<UploadId, UploadResult> results;

    {
        UploadManager manager(orchestrator_, 2);
        for (int i = 0; i < 5; ++i) {
            manager.enqueue(make_request("file" + std::to_string(i) + ".txt"),
                [&](UploadId id, const UploadResult& result) {
                    std::lock_guard<std::mutex> lock(results_mutex);
                    results[id] = result;
                });
        }
        manager.wait_idle();
        EXPECT_EQ(manager.queued_count(), 0u);
        EXPECT_EQ(manager.active_count(), 0u);
    }

    ASSERT_EQ(results.size(), 5u);
    std::set<std::string> handles;
    for (const auto& [id, result] : results) {
        EXPECT_EQ(result.status, TransferStatus::FINISHED) << result.result.to_string();
        handles.insert(result.entry.handle);
    }
    EXPECT_EQ(handles.size(), 5u);
    EXPECT_EQ(vault_->directory->get_record_count(), 5u);
}

TEST_F(UploadManagerTest, NeverExceedsConcurrencyLimit) {
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    ON_CALL(*api_, start_upload(_, _)).WillByDefault(
        Invoke([&](std::uint64_t size, std::string& handle) {
            int now = ++running;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            auto result = api_->real().start_upload(size, handle);
            --running;
            return result;
        }));

    UploadManager manager(orchestrator_, 2);
    for (int i = 0; i < 6; ++i) {
        manager.enqueue(make_request("file" + std::to_string(i)));
    }
    manager.wait_idle();

    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);
    EXPECT_EQ(vault_->directory->get_record_count(), 6u);
}

TEST_F(UploadManagerTest, CompletesInQueueOrderWithOneSlot) {
    std::mutex order_mutex;
    std::vector<UploadId> order;

    UploadManager manager(orchestrator_, 1);
    std::vector<UploadId> ids;
    for (int i = 0; i < 3; ++i) {
        ids.push_back(manager.enqueue(make_request("file" + std::to_string(i)),
            [&](UploadId id, const UploadResult&) {
                std::lock_guard<std::mutex> lock(order_mutex);
                order.push_back(id);
            }));
    }
    manager.wait_idle();

    EXPECT_EQ(order, ids);
}

TEST_F(UploadManagerTest, CancelQueuedAndRunningUploads) {
    std::promise<void> gate;
    auto released = gate.get_future().share();
    std::atomic<bool> first_started{false};

    ON_CALL(*api_, start_upload(_, _)).WillByDefault(
        Invoke([&, released](std::uint64_t size, std::string& handle) {
            first_started = true;
            released.wait();
            return api_->real().start_upload(size, handle);
        }));

    std::mutex results_mutex;
    std::map<UploadId, TransferStatus> statuses;
    auto record = [&](UploadId id, const UploadResult& result) {
        std::lock_guard<std::mutex> lock(results_mutex);
        statuses[id] = result.status;
    };

    UploadManager manager(orchestrator_, 1);
    auto running = manager.enqueue(make_request("running.bin", 3 * coffer::crypto::CHUNK_DATA_SIZE), record);
    auto queued = manager.enqueue(make_request("queued.bin"), record);

    while (!first_started) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(manager.active_count(), 1u);
    EXPECT_EQ(manager.queued_count(), 1u);

    EXPECT_TRUE(manager.cancel(queued));
    EXPECT_EQ(manager.queued_count(), 0u);
    {
        std::lock_guard<std::mutex> lock(results_mutex);
        EXPECT_EQ(statuses.count(queued), 1u);
        EXPECT_EQ(statuses[queued], TransferStatus::CANCELLED);
    }

    EXPECT_TRUE(manager.cancel(running));
    EXPECT_FALSE(manager.cancel(9999));
    gate.set_value();
    manager.wait_idle();

    std::lock_guard<std::mutex> lock(results_mutex);
    EXPECT_EQ(statuses[running], TransferStatus::CANCELLED);
    EXPECT_EQ(vault_->uploads->active_upload_count(), 0u);
    EXPECT_EQ(vault_->directory->get_record_count(), 0u);
}

TEST_F(UploadManagerTest, DestructionReportsQueuedUploadsAsCancelled) {
    std::promise<void> gate;
    auto released = gate.get_future().share();
    std::atomic<bool> first_started{false};

    ON_CALL(*api_, start_upload(_, _)).WillByDefault(
        Invoke([&, released](std::uint64_t size, std::string& handle) {
            first_started = true;
            released.wait();
            return api_->real().start_upload(size, handle);
        }));

    std::mutex results_mutex;
    std::map<UploadId, TransferStatus> statuses;
    auto record = [&](UploadId id, const UploadResult& result) {
        std::lock_guard<std::mutex> lock(results_mutex);
        statuses[id] = result.status;
    };

    auto manager = std::make_unique<UploadManager>(orchestrator_, 1);
    auto running = manager->enqueue(make_request("running.bin"), record);
    auto first_queued = manager->enqueue(make_request("queued1.bin"), record);
    auto second_queued = manager->enqueue(make_request("queued2.bin"), record);

    while (!first_started) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(manager->queued_count(), 2u);

    // The destructor waits for the running upload, which waits for the gate
    std::thread destroyer([&manager]() { manager.reset(); });

    auto queued_reported = [&]() {
        std::lock_guard<std::mutex> lock(results_mutex);
        return statuses.count(first_queued) == 1 && statuses.count(second_queued) == 1;
    };
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!queued_reported() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    gate.set_value();
    destroyer.join();

    std::lock_guard<std::mutex> lock(results_mutex);
    ASSERT_EQ(statuses.size(), 3u);
    EXPECT_EQ(statuses[first_queued], TransferStatus::CANCELLED);
    EXPECT_EQ(statuses[second_queued], TransferStatus::CANCELLED);
    EXPECT_EQ(statuses[running], TransferStatus::CANCELLED);
    EXPECT_EQ(vault_->directory->get_record_count(), 0u);
}
