#include <gtest/gtest.h>
#include "transfer_test_support.hpp"
#include "coffer/transfer/filesystem_cache.hpp"

using namespace coffer::transfer;
using coffer::core::ErrorCode;
using coffer::storage::FileRecord;
using coffer::storage::FilesystemEntry;
using coffer::storage::ROOT_HANDLE;
using coffer::test::TestVault;
using coffer::test::OTHER_USER;

namespace {
    constexpr std::uint64_t CHUNK_SIZE_PLUS = coffer::crypto::CHUNK_DATA_SIZE + 123;

    FilesystemEntry make_entry(const std::string& handle, const std::string& name, bool is_folder,
                               const std::string& parent = std::string(ROOT_HANDLE)) {
        FilesystemEntry entry;
        entry.handle = handle;
        entry.name = name;
        entry.is_folder = is_folder;
        entry.parent_handle = parent;
        return entry;
    }
}

TEST(FilesystemCacheTest, InsertFindRemove) {
    FilesystemCache cache;
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.find("FileAAAAAAAAAAA1").has_value());

    cache.insert(make_entry("FileAAAAAAAAAAA1", "a.txt", false));
    ASSERT_TRUE(cache.find("FileAAAAAAAAAAA1").has_value());
    EXPECT_EQ(cache.find("FileAAAAAAAAAAA1")->name, "a.txt");

    // Reinserting replaces
    cache.insert(make_entry("FileAAAAAAAAAAA1", "b.txt", false));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.find("FileAAAAAAAAAAA1")->name, "b.txt");

    EXPECT_TRUE(cache.remove("FileAAAAAAAAAAA1"));
    EXPECT_FALSE(cache.remove("FileAAAAAAAAAAA1"));
    EXPECT_EQ(cache.size(), 0u);
}

TEST(FilesystemCacheTest, ChildrenListFoldersFirstByName) {
    FilesystemCache cache;
    cache.insert(make_entry("FileBAAAAAAAAAA1", "zebra.txt", false));
    cache.insert(make_entry("FileAAAAAAAAAAA1", "apple.txt", false));
    cache.insert(make_entry("FolderBAAAAAAAA1", "music", true));
    cache.insert(make_entry("FolderAAAAAAAAA1", "docs", true));
    cache.insert(make_entry("NestedAAAAAAAAA1", "inner.txt", false, "FolderAAAAAAAAA1"));

    auto root = cache.children(std::string(ROOT_HANDLE));
    ASSERT_EQ(root.size(), 4u);
    EXPECT_EQ(root[0].name, "docs");
    EXPECT_EQ(root[1].name, "music");
    EXPECT_EQ(root[2].name, "apple.txt");
    EXPECT_EQ(root[3].name, "zebra.txt");

    auto nested = cache.children("FolderAAAAAAAAA1");
    ASSERT_EQ(nested.size(), 1u);
    EXPECT_EQ(nested[0].handle, "NestedAAAAAAAAA1");

    cache.clear();
    EXPECT_TRUE(cache.children(std::string(ROOT_HANDLE)).empty());
}

class FilesystemCacheLoadTest : public ::testing::Test {
protected:
    void SetUp() override {
        vault_ = std::make_unique<TestVault>("coffer_filesystem_cache_test");
    }

    void TearDown() override {
        vault_.reset();
    }

    std::unique_ptr<TestVault> vault_;
    FilesystemCache cache_;
};

TEST_F(FilesystemCacheLoadTest, LoadsAndDecryptsChildren) {
    auto stored = vault_->store_file("FileAAAAAAAAAAA1", coffer::test::random_bytes(CHUNK_SIZE_PLUS));
    vault_->store_folder("FolderAAAAAAAAA1", "docs");

    std::vector<FilesystemEntry> loaded;
    ASSERT_TRUE(cache_.load_children(*vault_->api, vault_->keys, std::string(ROOT_HANDLE), &loaded).success());
    EXPECT_EQ(loaded.size(), 2u);
    EXPECT_EQ(cache_.size(), 2u);

    auto file = cache_.find("FileAAAAAAAAAAA1");
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->name, "FileAAAAAAAAAAA1.bin");
    EXPECT_EQ(file->size, CHUNK_SIZE_PLUS);
    EXPECT_EQ(file->encrypted_file_size, stored.encrypted_file_size);
    EXPECT_EQ(file->file_crypt_key, stored.file_crypt_key);
    EXPECT_EQ(file->signature, stored.signature);
    EXPECT_EQ(file->date_added, 1700000000);
    EXPECT_FALSE(file->is_folder);

    auto folder = cache_.find("FolderAAAAAAAAA1");
    ASSERT_TRUE(folder.has_value());
    EXPECT_TRUE(folder->is_folder);
    EXPECT_EQ(folder->name, "docs");
    EXPECT_EQ(folder->size, 0u);
}

TEST_F(FilesystemCacheLoadTest, SkipsRecordsThatDoNotDecrypt) {
    vault_->store_file("FileAAAAAAAAAAA1", coffer::test::random_bytes(100));

    // Metadata sealed under somebody else's master key
    coffer::crypto::KeyManager stranger;
    ASSERT_TRUE(stranger.generate_keys().success());
    FileRecord foreign;
    foreign.handle = "ForeignAAAAAAAA1";
    foreign.owner_user_id = coffer::test::TEST_USER;
    foreign.parent_handle = std::string(ROOT_HANDLE);
    foreign.is_folder = true;
    ASSERT_TRUE(vault_->codec.encrypt_file_metadata({"secret", 1, true}, stranger.master_key(),
                                                    foreign.encrypted_metadata).success());
    ASSERT_TRUE(vault_->directory->register_folder(foreign).success());

    std::vector<FilesystemEntry> loaded;
    ASSERT_TRUE(cache_.load_children(*vault_->api, vault_->keys, std::string(ROOT_HANDLE), &loaded).success());
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].handle, "FileAAAAAAAAAAA1");
    EXPECT_FALSE(cache_.find("ForeignAAAAAAAA1").has_value());
}

TEST_F(FilesystemCacheLoadTest, ListingFailurePropagates) {
    vault_->store_folder("TheirFolderAAAA1", "theirs", OTHER_USER);
    EXPECT_EQ(cache_.load_children(*vault_->api, vault_->keys, "TheirFolderAAAA1").error,
              ErrorCode::OWNERSHIP_MISMATCH);
    EXPECT_EQ(cache_.size(), 0u);
}

TEST_F(FilesystemCacheLoadTest, DecodeRejectsMalformedRecords) {
    vault_->store_file("FileAAAAAAAAAAA1", coffer::test::random_bytes(100));
    coffer::storage::LookupResult found;
    ASSERT_TRUE(vault_->directory->lookup("FileAAAAAAAAAAA1", found).success());

    FilesystemEntry entry;
    auto record = found.record;
    record.signature.pop_back();
    EXPECT_EQ(FilesystemCache::decode_record(record, vault_->keys.master_key(), vault_->codec, entry).error,
              ErrorCode::INVALID_FORMAT);

    record = found.record;
    record.encrypted_file_size = 10;
    EXPECT_EQ(FilesystemCache::decode_record(record, vault_->keys.master_key(), vault_->codec, entry).error,
              ErrorCode::INVALID_FORMAT);

    record = found.record;
    record.encrypted_file_crypt_key[30] ^= 0x01;
    EXPECT_EQ(FilesystemCache::decode_record(record, vault_->keys.master_key(), vault_->codec, entry).error,
              ErrorCode::AUTHENTICATION_FAILED);
}

TEST_F(FilesystemCacheLoadTest, CreateFolderThenRename) {
    FilesystemEntry folder;
    ASSERT_TRUE(cache_.create_folder(*vault_->api, vault_->keys, std::string(ROOT_HANDLE), "photos", folder).success());
    EXPECT_TRUE(folder.is_folder);
    EXPECT_EQ(folder.name, "photos");
    EXPECT_GT(folder.date_added, 0);
    ASSERT_TRUE(cache_.find(folder.handle).has_value());

    FilesystemEntry nested;
    ASSERT_TRUE(cache_.create_folder(*vault_->api, vault_->keys, folder.handle, "2024", nested).success());
    EXPECT_EQ(nested.parent_handle, folder.handle);

    ASSERT_TRUE(cache_.rename(*vault_->api, vault_->keys, folder.handle, "pictures").success());
    EXPECT_EQ(cache_.find(folder.handle)->name, "pictures");

    // A fresh cache sees what the server stored
    FilesystemCache fresh;
    std::vector<FilesystemEntry> loaded;
    ASSERT_TRUE(fresh.load_children(*vault_->api, vault_->keys, std::string(ROOT_HANDLE), &loaded).success());
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].name, "pictures");
    EXPECT_TRUE(loaded[0].is_folder);
    EXPECT_EQ(loaded[0].date_added, folder.date_added);

    loaded.clear();
    ASSERT_TRUE(fresh.load_children(*vault_->api, vault_->keys, folder.handle, &loaded).success());
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].name, "2024");
}

TEST_F(FilesystemCacheLoadTest, RenameKeepsFileKeyAndSignature) {
    auto stored = vault_->store_file("FileAAAAAAAAAAA1", coffer::test::random_bytes(100));
    ASSERT_TRUE(cache_.load_children(*vault_->api, vault_->keys, std::string(ROOT_HANDLE)).success());
    ASSERT_TRUE(cache_.rename(*vault_->api, vault_->keys, "FileAAAAAAAAAAA1", "notes.txt").success());

    FilesystemCache fresh;
    ASSERT_TRUE(fresh.load_children(*vault_->api, vault_->keys, std::string(ROOT_HANDLE)).success());
    auto file = fresh.find("FileAAAAAAAAAAA1");
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->name, "notes.txt");
    EXPECT_FALSE(file->is_folder);
    EXPECT_EQ(file->date_added, 1700000000);
    EXPECT_EQ(file->file_crypt_key, stored.file_crypt_key);
    EXPECT_EQ(file->signature, stored.signature);
}

TEST_F(FilesystemCacheLoadTest, FolderAndRenameErrors) {
    FilesystemEntry folder;
    EXPECT_EQ(cache_.create_folder(*vault_->api, vault_->keys, std::string(ROOT_HANDLE), "", folder).error,
              ErrorCode::INVALID_ARGUMENT);

    vault_->store_folder("TheirFolderAAAA1", "theirs", OTHER_USER);
    EXPECT_EQ(cache_.create_folder(*vault_->api, vault_->keys, "TheirFolderAAAA1", "mine", folder).error,
              ErrorCode::OWNERSHIP_MISMATCH);
    EXPECT_EQ(cache_.size(), 0u);

    EXPECT_EQ(cache_.rename(*vault_->api, vault_->keys, "FileAAAAAAAAAAA1", "x").error, ErrorCode::NOT_FOUND);

    // Cached locally but owned by someone else on the server
    cache_.insert(make_entry("TheirFolderAAAA1", "theirs", true));
    EXPECT_EQ(cache_.rename(*vault_->api, vault_->keys, "TheirFolderAAAA1", "stolen").error, ErrorCode::NOT_FOUND);
    EXPECT_EQ(cache_.find("TheirFolderAAAA1")->name, "theirs");
}

TEST_F(FilesystemCacheLoadTest, UsageCountsUploadedFiles) {
    std::uint64_t used = 1;
    ASSERT_TRUE(vault_->api->get_usage(used).success());
    EXPECT_EQ(used, 0u);

    vault_->store_file("FileAAAAAAAAAAA1", coffer::test::random_bytes(CHUNK_SIZE_PLUS));
    ASSERT_TRUE(vault_->api->get_usage(used).success());
    EXPECT_EQ(used, coffer::storage::encrypted_file_size(CHUNK_SIZE_PLUS));
}
