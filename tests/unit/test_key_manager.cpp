#include <gtest/gtest.h>
#include "coffer/crypto/key_manager.hpp"
#include <filesystem>
#include <fstream>

namespace coffer::crypto::test {

class KeyManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        key_dir_ = std::filesystem::temp_directory_path() / "coffer_key_manager_test";
        std::filesystem::remove_all(key_dir_);
    }
    
    void TearDown() override {
        std::filesystem::remove_all(key_dir_);
    }
    
    std::filesystem::path key_dir_;
};

TEST_F(KeyManagerTest, InitializeGeneratesAndPersists) {
    KeyManager first;
    ASSERT_TRUE(first.initialize(key_dir_));
    EXPECT_TRUE(first.has_keys());
    
    auto key_file = key_dir_ / KeyManager::KEY_FILE_NAME;
    ASSERT_TRUE(std::filesystem::exists(key_file));
    EXPECT_EQ(std::filesystem::file_size(key_file), 192u);
    
    auto perms = std::filesystem::status(key_file).permissions();
    EXPECT_EQ(perms & std::filesystem::perms::group_all, std::filesystem::perms::none);
    EXPECT_EQ(perms & std::filesystem::perms::others_all, std::filesystem::perms::none);
    
    KeyManager second;
    ASSERT_TRUE(second.initialize(key_dir_));
    EXPECT_EQ(second.master_key(), first.master_key());
    EXPECT_EQ(second.signing_keys().public_key, first.signing_keys().public_key);
    EXPECT_EQ(second.encryption_keys().public_key, first.encryption_keys().public_key);
    EXPECT_EQ(second.fingerprint(), first.fingerprint());
}

TEST_F(KeyManagerTest, CorruptKeyFileIsRejected) {
    std::filesystem::create_directories(key_dir_);
    std::ofstream(key_dir_ / KeyManager::KEY_FILE_NAME) << "garbage";
    
    KeyManager keys;
    EXPECT_FALSE(keys.initialize(key_dir_));
}

TEST_F(KeyManagerTest, SetKeysChecksSigningPair) {
    KeyManager source;
    ASSERT_TRUE(source.generate_keys().success());
    
    KeyManager target;
    auto mismatched = source.signing_keys();
    mismatched.public_key[0] ^= 0xFF;
    auto result = target.set_keys(source.master_key(), mismatched, source.encryption_keys());
    EXPECT_EQ(result.error, ErrorCode::INVALID_ARGUMENT);
    EXPECT_FALSE(target.has_keys());
    
    ASSERT_TRUE(target.set_keys(source.master_key(), source.signing_keys(), source.encryption_keys()).success());
    EXPECT_EQ(target.fingerprint(), source.fingerprint());
}

TEST_F(KeyManagerTest, AccessWithoutKeysThrows) {
    KeyManager keys;
    EXPECT_FALSE(keys.has_keys());
    EXPECT_THROW(keys.master_key(), std::runtime_error);
    EXPECT_EQ(keys.fingerprint(), "<none>");
    EXPECT_EQ(keys.save_keys(key_dir_ / "x").error, ErrorCode::INVALID_STATE);
}

TEST_F(KeyManagerTest, CleanupForgetsKeys) {
    KeyManager keys;
    ASSERT_TRUE(keys.generate_keys().success());
    keys.cleanup();
    EXPECT_FALSE(keys.has_keys());
}

} // namespace coffer::crypto::test
