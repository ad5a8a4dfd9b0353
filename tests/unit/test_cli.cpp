#include <gtest/gtest.h>
#include "coffer/core/cli.hpp"
#include "coffer/core/command_registry.hpp"
#include "coffer/core/config.hpp"
#include "coffer/core/vault.hpp"
#include "coffer/storage/file_format.hpp"
#include <filesystem>
#include <fstream>
#include <vector>

using namespace coffer::core;

namespace {
    bool parse(CommandLineParser& parser, std::vector<std::string> args) {
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parser.parse(static_cast<int>(argv.size()), argv.data());
    }
}

TEST(CommandLineParserTest, ParsesOptionsAndPositionals) {
    CommandLineParser parser("coffer");
    ASSERT_TRUE(parse(parser, {"coffer", "--verbose", "-c", "vault.conf", "upload", "file.bin"}));
    
    EXPECT_TRUE(parser.has_option("verbose"));
    EXPECT_EQ(parser.get_option("config"), "vault.conf");
    ASSERT_EQ(parser.get_positional_args().size(), 2);
    EXPECT_EQ(parser.get_positional_args()[0], "upload");
    EXPECT_EQ(parser.get_positional_args()[1], "file.bin");
}

TEST(CommandLineParserTest, ConfigDefaultsToHomeFile) {
    CommandLineParser parser("coffer");
    ASSERT_TRUE(parse(parser, {"coffer", "ls"}));
    EXPECT_EQ(parser.get_option("config"), "~/.coffer.conf");
}

TEST(CommandLineParserTest, RejectsUnknownOption) {
    CommandLineParser parser("coffer");
    EXPECT_FALSE(parse(parser, {"coffer", "--force"}));
    EXPECT_EQ(parser.get_error(), "Unknown option: --force");
}

TEST(CommandLineParserTest, MissingValue) {
    CommandLineParser parser("coffer");
    EXPECT_FALSE(parse(parser, {"coffer", "--config"}));
}

TEST(CommandLineParserTest, CommandArgumentsPassThrough) {
    CommandLineParser parser("coffer");
    ASSERT_TRUE(parse(parser, {"coffer", "-d", "/tmp/vault", "download", "-weird-name", "--force"}));
    ASSERT_EQ(parser.get_positional_args().size(), 3u);
    EXPECT_EQ(parser.get_positional_args()[1], "-weird-name");
    EXPECT_EQ(parser.get_positional_args()[2], "--force");

    ASSERT_TRUE(parse(parser, {"coffer", "--", "-h"}));
    EXPECT_FALSE(parser.has_option("help"));
    EXPECT_EQ(parser.get_positional_args()[0], "-h");
}

TEST(CommandLineParserTest, AppliesConfigOverrides) {
    CommandLineParser parser("coffer");
    ASSERT_TRUE(parse(parser, {"coffer", "--data-dir=/srv/vault", "-u7", "--verbose", "ls"}));
    EXPECT_EQ(parser.get_option("d"), "/srv/vault");

    Config config;
    config.set_defaults();
    EXPECT_EQ(parser.apply_overrides(config), 2u);
    EXPECT_EQ(config.get_string("storage.base_dir"), "/srv/vault");
    EXPECT_EQ(config.get_int("user.id"), 7);
    EXPECT_EQ(config.get_string("keys.dir"), "./coffer_data/keys");
}

TEST(CommandLineParserTest, FlagRejectsInlineValue) {
    CommandLineParser parser("coffer");
    EXPECT_FALSE(parse(parser, {"coffer", "--verbose=yes"}));
    EXPECT_EQ(parser.get_error(), "Option --verbose does not take a value");
}

class CommandRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_dir = std::filesystem::temp_directory_path() / "coffer_cli_test";
        std::filesystem::remove_all(base_dir);
        
        auto& config = Config::instance();
        config.clear();
        config.set_defaults();
        config.set("storage.base_dir", (base_dir / "data").string());
        config.set("keys.dir", (base_dir / "keys").string());
    }
    
    void TearDown() override {
        Config::instance().clear();
        std::filesystem::remove_all(base_dir);
    }
    
    std::filesystem::path base_dir;
};

TEST_F(CommandRegistryTest, KnowsVaultCommands) {
    CommandRegistry registry;
    EXPECT_TRUE(registry.has_command("keygen"));
    EXPECT_TRUE(registry.has_command("upload"));
    EXPECT_TRUE(registry.has_command("download"));
    EXPECT_TRUE(registry.has_command("ls"));
    EXPECT_TRUE(registry.has_command("mkdir"));
    EXPECT_TRUE(registry.has_command("rename"));
    EXPECT_TRUE(registry.has_command("usage"));
    EXPECT_FALSE(registry.has_command("share"));
    
    auto result = registry.execute_command("share", {"share"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 1);
}

TEST_F(CommandRegistryTest, UsageErrors) {
    CommandRegistry registry;
    EXPECT_FALSE(registry.execute_command("upload", {"upload"}).success);
    EXPECT_FALSE(registry.execute_command("download", {"download", "abc"}).success);
    EXPECT_FALSE(registry.execute_command("download", {"download", "not-a-handle!!!!", "out"}).success);
    EXPECT_FALSE(registry.execute_command("mkdir", {"mkdir"}).success);
    EXPECT_FALSE(registry.execute_command("mkdir", {"mkdir", "docs", "bad"}).success);
    EXPECT_FALSE(registry.execute_command("rename", {"rename", "MissingAAAAAAAA1"}).success);
    EXPECT_FALSE(registry.execute_command("rename", {"rename", "MissingAAAAAAAA1", "x"}).success);
}

TEST_F(CommandRegistryTest, KeygenCreatesKeyFile) {
    CommandRegistry registry;
    auto result = registry.execute_command("keygen", {"keygen"});
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_TRUE(std::filesystem::exists(base_dir / "keys" / "user.keys"));
    
    // A second run keeps the existing keys
    auto before = std::filesystem::last_write_time(base_dir / "keys" / "user.keys");
    EXPECT_TRUE(registry.execute_command("keygen", {"keygen"}).success);
    EXPECT_EQ(std::filesystem::last_write_time(base_dir / "keys" / "user.keys"), before);
}

TEST_F(CommandRegistryTest, UploadListDownload) {
    auto source = base_dir / "hello.txt";
    std::filesystem::create_directories(base_dir);
    std::ofstream(source) << "hello vault";
    
    CommandRegistry registry;
    auto result = registry.execute_command("upload", {"upload", source.string()});
    ASSERT_TRUE(result.success) << result.message;
    
    EXPECT_TRUE(registry.execute_command("ls", {"ls"}).success);
    
    auto files = base_dir / "data" / "files";
    ASSERT_TRUE(std::filesystem::exists(files));
    std::string handle;
    for (const auto& entry : std::filesystem::directory_iterator(files)) {
        handle = entry.path().stem().string();
    }
    ASSERT_EQ(handle.size(), 16);
    
    auto destination = base_dir / "restored.txt";
    result = registry.execute_command("download", {"download", handle, destination.string()});
    ASSERT_TRUE(result.success) << result.message;
    
    std::ifstream restored(destination);
    std::string content((std::istreambuf_iterator<char>(restored)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "hello vault");
}

TEST_F(CommandRegistryTest, MkdirUploadIntoFolderRenameAndUsage) {
    auto source = base_dir / "hello.txt";
    std::filesystem::create_directories(base_dir);
    std::ofstream(source) << "hello vault";
    const std::string root(coffer::storage::ROOT_HANDLE);
    
    CommandRegistry registry;
    auto result = registry.execute_command("mkdir", {"mkdir", "docs"});
    ASSERT_TRUE(result.success) << result.message;
    
    std::string folder;
    {
        Vault vault(Config::instance());
        ASSERT_TRUE(vault.open().success());
        std::vector<coffer::storage::FilesystemEntry> listed;
        ASSERT_TRUE(vault.cache().load_children(*vault.api(), vault.keys(), root, &listed).success());
        ASSERT_EQ(listed.size(), 1u);
        EXPECT_TRUE(listed[0].is_folder);
        EXPECT_EQ(listed[0].name, "docs");
        folder = listed[0].handle;
    }
    
    result = registry.execute_command("upload", {"upload", source.string(), folder});
    ASSERT_TRUE(result.success) << result.message;
    result = registry.execute_command("rename", {"rename", folder, "papers"});
    ASSERT_TRUE(result.success) << result.message;
    result = registry.execute_command("usage", {"usage"});
    ASSERT_TRUE(result.success) << result.message;
    
    Vault vault(Config::instance());
    ASSERT_TRUE(vault.open().success());
    std::vector<coffer::storage::FilesystemEntry> listed;
    ASSERT_TRUE(vault.cache().load_children(*vault.api(), vault.keys(), root, &listed).success());
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].name, "papers");
    
    listed.clear();
    ASSERT_TRUE(vault.cache().load_children(*vault.api(), vault.keys(), folder, &listed).success());
    ASSERT_EQ(listed.size(), 1u);
    EXPECT_EQ(listed[0].name, "hello.txt");
    
    std::uint64_t used = 0;
    ASSERT_TRUE(vault.api()->get_usage(used).success());
    EXPECT_EQ(used, coffer::storage::encrypted_file_size(11));
}
