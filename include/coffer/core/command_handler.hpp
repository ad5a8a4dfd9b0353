#pragma once

#include <string>
#include <vector>

namespace coffer::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;
    
    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }
    
    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class KeygenCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Generate and store the vault keys"; }
    std::string get_usage() const override { return "coffer keygen"; }
};

class UploadCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Encrypt and upload a file into the vault"; }
    std::string get_usage() const override { return "coffer upload <file> [parent_handle]"; }
};

class DownloadCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Download and verify a file, resuming a partial download"; }
    std::string get_usage() const override { return "coffer download <handle> <destination>"; }
};

class ListCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List the decrypted entries of a folder"; }
    std::string get_usage() const override { return "coffer ls [parent_handle]"; }
};

class MkdirCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Create a folder"; }
    std::string get_usage() const override { return "coffer mkdir <name> [parent_handle]"; }
};

class RenameCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Rename a file or folder"; }
    std::string get_usage() const override { return "coffer rename <handle> <new_name>"; }
};

class UsageCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Show the encrypted bytes stored by the user"; }
    std::string get_usage() const override { return "coffer usage"; }
};

} // namespace coffer::core
