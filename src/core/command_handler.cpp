#include "coffer/core/command_handler.hpp"
#include "coffer/core/config.hpp"
#include "coffer/core/logger.hpp"
#include "coffer/core/utils.hpp"
#include "coffer/core/vault.hpp"
#include "coffer/storage/file_format.hpp"
#include "coffer/transfer/download_orchestrator.hpp"
#include "coffer/transfer/download_sink.hpp"
#include "coffer/transfer/upload_manager.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace coffer::core {

namespace {
    void print_progress(const transfer::TransferProgress& progress) {
        std::cout << "\r  " << std::fixed << std::setprecision(1) << progress.percentage() << "%  "
                  << utils::StringUtils::format_bytes(progress.bytes_transferred) << " / "
                  << utils::StringUtils::format_bytes(progress.total_bytes) << "  "
                  << utils::StringUtils::format_bytes(progress.speed_bps) << "/s   " << std::flush;
    }
}

// KeygenCommandHandler Implementation
CommandResult KeygenCommandHandler::execute(const std::vector<std::string>& args) {
    (void)args;
    auto keys_dir = utils::FileUtils::expand_home(Config::instance().get_string("keys.dir", "./coffer_data/keys"));
    auto key_file = keys_dir / crypto::KeyManager::KEY_FILE_NAME;
    bool existed = utils::FileUtils::exists(key_file);
    
    try {
        crypto::KeyManager keys;
        if (!keys.initialize(keys_dir)) {
            return CommandResult::error("Failed to create keys in " + keys_dir.string());
        }
        
        std::cout << (existed ? "Keys already exist" : "Generated new keys") << " in " << key_file.string() << "\n";
        std::cout << "  Fingerprint: " << keys.fingerprint() << "\n";
        return CommandResult::ok();
        
    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

// UploadCommandHandler Implementation
CommandResult UploadCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::filesystem::path file_path = args[1];
    std::string parent_handle = args.size() > 2 ? args[2] : std::string(storage::ROOT_HANDLE);
    
    auto file_size = utils::FileUtils::file_size(file_path);
    if (!file_size) {
        return CommandResult::error("File does not exist: " + file_path.string());
    }
    
    try {
        Vault vault(Config::instance());
        auto result = vault.open();
        if (!result) {
            return CommandResult::error("Failed to open vault: " + result.to_string());
        }
        
        auto orchestrator = std::make_shared<transfer::UploadOrchestrator>(
            vault.api(), vault.keys(), vault.upload_options(), &vault.cache());
        transfer::UploadManager manager(orchestrator, vault.max_concurrent_uploads());
        
        auto source = std::make_shared<transfer::FileByteSource>(file_path);
        if (!source->is_open()) {
            return CommandResult::error("Cannot read " + file_path.string());
        }
        
        transfer::UploadRequest request;
        request.file_name = file_path.filename().string();
        request.file_size = *file_size;
        request.source = source;
        request.parent_handle = parent_handle;
        
        std::cout << "Uploading " << request.file_name << " ("
                  << utils::StringUtils::format_bytes(request.file_size) << ")\n";
        
        transfer::UploadResult outcome;
        manager.enqueue(request, [&outcome](transfer::UploadId, const transfer::UploadResult& done) {
            outcome = done;
        }, print_progress);
        manager.wait_idle();
        std::cout << "\n";
        
        if (outcome.status != transfer::TransferStatus::FINISHED) {
            return CommandResult::error("Upload failed: " + outcome.result.to_string());
        }
        
        std::cout << "✓ Uploaded\n";
        std::cout << "  Handle: " << outcome.entry.handle << "\n";
        std::cout << "  Encrypted size: " << outcome.entry.encrypted_file_size << " bytes\n";
        std::cout << "  Chunks: " << storage::chunk_count(outcome.entry.size) << "\n";
        return CommandResult::ok("File uploaded successfully");
        
    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

// DownloadCommandHandler Implementation
CommandResult DownloadCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    const std::string& handle = args[1];
    std::filesystem::path destination = args[2];
    if (!storage::is_valid_handle(handle) || storage::is_root_handle(handle)) {
        return CommandResult::error("Invalid handle: " + handle);
    }
    
    try {
        Vault vault(Config::instance());
        auto result = vault.open();
        if (!result) {
            return CommandResult::error("Failed to open vault: " + result.to_string());
        }
        
        storage::LookupResult lookup;
        result = vault.directory().lookup(handle, lookup);
        if (!result || lookup.record.owner_user_id != vault.user_id()) {
            return CommandResult::error("File not found: " + handle + "\nUse 'coffer ls' to see available files");
        }
        
        result = vault.cache().load_children(*vault.api(), vault.keys(), lookup.record.parent_handle);
        if (!result) {
            return CommandResult::error("Failed to list folder: " + result.to_string());
        }
        
        auto entry = vault.cache().find(handle);
        if (!entry) {
            return CommandResult::error("Cannot decrypt the entry for " + handle);
        }
        
        std::cout << "Downloading " << entry->name << " ("
                  << utils::StringUtils::format_bytes(entry->size) << ")\n";
        
        transfer::DownloadOrchestrator orchestrator(vault.api());
        transfer::FileDownloadSink sink(destination);
        auto outcome = orchestrator.download_to_sink(*entry, vault.keys().signing_keys().public_key, sink,
                                                     {}, print_progress);
        std::cout << "\n";
        
        if (outcome.status != transfer::TransferStatus::FINISHED) {
            return CommandResult::error("Download failed: " + outcome.result.to_string());
        }
        
        std::cout << "✓ Downloaded and verified into " << destination.string() << "\n";
        return CommandResult::ok("File downloaded successfully");
        
    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

// ListCommandHandler Implementation
CommandResult ListCommandHandler::execute(const std::vector<std::string>& args) {
    std::string parent_handle = args.size() > 1 ? args[1] : std::string(storage::ROOT_HANDLE);
    if (!storage::is_valid_handle(parent_handle)) {
        return CommandResult::error("Invalid handle: " + parent_handle);
    }
    
    try {
        Vault vault(Config::instance());
        auto result = vault.open();
        if (!result) {
            return CommandResult::error("Failed to open vault: " + result.to_string());
        }
        
        result = vault.cache().load_children(*vault.api(), vault.keys(), parent_handle);
        if (!result) {
            return CommandResult::error("Failed to list folder: " + result.to_string());
        }
        
        auto entries = vault.cache().children(parent_handle);
        if (entries.empty()) {
            std::cout << "No files in " << parent_handle << "\n";
            return CommandResult::ok();
        }
        
        for (const auto& entry : entries) {
            std::cout << entry.handle << "  "
                      << std::left << std::setw(12)
                      << (entry.is_folder ? std::string("<dir>") : utils::StringUtils::format_bytes(entry.size))
                      << utils::TimeUtils::format_timestamp(entry.date_added) << "  "
                      << entry.name << "\n";
        }
        return CommandResult::ok();
        
    } catch (const std::exception& e) {
        return CommandResult::error("Failed to list files: " + std::string(e.what()));
    }
}

// MkdirCommandHandler Implementation
CommandResult MkdirCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2 || args[1].empty()) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    const std::string& name = args[1];
    std::string parent_handle = args.size() > 2 ? args[2] : std::string(storage::ROOT_HANDLE);
    if (!storage::is_valid_handle(parent_handle)) {
        return CommandResult::error("Invalid handle: " + parent_handle);
    }
    
    try {
        Vault vault(Config::instance());
        auto result = vault.open();
        if (!result) {
            return CommandResult::error("Failed to open vault: " + result.to_string());
        }
        
        storage::FilesystemEntry folder;
        result = vault.cache().create_folder(*vault.api(), vault.keys(), parent_handle, name, folder);
        if (!result) {
            return CommandResult::error("Failed to create folder: " + result.to_string());
        }
        
        std::cout << "✓ Created folder " << folder.name << "\n";
        std::cout << "  Handle: " << folder.handle << "\n";
        return CommandResult::ok("Folder created");
        
    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

// RenameCommandHandler Implementation
CommandResult RenameCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3 || args[2].empty()) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    const std::string& handle = args[1];
    const std::string& new_name = args[2];
    if (!storage::is_valid_handle(handle) || storage::is_root_handle(handle)) {
        return CommandResult::error("Invalid handle: " + handle);
    }
    
    try {
        Vault vault(Config::instance());
        auto result = vault.open();
        if (!result) {
            return CommandResult::error("Failed to open vault: " + result.to_string());
        }
        
        storage::LookupResult lookup;
        result = vault.directory().lookup(handle, lookup);
        if (!result || lookup.record.owner_user_id != vault.user_id()) {
            return CommandResult::error("Entry not found: " + handle);
        }
        
        // The current metadata supplies the date added and the folder flag
        result = vault.cache().load_children(*vault.api(), vault.keys(), lookup.record.parent_handle);
        if (result) {
            result = vault.cache().rename(*vault.api(), vault.keys(), handle, new_name);
        }
        if (!result) {
            return CommandResult::error("Rename failed: " + result.to_string());
        }
        
        std::cout << "✓ Renamed " << handle << " to " << new_name << "\n";
        return CommandResult::ok("Entry renamed");
        
    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

// UsageCommandHandler Implementation
CommandResult UsageCommandHandler::execute(const std::vector<std::string>& args) {
    (void)args;
    try {
        Vault vault(Config::instance());
        auto result = vault.open();
        if (!result) {
            return CommandResult::error("Failed to open vault: " + result.to_string());
        }
        
        std::uint64_t bytes_used = 0;
        result = vault.api()->get_usage(bytes_used);
        if (!result) {
            return CommandResult::error("Failed to query usage: " + result.to_string());
        }
        
        std::cout << "Storage used: " << utils::StringUtils::format_bytes(bytes_used)
                  << " (" << bytes_used << " bytes)\n";
        return CommandResult::ok();
        
    } catch (const std::exception& e) {
        return CommandResult::error("Exception: " + std::string(e.what()));
    }
}

} // namespace coffer::core
