#include "coffer/core/vault.hpp"
#include "coffer/core/config.hpp"
#include "coffer/core/logger.hpp"
#include "coffer/core/utils.hpp"

namespace coffer::core {

Vault::Vault(const Config& config)
    : storage_config_(utils::FileUtils::expand_home(config.get_string("storage.base_dir", "./coffer_data")))
    , keys_dir_(utils::FileUtils::expand_home(config.get_string("keys.dir", "./coffer_data/keys")))
    , user_id_(config.get_as<storage::UserId>("user.id").value_or(1))
    , session_expiry_(config.get_int("server.session_expiry_ms", 10000))
    , max_buffered_chunks_(static_cast<size_t>(config.get_int("server.max_buffered_chunks", 4)))
    , max_concurrent_uploads_(static_cast<size_t>(config.get_int("transfer.max_concurrent_uploads", 4))) {
    
    upload_options_.max_concurrent_chunks = static_cast<size_t>(config.get_int("transfer.max_concurrent_chunks", 4));
    upload_options_.throughput_increment =
        config.get_as<std::uint64_t>("transfer.throughput_increment").value_or(transfer::DEFAULT_THROUGHPUT_INCREMENT);
    upload_options_.retune_interval = std::chrono::milliseconds(config.get_int("transfer.retune_interval_ms", 250));
}

Vault::~Vault() {
    close();
}

Result Vault::open() {
    if (!storage_config_.create_directories() || !storage_config_.validate()) {
        return Result(ErrorCode::IO_ERROR, "Cannot prepare storage under " + storage_config_.database_path.parent_path().string());
    }
    
    directory_ = std::make_shared<storage::SqliteDirectoryService>(storage_config_);
    if (!directory_->initialize()) {
        return Result(ErrorCode::IO_ERROR, "Cannot open " + storage_config_.database_path.string());
    }
    
    if (!keys_.initialize(keys_dir_)) {
        return Result(ErrorCode::CRYPTO_FAILURE, "Cannot load or create keys in " + keys_dir_.string());
    }
    
    uploads_ = std::make_shared<server::UploadSessionStore>(directory_, storage_config_, max_buffered_chunks_);
    downloads_ = std::make_shared<server::ChunkSessionStore>(directory_, session_expiry_);
    if (!downloads_->start()) {
        return Result(ErrorCode::INVALID_STATE, "Cannot start the download session store");
    }
    
    endpoints_ = std::make_shared<server::TransferEndpoints>(directory_, uploads_, downloads_);
    api_ = std::make_shared<transfer::LoopbackTransferApi>(endpoints_, user_id_);
    
    LOG_DEBUG("Opened vault for user {} with key {}", user_id_, keys_.fingerprint());
    return Result();
}

void Vault::close() {
    api_.reset();
    endpoints_.reset();
    if (downloads_) {
        downloads_->stop();
        downloads_.reset();
    }
    uploads_.reset();
    directory_.reset();
    cache_.clear();
}

} // namespace coffer::core
