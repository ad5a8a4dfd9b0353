#include "coffer/server/transfer_schemas.hpp"
#include "coffer/crypto/encoding.hpp"

namespace coffer::server {

using core::ErrorCode;
using core::Result;
using crypto::encoding::base64_decode;
using crypto::encoding::base64_encode;

namespace {
    Result decode_field(const nlohmann::json& j, const char* name, std::vector<std::uint8_t>& out) {
        if (!j.contains(name) || !j.at(name).is_string()) {
            return Result(ErrorCode::INVALID_ARGUMENT, std::string("Missing field: ") + name);
        }
        auto result = base64_decode(j.at(name).get<std::string>(), out);
        if (!result) {
            return Result(ErrorCode::INVALID_ARGUMENT, std::string("Field is not valid base64: ") + name);
        }
        return Result();
    }

    Result string_field(const nlohmann::json& j, const char* name, std::string& out) {
        if (!j.contains(name) || !j.at(name).is_string()) {
            return Result(ErrorCode::INVALID_ARGUMENT, std::string("Missing field: ") + name);
        }
        out = j.at(name).get<std::string>();
        return Result();
    }
}

nlohmann::json finalise_request_to_json(const FinaliseUploadRequest& request) {
    return nlohmann::json{
        {"handle", request.handle},
        {"parentHandle", request.parent_handle},
        {"encryptedMetadata", base64_encode(request.encrypted_metadata)},
        {"encryptedFileCryptKey", base64_encode(request.encrypted_file_crypt_key)},
        {"signature", base64_encode(request.signature)}
    };
}

Result finalise_request_from_json(const std::string& body, FinaliseUploadRequest& out_request) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Request body is not a JSON object");
    }

    Result result;
    if (!(result = string_field(j, "handle", out_request.handle))) return result;
    if (!(result = string_field(j, "parentHandle", out_request.parent_handle))) return result;
    if (!(result = decode_field(j, "encryptedMetadata", out_request.encrypted_metadata))) return result;
    if (!(result = decode_field(j, "encryptedFileCryptKey", out_request.encrypted_file_crypt_key))) return result;
    if (!(result = decode_field(j, "signature", out_request.signature))) return result;

    return Result();
}

nlohmann::json create_folder_request_to_json(const CreateFolderRequest& request) {
    return nlohmann::json{
        {"parentHandle", request.parent_handle},
        {"encryptedMetadata", base64_encode(request.encrypted_metadata)}
    };
}

Result create_folder_request_from_json(const std::string& body, CreateFolderRequest& out_request) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Request body is not a JSON object");
    }

    Result result;
    if (!(result = string_field(j, "parentHandle", out_request.parent_handle))) return result;
    if (!(result = decode_field(j, "encryptedMetadata", out_request.encrypted_metadata))) return result;

    return Result();
}

nlohmann::json metadata_updates_to_json(const std::vector<storage::MetadataUpdate>& updates) {
    auto items = nlohmann::json::array();
    for (const auto& update : updates) {
        items.push_back(nlohmann::json{
            {"handle", update.handle},
            {"encryptedMetadata", base64_encode(update.encrypted_metadata)}
        });
    }
    return items;
}

Result metadata_updates_from_json(const std::string& body, std::vector<storage::MetadataUpdate>& out_updates) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_array()) {
        return Result(ErrorCode::INVALID_ARGUMENT, "Request body is not a JSON array");
    }

    out_updates.clear();
    out_updates.reserve(j.size());
    for (const auto& item : j) {
        if (!item.is_object()) {
            return Result(ErrorCode::INVALID_ARGUMENT, "Metadata update is not a JSON object");
        }
        storage::MetadataUpdate update;
        Result result;
        if (!(result = string_field(item, "handle", update.handle))) return result;
        if (!(result = decode_field(item, "encryptedMetadata", update.encrypted_metadata))) return result;
        out_updates.push_back(std::move(update));
    }

    return Result();
}

nlohmann::json file_record_to_json(const storage::FileRecord& record) {
    return nlohmann::json{
        {"handle", record.handle},
        {"parentHandle", record.parent_handle},
        {"isFolder", record.is_folder},
        {"encryptedMetadata", base64_encode(record.encrypted_metadata)},
        {"encryptedFileCryptKey", base64_encode(record.encrypted_file_crypt_key)},
        {"signature", base64_encode(record.signature)},
        {"encryptedFileSize", record.encrypted_file_size}
    };
}

Result file_record_from_json(const nlohmann::json& j, storage::FileRecord& out_record) {
    if (!j.is_object()) {
        return Result(ErrorCode::INVALID_FORMAT, "File record is not a JSON object");
    }

    Result result;
    if (!(result = string_field(j, "handle", out_record.handle))) return result;
    if (!(result = string_field(j, "parentHandle", out_record.parent_handle))) return result;
    if (!(result = decode_field(j, "encryptedMetadata", out_record.encrypted_metadata))) return result;
    if (!(result = decode_field(j, "encryptedFileCryptKey", out_record.encrypted_file_crypt_key))) return result;
    if (!(result = decode_field(j, "signature", out_record.signature))) return result;

    if (!j.contains("isFolder") || !j.at("isFolder").is_boolean() ||
        !j.contains("encryptedFileSize") || !j.at("encryptedFileSize").is_number_unsigned()) {
        return Result(ErrorCode::INVALID_FORMAT, "File record is missing typed fields");
    }
    out_record.is_folder = j.at("isFolder").get<bool>();
    out_record.encrypted_file_size = j.at("encryptedFileSize").get<std::uint64_t>();

    return Result();
}

} // namespace coffer::server
