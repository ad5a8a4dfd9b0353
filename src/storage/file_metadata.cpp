#include "coffer/storage/file_metadata.hpp"

namespace coffer::storage {

void to_json(nlohmann::json& j, const FileMetadata& metadata) {
    j = nlohmann::json{
        {"fn", metadata.file_name},
        {"da", metadata.date_added},
        {"if", metadata.is_folder}
    };
}

void from_json(const nlohmann::json& j, FileMetadata& metadata) {
    j.at("fn").get_to(metadata.file_name);
    j.at("da").get_to(metadata.date_added);
    j.at("if").get_to(metadata.is_folder);
}

} // namespace coffer::storage
