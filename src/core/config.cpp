#include "coffer/core/config.hpp"
#include "coffer/core/utils.hpp"
#include <cctype>
#include <cstdlib>

namespace coffer::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }
        
        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        
        if (!key.empty()) {
            values_[key] = value;
        }
    }
    
    return true;
}

bool Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    
    file << "# coffer configuration\n\n";
    
    for (const auto& [key, value] : values_) {
        file << key << "=" << value << "\n";
    }
    
    return file.good();
}

size_t Config::load_from_env(const std::string& prefix) {
    size_t replaced = 0;
    for (auto& [key, value] : values_) {
        const char* env_value = std::getenv(env_name(prefix, key).c_str());
        if (env_value && *env_value) {
            value = env_value;
            ++replaced;
        }
    }
    return replaced;
}

std::string Config::env_name(const std::string& prefix, const std::string& key) {
    std::string name = prefix;
    for (char c : key) {
        name += (c == '.') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return name;
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    
    std::string lower = utils::StringUtils::to_lower(*value);
    return lower == "true" || lower == "1" || lower == "yes";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get_as<int>(key);
    return value ? *value : default_value;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

void Config::set_defaults() {
    values_["storage.base_dir"] = "./coffer_data";
    values_["keys.dir"] = "./coffer_data/keys";
    values_["server.session_expiry_ms"] = "10000";
    values_["server.max_buffered_chunks"] = "4";
    values_["transfer.max_concurrent_chunks"] = "4";
    values_["transfer.throughput_increment"] = "5000000";
    values_["transfer.retune_interval_ms"] = "250";
    values_["transfer.max_concurrent_uploads"] = "4";
    values_["log.level"] = "info";
    values_["log.file"] = "coffer.log";
    values_["user.id"] = "1";
}

std::string Config::trim(const std::string& str) const {
    return utils::StringUtils::trim(str);
}

} // namespace coffer::core
