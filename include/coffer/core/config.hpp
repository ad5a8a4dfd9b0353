#pragma once

#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>

namespace coffer::core {

class Config {
public:
    static Config& instance();
    
    Config() = default;
    
    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;
    
    // Overrides known keys from the environment: storage.base_dir is read
    // from <prefix>STORAGE_BASE_DIR. Returns the number of keys replaced.
    size_t load_from_env(const std::string& prefix = "COFFER_");
    
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    
    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    
    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) return std::nullopt;
        
        std::istringstream iss(*value);
        T result;
        if (!(iss >> result) || !(iss >> std::ws).eof()) {
            return std::nullopt;
        }
        return result;
    }
    
    void set_defaults();
    void clear() { values_.clear(); }

private:
    std::string trim(const std::string& str) const;
    static std::string env_name(const std::string& prefix, const std::string& key);
    
    std::map<std::string, std::string> values_;
};

} // namespace coffer::core
