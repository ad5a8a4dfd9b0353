#pragma once

#include <map>
#include <string>
#include <vector>

namespace coffer::core {

class Config;

// Parses the global options that precede the command. Everything from the
// command onwards is handed to the command untouched, so command arguments
// may themselves start with '-'.
class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);

    // config_key, when set, is the Config entry the option overrides
    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, bool has_value = false,
                    const std::string& default_value = "",
                    const std::string& config_key = "");

    bool parse(int argc, char* argv[]);

    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;

    // Copies every option given on the command line that maps to a Config key
    size_t apply_overrides(Config& config) const;

    // Command name followed by its arguments
    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    struct Option {
        std::string long_name;
        std::string description;
        bool has_value = false;
        std::string default_value;
        std::string config_key;
    };

    bool take_option(const std::string& name, const std::string& display,
                     const std::string* inline_value, int argc, char* argv[], int& index);
    std::string normalize_option_name(const std::string& name) const;

    std::string program_name_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::map<std::string, std::string> parsed_options_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

} // namespace coffer::core
