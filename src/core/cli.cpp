#include "coffer/core/cli.hpp"
#include "coffer/core/config.hpp"
#include <iostream>
#include <iomanip>

namespace coffer::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name) {

    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", true, "~/.coffer.conf");
    add_option("", "verbose", "Enable debug logging");
    add_option("d", "data-dir", "Vault storage directory", true, "", "storage.base_dir");
    add_option("k", "keys-dir", "Directory holding the user key file", true, "", "keys.dir");
    add_option("u", "user", "Numeric id of the acting user", true, "", "user.id");
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                  const std::string& description, bool has_value,
                                  const std::string& default_value,
                                  const std::string& config_key) {
    options_[long_name] = Option{long_name, description, has_value, default_value, config_key};
    if (!short_name.empty()) {
        short_to_long_[short_name] = long_name;
    }
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();

    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--") {
            ++i;
            break;
        }

        if (arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            std::string name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);
            std::string inline_value = eq_pos == std::string::npos ? "" : arg.substr(eq_pos + 1);
            if (!take_option(name, "--" + name, eq_pos == std::string::npos ? nullptr : &inline_value,
                             argc, argv, i)) {
                return false;
            }
        } else if (arg.starts_with("-") && arg.length() > 1) {
            std::string short_opt = arg.substr(1, 1);
            auto long_it = short_to_long_.find(short_opt);
            if (long_it == short_to_long_.end()) {
                error_ = "Unknown option: -" + short_opt;
                return false;
            }
            // -dPATH form
            std::string attached = arg.substr(2);
            if (!take_option(long_it->second, "-" + short_opt, attached.empty() ? nullptr : &attached,
                             argc, argv, i)) {
                return false;
            }
        } else {
            break;
        }
    }

    for (; i < argc; ++i) {
        positional_args_.emplace_back(argv[i]);
    }
    return true;
}

bool CommandLineParser::take_option(const std::string& name, const std::string& display,
                                    const std::string* inline_value, int argc, char* argv[], int& index) {
    auto it = options_.find(name);
    if (it == options_.end()) {
        error_ = "Unknown option: " + display;
        return false;
    }

    if (!it->second.has_value) {
        if (inline_value) {
            error_ = "Option " + display + " does not take a value";
            return false;
        }
        parsed_options_[name] = "true";
        return true;
    }

    if (inline_value) {
        parsed_options_[name] = *inline_value;
    } else if (index + 1 < argc) {
        parsed_options_[name] = argv[++index];
    } else {
        error_ = "Option " + display + " requires a value";
        return false;
    }
    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return parsed_options_.count(normalize_option_name(name)) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    std::string normalized = normalize_option_name(name);
    auto it = parsed_options_.find(normalized);
    if (it != parsed_options_.end()) {
        return it->second;
    }

    auto opt_it = options_.find(normalized);
    if (opt_it != options_.end() && !opt_it->second.default_value.empty()) {
        return opt_it->second.default_value;
    }

    return default_value;
}

size_t CommandLineParser::apply_overrides(Config& config) const {
    size_t applied = 0;
    for (const auto& [name, value] : parsed_options_) {
        const auto& option = options_.at(name);
        if (!option.config_key.empty()) {
            config.set(option.config_key, value);
            ++applied;
        }
    }
    return applied;
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";

    for (const auto& [name, option] : options_) {
        std::string short_opt;
        for (const auto& [short_name, long_name] : short_to_long_) {
            if (long_name == name) {
                short_opt = "-" + short_name + ", ";
                break;
            }
        }

        std::cout << "  " << std::left << std::setw(24)
                  << (short_opt + "--" + name + (option.has_value ? " <value>" : ""))
                  << option.description;

        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
    std::cout << "\n";
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version 0.3.0\n";
}

std::string CommandLineParser::normalize_option_name(const std::string& name) const {
    auto it = short_to_long_.find(name);
    return it != short_to_long_.end() ? it->second : name;
}

} // namespace coffer::core
