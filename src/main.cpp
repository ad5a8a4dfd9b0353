#include <iostream>
#include <string>
#include <vector>
#include "coffer/core/logger.hpp"
#include "coffer/core/config.hpp"
#include "coffer/core/cli.hpp"
#include "coffer/core/utils.hpp"
#include "coffer/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    coffer::core::CommandLineParser parser("coffer");
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    
    if (parser.has_option("help")) {
        parser.print_help();
        coffer::core::CommandRegistry().print_help();
        return 0;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    auto& config = coffer::core::Config::instance();
    config.set_defaults();
    
    auto config_file = coffer::core::utils::FileUtils::expand_home(parser.get_option("config", "~/.coffer.conf"));
    if (coffer::core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file.string())) {
            std::cerr << "Warning: could not read " << config_file.string() << "\n";
        }
    }
    
    config.load_from_env();
    parser.apply_overrides(config);
    
    auto log_level = parser.has_option("verbose") ?
        coffer::core::LogLevel::Debug : coffer::core::Logger::parse_level(config.get_string("log.level", "info"));
    coffer::core::Logger::initialize(config.get_string("log.file", "coffer.log"), log_level);
    
    coffer::core::CommandRegistry command_registry;
    
    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help();
        command_registry.print_help();
        coffer::core::Logger::shutdown();
        return 0;
    }

    std::string command = args[0];
    LOG_DEBUG("Running command {}", command);
    
    auto result = command_registry.execute_command(command, args);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }
    
    coffer::core::Logger::shutdown();
    return result.exit_code;
}
