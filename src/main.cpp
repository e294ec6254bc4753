#include <iostream>
#include <string>
#include <vector>
#include "relaysave/core/logger.hpp"
#include "relaysave/core/config.hpp"
#include "relaysave/core/cli.hpp"
#include "relaysave/core/utils.hpp"
#include "relaysave/core/command_registry.hpp"

int main(int argc, char* argv[]) {
    relaysave::core::CommandLineParser parser("relaysave");
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    auto& config = relaysave::core::Config::instance();
    config.set_defaults();
    
    auto config_file = relaysave::core::utils::FileUtils::expand_home(parser.get_option("config"));
    if (relaysave::core::utils::FileUtils::exists(config_file)) {
        if (!config.load_from_file(config_file.string())) {
            std::cerr << "Error: cannot read config file " << config_file.string() << "\n";
            return 1;
        }
    }
    
    auto log_level = parser.has_option("verbose")
        ? relaysave::core::LogLevel::Debug
        : relaysave::core::parse_log_level(config.get_string("log.level", "info"));
    relaysave::core::Logger::initialize(config.get_string("log.file", "relaysave.log"), log_level);
    
    relaysave::core::CommandContext context;
    context.store_path = parser.get_option("store", config.get_string("store.path", "relaysave.db"));
    context.output_path = parser.get_option("out");
    context.secret_key_hex = parser.get_option("secret-key");
    
    relaysave::core::InterruptGuard interrupt_guard(context.cancel);
    
    relaysave::core::CommandRegistry command_registry(context);
    
    auto& args = parser.get_positional_args();
    if (parser.has_option("help") || args.empty()) {
        parser.print_help();
        command_registry.print_help();
        relaysave::core::Logger::shutdown();
        return 0;
    }
    
    const std::string& command = args[0];
    LOG_DEBUG("Running {} with {} argument(s)", command, args.size() - 1);
    
    auto result = command_registry.execute_command(command, args);
    
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!command_registry.has_command(command)) {
            std::cout << "\nAvailable commands:\n";
            command_registry.print_help();
        }
    }
    
    relaysave::core::Logger::shutdown();
    return result.exit_code;
}
