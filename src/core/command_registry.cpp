#include "relaysave/core/command_registry.hpp"
#include <iostream>
#include <iomanip>

namespace relaysave::core {

CommandRegistry::CommandRegistry(CommandContext& context) {
    register_command("import", std::make_unique<ImportCommandHandler>(context));
    register_command("list", std::make_unique<ListCommandHandler>(context));
    register_command("info", std::make_unique<InfoCommandHandler>(context));
    register_command("fetch", std::make_unique<FetchCommandHandler>(context));
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }
    
    return it->second->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.count(command) > 0;
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";
    
    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(10) << name
                  << handler->get_description() << "\n";
        std::cout << "  " << std::left << std::setw(10) << " "
                  << "Usage: " << handler->get_usage() << "\n\n";
    }
}

}
