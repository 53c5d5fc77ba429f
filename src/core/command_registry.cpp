#include "torrentcast/core/command_registry.hpp"
#include "torrentcast/core/logger.hpp"
#include <iostream>
#include <iomanip>
#include <stdexcept>

namespace torrentcast::core {

CommandRegistry CommandRegistry::with_builtin_commands(EngineFactory engine_factory) {
    CommandRegistry registry;
    registry.register_command("serve", std::make_unique<ServeCommandHandler>(std::move(engine_factory)));
    registry.register_command("check-locator", std::make_unique<CheckLocatorCommandHandler>());
    registry.register_command("search", std::make_unique<SearchCommandHandler>());
    registry.register_alias("start", "serve");
    registry.register_alias("check", "check-locator");
    return registry;
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

void CommandRegistry::register_alias(const std::string& alias, const std::string& command) {
    aliases_[alias] = command;
}

std::string CommandRegistry::resolve(const std::string& name) const {
    auto it = aliases_.find(name);
    return it != aliases_.end() ? it->second : name;
}

CommandResult CommandRegistry::run(const std::vector<std::string>& args) {
    if (args.empty()) {
        return CommandResult::error("No command given");
    }
    
    auto it = handlers_.find(resolve(args[0]));
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + args[0], 2);
    }
    
    try {
        return it->second->execute(args);
    } catch (const std::exception& e) {
        LOG_CRITICAL("Command '{}' failed: {}", it->first, e.what());
        return CommandResult::error(e.what());
    }
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.count(resolve(command)) > 0;
}

std::vector<std::string> CommandRegistry::command_names() const {
    std::vector<std::string> names;
    for (const auto& [name, handler] : handlers_) {
        names.push_back(name);
    }
    return names;
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";
    
    for (const auto& [name, handler] : handlers_) {
        std::string label = name;
        for (const auto& [alias, target] : aliases_) {
            if (target == name) {
                label += ", " + alias;
            }
        }
        std::cout << "  " << std::left << std::setw(22) << label << handler->get_description() << "\n";
        std::cout << "  " << std::left << std::setw(22) << " " << handler->get_usage() << "\n";
    }
}

}
