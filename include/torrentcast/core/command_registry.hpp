#pragma once

#include "torrentcast/core/command_handler.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace torrentcast::core {

class CommandRegistry {
public:
    CommandRegistry() = default;
    
    // serve, check-locator and search.
    static CommandRegistry with_builtin_commands(EngineFactory engine_factory);
    
    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);
    void register_alias(const std::string& alias, const std::string& command);
    
    // args[0] names the command. Handler exceptions become error results.
    CommandResult run(const std::vector<std::string>& args);
    bool has_command(const std::string& command) const;
    std::vector<std::string> command_names() const;
    void print_help() const;
    
private:
    std::string resolve(const std::string& name) const;
    
    std::map<std::string, std::unique_ptr<CommandHandler>> handlers_;
    std::map<std::string, std::string> aliases_;
};

}
