#pragma once

#include "torrentcast/engine/transfer_engine.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace torrentcast::core {

class Config;

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;
    
    static CommandResult ok(const std::string& msg = "") {
        return CommandResult{true, msg, 0};
    }
    
    static CommandResult error(const std::string& msg, int code = 1) {
        return CommandResult{false, msg, code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name.
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

using EngineFactory = std::function<std::shared_ptr<engine::TransferEngine>(const Config&)>;

// Runs the HTTP gateway until SIGINT or SIGTERM.
class ServeCommandHandler : public CommandHandler {
public:
    explicit ServeCommandHandler(EngineFactory engine_factory);
    
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Run the streaming gateway (default)"; }
    std::string get_usage() const override { return "torrentcast serve [--port <n>] [--bind <addr>]"; }
    
private:
    EngineFactory engine_factory_;
};

class CheckLocatorCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Print the resource key a locator resolves to"; }
    std::string get_usage() const override { return "torrentcast check-locator <magnet-uri|info-hash>"; }
};

class SearchCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Search the configured index and print ranked results"; }
    std::string get_usage() const override { return "torrentcast search <query...>"; }
};

}
