#include "torrentcast/core/cli.hpp"
#include "torrentcast/core/config.hpp"
#include "torrentcast/core/utils.hpp"
#include "torrentcast/version.hpp"
#include <iostream>
#include <iomanip>

namespace torrentcast::core {

namespace {

constexpr const char* DEFAULT_COMMAND = "serve";

}

CommandLineParser::CommandLineParser(const std::string& program_name) 
    : program_name_(program_name) {
    
    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", true, "~/.torrentcast.conf");
    add_option("p", "port", "HTTP listen port", true, "", "server.port");
    add_option("b", "bind", "HTTP bind address", true, "", "server.bind_address");
    add_option("l", "log-level", "trace, debug, info, warn, error or off", true, "", "log.level");
    add_option("s", "set", "Override any config entry, e.g. -s sessions.max_active=5", true);
    add_option("", "verbose", "Shorthand for --log-level debug");
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name, 
                                  const std::string& description, bool has_value, 
                                  const std::string& default_value, const std::string& config_key) {
    options_.push_back(Option{short_name, long_name, description, has_value, default_value, config_key});
}

const CommandLineParser::Option* CommandLineParser::find_option(const std::string& name) const {
    for (const auto& option : options_) {
        if (option.long_name == name || (!option.short_name.empty() && option.short_name == name)) {
            return &option;
        }
    }
    return nullptr;
}

bool CommandLineParser::take_value(const Option& option, int& index, int argc, char* argv[],
                                   const std::string& inline_value, bool has_inline_value) {
    if (!option.has_value) {
        if (has_inline_value) {
            error_ = "Option --" + option.long_name + " does not take a value";
            return false;
        }
        parsed_options_[option.long_name].push_back("true");
        return true;
    }
    
    if (has_inline_value) {
        parsed_options_[option.long_name].push_back(inline_value);
    } else if (index + 1 < argc) {
        parsed_options_[option.long_name].push_back(argv[++index]);
    } else {
        error_ = "Option --" + option.long_name + " requires a value";
        return false;
    }
    return true;
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();
    
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        if (options_done || arg == "-" || !arg.starts_with("-")) {
            positional_args_.push_back(arg);
            continue;
        }
        
        if (arg == "--") {
            options_done = true;
            continue;
        }
        
        if (arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            auto name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);
            const auto* option = find_option(name);
            if (!option || option->long_name != name) {
                error_ = "Unknown option: --" + name;
                return false;
            }
            bool has_inline = eq_pos != std::string::npos;
            if (!take_value(*option, i, argc, argv, has_inline ? arg.substr(eq_pos + 1) : "", has_inline)) {
                return false;
            }
            continue;
        }
        
        // Bundled short flags; a value-taking flag consumes the rest of the token.
        for (size_t j = 1; j < arg.length(); ++j) {
            std::string short_opt(1, arg[j]);
            const auto* option = find_option(short_opt);
            if (!option || option->short_name != short_opt) {
                error_ = "Unknown option: -" + short_opt;
                return false;
            }
            
            bool rest_is_value = option->has_value && j + 1 < arg.length();
            if (!take_value(*option, i, argc, argv, rest_is_value ? arg.substr(j + 1) : "", rest_is_value)) {
                return false;
            }
            if (option->has_value) {
                break;
            }
        }
    }
    
    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    const auto* option = find_option(name);
    return option && parsed_options_.count(option->long_name) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    const auto* option = find_option(name);
    if (!option) {
        return default_value;
    }
    
    auto it = parsed_options_.find(option->long_name);
    if (it != parsed_options_.end() && !it->second.empty()) {
        return it->second.back();
    }
    return option->default_value.empty() ? default_value : option->default_value;
}

std::vector<std::string> CommandLineParser::get_option_values(const std::string& name) const {
    const auto* option = find_option(name);
    if (!option) {
        return {};
    }
    auto it = parsed_options_.find(option->long_name);
    return it != parsed_options_.end() ? it->second : std::vector<std::string>{};
}

bool CommandLineParser::apply_to(Config& config) {
    for (const auto& assignment : get_option_values("set")) {
        auto eq = assignment.find('=');
        auto key = utils::StringUtils::trim(assignment.substr(0, eq));
        if (eq == std::string::npos || key.empty()) {
            error_ = "Expected key=value for --set, got '" + assignment + "'";
            return false;
        }
        config.set(key, utils::StringUtils::trim(assignment.substr(eq + 1)));
    }
    
    // Dedicated flags win over --set.
    for (const auto& option : options_) {
        if (option.config_key.empty() || !has_option(option.long_name)) {
            continue;
        }
        config.set(option.config_key, get_option(option.long_name));
    }
    
    if (has_option("verbose") && !has_option("log-level")) {
        config.set("log.level", "debug");
    }
    
    if (has_option("port")) {
        auto port = utils::StringUtils::parse_uint64(get_option("port"));
        if (!port || *port == 0 || *port > 65535) {
            error_ = "Invalid port: " + get_option("port");
            return false;
        }
    }
    
    return true;
}

std::vector<std::string> CommandLineParser::command_args() const {
    if (positional_args_.empty()) {
        return {DEFAULT_COMMAND};
    }
    return positional_args_;
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] [command] [args...]\n\n";
    std::cout << "Options:\n";
    
    for (const auto& option : options_) {
        std::string flags = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        flags += "--" + option.long_name + (option.has_value ? " <value>" : "");
        
        std::cout << "  " << std::left << std::setw(26) << flags << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        if (!option.config_key.empty()) {
            std::cout << " [" << option.config_key << "]";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version " << TORRENTCAST_VERSION_STRING << "\n";
    std::cout << "Built with C++20\n";
}

}
