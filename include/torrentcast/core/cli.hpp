#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace torrentcast::core {

class Config;

class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);
    
    // config_key binds the option to a Config entry applied by apply_to().
    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, bool has_value = false,
                    const std::string& default_value = "", const std::string& config_key = "");
    
    bool parse(int argc, char* argv[]);
    
    bool has_option(const std::string& name) const;
    // Last value given for the option, else its default, else default_value.
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    std::vector<std::string> get_option_values(const std::string& name) const;
    
    // Writes bound options and every --set key=value into config. Returns false
    // and sets the error on a malformed override.
    bool apply_to(Config& config);
    
    // Positional arguments with the command first; "serve" when none was given.
    std::vector<std::string> command_args() const;
    
    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }
    
    void print_help() const;
    void print_version() const;
    
private:
    struct Option {
        std::string short_name;
        std::string long_name;
        std::string description;
        bool has_value = false;
        std::string default_value;
        std::string config_key;
    };
    
    const Option* find_option(const std::string& name) const;
    bool take_value(const Option& option, int& index, int argc, char* argv[], const std::string& inline_value,
                    bool has_inline_value);
    
    std::string program_name_;
    std::vector<Option> options_;
    std::unordered_map<std::string, std::vector<std::string>> parsed_options_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
