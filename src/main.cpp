#include <iostream>
#include <string>
#include <vector>
#include "torrentcast/core/logger.hpp"
#include "torrentcast/core/config.hpp"
#include "torrentcast/core/cli.hpp"
#include "torrentcast/core/utils.hpp"
#include "torrentcast/core/command_registry.hpp"
#include "torrentcast/engine/libtorrent_engine.hpp"
#include "torrentcast/version.hpp"

namespace {

// Missing default file is fine; a missing --config file is not.
bool load_config_file(const torrentcast::core::CommandLineParser& parser, torrentcast::core::Config& config) {
    using torrentcast::core::utils::FileUtils;
    
    auto path = FileUtils::expand_home(parser.get_option("config", "~/.torrentcast.conf"));
    if (!FileUtils::exists(path)) {
        if (parser.has_option("config")) {
            std::cerr << "Error: config file not found: " << path << "\n";
            return false;
        }
        return true;
    }
    
    if (!config.load_from_file(path.string())) {
        std::cerr << "Error: failed to read config file " << path << "\n";
        return false;
    }
    return true;
}

}

int main(int argc, char* argv[]) {
    torrentcast::core::CommandLineParser parser("torrentcast");
    
    auto registry = torrentcast::core::CommandRegistry::with_builtin_commands(
        [](const torrentcast::core::Config& cfg) {
            return torrentcast::engine::make_libtorrent_engine(
                torrentcast::engine::EngineConfig::from_config(cfg));
        });
    
    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help();
        return 1;
    }
    
    if (parser.has_option("help")) {
        parser.print_help();
        registry.print_help();
        return 0;
    }
    
    if (parser.has_option("version")) {
        parser.print_version();
        return 0;
    }
    
    auto& config = torrentcast::core::Config::instance();
    config.set_defaults();
    
    if (!load_config_file(parser, config)) {
        return 1;
    }
    config.apply_environment();
    if (!parser.apply_to(config)) {
        std::cerr << "Error: " << parser.get_error() << "\n";
        return 1;
    }
    
    torrentcast::core::Logger::initialize(
        config.get_string("log.file", "torrentcast.log"),
        torrentcast::core::Logger::parse_level(config.get_string("log.level", "info")));
    
    auto args = parser.command_args();
    LOG_INFO("torrentcast {} starting: {}", TORRENTCAST_VERSION_STRING, args[0]);
    
    auto result = registry.run(args);
    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        if (!registry.has_command(args[0])) {
            registry.print_help();
        }
    } else if (!result.message.empty()) {
        LOG_INFO("{}", result.message);
    }
    
    torrentcast::core::Logger::shutdown();
    return result.exit_code;
}
