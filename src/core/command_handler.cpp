#include "torrentcast/core/command_handler.hpp"
#include "torrentcast/core/config.hpp"
#include "torrentcast/core/logger.hpp"
#include "torrentcast/core/utils.hpp"
#include "torrentcast/network/api_router.hpp"
#include "torrentcast/network/http_server.hpp"
#include "torrentcast/search/apibay_provider.hpp"
#include "torrentcast/search/search_service.hpp"
#include "torrentcast/session/resource_locator.hpp"
#include "torrentcast/session/session_registry.hpp"
#include "torrentcast/streaming/stream_gateway.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iomanip>
#include <iostream>

namespace torrentcast::core {

// ServeCommandHandler Implementation
ServeCommandHandler::ServeCommandHandler(EngineFactory engine_factory)
    : engine_factory_(std::move(engine_factory)) {}

CommandResult ServeCommandHandler::execute(const std::vector<std::string>&) {
    auto& config = Config::instance();
    
    try {
        boost::asio::io_context io_context;
        
        auto engine = engine_factory_(config);
        if (!engine) {
            return CommandResult::error("No transfer engine available");
        }
        
        session::SessionRegistry registry(
            engine,
            session::RegistryConfig::from_config(config),
            session::PiecePriorityPolicy(session::PriorityConfig::from_config(config)));
        streaming::StreamGateway gateway(registry, streaming::GatewayConfig::from_config(config));
        
        auto search_config = search::SearchConfig::from_config(config);
        auto search_service = std::make_shared<search::SearchService>(
            std::make_shared<search::ApibaySearchProvider>(search_config), search_config);
        
        network::ApiRouter router(registry, gateway, search_service,
                                  std::make_shared<network::EventBroadcaster>());
        network::HttpServer server(
            network::ServerConfig::from_config(config),
            [&router](const network::HttpRequest& request, network::HttpResponder& responder) {
                router.handle(request, responder);
            });
        
        server.start();
        registry.start_cleanup(io_context);
        
        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            LOG_INFO("Received signal {}, shutting down", signal_number);
            registry.stop_cleanup();
            io_context.stop();
        });
        
        std::cout << "torrentcast listening on port " << server.local_port() << "\n";
        io_context.run();
        
        registry.stop_cleanup();
        registry.shutdown();
        router.shutdown();
        server.stop();
        engine->shutdown();
        
        LOG_INFO("torrentcast stopped");
        return CommandResult::ok("Server stopped");
        
    } catch (const std::exception& e) {
        LOG_CRITICAL("Server failed: {}", e.what());
        return CommandResult::error("Server failed: " + std::string(e.what()));
    }
}

// CheckLocatorCommandHandler Implementation
CommandResult CheckLocatorCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    session::ResourceLocator locator;
    auto result = session::parse_locator(args[1], locator);
    if (!result.success()) {
        return CommandResult::error(result.message);
    }
    
    std::cout << "Resource key: " << locator.key << "\n";
    if (!locator.display_name.empty()) {
        std::cout << "Name:         " << locator.display_name << "\n";
    }
    std::cout << "Trackers:     " << locator.trackers.size() << "\n";
    for (const auto& tracker : locator.trackers) {
        std::cout << "  " << tracker << "\n";
    }
    std::cout << "Fingerprint:  " << locator.fingerprint << "\n";
    
    return CommandResult::ok();
}

// SearchCommandHandler Implementation
CommandResult SearchCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }
    
    std::vector<std::string> terms(args.begin() + 1, args.end());
    auto query = utils::StringUtils::join(terms, " ");
    
    auto search_config = search::SearchConfig::from_config(Config::instance());
    search::SearchService service(std::make_shared<search::ApibaySearchProvider>(search_config), search_config);
    
    auto response = service.search(query);
    if (!response.result.success()) {
        return CommandResult::error(response.result.message);
    }
    
    std::cout << response.total << " results for \"" << response.query << "\"\n\n";
    for (const auto& hit : response.results) {
        std::cout << std::left << std::setw(8) << hit.seeders
                  << std::setw(12) << hit.size
                  << hit.name << "\n";
        std::cout << "        " << hit.magnet << "\n";
    }
    
    return CommandResult::ok();
}

}
