#include "server/http_server.hpp"
#include "server/background_sweeper.hpp"
#include "server/ice_config.hpp"
#include "server/request_handler.hpp"
#include "server/stats_collector.hpp"
#include "auth/token_verifier.hpp"
#include "common/errors.hpp"
#include "signaling/reconnection_manager.hpp"
#include "signaling/room_registry.hpp"
#include "signaling/signaling_bridge.hpp"
#include "signaling/signaling_relay.hpp"
#include "store/in_memory_coordination_store.hpp"
#include "store/redis_coordination_store.hpp"
#include "transfer/chunk_storage.hpp"
#include "transfer/file_transfer_manager.hpp"
#include "utils/config.hpp"
#include "utils/logger.hpp"
#include <iostream>
#include <csignal>
#include <cstdlib>

rendezvous::HttpServer* g_server = nullptr;

void signalHandler(int signal) {
    (void)signal;
    if (g_server) {
        std::cout << "\nShutting down server..." << std::endl;
        g_server->stop();
    }
}

int main(int argc, char* argv[]) {
    using namespace rendezvous;

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    Config config;
    try {
        config = Config::fromEnvironment();

        // Allow port override via command line argument
        if (argc > 1) {
            int port = std::stoi(argv[1]);
            if (port <= 0 || port > 65535) {
                throw ValidationError("Port must be between 1 and 65535");
            }
            config.port = static_cast<unsigned short>(port);
        }
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    Logger& logger = Logger::getInstance();
    logger.setMinLevel(Logger::parseLevel(config.log_level));
    if (!config.log_file.empty()) {
        logger.setLogFile(config.log_file);
    }
    logger.info("Starting Rendezvous signaling server " + config.instance_id + "...");

    try {
        std::shared_ptr<CoordinationStore> store;
        if (config.store_backend == "memory") {
            logger.warning("Using the in-memory coordination store; state is not shared between instances");
            store = std::make_shared<InMemoryCoordinationStore>();
        } else {
            store = std::make_shared<RedisCoordinationStore>(config.redis);
            if (!store->ping()) {
                logger.warning("Redis at " + config.redis.host + ":" + std::to_string(config.redis.port) +
                               " is not reachable yet; signaling will degrade to local delivery");
            }
        }

        std::shared_ptr<TokenVerifier> verifier;
        if (!config.jwt_secret.empty()) {
            verifier = std::make_shared<JwtTokenVerifier>(config.jwt_secret);
        } else {
            logger.warning("RENDEZVOUS_JWT_SECRET is not set; tokens are accepted as plain user ids");
            verifier = std::make_shared<DevelopmentTokenVerifier>();
        }

        auto registry = std::make_shared<RoomRegistry>(store, config.signaling);
        auto bridge = std::make_shared<SignalingBridge>(store, config.instance_id);
        auto relay = std::make_shared<SignalingRelay>(store, registry, bridge, config.signaling);
        auto reconnection = std::make_shared<ReconnectionManager>(store, config.signaling);
        relay->addPublishHook([reconnection](const SignalingMessage& message, const std::string& serialized) {
            reconnection->onPublish(message, serialized);
        });

        auto storage = std::make_shared<ChunkStorage>(config.transfer.storage_dir);
        auto transfers = std::make_shared<FileTransferManager>(store, relay, storage, config.transfer);
        auto ice_config = std::make_shared<IceConfigProvider>(config.ice);

        auto stats = std::make_shared<StatsCollector>(registry, bridge, transfers, config.instance_id);

        auto request_handler = std::make_shared<RequestHandler>(store, verifier, registry, transfers, ice_config,
                                                                stats, config.instance_id);

        auto session_context = std::make_shared<SessionContext>();
        session_context->relay = relay;
        session_context->reconnection = reconnection;
        session_context->transfers = transfers;
        session_context->verifier = verifier;
        session_context->settings = config.signaling;

        bridge->start();

        BackgroundSweeper sweeper(relay, transfers, config.sweep_interval_seconds);
        sweeper.start();

        logger.info("Server will listen on " + config.address + ":" + std::to_string(config.port));

        HttpServer server(config.address, config.port, config.io_threads, request_handler, session_context);
        g_server = &server;

        bool started = server.start();
        g_server = nullptr;

        sweeper.stop();
        bridge->stop();
        store->close();

        if (!started) {
            logger.error("Failed to start server");
            return 1;
        }
    } catch (const std::exception& e) {
        logger.error(std::string("Fatal error: ") + e.what());
        return 1;
    }

    logger.info("Rendezvous server stopped");
    return 0;
}
