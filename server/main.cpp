// server/main.cpp
#include "access_policy.hpp"
#include "config.hpp"
#include "database.hpp"
#include "device_registry.hpp"
#include "ingestion_coordinator.hpp"
#include "logger.hpp"
#include "orphan_reclaimer.hpp"
#include "policy_manager.hpp"
#include "query_service.hpp"
#include "request_dispatcher.hpp"
#include "server.hpp"
#include "stream_publisher.hpp"
#include "table_manager.hpp"
#include "thread_pool.hpp"
#include "../common/errors.hpp"
#include <iostream>
#include <string>
#include <csignal>
#include <memory>
#include <vector>

std::atomic<MeterStoreServer*> server_instance{nullptr};

void signal_handler(int) {
    MeterStoreServer* server = server_instance.load();
    if (server) {
        server->request_stop();
    }
}

int main(int argc, char* argv[]) {
    Config config;
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        if (parse_command_line(args, config) == CommandLineAction::ShowHelp) {
            std::cout << usage_text(argv[0]);
            return 0;
        }
        config.validate();
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << usage_text(argv[0]);
        return 1;
    }

    Logger::configure(config.quiet, config.verbose);

    std::cout << CYAN BOLD "meterstore v1.0" RESET << std::endl;
    std::cout << CYAN "Configuration: Port=" << config.server.port
              << ", Database=" << config.database.host << ":" << config.database.port
              << "/" << config.database.name
              << ", Pool=" << config.database.pool_size
              << ", Retention=" << config.storage.retention_days << "d"
              << ", Compression=" << config.storage.compression_after_days << "d"
              << ", Stream=" << (config.stream.enabled ? config.stream.brokers : std::string("off"))
              << RESET << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    try {
        ConnectionPool pool(config.database);
        PgExecutor executor(pool);
        PolicyManager policies(executor);
        TableManager tables(executor, policies, config.storage.compression_after_days);
        DeviceRegistry registry(executor, tables, policies, config.storage.retention_days);
        OrphanReclaimer reclaimer(executor, registry);
        std::unique_ptr<AccessPolicy> access = make_access_policy(config.enforce_permissions, executor);

        // Start-up phase: nothing is served until the store matches the registry
        pool.connect_with_retry();
        registry.initialize_schema();
        std::unique_ptr<StreamPublisher> stream = make_stream_publisher(config.stream);
        reclaimer.reclaim_orphans();
        registry.reconcile_stores();
        policies.apply_retention_to_all(registry.list_ids(), config.storage.retention_days);

        ThreadPool publish_pool(config.server.publish_threads, "publish");
        IngestionCoordinator ingestion(executor, registry, *access, *stream, publish_pool);
        QueryService queries(executor, registry, *access, config.query);

        RequestDispatcher dispatcher(ServiceSet{
            registry, ingestion, queries, reclaimer, policies, *stream,
            [&pool]() { return pool.ping(); }});

        MeterStoreServer server(config.server.port, config.server.threads, dispatcher);
        if (!server.start()) return 1;

        dispatcher.set_readiness(Readiness::Ready);
        server_instance.store(&server);
        server.run();
        server_instance.store(nullptr);

        Logger::info("Shutting down gracefully");
        dispatcher.set_readiness(Readiness::Stopping);
        server.stop();
        publish_pool.shutdown();
        stream->flush(10000);
        Logger::info("Served " + std::to_string(server.requests_served()) + " request(s), stored " +
                     std::to_string(ingestion.stored_count()) + " reading(s)");
    } catch (const ConfigError& e) {
        Logger::error(std::string("Configuration error: ") + e.what());
        return 1;
    } catch (const MeterStoreError& e) {
        Logger::error(std::string("Start-up failed: ") + e.what());
        return 1;
    }

    return 0;
}
