#include "common/config_loader.hpp"
#include "common/logger.hpp"
#include "config_path.hpp"
#include "server/device_quota_service_impl.hpp"
#include "server/health_service.h"
#include "server/quota_backend.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <grpcpp/grpcpp.h>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void HandleSignal(int signal) {
    g_stop_signal = signal;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    if (argc > 1) {
        config_path = argv[1];
    } else if (const char* env = std::getenv("DEVICE_QUOTA_CONFIG")) {
        config_path = env;
    } else {
        config_path = quota::common::GetConfigPath("app.example.json");
    }

    quota::common::AppConfig config;
    try {
        config = quota::common::ConfigLoader::Load(config_path);
    } catch (const std::exception& ex) {
        fprintf(stderr, "Failed to load config %s: %s\n", config_path.c_str(), ex.what());
        return EXIT_FAILURE;
    }

    quota::common::InitLogger(config.logging);
    QUOTA_LOG_INFO("Device quota server starting with config {}", config_path);

    auto backend_or = quota::server::BuildQuotaBackend(config);
    if (!backend_or.IsOk()) {
        QUOTA_LOG_ERROR("Failed to initialize quota backend: {}", backend_or.GetStatus().Message());
        quota::common::ShutdownLogger();
        return EXIT_FAILURE;
    }
    auto backend = std::move(backend_or.Value());

    quota::server::DeviceQuotaServiceImpl quota_service(backend.ledger, backend.admin);
    quota::server::HealthServiceImpl health_service(backend.sweeper);

    grpc::ServerBuilder builder;
    std::string address = config.server.host + ":" + std::to_string(config.server.port);
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterService(&quota_service);
    builder.RegisterService(&health_service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        QUOTA_LOG_ERROR("Failed to start gRPC server on {}", address);
        quota::common::ShutdownLogger();
        return EXIT_FAILURE;
    }

    backend.sweeper->Start();
    QUOTA_LOG_INFO("Device quota server listening on {}", address);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::thread shutdown_thread([&server]() {
        while (g_stop_signal == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        QUOTA_LOG_WARN("Signal {} received, shutting down gRPC server...", g_stop_signal);
        server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
    });

    server->Wait();
    shutdown_thread.join();
    backend.sweeper->Stop();
    quota::common::ShutdownLogger();
    return EXIT_SUCCESS;
}
