#include "common/config_loader.hpp"
#include "common/event_loop.hpp"
#include "common/logger.hpp"
#include "server/dispatch_context.hpp"
#include "server/dispatch_service_impl.hpp"

#include <cstdlib>
#include <csignal>
#include <chrono>
#include <grpcpp/grpcpp.h>
#include <thread>

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void HandleSignal(int signal) {
    g_stop_signal = signal;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = dispatch::common::ResolveConfigPath(argc, argv);

    dispatch::common::AppConfig config;
    try {
        config = dispatch::common::ConfigLoader::Load(config_path);
    } catch (const std::exception& ex) {
        fprintf(stderr, "Failed to load config %s: %s\n", config_path.c_str(), ex.what());
        return EXIT_FAILURE;
    }

    try {
        dispatch::common::InitLogger(config.logging);
    } catch (const std::exception& ex) {
        fprintf(stderr, "Failed to initialize logger: %s\n", ex.what());
        return EXIT_FAILURE;
    }
    DISPATCH_LOG_INFO("Dispatch server {} starting with config {}", config.server.node_id, config_path);

    dispatch::common::EventLoop loop;
    loop.Start();

    dispatch::server::DispatchContext context(loop, config, dispatch::server::CreateBackends(config));
    // 组件的定时器和订阅都在事件循环上启动
    loop.Submit([&context]() { context.Gateway().Start(); }).get();

    dispatch::server::DispatchServiceImpl dispatch_service(loop, context);

    grpc::ServerBuilder builder;
    std::string address = config.server.host + ":" + std::to_string(config.server.port);
    builder.AddListeningPort(address, grpc::InsecureServerCredentials());
    builder.RegisterService(&dispatch_service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        DISPATCH_LOG_ERROR("Failed to start gRPC server on {}", address);
        loop.Stop();
        return EXIT_FAILURE;
    }

    DISPATCH_LOG_INFO("Dispatch server listening on {}", address);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::thread shutdown_thread([&server]() {
        while (g_stop_signal == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
        DISPATCH_LOG_WARN("Signal {} received, shutting down gRPC server...", g_stop_signal);
        server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
    });

    server->Wait();
    shutdown_thread.join();
    loop.Submit([&context]() { context.Gateway().Stop(); }).get();
    loop.Stop();
    dispatch::common::ShutdownLogger();
    return EXIT_SUCCESS;
}
