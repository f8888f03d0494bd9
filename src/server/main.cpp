// src/server/main.cpp
#include "server/server_builder.h"
#include "common/logger.h"
#include <csignal>
#include <cstdlib>
#include <iostream>

namespace {

token_service::GrpcServer* g_server = nullptr;

void SignalHandler(int signal) {
    if (g_server) {
        g_server->Shutdown();
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    const char* config_path = std::getenv("CONFIG_PATH");
    if (!config_path) {
        config_path = argc > 1 ? argv[1] : "configs/config.yaml";
    }

    try {
        // 先加载配置，环境变量覆盖
        auto config = std::make_shared<token_service::Config>(
            token_service::Config::LoadFromFile(config_path));
        config->LoadFromEnv();

        // 立即初始化 Logger
        token_service::Logger::Init(
            config->log.path,
            config->log.filename,
            config->log.level,
            config->log.max_size,
            config->log.max_files,
            config->log.console_output
        );
        LOG_DEBUG(config->ToString());

        auto server = token_service::ServerBuilder()
            .WithConfig(config)
            .OnShutdown([]() { LOG_INFO("Token service shutdown requested"); })
            .Build();

        g_server = server.get();

        std::signal(SIGINT, SignalHandler);
        std::signal(SIGTERM, SignalHandler);

        if (!server->Initialize()) {
            std::cerr << "Failed to initialize server" << std::endl;
            return 1;
        }

        server->Run();
        g_server = nullptr;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    token_service::Logger::Shutdown();
    return 0;
}
