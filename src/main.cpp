#include "common/Config.h"
#include "common/Logger.h"
#include "engine/DemoBrokerGateway.h"
#include "engine/ReplayBrokerGateway.h"
#include "engine/TradingEngine.h"

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

using namespace corolla;

// 전역 엔진 인스턴스(Ctrl+C 종료용)
std::unique_ptr<engine::TradingEngine> g_engine;

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        if (g_engine) {
            g_engine->stop();
        }
    }
}

static std::shared_ptr<engine::IBrokerGateway> createGateway(const engine::EngineConfig& config) {
    switch (config.mode) {
        case engine::TradingMode::REPLAY:
            return std::make_shared<engine::ReplayBrokerGateway>(
                engine::ReplayBrokerGateway::fromFile(config.replay_file));
        case engine::TradingMode::DEMO:
            break;
    }
    return std::make_shared<engine::DemoBrokerGateway>(config.demo_base_price, config.demo_seed);
}

int main(int argc, char* argv[]) {
    const std::string config_path = (argc > 1) ? argv[1] : "config/config.json";

    Config config;
    config.load(config_path);
    config.applyEnvironmentOverrides();

    const auto problems = config.validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            std::cerr << "설정 오류: " << problem << std::endl;
        }
        return 2;
    }

    const engine::EngineConfig engine_config = config.getEngineConfig();

    try {
        Logger::getInstance().initialize(engine_config.log_dir, engine_config.log_level);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    LOG_INFO("Corolla trading bot - starting up ({} mode, {})",
             engine::toString(engine_config.mode), engine_config.symbol);
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    int exit_code = 0;
    try {
        g_engine = std::make_unique<engine::TradingEngine>(
            engine_config, config.getStrategyConfig(), createGateway(engine_config));
        if (!g_engine->getStatusPath().empty()) {
            LOG_INFO("Dashboard status snapshot: {}", g_engine->getStatusPath().string());
        }

        if (!g_engine->start()) {
            LOG_ERROR("Failed to start engine. Exiting.");
            exit_code = 1;
        } else {
            g_engine->run();
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        exit_code = 1;
    }

    g_engine.reset();
    LOG_INFO("Bot stopped cleanly");
    return exit_code;
}
