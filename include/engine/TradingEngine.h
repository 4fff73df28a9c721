#pragma once

#include "analytics/CandleAggregator.h"
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "engine/IBrokerGateway.h"
#include "strategy/StrategyConfig.h"
#include "strategy/StrategyEngine.h"

#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace corolla {
namespace engine {

enum class CycleOutcome {
    PROCESSED,  // candle consumed and evaluated
    IDLE,       // no new candle (or rejected / duplicate)
    FAILED,     // gateway or evaluation error, loop backs off
    EXHAUSTED   // feed finished
};

// Trading Engine - 캔들 수집, 전략 평가, 상태 공개를 담당하는 구동 루프
class TradingEngine {
public:
    TradingEngine(
        const EngineConfig& config,
        const strategy::StrategyConfig& strategy_config,
        std::shared_ptr<IBrokerGateway> gateway
    );

    ~TradingEngine();

    // ===== 엔진 제어 =====

    bool start();
    void stop();    // safe to call from a signal handler
    bool isRunning() const { return running_; }

    // ===== 메인 루프 =====

    void run();         // blocking, until stop() / feed exhausted / max_cycles
    CycleOutcome runOnce();

    // ===== 상태 조회 =====

    nlohmann::json getStatusJson() const;
    strategy::StrategyStatus getStrategyStatus() const { return strategy_.getStatus(); }
    int getErrorCount() const { return error_count_; }
    long long getCycleCount() const { return cycle_count_; }
    std::string getLastSignalText() const;

    // status_file resolved against the executable dir; empty when disabled
    const std::filesystem::path& getStatusPath() const { return status_path_; }

    // finite, non-negative, high >= low
    static bool isValidCandle(const Candle& candle);

private:
    bool processCandle(const Candle& candle, int position);
    void shutdown();
    void handleSignal(const strategy::Signal& signal);
    void publishStatus() const;
    void sleepFor(int seconds) const;

    EngineConfig config_;
    std::filesystem::path status_path_;
    std::shared_ptr<IBrokerGateway> gateway_;
    strategy::StrategyEngine strategy_;
    analytics::CandleAggregator confirmation_aggregator_;

    std::atomic<bool> running_{false};
    std::atomic<int> error_count_{0};
    std::atomic<long long> cycle_count_{0};
    std::chrono::steady_clock::time_point start_time_;

    mutable std::mutex state_mutex_;
    int position_ = 0;
    double current_price_ = 0.0;
    std::string last_signal_text_ = "None";
    std::optional<long long> last_sequence_;
};

} // namespace engine
} // namespace corolla
