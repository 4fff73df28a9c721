#include "engine/TradingEngine.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace corolla {
namespace engine {

std::string toString(TradingMode mode) {
    switch (mode) {
        case TradingMode::DEMO: return "DEMO";
        case TradingMode::REPLAY: return "REPLAY";
    }
    return "DEMO";
}

TradingEngine::TradingEngine(
    const EngineConfig& config,
    const strategy::StrategyConfig& strategy_config,
    std::shared_ptr<IBrokerGateway> gateway
)
    : config_(config)
    , gateway_(std::move(gateway))
    , strategy_(strategy_config)
    , confirmation_aggregator_(strategy_config.confirmation_bars_per_candle)
    , start_time_(std::chrono::steady_clock::now()) {
    if (!gateway_) {
        throw std::invalid_argument("TradingEngine requires a broker gateway");
    }
    if (!config_.status_file.empty()) {
        // 로그와 같은 기준(실행 파일 디렉토리)으로 해석
        const std::filesystem::path status_file(config_.status_file);
        status_path_ = status_file.is_absolute()
            ? status_file
            : utils::PathUtils::resolveRelativePath(config_.status_file);
    }
    LOG_INFO("Corolla trading engine initialized ({} / {} feed)", config_.symbol, gateway_->name());
}

TradingEngine::~TradingEngine() {
    shutdown();
}

bool TradingEngine::start() {
    if (running_) {
        return true;
    }

    LOG_INFO("Starting Corolla trading engine...");
    if (!gateway_->connect()) {
        LOG_ERROR("Failed to connect to {} gateway", gateway_->name());
        return false;
    }

    start_time_ = std::chrono::steady_clock::now();
    running_ = true;
    publishStatus();
    return true;
}

void TradingEngine::stop() {
    running_ = false;
}

void TradingEngine::shutdown() {
    running_ = false;
    if (gateway_ && gateway_->isConnected()) {
        gateway_->disconnect();
        LOG_INFO("Disconnected from {} gateway", gateway_->name());
    }
    publishStatus();
}

void TradingEngine::run() {
    if (!running_ && !start()) {
        return;
    }

    LOG_INFO("Starting main loop...");

    while (running_) {
        const CycleOutcome outcome = runOnce();

        if (outcome == CycleOutcome::EXHAUSTED) {
            LOG_INFO("Candle feed exhausted after {} cycles", cycle_count_.load());
            break;
        }
        if (config_.max_cycles > 0 && cycle_count_ >= config_.max_cycles) {
            LOG_INFO("Reached max_cycles ({})", config_.max_cycles);
            break;
        }

        if (outcome == CycleOutcome::FAILED) {
            sleepFor(config_.error_backoff_seconds);
        } else if (config_.mode != TradingMode::REPLAY) {
            // 재생 모드는 봉 간격 대기 없이 연속 처리
            sleepFor(config_.candle_interval_seconds);
        }
    }

    LOG_INFO("Stopping Corolla trading engine...");
    shutdown();
}

CycleOutcome TradingEngine::runOnce() {
    try {
        const auto candle = gateway_->fetchLatestCandle();
        if (!candle) {
            return gateway_->isExhausted() ? CycleOutcome::EXHAUSTED : CycleOutcome::IDLE;
        }

        const double price = gateway_->currentPrice();
        const int position = gateway_->currentPosition();
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            current_price_ = price;
            position_ = position;
        }

        if (price > 0) {
            LOG_DEBUG("{} Price: {}, Position: {}", config_.symbol, price, position);
        }

        if (!processCandle(*candle, position)) {
            return CycleOutcome::IDLE;
        }

        ++cycle_count_;
        publishStatus();
        return CycleOutcome::PROCESSED;

    } catch (const std::exception& e) {
        LOG_ERROR("Error in main loop: {}", e.what());
        ++error_count_;
        return CycleOutcome::FAILED;
    }
}

bool TradingEngine::isValidCandle(const Candle& candle) {
    const bool finite = std::isfinite(candle.high) && std::isfinite(candle.low) &&
                        std::isfinite(candle.close);
    if (!finite) return false;
    if (candle.high < 0.0 || candle.low < 0.0 || candle.close < 0.0 || candle.volume < 0) return false;
    return candle.high >= candle.low;
}

bool TradingEngine::processCandle(const Candle& candle, int position) {
    if (!isValidCandle(candle)) {
        LOG_WARN("Rejected malformed candle #{} (h={}, l={}, c={}, v={})",
                 candle.sequence_index, candle.high, candle.low, candle.close, candle.volume);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (last_sequence_ && candle.sequence_index <= *last_sequence_) {
            LOG_DEBUG("Skipping already processed candle #{}", candle.sequence_index);
            return false;
        }
        last_sequence_ = candle.sequence_index;
    }

    strategy_.onCandle(candle, strategy::Timeframe::PRIMARY);
    if (const auto higher = confirmation_aggregator_.add(candle)) {
        strategy_.onCandle(*higher, strategy::Timeframe::CONFIRMATION);
    }

    const strategy::EvaluationResult result = strategy_.evaluate(position);
    handleSignal(result.entry);
    if (result.exit) {
        handleSignal(*result.exit);
    }
    return true;
}

void TradingEngine::handleSignal(const strategy::Signal& signal) {
    if (!signal.isActionable()) {
        return;
    }

    std::string reasons;
    for (const auto& reason : signal.reasons) {
        if (!reasons.empty()) reasons += ", ";
        reasons += reason;
    }

    LOG_INFO("SIGNAL: {} at {} (strength: {:.2f}) [{}]",
             strategy::toString(signal.kind), signal.price, signal.strength, reasons);

    std::ostringstream text;
    text << strategy::toString(signal.kind) << " @ " << std::fixed << std::setprecision(0) << signal.price;

    std::lock_guard<std::mutex> lock(state_mutex_);
    last_signal_text_ = text.str();
}

std::string TradingEngine::getLastSignalText() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_signal_text_;
}

nlohmann::json TradingEngine::getStatusJson() const {
    nlohmann::json j = strategy_.getStatus().toJson();

    const auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - start_time_).count();

    j["status"] = running_ ? "Running" : "Stopped";
    j["symbol"] = config_.symbol;
    j["mode"] = toString(config_.mode);
    j["uptime_seconds"] = uptime;
    j["connected"] = gateway_->isConnected();
    j["error_count"] = error_count_.load();
    j["cycles"] = cycle_count_.load();

    std::lock_guard<std::mutex> lock(state_mutex_);
    j["position"] = position_;
    j["current_price"] = current_price_;
    j["data_feed_ok"] = current_price_ > 0.0;
    j["last_signal_text"] = last_signal_text_;
    return j;
}

void TradingEngine::publishStatus() const {
    if (status_path_.empty()) {
        return;
    }

    const std::filesystem::path& target = status_path_;
    const std::filesystem::path temp = target.string() + ".tmp";
    std::error_code ec;

    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
    }

    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out.is_open()) {
            LOG_WARN("Cannot write status file: {}", temp.string());
            return;
        }
        out << getStatusJson().dump(2) << "\n";
    }

    std::filesystem::rename(temp, target, ec);
    if (ec) {
        LOG_WARN("Cannot publish status file {}: {}", target.string(), ec.message());
    }
}

void TradingEngine::sleepFor(int seconds) const {
    // 100ms 단위로 나눠 stop() 에 빠르게 반응
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (running_ && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

} // namespace engine
} // namespace corolla
