#include "common/Config.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace corolla {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string toUpperCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

engine::TradingMode parseMode(const std::string& value, engine::TradingMode fallback) {
    const std::string mode = toUpperCopy(trimCopy(value));
    if (mode == "DEMO") return engine::TradingMode::DEMO;
    if (mode == "REPLAY") return engine::TradingMode::REPLAY;
    if (!mode.empty()) {
        std::cout << "경고: 알 수 없는 mode 값 '" << value << "', 기존 값을 유지합니다." << std::endl;
    }
    return fallback;
}

void readTrendFlow(const nlohmann::json& j, const char* key, analytics::TrendFlowParams& out) {
    if (!j.contains(key)) return;
    const auto& t = j[key];
    out.main_length = t.value("main", out.main_length);
    out.smooth_length = t.value("smooth", out.smooth_length);
    out.sensitivity = t.value("sens", out.sensitivity);
}
}

void Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
            if (!std::filesystem::exists(config_path) && std::filesystem::exists(path)) {
                config_path = path;
            }
        }

        std::cout << "설정 파일 경로: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cout << "경고: 설정 파일을 찾을 수 없습니다: " << config_path << std::endl;
            std::cout << "기본값을 사용합니다." << std::endl;
            return;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cout << "경고: 설정 파일을 열 수 없습니다." << std::endl;
            return;
        }

        nlohmann::json j;
        file >> j;
        loadFromJson(j);

        std::cout << "설정 파일 로드 완료" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "설정 로드 오류: " << e.what() << std::endl;
    }
}

void Config::loadFromJson(const nlohmann::json& j) {
    if (j.contains("trading")) {
        const auto& t = j["trading"];
        engine_config_.symbol = t.value("symbol", engine_config_.symbol);
        engine_config_.mode = parseMode(t.value("mode", std::string()), engine_config_.mode);
        engine_config_.candle_interval_seconds =
            t.value("candle_interval_seconds", engine_config_.candle_interval_seconds);
        engine_config_.error_backoff_seconds =
            t.value("error_backoff_seconds", engine_config_.error_backoff_seconds);
        engine_config_.max_cycles = t.value("max_cycles", engine_config_.max_cycles);
        engine_config_.replay_file = t.value("replay_file", engine_config_.replay_file);
        engine_config_.status_file = t.value("status_file", engine_config_.status_file);
        engine_config_.log_dir = t.value("log_dir", engine_config_.log_dir);
        engine_config_.log_level = t.value("log_level", engine_config_.log_level);
        engine_config_.demo_base_price = t.value("demo_base_price", engine_config_.demo_base_price);
        engine_config_.demo_seed = t.value("demo_seed", engine_config_.demo_seed);
    }

    if (j.contains("strategy")) {
        const auto& s = j["strategy"];
        strategy_config_.momentum_window = s.value("momentum_window", strategy_config_.momentum_window);
        strategy_config_.min_confluence = s.value("min_confluence", strategy_config_.min_confluence);
        strategy_config_.min_bars = s.value("min_bars", strategy_config_.min_bars);
        strategy_config_.series_capacity = s.value("series_capacity", strategy_config_.series_capacity);
        strategy_config_.break_tolerance = s.value("break_tolerance", strategy_config_.break_tolerance);
        strategy_config_.exit_strength = s.value("exit_strength", strategy_config_.exit_strength);
        strategy_config_.confirmation_bars_per_candle =
            s.value("confirmation_bars_per_candle", strategy_config_.confirmation_bars_per_candle);
    }

    if (j.contains("indicators")) {
        const auto& i = j["indicators"];
        auto& ind = strategy_config_.indicators;
        readTrendFlow(i, "atf_fast", ind.trend_fast);
        readTrendFlow(i, "atf_slow", ind.trend_slow);
        ind.pivot_left_bars = i.value("pivot_left", ind.pivot_left_bars);
        ind.pivot_right_bars = i.value("pivot_right", ind.pivot_right_bars);
        ind.max_levels = i.value("max_levels", ind.max_levels);
        ind.bb_length = i.value("bb_length", ind.bb_length);
        ind.bb_mult = i.value("bb_mult", ind.bb_mult);
        ind.kc_length = i.value("kc_length", ind.kc_length);
        ind.kc_mult = i.value("kc_mult", ind.kc_mult);
        ind.momentum_length = i.value("momentum_length", ind.momentum_length);
        ind.min_snapshot_bars = i.value("min_snapshot_bars", ind.min_snapshot_bars);
    }
}

void Config::applyEnvironmentOverrides() {
    const std::string mode = readEnvVar("COROLLA_MODE");
    if (!mode.empty()) {
        engine_config_.mode = parseMode(mode, engine_config_.mode);
    }

    const std::string level = readEnvVar("COROLLA_LOG_LEVEL");
    if (!level.empty()) {
        engine_config_.log_level = level;
    }
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> problems;
    const auto& s = strategy_config_;
    const auto& ind = s.indicators;

    if (s.momentum_window < 1) problems.push_back("strategy.momentum_window must be >= 1");
    if (s.min_confluence < 1 || s.min_confluence > 5) problems.push_back("strategy.min_confluence must be in [1, 5]");
    if (s.min_bars < 1) problems.push_back("strategy.min_bars must be >= 1");
    if (s.series_capacity < s.min_bars) problems.push_back("strategy.series_capacity must be >= min_bars");
    if (s.break_tolerance <= 0.0) problems.push_back("strategy.break_tolerance must be > 0");
    if (s.exit_strength < 0.0 || s.exit_strength > 1.0) problems.push_back("strategy.exit_strength must be in [0, 1]");
    if (s.confirmation_bars_per_candle < 1) problems.push_back("strategy.confirmation_bars_per_candle must be >= 1");

    if (ind.trend_fast.main_length < 1 || ind.trend_fast.smooth_length < 1) problems.push_back("indicators.atf_fast lengths must be >= 1");
    if (ind.trend_slow.main_length < 1 || ind.trend_slow.smooth_length < 1) problems.push_back("indicators.atf_slow lengths must be >= 1");
    if (ind.pivot_left_bars < 1 || ind.pivot_right_bars < 1) problems.push_back("indicators.pivot_left/pivot_right must be >= 1");
    if (ind.max_levels < 1) problems.push_back("indicators.max_levels must be >= 1");
    if (ind.bb_length < 1 || ind.kc_length < 1 || ind.momentum_length < 1) problems.push_back("indicators band lengths must be >= 1");
    if (ind.bb_mult <= 0.0 || ind.kc_mult <= 0.0) problems.push_back("indicators band multipliers must be > 0");

    const auto& e = engine_config_;
    if (e.candle_interval_seconds < 0) problems.push_back("trading.candle_interval_seconds must be >= 0");
    if (e.error_backoff_seconds < 0) problems.push_back("trading.error_backoff_seconds must be >= 0");
    if (e.mode == engine::TradingMode::REPLAY && e.replay_file.empty()) problems.push_back("trading.replay_file is required in REPLAY mode");

    return problems;
}

} // namespace corolla
