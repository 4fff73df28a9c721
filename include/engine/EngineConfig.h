#pragma once

#include <string>

namespace corolla {
namespace engine {

// 캔들 공급 모드
enum class TradingMode {
    DEMO,       // 랜덤 워크 캔들 (브로커 연결 없음)
    REPLAY      // CSV 캔들 재생
};

// 엔진 설정
struct EngineConfig {
    TradingMode mode;
    std::string symbol;

    int candle_interval_seconds;    // 1m bars
    int error_backoff_seconds;      // 사이클 오류 후 대기
    long long max_cycles;           // 0 = unlimited

    std::string replay_file;        // REPLAY: timestamp,open,high,low,close,volume
    std::string status_file;        // dashboard snapshot, empty = disabled

    std::string log_dir;
    std::string log_level;

    double demo_base_price;
    unsigned int demo_seed;

    EngineConfig()
        : mode(TradingMode::DEMO)
        , symbol("NQ")
        , candle_interval_seconds(60)
        , error_backoff_seconds(30)
        , max_cycles(0)
        , status_file("logs/status.json")
        , log_dir("logs")
        , log_level("info")
        , demo_base_price(18500.0)
        , demo_seed(42)
    {}
};

std::string toString(TradingMode mode);

} // namespace engine
} // namespace corolla
