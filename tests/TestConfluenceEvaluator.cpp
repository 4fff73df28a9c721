#include "strategy/ConfluenceEvaluator.h"

#include <cassert>
#include <iostream>

using corolla::analytics::IndicatorSnapshot;
using corolla::strategy::ConfluenceEvaluator;
using corolla::strategy::ConfluenceScore;
using corolla::strategy::Direction;

namespace {
IndicatorSnapshot makeSnapshot(bool in_squeeze, double momentum, int fast, int slow, double close) {
    IndicatorSnapshot snapshot;
    snapshot.squeeze.in_squeeze = in_squeeze;
    snapshot.squeeze.momentum = momentum;
    snapshot.trend_signal_short = fast;
    snapshot.trend_signal_long = slow;
    snapshot.last_close = close;
    return snapshot;
}
}

int main() {
    const ConfluenceEvaluator evaluator;

    {
        const auto score = evaluator.evaluate(Direction::LONG, 100.0, makeSnapshot(false, 1.5, 1, 1, 101.0));
        assert(score.count() == 5);
        assert(score.squeeze_exit);
        assert(score.momentum_aligned);
        assert(score.fast_trend_aligned);
        assert(score.slow_trend_aligned);
        assert(score.break_strength);

        const auto names = score.trueFactorNames();
        assert(names.size() == 5);
        assert(names[0] == "squeeze_exit");
        assert(names[1] == "momentum_aligned");
        assert(names[2] == "fast_trend_aligned");
        assert(names[3] == "slow_trend_aligned");
        assert(names[4] == "break_strength");
    }

    // SHORT against positive momentum while in squeeze
    {
        const auto score = evaluator.evaluate(Direction::SHORT, 100.0, makeSnapshot(true, 0.8, -1, 0, 98.0));
        assert(!score.squeeze_exit);
        assert(!score.momentum_aligned);
        assert(score.fast_trend_aligned);
        assert(score.slow_trend_aligned);
        assert(score.break_strength);
        assert(score.count() == 3);

        const auto names = score.trueFactorNames();
        assert(names.size() == 3);
        assert(names.front() == "fast_trend_aligned");
    }

    // neutral trend counts for both directions, opposing trend does not
    {
        const auto neutral = makeSnapshot(false, 0.0, 0, 0, 100.0);
        assert(evaluator.evaluate(Direction::LONG, 100.0, neutral).fast_trend_aligned);
        assert(evaluator.evaluate(Direction::SHORT, 100.0, neutral).slow_trend_aligned);

        // zero momentum aligns with nothing
        assert(!evaluator.evaluate(Direction::LONG, 100.0, neutral).momentum_aligned);
        assert(!evaluator.evaluate(Direction::SHORT, 100.0, neutral).momentum_aligned);

        const auto bearish = makeSnapshot(false, 0.0, -1, -1, 100.0);
        const auto score = evaluator.evaluate(Direction::LONG, 100.0, bearish);
        assert(!score.fast_trend_aligned);
        assert(!score.slow_trend_aligned);
    }

    // break strength
    {
        const auto close_to_level = makeSnapshot(false, 1.0, 1, 1, 100.05);
        assert(!evaluator.evaluate(Direction::LONG, 100.0, close_to_level).break_strength);
        assert(evaluator.evaluate(Direction::LONG, 100.0, close_to_level).count() == 4);

        assert(!evaluator.evaluate(Direction::LONG, 0.0, makeSnapshot(false, 1.0, 1, 1, 101.0)).break_strength);
        assert(!evaluator.evaluate(Direction::LONG, 100.0, makeSnapshot(false, 1.0, 1, 1, 0.0)).break_strength);
    }

    // no candidate direction: only the squeeze factor can hold
    {
        const auto score = evaluator.evaluate(Direction::NONE, 0.0, makeSnapshot(false, 1.0, 1, 1, 101.0));
        assert(score.count() == 1);
        assert(score.squeeze_exit);
    }

    {
        const auto map = ConfluenceScore().toMap();
        assert(map.size() == static_cast<std::size_t>(ConfluenceScore::kFactorCount));
        assert(map.count("squeeze_exit") == 1);
        assert(map.count("break_strength") == 1);
        assert(!map.at("momentum_aligned"));
        assert(ConfluenceScore().count() == 0);
        assert(ConfluenceScore().trueFactorNames().empty());
    }

    std::cout << "[TEST] ConfluenceEvaluator PASSED\n";
    return 0;
}
