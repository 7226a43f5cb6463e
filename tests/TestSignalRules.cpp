#include "analytics/RegimeClassifier.h"
#include "strategy/SignalGenerator.h"
#include "risk/PositionSizer.h"
#include "engine/BacktestConfig.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

using namespace regimepairs;
using regimepairs::analytics::RegimeClassifier;
using regimepairs::risk::PositionSizer;
using regimepairs::strategy::SignalGenerator;

namespace {
bool near(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) <= tol;
}
}

int main() {
    {
        RegimeClassifier classifier(0.7, 0.3);
        assert(classifier.classify(0.71) == Regime::HIGH_CORRELATION);
        assert(classifier.classify(0.7) == Regime::TRANSITION);
        assert(classifier.classify(0.5) == Regime::TRANSITION);
        assert(classifier.classify(0.3) == Regime::TRANSITION);
        assert(classifier.classify(0.29) == Regime::LOW_CORRELATION);
        assert(classifier.classify(-0.9) == Regime::LOW_CORRELATION);
        assert(classifier.classify(std::nullopt) == Regime::TRANSITION);
        assert(classifier.classify(std::numeric_limits<double>::quiet_NaN()) == Regime::TRANSITION);

        bool threw = false;
        try {
            RegimeClassifier bad(0.3, 0.7);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        assert(threw);
    }

    {
        SignalGenerator gen(2.5);

        auto s = gen.generate(2.5, Regime::HIGH_CORRELATION);
        assert(!s.isEntry());

        s = gen.generate(3.0, Regime::HIGH_CORRELATION);
        assert(s.isEntry());
        assert(s.strategy == StrategyKind::MEAN_REVERSION);
        assert(s.direction == TradeDirection::SHORT_A_LONG_B);
        assert(near(s.strength, 1.2));

        s = gen.generate(-3.0, Regime::HIGH_CORRELATION);
        assert(s.direction == TradeDirection::LONG_A_SHORT_B);

        s = gen.generate(3.0, Regime::LOW_CORRELATION);
        assert(s.isEntry());
        assert(s.strategy == StrategyKind::MOMENTUM);
        assert(s.direction == TradeDirection::LONG_A_SHORT_B);

        s = gen.generate(-6.0, Regime::LOW_CORRELATION);
        assert(s.direction == TradeDirection::SHORT_A_LONG_B);
        assert(near(s.strength, SignalGenerator::MAX_STRENGTH));

        assert(!gen.generate(5.0, Regime::TRANSITION).isEntry());
        assert(!gen.generate(std::numeric_limits<double>::quiet_NaN(), Regime::HIGH_CORRELATION).isEntry());
    }

    {
        engine::BacktestConfig config;
        PositionSizer sizer(config);

        auto d = sizer.size(Regime::HIGH_CORRELATION, 1.2, 100000.0);
        assert(d.accepted);
        assert(near(d.capital_allocated, 48000.0));
        assert(near(d.leverage, 2.5));

        // capped at max_position_size
        d = sizer.size(Regime::LOW_CORRELATION, 2.0, 100000.0);
        assert(d.accepted);
        assert(near(d.capital_allocated, 50000.0));
        assert(near(d.leverage, 4.0));

        d = sizer.size(Regime::TRANSITION, 1.0, 100000.0);
        assert(near(d.capital_allocated, 20000.0));
        assert(near(d.leverage, 1.5));

        // below minimum position size
        d = sizer.size(Regime::HIGH_CORRELATION, 1.0, 2000.0);
        assert(!d.accepted);

        assert(!sizer.size(Regime::HIGH_CORRELATION, 0.0, 100000.0).accepted);
        assert(!sizer.size(Regime::HIGH_CORRELATION, 1.0, -5.0).accepted);
    }

    std::cout << "[TEST] SignalRules PASSED\n";
    return 0;
}
