#pragma once

#include "signal_spec.hpp"
#include "strategy_graph.hpp"

namespace strategy_engine {

    // Turns a validated graph plus backtest parameters into a Signal Specification.
    // Implementations must be pure: identical inputs give identical output.
    class ISignalCompiler {
    public:
        virtual ~ISignalCompiler() = default;

        // Throws CompileException for unsupported categories and unusable numbers
        virtual SignalSpecification compile(const NormalizedGraph& graph,
                                            const BacktestParameters& params) const = 0;
    };

    // Pattern-based compiler: rule text goes through RuleParser, structured
    // rules through ConditionFactory. When nothing is recognized it falls back
    // to an SMA(10)/SMA(30) crossover and says so in the diagnostics.
    class RuleSignalCompiler : public ISignalCompiler {
    public:
        static constexpr int kFallbackFastWindow = 10;
        static constexpr int kFallbackSlowWindow = 30;

        SignalSpecification compile(const NormalizedGraph& graph,
                                    const BacktestParameters& params) const override;
    };

} // namespace strategy_engine
