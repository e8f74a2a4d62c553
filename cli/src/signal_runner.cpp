// cli/src/signal_runner.cpp
//
// Sandbox worker. Runs inside a scratch directory with no network:
//   signal_runner --spec signal_spec.json --prices prices.csv
// The backtest result goes to stdout between the result sentinels; logs go
// to stderr. Exit code 0 on success, 1 on any failure, 2 on bad usage.

#include <iostream>
#include <string>
#include <exception>

#include "logging.hpp"
#include "exceptions.hpp"
#include "signal_spec.hpp"
#include "backtester.hpp"
#include "price_csv.hpp"

#include <ta_libc.h>
#include <nlohmann/json.hpp>
#include <fstream>

namespace {

    const char* const kResultsStart = "===RESULTS_START===";
    const char* const kResultsEnd = "===RESULTS_END===";

    // TA_Initialize / TA_Shutdown for the lifetime of main
    struct TaLibSession {
        TaLibSession() {
            TA_RetCode rc = TA_Initialize();
            if (rc != TA_SUCCESS) {
                throw core::IndicatorCalculationException("TA_Initialize failed with code " + std::to_string(rc));
            }
        }
        ~TaLibSession() { TA_Shutdown(); }
    };

    nlohmann::json readSpecFile(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw core::DataLoadException("Cannot open specification file: " + path);
        }
        try {
            return nlohmann::json::parse(ifs);
        } catch (const nlohmann::json::parse_error& e) {
            throw core::DataLoadException("Specification is not valid JSON: " + std::string(e.what()));
        }
    }

} // namespace

int main(int argc, char* argv[]) {
    std::string spec_path;
    std::string prices_path;
    for (int i = 1; i + 1 < argc; i += 2) {
        std::string flag = argv[i];
        if (flag == "--spec") spec_path = argv[i + 1];
        else if (flag == "--prices") prices_path = argv[i + 1];
    }
    if (spec_path.empty() || prices_path.empty()) {
        std::cerr << "usage: signal_runner --spec FILE --prices FILE" << std::endl;
        return 2;
    }

    try {
        core::logging::initializeStderr();
        auto logger = core::logging::getLogger();
        TaLibSession ta_lib;

        auto spec = strategy_engine::SignalSpecification::fromJson(readSpecFile(spec_path));
        auto candles = data::readPriceCsv(prices_path);
        logger->info("Worker running {} over {} candles", spec.asset.symbol, candles.size());

        backtester::Backtester backtester(spec);
        backtester::BacktestResult result = backtester.run(candles);
        result.metrics.logMetrics();

        std::cout << kResultsStart << "\n" << result.toJson().dump() << "\n" << kResultsEnd << std::endl;
    } catch (const core::PipelineException& ex) {
        std::cerr << "Worker Error [" << core::errorKindToString(ex.kind()) << "]: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Worker Error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
