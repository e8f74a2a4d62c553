#include "exceptions.hpp"
#include "datatypes.hpp"

namespace core {

    std::string errorKindToString(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::SchemaError:    return "SchemaError";
            case ErrorKind::CompileError:   return "CompileError";
            case ErrorKind::SecurityError:  return "SecurityError";
            case ErrorKind::TimeoutError:   return "TimeoutError";
            case ErrorKind::ExecutionError: return "ExecutionError";
            case ErrorKind::NotReadyError:  return "NotReadyError";
            case ErrorKind::InternalError:  return "InternalError";
        }
        return "InternalError";
    }

    ErrorKind errorKindFromString(const std::string& kind) {
        if (kind == "SchemaError") return ErrorKind::SchemaError;
        if (kind == "CompileError") return ErrorKind::CompileError;
        if (kind == "SecurityError") return ErrorKind::SecurityError;
        if (kind == "TimeoutError") return ErrorKind::TimeoutError;
        if (kind == "ExecutionError") return ErrorKind::ExecutionError;
        if (kind == "NotReadyError") return ErrorKind::NotReadyError;
        return ErrorKind::InternalError;
    }

    std::string tradeSideToString(TradeSide side) {
        return side == TradeSide::Buy ? "BUY" : "SELL";
    }

    TradeSide tradeSideFromString(const std::string& side) {
        if (side == "BUY") return TradeSide::Buy;
        if (side == "SELL") return TradeSide::Sell;
        throw DataLoadException("Unknown trade side: " + side);
    }

    std::string exitReasonToString(ExitReason reason) {
        switch (reason) {
            case ExitReason::None:       return "";
            case ExitReason::Signal:     return "signal";
            case ExitReason::StopLoss:   return "stop_loss";
            case ExitReason::TakeProfit: return "take_profit";
            case ExitReason::EndOfData:  return "end_of_data";
        }
        return "";
    }

    ExitReason exitReasonFromString(const std::string& reason) {
        if (reason == "signal") return ExitReason::Signal;
        if (reason == "stop_loss") return ExitReason::StopLoss;
        if (reason == "take_profit") return ExitReason::TakeProfit;
        if (reason == "end_of_data") return ExitReason::EndOfData;
        return ExitReason::None;
    }

} // namespace core
