#pragma once

#include <stdexcept>
#include <string>

namespace core {

    // Failure categories reported on a failed execution
    enum class ErrorKind {
        SchemaError,     // Malformed strategy graph
        CompileError,    // Unsupported or invalid parameters
        SecurityError,   // Generated logic fails sandbox policy
        TimeoutError,    // Sandbox exceeded its wall-clock budget
        ExecutionError,  // Runtime failure in the sandbox or the data provider
        NotReadyError,   // Result requested before completion
        InternalError    // Anything unanticipated
    };

    std::string errorKindToString(ErrorKind kind);
    ErrorKind errorKindFromString(const std::string& kind);

    class PipelineException : public std::runtime_error {
    public:
        explicit PipelineException(const std::string& message)
            : std::runtime_error(message) {}

        explicit PipelineException(const char* message)
            : std::runtime_error(message) {}

        virtual ErrorKind kind() const { return ErrorKind::InternalError; }
    };

    // --- Tagged pipeline errors ---
    class SchemaException : public PipelineException {
    public: using PipelineException::PipelineException;
        ErrorKind kind() const override { return ErrorKind::SchemaError; } };

    class CompileException : public PipelineException {
    public: using PipelineException::PipelineException;
        ErrorKind kind() const override { return ErrorKind::CompileError; } };

    class SecurityException : public PipelineException {
    public: using PipelineException::PipelineException;
        ErrorKind kind() const override { return ErrorKind::SecurityError; } };

    class TimeoutException : public PipelineException {
    public: using PipelineException::PipelineException;
        ErrorKind kind() const override { return ErrorKind::TimeoutError; } };

    class ExecutionException : public PipelineException {
    public: using PipelineException::PipelineException;
        ErrorKind kind() const override { return ErrorKind::ExecutionError; } };

    class NotReadyException : public PipelineException {
    public: using PipelineException::PipelineException;
        ErrorKind kind() const override { return ErrorKind::NotReadyError; } };

    class InternalException : public PipelineException {
    public: using PipelineException::PipelineException; };

    // --- Infrastructure errors (reported as InternalError unless wrapped) ---
    class ConfigException : public PipelineException {
    public: using PipelineException::PipelineException; };

    class DataLoadException : public PipelineException {
    public: using PipelineException::PipelineException; };

    class DatabaseException : public PipelineException {
    public: using PipelineException::PipelineException; };

    class ApiRequestException : public PipelineException {
    public: using PipelineException::PipelineException; };

    class IndicatorCalculationException : public PipelineException {
    public: using PipelineException::PipelineException; };

    // Lookup of an id nobody created
    class NotFoundException : public PipelineException {
    public: using PipelineException::PipelineException; };

} // namespace core
