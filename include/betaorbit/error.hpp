#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace betaorbit {

/**
 * Structured error reporting. Every exception carries a code, the
 * function it was raised in, and where useful a hint for the operator.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    NOT_PERRON = 2,

    // Numerical errors
    ACCURACY = 200,
    CONVERGENCE_FAILED = 201,

    // Register errors
    DATA_NOT_FOUND = 300,
    DUPLICATE_SEGMENT = 301,

    // I/O errors
    IO_FAILURE = 400,
    FORMAT_MISMATCH = 401,

    INTERNAL_ERROR = 500
};

class BetaOrbitException : public std::runtime_error {
public:
    explicit BetaOrbitException(ErrorCode code, const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "betaorbit error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public BetaOrbitException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : BetaOrbitException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

class NotPerronError : public BetaOrbitException {
public:
    explicit NotPerronError(const std::string& message,
                            const std::string& context = "")
        : BetaOrbitException(ErrorCode::NOT_PERRON, message, context) {}
};

class NumericalError : public BetaOrbitException {
public:
    explicit NumericalError(const std::string& message,
                            const std::string& context = "")
        : BetaOrbitException(ErrorCode::CONVERGENCE_FAILED, message, context) {}
};

/**
 * The working precision cannot decide the next digit. Recoverable: the
 * controller doubles the precision and starts the attempt again.
 */
class AccuracyError : public BetaOrbitException {
public:
    AccuracyError(unsigned precision, std::int64_t index, const std::string& context = "")
        : BetaOrbitException(ErrorCode::ACCURACY,
                             "insufficient precision " + std::to_string(precision) +
                             " bits at index " + std::to_string(index),
                             context, "increase the working precision")
        , precision_(precision)
        , index_(index) {}

    unsigned precision() const noexcept { return precision_; }
    std::int64_t index() const noexcept { return index_; }

private:
    unsigned precision_;
    std::int64_t index_;
};

/// Distinguishes "retry later" from "this index will never be stored".
enum class Availability {
    NotYetAvailable,
    PermanentlyAbsent
};

class DataNotFoundError : public BetaOrbitException {
public:
    DataNotFoundError(Availability availability, std::int64_t index, const std::string& context = "")
        : BetaOrbitException(ErrorCode::DATA_NOT_FOUND,
                             std::string(availability == Availability::NotYetAvailable
                                             ? "index not yet produced: "
                                             : "index permanently absent: ") + std::to_string(index),
                             context)
        , availability_(availability)
        , index_(index) {}

    Availability availability() const noexcept { return availability_; }
    std::int64_t index() const noexcept { return index_; }

private:
    Availability availability_;
    std::int64_t index_;
};

class DuplicateSegmentError : public BetaOrbitException {
public:
    explicit DuplicateSegmentError(const std::string& message, const std::string& context = "")
        : BetaOrbitException(ErrorCode::DUPLICATE_SEGMENT, message, context,
                             "a segment range was flushed twice; check the save bookkeeping") {}
};

class IOError : public BetaOrbitException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : BetaOrbitException(ErrorCode::IO_FAILURE, message, context, suggestion) {}
};

class FormatError : public BetaOrbitException {
public:
    explicit FormatError(const std::string& message, const std::string& context = "")
        : BetaOrbitException(ErrorCode::FORMAT_MISMATCH, message, context) {}
};

class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw BetaOrbitException(code, message, context, suggestion);
        }
    }

    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }
};

#define BETAORBIT_CHECK(condition, code, message) \
    betaorbit::ErrorHandler::check_condition(condition, code, message, __func__)

#define BETAORBIT_CHECK_ARGUMENT(condition, message) \
    betaorbit::ErrorHandler::check_argument(condition, message, __func__)

#define BETAORBIT_THROW(code, message) \
    throw betaorbit::BetaOrbitException(code, message, __func__)

#define BETAORBIT_THROW_INVALID_ARG(message) \
    throw betaorbit::InvalidArgumentError(message, __func__)

} // namespace betaorbit
