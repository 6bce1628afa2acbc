/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See License file.
 */

#ifndef PFL_CORE_EXCEPTION_H
#define PFL_CORE_EXCEPTION_H

/**
 * @file PFLException.h
 * @brief Exception hierarchy for error handling in the field library
 *
 * Every error surfaces immediately to the caller. Exceptions carry a status
 * code, the throwing source location and, in debug builds, a stack trace.
 */

#include "Types.h"
#include "PFLConfig.h"
#include <cstdlib>
#include <exception>
#include <sstream>
#include <string>
#include <vector>

#if PFL_HAS_MPI
#include <mpi.h>
#endif

#if defined(__GNUC__) && !defined(_WIN32)
#include <execinfo.h>
#include <cxxabi.h>
#endif

namespace pfl {

// ============================================================================
// Base Exception Class
// ============================================================================

/**
 * @brief Base exception class for all field library exceptions
 */
class PFLException : public std::exception {
public:
    PFLException(const std::string& message,
                 PFLStatus status = PFLStatus::Unknown)
        : message_(message),
          status_(status),
          line_(0),
          mpi_rank_(-1) {
        capture_context();
        build_what();
    }

    PFLException(const std::string& message,
                 const char* file,
                 int line,
                 const char* function = "",
                 PFLStatus status = PFLStatus::Unknown)
        : message_(message),
          status_(status),
          file_(file),
          line_(line),
          function_(function),
          mpi_rank_(-1) {
        capture_context();
        build_what();
    }

    PFLException(const PFLException&) = default;

    virtual ~PFLException() noexcept = default;

    const char* what() const noexcept override {
        return what_.c_str();
    }

    PFLStatus status() const noexcept { return status_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& file() const noexcept { return file_; }
    int line() const noexcept { return line_; }
    const std::string& function() const noexcept { return function_; }
    int mpi_rank() const noexcept { return mpi_rank_; }
    const std::vector<std::string>& stack_trace() const noexcept { return stack_trace_; }

    /**
     * @brief Prepend context to the message (used when rethrowing)
     */
    void add_context(const std::string& context) {
        message_ = context + "\n  -> " + message_;
        build_what();
    }

protected:
    std::string message_;
    PFLStatus status_;
    std::string file_;
    int line_;
    std::string function_;
    int mpi_rank_;
    std::vector<std::string> stack_trace_;
    std::string what_;

    void capture_context() {
        #if PFL_HAS_MPI
        int initialized = 0;
        MPI_Initialized(&initialized);
        if (initialized) {
            MPI_Comm_rank(MPI_COMM_WORLD, &mpi_rank_);
        }
        #endif

        #if PFL_DEBUG_MODE
        capture_stack_trace();
        #endif
    }

    void capture_stack_trace() {
        #if defined(__GNUC__) && !defined(_WIN32)
        constexpr int MAX_FRAMES = 32;
        void* frames[MAX_FRAMES];
        int n_frames = backtrace(frames, MAX_FRAMES);

        char** symbols = backtrace_symbols(frames, n_frames);
        if (symbols) {
            for (int i = 1; i < n_frames; ++i) {
                std::string symbol(symbols[i]);

                size_t start = symbol.find('(');
                size_t end = symbol.find('+', start);
                if (start != std::string::npos && end != std::string::npos) {
                    std::string mangled = symbol.substr(start + 1, end - start - 1);
                    int status;
                    char* demangled = abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status);
                    if (status == 0 && demangled) {
                        symbol.replace(start + 1, end - start - 1, demangled);
                        std::free(demangled);
                    }
                }
                stack_trace_.push_back(symbol);
            }
            std::free(symbols);
        }
        #endif
    }

    void build_what() {
        std::ostringstream oss;
        oss << "[PFL Exception] " << status_to_string(status_);
        if (mpi_rank_ >= 0) {
            oss << " (Rank " << mpi_rank_ << ")";
        }
        oss << "\n";

        if (!file_.empty()) {
            oss << "  Location: " << file_ << ":" << line_;
            if (!function_.empty()) {
                oss << " in " << function_ << "()";
            }
            oss << "\n";
        }

        oss << "  Message: " << message_ << "\n";

        #if PFL_DEBUG_MODE
        if (!stack_trace_.empty()) {
            oss << "  Stack trace:\n";
            for (size_t i = 0; i < stack_trace_.size() && i < 10; ++i) {
                oss << "    #" << i << " " << stack_trace_[i] << "\n";
            }
        }
        #endif

        what_ = oss.str();
    }
};

// ============================================================================
// Specific Exception Types
// ============================================================================

/**
 * @brief Wrong argument type or value (construction errors)
 */
class InvalidArgumentException : public PFLException {
public:
    InvalidArgumentException(const std::string& message,
                             const char* file = "",
                             int line = 0,
                             const char* function = "")
        : PFLException(message, file, line, function, PFLStatus::InvalidArgument) {}
};

/**
 * @brief Tensor shapes that cannot be broadcast against each other
 */
class ShapeMismatchException : public PFLException {
public:
    ShapeMismatchException(const std::string& message,
                           const char* file = "",
                           int line = 0,
                           const char* function = "")
        : PFLException(message, file, line, function, PFLStatus::ShapeMismatch) {}
};

/**
 * @brief Boundary rules whose semantics cannot be combined
 */
class IncompatibleExtrapolations : public PFLException {
public:
    IncompatibleExtrapolations(const std::string& message,
                               const char* file = "",
                               int line = 0,
                               const char* function = "")
        : PFLException(message, file, line, function, PFLStatus::IncompatibleExtrapolation) {}
};

/**
 * @brief Capability that a variant does not provide
 */
class NotImplementedException : public PFLException {
public:
    NotImplementedException(const std::string& feature,
                            const char* file = "",
                            int line = 0,
                            const char* function = "")
        : PFLException("Feature not implemented: " + feature, file, line, function, PFLStatus::NotImplemented) {}
};

/**
 * @brief Index or item name outside of a dimension
 */
class OutOfRangeException : public PFLException {
public:
    OutOfRangeException(const std::string& message,
                        const char* file = "",
                        int line = 0,
                        const char* function = "")
        : PFLException(message, file, line, function, PFLStatus::OutOfRange) {}
};

// ============================================================================
// Exception Throwing Macros
// ============================================================================

#define PFL_THROW(ExceptionType, message) \
    throw ExceptionType(message, __FILE__, __LINE__, __FUNCTION__)

#define PFL_THROW_IF_3(condition, ExceptionType, message) \
    do { \
        if (PFL_UNLIKELY(condition)) { \
            PFL_THROW(ExceptionType, message); \
        } \
    } while(0)

#define PFL_THROW_IF_2(condition, message) \
    do { \
        if (PFL_UNLIKELY(condition)) { \
            PFL_THROW(PFLException, message); \
        } \
    } while(0)

#define PFL_THROW_IF_SELECT(_1, _2, _3, NAME, ...) NAME

/**
 * @brief Conditional throw with source location
 *
 * Called with (condition, message) for PFLException or with
 * (condition, ExceptionType, message) for a specific type.
 */
#define PFL_THROW_IF(...) \
    PFL_THROW_IF_SELECT(__VA_ARGS__, PFL_THROW_IF_3, PFL_THROW_IF_2)(__VA_ARGS__)

#define PFL_CHECK_ARG(condition, message) \
    PFL_THROW_IF(!(condition), InvalidArgumentException, message)

#define PFL_CHECK_NOT_NULL(ptr, name) \
    PFL_THROW_IF((ptr) == nullptr, InvalidArgumentException, \
                 std::string(name) + " is null")

#define PFL_CHECK_SHAPE(condition, message) \
    PFL_THROW_IF(!(condition), ShapeMismatchException, message)

#define PFL_NOT_IMPLEMENTED(feature) \
    PFL_THROW(NotImplementedException, feature)

} // namespace pfl

#endif // PFL_CORE_EXCEPTION_H
