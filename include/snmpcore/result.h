#ifndef SNMPCORE_RESULT_H
#define SNMPCORE_RESULT_H

#include <snmpcore/config.h>
#include <snmpcore/error.h>
#include <variant>
#include <string>
#include <utility>
#include <type_traits>

namespace snmpcore {
namespace v1 {

template<typename T>
class Result;

/**
 * Result type for operations that can fail.
 *
 * Holds either a success value of type T or an SNMPError together with a
 * human readable message. Messages are produced by the component that
 * failed and never contain credential material.
 *
 * @tparam T The type of the success value
 */
template<typename T>
class SNMPCORE_API Result {
public:
    /**
     * Constructs a successful Result with the given value.
     * @param value The success value
     */
    Result(T value) : data_(std::move(value)) {}

    /**
     * Constructs a failed Result with the given error.
     * @param error The error code
     * @param message Optional context for the error
     */
    Result(SNMPError error, std::string message = {})
        : data_(error), message_(std::move(message)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool is_success() const noexcept {
        return std::holds_alternative<T>(data_);
    }

    bool is_ok() const noexcept {
        return is_success();
    }

    bool is_error() const noexcept {
        return std::holds_alternative<SNMPError>(data_);
    }

    // Value access (throws if error)
    const T& value() const & {
        if (is_error()) {
            throw SNMPException(std::get<SNMPError>(data_), error_message());
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (is_error()) {
            throw SNMPException(std::get<SNMPError>(data_), error_message());
        }
        return std::get<T>(data_);
    }

    T value() && {
        if (is_error()) {
            throw SNMPException(std::get<SNMPError>(data_), error_message());
        }
        return std::move(std::get<T>(data_));
    }

    template<typename U>
    T value_or(U&& default_value) const & {
        if (is_success()) {
            return std::get<T>(data_);
        }
        return static_cast<T>(std::forward<U>(default_value));
    }

    SNMPError error() const {
        if (is_success()) {
            return SNMPError::SUCCESS;
        }
        return std::get<SNMPError>(data_);
    }

    /**
     * Message attached to the error, or the generic description of the
     * error code when none was supplied.
     */
    std::string error_message() const {
        if (is_success()) {
            return {};
        }
        if (!message_.empty()) {
            return message_;
        }
        return ::snmpcore::v1::error_message(std::get<SNMPError>(data_));
    }

    explicit operator bool() const noexcept {
        return is_success();
    }

    const T& operator*() const & {
        return value();
    }

    T& operator*() & {
        return value();
    }

    const T* operator->() const {
        if (is_error()) {
            return nullptr;
        }
        return &std::get<T>(data_);
    }

    T* operator->() {
        if (is_error()) {
            return nullptr;
        }
        return &std::get<T>(data_);
    }

    template<typename F>
    auto map(F&& func) const & -> Result<decltype(func(value()))> {
        using ReturnType = decltype(func(value()));
        if (is_error()) {
            return Result<ReturnType>(error(), message_);
        }
        return Result<ReturnType>(func(value()));
    }

    template<typename F>
    auto and_then(F&& func) const & -> decltype(func(value())) {
        if (is_error()) {
            using ReturnType = decltype(func(value()));
            return ReturnType(error(), message_);
        }
        return func(value());
    }

private:
    std::variant<T, SNMPError> data_;
    std::string message_;
};

// Specialization for void type
template<>
class SNMPCORE_API Result<void> {
public:
    Result() : error_(SNMPError::SUCCESS) {}
    Result(SNMPError error, std::string message = {})
        : error_(error), message_(std::move(message)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    bool is_success() const noexcept {
        return error_ == SNMPError::SUCCESS;
    }

    bool is_ok() const noexcept {
        return is_success();
    }

    bool is_error() const noexcept {
        return error_ != SNMPError::SUCCESS;
    }

    SNMPError error() const noexcept {
        return error_;
    }

    std::string error_message() const {
        if (is_success()) {
            return {};
        }
        if (!message_.empty()) {
            return message_;
        }
        return ::snmpcore::v1::error_message(error_);
    }

    explicit operator bool() const noexcept {
        return is_success();
    }

    template<typename F>
    auto and_then(F&& func) const -> decltype(func()) {
        if (is_error()) {
            using ReturnType = decltype(func());
            return ReturnType(error_, message_);
        }
        return func();
    }

private:
    SNMPError error_;
    std::string message_;
};

// Helper functions for creating Results
template<typename T>
Result<std::decay_t<T>> make_result(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

inline Result<void> make_result() {
    return Result<void>();
}

template<typename T>
Result<T> make_error(SNMPError error) {
    return Result<T>(error);
}

template<typename T>
Result<T> make_error(SNMPError error, std::string message) {
    return Result<T>(error, std::move(message));
}

// Forwards the error (code and message) of another Result
template<typename T, typename U>
Result<T> forward_error(const Result<U>& other) {
    return Result<T>(other.error(), other.error_message());
}

#define SNMPCORE_RETURN_IF_ERROR(result) \
    do { \
        auto&& _snmpcore_r = (result); \
        if (!_snmpcore_r.is_success()) { \
            return {_snmpcore_r.error(), _snmpcore_r.error_message()}; \
        } \
    } while (0)

} // namespace v1
} // namespace snmpcore

#endif // SNMPCORE_RESULT_H
