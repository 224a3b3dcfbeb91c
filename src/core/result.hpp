#pragma once

#include <variant>
#include <string>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace studysync {

/**
 * ErrorKind - Coarse classification of a failure.
 *
 * Drives retry decisions in the sync layer; see is_retryable().
 */
enum class ErrorKind {
    Network,     // timeout, host unreachable, connection lost
    Server,      // 5xx
    Auth,        // 401/403, missing session
    Validation,  // malformed payload, constraint violation
    Database,    // local SQLite failure
    Unknown
};

/**
 * Error type for Result - a failure with a message, an optional numeric
 * code (SQLite result code or HTTP status) and a kind.
 */
struct Error {
    std::string message;
    int code{0};
    ErrorKind kind{ErrorKind::Unknown};

    Error() = default;
    explicit Error(std::string msg, int c = 0, ErrorKind k = ErrorKind::Unknown)
        : message(std::move(msg)), code(c), kind(k) {}

    [[nodiscard]] static Error network(std::string msg, int c = 0) {
        return Error{std::move(msg), c, ErrorKind::Network};
    }

    [[nodiscard]] static Error auth(std::string msg, int c = 0) {
        return Error{std::move(msg), c, ErrorKind::Auth};
    }

    [[nodiscard]] static Error validation(std::string msg, int c = 0) {
        return Error{std::move(msg), c, ErrorKind::Validation};
    }

    [[nodiscard]] static Error database(std::string msg, int c = 0) {
        return Error{std::move(msg), c, ErrorKind::Database};
    }

    /**
     * Build an error from an HTTP status code returned by the backend.
     */
    [[nodiscard]] static Error from_http_status(int status, std::string msg) {
        ErrorKind kind = ErrorKind::Unknown;
        if (status == 401 || status == 403) {
            kind = ErrorKind::Auth;
        } else if (status == 408 || status == 429) {
            kind = ErrorKind::Network;
        } else if (status >= 400 && status < 500) {
            kind = ErrorKind::Validation;
        } else if (status >= 500 && status < 600) {
            kind = ErrorKind::Server;
        }
        return Error{std::move(msg), status, kind};
    }

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code && kind == other.kind;
    }
};

/**
 * Whether the automatic retry machinery may try again after this error.
 * Unclassified failures are optimistically retryable; the retry budget
 * bounds them.
 */
[[nodiscard]] inline bool is_retryable(const Error& error) noexcept {
    switch (error.kind) {
        case ErrorKind::Network:
        case ErrorKind::Server:
        case ErrorKind::Database:
        case ErrorKind::Unknown:
            return true;
        case ErrorKind::Auth:
        case ErrorKind::Validation:
            return false;
    }
    return true;
}

[[nodiscard]] inline const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Network: return "network";
        case ErrorKind::Server: return "server";
        case ErrorKind::Auth: return "auth";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Database: return "database";
        case ErrorKind::Unknown: return "unknown";
    }
    return "unknown";
}

/**
 * Result<T, E> - either a value (Ok) or an error (Err).
 *
 * Usage:
 *   Result<Deck> load(const Uuid& id);
 *
 *   auto name = load(id)
 *       .map([](const Deck& d) { return d.name; })
 *       .value_or("<missing>");
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Access the value. Throws std::runtime_error when called on an error,
     * so check is_ok() first or use value_or().
     */
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        throw_if_err();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    [[nodiscard]] T value_or(T default_value) && {
        if (is_ok()) {
            return std::get<0>(std::move(data_));
        }
        return default_value;
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    template<typename F>
    [[nodiscard]] auto map(F&& f) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(std::move(data_))));
        }
        return Result<U, E>::err(std::get<1>(std::move(data_)));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return ResultU::err(std::get<1>(data_));
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (!is_err()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).message);
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Index-based access so T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success without a value, or an error.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return is_ok_;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return !is_ok_;
    }

    void unwrap() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

} // namespace studysync
