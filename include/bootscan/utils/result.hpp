#pragma once
#include <string>
#include <utility>
#include <variant>

namespace bootscan {
namespace utils {

/**
 * @brief Failure reported by an external collaborator.
 */
struct Error {
    std::string message;
    bool cancelled{false};   ///< The operation was cancelled rather than failed

    static Error cancellation(std::string message) {
        return Error{std::move(message), true};
    }
};

// Generic Result<T> template
// Holds either a value of type T or an Error

template <typename T>
class Result {
public:
    // Success constructors
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    // Error constructors
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    static Result failure(std::string message) {
        return Result(Error{std::move(message), false});
    }

    bool has_value() const { return std::holds_alternative<T>(data_); }
    bool has_error() const { return std::holds_alternative<Error>(data_); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }
    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

// Specialization for void

template <>
class Result<void> {
public:
    Result() = default;
    Result(const Error& error) : success_(false), error_(error) {}
    Result(Error&& error) : success_(false), error_(std::move(error)) {}

    bool has_value() const { return success_; }
    bool has_error() const { return !success_; }
    const Error& error() const { return error_; }

private:
    bool success_ = true;
    Error error_;
};

} // namespace utils
} // namespace bootscan

namespace bootscan {
using utils::Result;
}
