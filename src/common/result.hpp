#pragma once

#include "common/diagnostic.hpp"

#include <variant>

namespace loft {

/// Either a value or the error that prevented producing it.
/// Parse entry points return `Result<T>` whose error is the first
/// diagnostic raised.
template <typename T, typename E = Diagnostic>
class Result {
public:
    [[nodiscard]] static Result ok(T value) { return Result(std::move(value)); }
    [[nodiscard]] static Result err(E error) { return Result(Failure{std::move(error)}); }

    [[nodiscard]] bool is_ok() const { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool is_err() const { return std::holds_alternative<Failure>(data_); }

    /// Undefined behavior if is_err().
    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    /// Undefined behavior if is_ok().
    [[nodiscard]] E& error() & { return std::get<Failure>(data_).err; }
    [[nodiscard]] const E& error() const& { return std::get<Failure>(data_).err; }

    [[nodiscard]] explicit operator bool() const { return is_ok(); }

private:
    // Distinct wrapper so T and E may be the same type.
    struct Failure {
        E err;
    };

    explicit Result(T value) : data_(std::move(value)) {}
    explicit Result(Failure failure) : data_(std::move(failure)) {}

    std::variant<T, Failure> data_;
};

} // namespace loft
