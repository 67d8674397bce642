#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <variant>

namespace isr {

enum class ErrorKind : u8 {
    Generic,
    Boundary,      // cell outside [0,W) x [0,H)
    Configuration, // invalid config value, unknown terrain code, malformed table/layer
};

const char* error_kind_name(ErrorKind kind);

/// Offending coordinate and the bounds it violated.
struct BoundaryContext {
    i32 x = 0;
    i32 y = 0;
    i32 width = 0;
    i32 height = 0;
};

struct Error {
    ErrorKind kind = ErrorKind::Generic;
    std::string message;
    std::string field;                      ///< Offending field or terrain code (Configuration)
    std::optional<BoundaryContext> bounds;  ///< Set for Boundary faults

    Error() = default;
    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

/// Build a Boundary fault for (x, y) against a width x height grid.
Error boundary_fault(i32 x, i32 y, i32 width, i32 height);

/// Build a Configuration fault. `field` names the offending field or code.
Error configuration_fault(std::string field, std::string msg);

/// Simple Result type: holds either a value of type T or an Error.
/// For void results, use Result<void>.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error err) : data_(std::move(err)) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }

    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

/// Specialization for void results.
template <>
class Result<void> {
public:
    Result() : err_(std::nullopt) {}
    Result(Error err) : err_(std::move(err)) {}

    bool ok() const { return !err_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return err_.value(); }

private:
    std::optional<Error> err_;
};

} // namespace isr
