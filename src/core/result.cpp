#include "core/result.hpp"

#include <spdlog/fmt/fmt.h>

namespace isr {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Generic: return "Error";
    case ErrorKind::Boundary: return "BoundaryFault";
    case ErrorKind::Configuration: return "ConfigurationFault";
    }
    return "Unknown";
}

Error boundary_fault(i32 x, i32 y, i32 width, i32 height) {
    Error err(ErrorKind::Boundary,
              fmt::format("cell ({}, {}) is outside grid bounds {}x{}",
                          x, y, width, height));
    err.bounds = BoundaryContext{x, y, width, height};
    return err;
}

Error configuration_fault(std::string field, std::string msg) {
    Error err(ErrorKind::Configuration, std::move(msg));
    err.field = std::move(field);
    return err;
}

} // namespace isr
