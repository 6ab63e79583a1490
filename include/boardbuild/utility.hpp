#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace boardbuild {

enum class ErrorKind {
    Configuration,
    Acquisition,
    Isolation,
    Build,
    Artifact,
};

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Configuration:
        return "ConfigurationError";
    case ErrorKind::Acquisition:
        return "AcquisitionError";
    case ErrorKind::Isolation:
        return "IsolationError";
    case ErrorKind::Build:
        return "BuildError";
    case ErrorKind::Artifact:
        return "ArtifactError";
    }
    return "Error";
}

/**
 * @brief A typed pipeline failure.
 *
 * `status` is the process exit status the failure maps to: the status of the
 * delegated command that failed, or 1 when no command is involved.
 */
struct Error {
    ErrorKind kind;
    std::string message;
    int status = 1;
};

template <typename T>
using Result = std::expected<T, Error>;

inline std::unexpected<Error> fail(ErrorKind kind, std::string message, int status = 1) {
    return std::unexpected(Error{kind, std::move(message), status});
}

} // namespace boardbuild

template <>
struct std::formatter<boardbuild::Error> : std::formatter<std::string_view> {
    auto format(const boardbuild::Error &err, std::format_context &ctx) const {
        return std::format_to(ctx.out(), "{}: {}", boardbuild::to_string(err.kind), err.message);
    }
};
