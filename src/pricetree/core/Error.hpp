#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace PT {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        NotFound,
        InvalidWeight,
        MalformedInput,
        MissingColumn,
        IoFailure,
        InvalidConfig,
        InvariantViolation,
        NothingToUndo
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::InvalidWeight:
        return "invalid_weight";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::MissingColumn:
        return "missing_column";
    case Error::Code::IoFailure:
        return "io_failure";
    case Error::Code::InvalidConfig:
        return "invalid_config";
    case Error::Code::InvariantViolation:
        return "invariant_violation";
    case Error::Code::NothingToUndo:
        return "nothing_to_undo";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace PT
