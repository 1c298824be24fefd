#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace RW {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        ConsistencyViolation,
        ContractViolation,
        MutationDeferred,
        CapabilityMismatch,
        NoSuchInstance,
        NoSuchDrawable,
        InvalidArgument,
        NotSupported
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto make_error(std::string message, Error::Code code) -> Error {
    return Error{code, std::move(message)};
}

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::ConsistencyViolation:
        return "consistency_violation";
    case Error::Code::ContractViolation:
        return "contract_violation";
    case Error::Code::MutationDeferred:
        return "mutation_deferred";
    case Error::Code::CapabilityMismatch:
        return "capability_mismatch";
    case Error::Code::NoSuchInstance:
        return "no_such_instance";
    case Error::Code::NoSuchDrawable:
        return "no_such_drawable";
    case Error::Code::InvalidArgument:
        return "invalid_argument";
    case Error::Code::NotSupported:
        return "not_supported";
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

} // namespace RW
