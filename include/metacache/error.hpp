#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace metacache {

// ---------------------------------------------------------------------------
// ErrorCode -- failure categories delivered through completion callbacks
// ---------------------------------------------------------------------------
enum class ErrorCode : std::uint8_t {
    not_found = 0,            // no asset was supplied
    load_failure,             // the loader unit reported or threw an error
    serialization_failure,    // encode/decode of a metadata payload failed
    cancelled,                // reserved for loaders observing stop requests
    persistence_unavailable,  // cache directory could not be created
    codec_unavailable,        // configured disk codec is not compiled in
};

[[nodiscard]] constexpr std::string_view error_code_name(ErrorCode c) noexcept
{
    switch (c) {
        case ErrorCode::not_found:               return "not_found";
        case ErrorCode::load_failure:            return "load_failure";
        case ErrorCode::serialization_failure:   return "serialization_failure";
        case ErrorCode::cancelled:               return "cancelled";
        case ErrorCode::persistence_unavailable: return "persistence_unavailable";
        case ErrorCode::codec_unavailable:       return "codec_unavailable";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// Error -- value-type error passed to callbacks as std::optional<Error>
// ---------------------------------------------------------------------------
struct Error {
    ErrorCode   code = ErrorCode::load_failure;
    std::string message;

    [[nodiscard]] static Error not_found(std::string msg = "asset is absent")
    {
        return {ErrorCode::not_found, std::move(msg)};
    }

    [[nodiscard]] static Error load_failure(std::string msg)
    {
        return {ErrorCode::load_failure, std::move(msg)};
    }

    [[nodiscard]] static Error serialization_failure(std::string msg)
    {
        return {ErrorCode::serialization_failure, std::move(msg)};
    }

    [[nodiscard]] std::string describe() const
    {
        return std::string(error_code_name(code)) + ": " + message;
    }

    friend bool operator==(const Error&, const Error&) = default;
};

// ---------------------------------------------------------------------------
// Exceptions thrown at construction time
// ---------------------------------------------------------------------------
class PersistenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    [[nodiscard]] static constexpr ErrorCode code() noexcept
    {
        return ErrorCode::persistence_unavailable;
    }
};

class CodecError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace metacache
