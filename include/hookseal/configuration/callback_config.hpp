#pragma once

#include "hookseal/core/result.hpp"
#include "hookseal/core/failures.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace hookseal::protocol::configuration {

/// Raw credentials of one callback integration, as supplied by deployment.
///
/// Nothing here is validated; CredentialSet::Create() does that. The struct
/// exists so hosts can fill it from whatever configuration source they use.
///
/// @example
/// ```cpp
/// auto config = CallbackConfig::FromJson(R"({
///     "token": "QDG6eK",
///     "encoding_aes_key": "jWmYm7qr5nMoAUwZRjGtBxmz3KA1tkAj3ykkR6q2B2C",
///     "receive_id": "wx5823bf96d3bd56c7"
/// })");
/// ```
struct CallbackConfig {
    std::string token;
    std::string encoding_aes_key;
    std::optional<std::string> receive_id;

    /// Parse a JSON settings document. Unknown fields are ignored so the
    /// document can be shared with the rest of the integration's settings.
    ///
    /// @return ConfigError if the JSON is malformed or `token` /
    ///         `encoding_aes_key` are missing
    [[nodiscard]] static Result<CallbackConfig, CallbackFailure> FromJson(std::string_view json);
};

} // namespace hookseal::protocol::configuration
