#include "hookseal/configuration/callback_config.hpp"
#include "config/callback_settings.pb.h"

#include <google/protobuf/util/json_util.h>
#include <fmt/core.h>

namespace hookseal::protocol::configuration {

Result<CallbackConfig, CallbackFailure> CallbackConfig::FromJson(std::string_view json) {
    proto::config::CallbackSettings settings;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    const auto status = google::protobuf::util::JsonStringToMessage(
        std::string(json), &settings, options);
    if (!status.ok()) {
        return Result<CallbackConfig, CallbackFailure>::Err(
            CallbackFailure::ConfigError(
                fmt::format("Malformed callback settings: {}", std::string(status.message()))));
    }
    if (settings.token().empty()) {
        return Result<CallbackConfig, CallbackFailure>::Err(
            CallbackFailure::ConfigError("Callback settings are missing 'token'"));
    }
    if (settings.encoding_aes_key().empty()) {
        return Result<CallbackConfig, CallbackFailure>::Err(
            CallbackFailure::ConfigError("Callback settings are missing 'encoding_aes_key'"));
    }

    CallbackConfig config;
    config.token = settings.token();
    config.encoding_aes_key = settings.encoding_aes_key();
    if (settings.has_receive_id()) {
        config.receive_id = settings.receive_id();
    }
    return Result<CallbackConfig, CallbackFailure>::Ok(std::move(config));
}

} // namespace hookseal::protocol::configuration
