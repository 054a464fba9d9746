#include "hookseal/utilities/json_envelope.hpp"
#include "callback/envelope.pb.h"
#include <google/protobuf/stubs/common.h>
#include <google/protobuf/util/json_util.h>
#include <fmt/core.h>
namespace hookseal::protocol::utilities {

Result<std::string, CallbackFailure> JsonEnvelope::ParseCallbackBody(std::string_view json) {
    proto::callback::CallbackBody body;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    const auto status = google::protobuf::util::JsonStringToMessage(
        std::string(json), &body, options);
    if (!status.ok()) {
        return Result<std::string, CallbackFailure>::Err(
            CallbackFailure::InvalidRequest(
                fmt::format("Malformed callback body: {}", std::string(status.message()))));
    }
    if (body.encrypt().empty()) {
        return Result<std::string, CallbackFailure>::Err(
            CallbackFailure::InvalidRequest("Callback body is missing 'encrypt'"));
    }
    return Result<std::string, CallbackFailure>::Ok(std::move(*body.mutable_encrypt()));
}

Result<std::string, CallbackFailure> JsonEnvelope::RenderReply(const EncryptedReply& reply) {
    proto::callback::EncryptedReplyBody body;
    body.set_encrypt(reply.encrypt);
    body.set_msgsignature(reply.msg_signature);
    body.set_timestamp(reply.timestamp);
    body.set_nonce(reply.nonce);

    google::protobuf::util::JsonPrintOptions options;
    options.preserve_proto_field_names = true;
#if GOOGLE_PROTOBUF_VERSION >= 5026000
    options.always_print_fields_with_no_presence = true;
#else
    options.always_print_primitive_fields = true;
#endif

    std::string json;
    const auto status = google::protobuf::util::MessageToJsonString(body, &json, options);
    if (!status.ok()) {
        return Result<std::string, CallbackFailure>::Err(
            CallbackFailure::CryptoBackend(
                fmt::format("Failed to render reply body: {}", std::string(status.message()))));
    }
    return Result<std::string, CallbackFailure>::Ok(std::move(json));
}
}
