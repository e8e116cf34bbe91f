#include <runbox/codec/json_codec.hpp>

#include <runbox/common/error_types.hpp>
#include <runbox/logging.hpp>
#include <runbox/sandbox/execution_request.hpp>
#include <runbox/sandbox/execution_result.hpp>

#include <fmt/format.h>
#include <json/json.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace runbox::json {

namespace {

constexpr int HTTP_BAD_REQUEST = 400;
constexpr int HTTP_INTERNAL_SERVER_ERROR = 500;

Expected<Json::Value, ExecutionError> parse_object(std::string_view body) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;

    const std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};

    Json::Value root;
    std::string errs;

    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errs)) {
        LOG_DEBUG("Rejecting malformed request body: {}", errs);
        return ExecutionError{.kind = ErrorKind::InvalidInput, .message = fmt::format("Invalid JSON: {}", errs)};
    }

    if (!root.isObject()) {
        return ExecutionError{.kind = ErrorKind::InvalidInput, .message = "Request body must be a JSON object"};
    }

    return root;
}

/// The string at ``key``, or empty if absent or not a string
std::string string_or_empty(const Json::Value& object, const char* key) {
    const Json::Value& val = object[key];

    return val.isString() ? val.asString() : std::string{};
}

std::string write_compact(const Json::Value& root) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    // Child output is arbitrary bytes. Leaving emitUTF8 off makes the writer escape everything outside ASCII
    // as \uXXXX, with U+FFFD for invalid sequences, so the document is always valid UTF-8
    builder["emitUTF8"] = false;

    return Json::writeString(builder, root);
}

} // namespace

Expected<SingleFileRequest, ExecutionError> decode_single_file_request(std::string_view body) {
    auto root = parse_object(body);

    if (!root) {
        return root.error();
    }

    return SingleFileRequest{
        .code = string_or_empty(*root, "code"),
        .language = parse_language(string_or_empty(*root, "language")),
    };
}

Expected<ProjectRequest, ExecutionError> decode_project_request(std::string_view body) {
    auto root = parse_object(body);

    if (!root) {
        return root.error();
    }

    ProjectRequest request;

    if (const Json::Value& files = (*root)["files"]; files.isArray()) {
        for (const Json::Value& file : files) {
            if (!file.isObject()) {
                return ExecutionError{.kind = ErrorKind::InvalidInput, .message = "files[] entries must be objects"};
            }

            request.files.push_back(ProjectFile{
                .path = string_or_empty(file, "path"),
                .content = string_or_empty(file, "content"),
            });
        }
    }

    request.language = string_or_empty(*root, "language");

    if (const Json::Value& command = (*root)["command"]; command.isString()) {
        request.command = command.asString();
    }

    return request;
}

std::string encode_result(const ExecutionResult& result) {
    Json::Value root{Json::objectValue};

    root["stdout"] = result.stdout_text;
    root["stderr"] = result.stderr_text;
    root["exitCode"] = result.exit_code ? Json::Value{*result.exit_code} : Json::Value{Json::nullValue};
    root["timedOut"] = result.timed_out;

    if (result.image_used) {
        root["imageUsed"] = *result.image_used;
    }

    if (result.output_truncated) {
        root["outputTruncated"] = true;
    }

    return write_compact(root);
}

std::string encode_error(const ExecutionError& error) {
    Json::Value root{Json::objectValue};

    root["error"] = error.message;

    return write_compact(root);
}

int http_status(ErrorKind kind) {
    return kind == ErrorKind::InvalidInput ? HTTP_BAD_REQUEST : HTTP_INTERNAL_SERVER_ERROR;
}

} // namespace runbox::json
