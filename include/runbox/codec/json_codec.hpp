#pragma once

#include <runbox/common/error_types.hpp>
#include <runbox/common/expected.hpp>
#include <runbox/sandbox/execution_request.hpp>
#include <runbox/sandbox/execution_result.hpp>

#include <string>
#include <string_view>

namespace runbox::json {

/// Decodes ``{"code": string, "language": string}``.
///
/// Only malformed JSON (or a non-object document) is an error here. Missing or mistyped fields decode
/// to their empty defaults, leaving the runners to reject them with their usual messages.
Expected<SingleFileRequest, ExecutionError> decode_single_file_request(std::string_view body);

/// Decodes ``{"files": [{"path": string, "content": string}], "language": string, "command": string}``.
/// Same leniency as ``decode_single_file_request``.
Expected<ProjectRequest, ExecutionError> decode_project_request(std::string_view body);

/// ``{"stdout", "stderr", "exitCode", "timedOut"}``, plus ``"imageUsed"`` if set.
/// ``exitCode`` is null for processes that did not exit on their own.
std::string encode_result(const ExecutionResult& result);

/// ``{"error": message}``
std::string encode_error(const ExecutionError& error);

/// The HTTP status the error would be reported with: 400 for bad requests, 500 for everything else
int http_status(ErrorKind kind);

} // namespace runbox::json
