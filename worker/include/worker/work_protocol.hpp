//! # Worker Protocol
//!
//! Persistent workers talk to the build system over stdin/stdout with one
//! JSON object per line.
//!
//! ## Request
//!
//! ```json
//! {"arguments": ["--output=a.sum", "--source=multi-root:///a.kl"], "requestId": 7}
//! ```
//!
//! Absent fields take their empty values (`[]`, `0`); unknown fields such
//! as `inputs` are ignored.
//!
//! ## Response
//!
//! ```json
//! {"exitCode": 0, "output": "", "requestId": 7}
//! ```

#pragma once

#include "common.hpp"
#include "json/json_value.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kiln::worker {

struct WorkRequest {
    int64_t request_id = 0;
    std::vector<std::string> arguments;
};

struct WorkResponse {
    int exit_code = 0;
    std::string output;
    int64_t request_id = 0;

    [[nodiscard]] auto to_json() const -> json::JsonValue;
};

/// A request line that could not be understood. `request_id` holds the id
/// if it could still be read, 0 otherwise.
struct ProtocolError {
    std::string message;
    int64_t request_id = 0;
};

[[nodiscard]] auto parse_request(std::string_view line) -> Result<WorkRequest, ProtocolError>;

/// Serializes a response as a single line (without the trailing newline).
[[nodiscard]] auto serialize_response(const WorkResponse& response) -> std::string;

/// Parses a response line, as a build system client would.
[[nodiscard]] auto parse_response(std::string_view line) -> Result<WorkResponse, std::string>;

} // namespace kiln::worker
