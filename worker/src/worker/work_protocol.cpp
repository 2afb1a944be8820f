#include "worker/work_protocol.hpp"

#include "json/json_parser.hpp"

namespace kiln::worker {

auto WorkResponse::to_json() const -> json::JsonValue {
    json::JsonObject obj;
    obj["exitCode"] = json::JsonValue(exit_code);
    obj["output"] = json::JsonValue(output);
    obj["requestId"] = json::JsonValue(request_id);
    return json::JsonValue(std::move(obj));
}

auto serialize_response(const WorkResponse& response) -> std::string {
    return response.to_json().to_string();
}

auto parse_request(std::string_view line) -> Result<WorkRequest, ProtocolError> {
    auto parsed = json::parse_json(line);
    if (is_err(parsed)) {
        return ProtocolError{"Invalid JSON: " + unwrap_err(parsed).to_string(), 0};
    }
    const auto& value = unwrap(parsed);
    if (!value.is_object()) {
        return ProtocolError{"Work request must be a JSON object", 0};
    }

    WorkRequest request;
    if (const auto* id = value.get("requestId")) {
        auto int_id = id->try_as_i64();
        if (!int_id) {
            return ProtocolError{"\"requestId\" must be an integer", 0};
        }
        request.request_id = *int_id;
    }

    if (const auto* arguments = value.get("arguments")) {
        if (!arguments->is_array()) {
            return ProtocolError{"\"arguments\" must be an array of strings", request.request_id};
        }
        for (const auto& arg : arguments->as_array()) {
            if (!arg.is_string()) {
                return ProtocolError{"\"arguments\" must be an array of strings",
                                     request.request_id};
            }
            request.arguments.push_back(arg.as_string());
        }
    }
    return request;
}

auto parse_response(std::string_view line) -> Result<WorkResponse, std::string> {
    auto parsed = json::parse_json(line);
    if (is_err(parsed)) {
        return "Invalid JSON: " + unwrap_err(parsed).to_string();
    }
    const auto& value = unwrap(parsed);
    if (!value.is_object()) {
        return std::string("Work response must be a JSON object");
    }

    WorkResponse response;
    if (const auto* code = value.get("exitCode")) {
        auto int_code = code->try_as_i64();
        if (!int_code) {
            return std::string("\"exitCode\" must be an integer");
        }
        response.exit_code = static_cast<int>(*int_code);
    }
    if (const auto* output = value.get("output")) {
        if (!output->is_string()) {
            return std::string("\"output\" must be a string");
        }
        response.output = output->as_string();
    }
    if (const auto* id = value.get("requestId")) {
        auto int_id = id->try_as_i64();
        if (!int_id) {
            return std::string("\"requestId\" must be an integer");
        }
        response.request_id = *int_id;
    }
    return response;
}

} // namespace kiln::worker
