#include "worker/worker_loop.hpp"

#include "driver/request_runner.hpp"
#include "log/log.hpp"

#include <exception>
#include <istream>
#include <ostream>

namespace kiln::worker {

namespace {

auto is_blank(const std::string& line) -> bool {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

} // namespace

WorkerLoop::WorkerLoop(std::istream& in, std::ostream& out, RequestHandler handler)
    : in_(in), out_(out), handler_(std::move(handler)) {}

auto WorkerLoop::run() -> int {
    KILN_LOG_INFO("worker", "Persistent worker started (kiln " << VERSION << ")");

    std::string line;
    while (std::getline(in_, line)) {
        if (is_blank(line)) {
            continue;
        }

        WorkResponse response = serve_one(line);
        out_ << serialize_response(response) << "\n" << std::flush;
        if (!out_) {
            KILN_LOG_ERROR("worker", "Cannot write response for request " << response.request_id
                                                                           << ", stopping");
            return exit_code::STARTUP_FAILURE;
        }
    }

    KILN_LOG_INFO("worker", "End of input after " << requests_served_ << " requests");
    return exit_code::SUCCESS;
}

auto WorkerLoop::serve_one(const std::string& line) -> WorkResponse {
    ++requests_served_;

    auto parsed = parse_request(line);
    if (is_err(parsed)) {
        const auto& error = unwrap_err(parsed);
        KILN_LOG_WARN("worker", "Malformed work request: " << error.message);
        WorkResponse response;
        response.exit_code = exit_code::DIAGNOSTICS;
        response.output = "Malformed work request: " + error.message + "\n";
        response.request_id = error.request_id;
        return response;
    }

    const auto& request = unwrap(parsed);
    log::RequestScope scope(request.request_id);
    KILN_LOG_DEBUG("worker", "Request " << request.request_id << " with "
                                        << request.arguments.size() << " arguments");

    WorkResponse response;
    try {
        response = handler_(request);
    } catch (const std::exception& e) {
        KILN_LOG_ERROR("worker", "Request " << request.request_id << " threw: " << e.what());
        response = WorkResponse{};
        response.exit_code = exit_code::DIAGNOSTICS;
        response.output = std::string("Worker error: ") + e.what() + "\n";
    } catch (...) {
        KILN_LOG_ERROR("worker", "Request " << request.request_id << " threw a non-standard exception");
        response = WorkResponse{};
        response.exit_code = exit_code::DIAGNOSTICS;
        response.output = "Worker error: unknown exception\n";
    }
    response.request_id = request.request_id;
    return response;
}

auto make_request_handler(driver::RequestRunner& runner) -> RequestHandler {
    return [&runner](const WorkRequest& request) {
        auto result = runner.run(request.arguments);
        WorkResponse response;
        response.exit_code = result.exit_code();
        response.output = result.output();
        response.request_id = request.request_id;
        return response;
    };
}

} // namespace kiln::worker
