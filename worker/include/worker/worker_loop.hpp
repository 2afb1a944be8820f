//! # Worker Loop
//!
//! Reads work requests line by line, runs each one and writes exactly one
//! response per request, in order, flushing after every response.
//!
//! ## Failure Isolation
//!
//! `serve_one` is the only place where failures of a single request are
//! contained: a malformed line or an exception thrown by the handler turns
//! into a failure response and the loop moves on to the next line. The loop
//! only ends on end of input (exit code 0) or when the output stream breaks
//! (exit code 1).

#pragma once

#include "worker/work_protocol.hpp"

#include <functional>
#include <iosfwd>
#include <string>

namespace kiln::driver {
class RequestRunner;
}

namespace kiln::worker {

using RequestHandler = std::function<WorkResponse(const WorkRequest&)>;

class WorkerLoop {
public:
    /// The streams must outlive the loop.
    WorkerLoop(std::istream& in, std::ostream& out, RequestHandler handler);

    /// Serves requests until end of input.
    ///
    /// # Returns
    ///
    /// The process exit code: 0 at end of input, 1 if a response could not
    /// be written.
    [[nodiscard]] auto run() -> int;

    /// Handles one request line. Never throws.
    [[nodiscard]] auto serve_one(const std::string& line) -> WorkResponse;

    [[nodiscard]] auto requests_served() const -> size_t {
        return requests_served_;
    }

private:
    std::istream& in_;
    std::ostream& out_;
    RequestHandler handler_;
    size_t requests_served_ = 0;
};

/// Adapts a `RequestRunner` to the worker protocol.
[[nodiscard]] auto make_request_handler(driver::RequestRunner& runner) -> RequestHandler;

} // namespace kiln::worker
