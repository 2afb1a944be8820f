#include "args/arg_expander.hpp"
#include "driver/driver.hpp"
#include "driver/request_runner.hpp"
#include "log/log.hpp"
#include "service/source_compiler.hpp"
#include "session/compilation_session.hpp"
#include "vfs/file_system.hpp"
#include "worker/worker_loop.hpp"

#include <iostream>

namespace kiln::driver {

namespace {

constexpr const char* PERSISTENT_FLAG = "--persistent_worker";

auto run_persistent() -> int {
    auto service = make_rc<service::SourceCompiler>();
    auto physical = make_rc<vfs::StandardFileSystem>();
    auto provider = make_rc<session::CachedSessionProvider>(service, physical);
    RequestRunner runner(provider, physical);

    worker::WorkerLoop loop(std::cin, std::cout, worker::make_request_handler(runner));
    int code = loop.run();
    KILN_LOG_INFO("worker", "Served " << loop.requests_served() << " requests, "
                                      << provider->reuse_count() << " reused a session");
    return code;
}

auto run_once(const args::ArgList& args) -> int {
    auto service = make_rc<service::SourceCompiler>();
    auto physical = make_rc<vfs::StandardFileSystem>();
    auto provider = make_rc<session::FreshSessionProvider>(service, physical);
    RequestRunner runner(provider, physical);

    auto result = runner.run(args);
    std::string output = result.output();
    if (!output.empty()) {
        std::cerr << output;
        if (output.back() != '\n') {
            std::cerr << "\n";
        }
    }
    return result.exit_code();
}

} // namespace

auto kiln_main(int argc, char* argv[]) -> int {
    std::vector<std::string> raw;
    for (int i = 1; i < argc; ++i) {
        raw.emplace_back(argv[i]);
    }

    args::ArgList rest;
    log::Logger::init(log::parse_log_options(raw, rest));

    // Expansion here only decides the mode. A single-shot request expands its
    // own arguments, so it receives `rest` as given and an unreadable file
    // becomes one of its diagnostics.
    auto expanded = args::expand_arguments(rest);
    const auto& args = is_ok(expanded) ? unwrap(expanded) : rest;

    bool persistent = false;
    for (const auto& arg : args) {
        if (arg == PERSISTENT_FLAG) {
            persistent = true;
        }
    }
    if (persistent) {
        if (args.size() != 1) {
            std::cerr << "unexpected args: " << PERSISTENT_FLAG
                      << " must be the only argument\n";
            return exit_code::STARTUP_FAILURE;
        }
        return run_persistent();
    }
    return run_once(rest);
}

} // namespace kiln::driver

// Entry point wrapper (outside namespace)
int kiln_main(int argc, char* argv[]) {
    return kiln::driver::kiln_main(argc, argv);
}
