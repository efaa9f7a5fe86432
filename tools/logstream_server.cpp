#include <csignal>
#include <cstdlib>

#include <logstream/log/TaggedLogger.hpp>
#include <logstream/runtime/ShutdownSignal.hpp>
#include <logstream/web/LogStreamServer.hpp>

namespace {
void handle_signal(int) {
    LS::Runtime::RequestShutdown();
}
} // namespace

int main(int argc, char** argv) {
    auto options_opt = LS::Web::ParseLogStreamArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        LS::Web::PrintLogStreamUsage();
        return EXIT_SUCCESS;
    }

    LS::set_thread_name("Main");
    LS::set_logging_enabled(!options.quiet);
    LS::Runtime::ResetShutdownFlag();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    return LS::Web::RunLogStreamServer(options);
}
