#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <govcat/cli/govcat_cli.h>

namespace {

// Runs the handshake strand, usage debounce timers and outbound frames off the request threads
class BackgroundIo {
public:
    explicit BackgroundIo(unsigned int threads) : guard_(boost::asio::make_work_guard(io_)) {
        for (unsigned int i = 0; i < threads; ++i) {
            threads_.emplace_back([this] { io_.run(); });
        }
    }

    ~BackgroundIo() {
        guard_.reset();
        io_.stop();
        for (auto& t : threads_) {
            t.join();
        }
    }

    BackgroundIo(const BackgroundIo&) = delete;
    BackgroundIo& operator=(const BackgroundIo&) = delete;

    boost::asio::any_io_executor executor() { return io_.get_executor(); }

private:
    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> guard_;
    std::vector<std::thread> threads_;
};

} // namespace

int main(int argc, char* argv[]) {
    // stdout carries protocol frames, so logging goes to stderr from the first line on;
    // the CLI adopts this logger and sets its level once the config is resolved
    auto logger = spdlog::stderr_color_mt("govcat");
    logger->set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::warn);

    try {
        BackgroundIo io(2);
        govcat::cli::GovcatCLI cli(io.executor());
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
