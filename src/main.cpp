#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

#include "lanmap/config/config_loader.hpp"
#include "lanmap/model/topology_view.hpp"
#include "lanmap/session/topology_session.hpp"
#include "lanmap/util/logging.hpp"

namespace {

using namespace lanmap;

struct Options {
    std::string config_path{"config/lanmap.yaml"};
    std::optional<model::LayoutStrategy> strategy;
    bool once{false};
};

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0
              << " [--config <lanmap.yaml>] [--strategy hierarchical|circular|grid|clustered] [--once]\n";
}

Options parse_options(int argc, char** argv) {
    Options opt;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            opt.config_path = argv[++i];
        } else if (arg == "--strategy" && i + 1 < argc) {
            const std::string name = argv[++i];
            opt.strategy = model::parse_layout_strategy(name);
            if (!opt.strategy) {
                throw std::runtime_error("Unknown layout strategy: " + name);
            }
        } else if (arg == "--once") {
            opt.once = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else {
            throw std::runtime_error("Unknown argument: " + arg);
        }
    }
    return opt;
}

std::string summarize(const model::TopologyView& view) {
    const auto& counters = view.counters;
    std::string line = "rev " + std::to_string(view.revision) + " | devices " + std::to_string(counters.total) +
                       " (online " + std::to_string(counters.online) + ", offline " +
                       std::to_string(counters.offline) + ") | edges " + std::to_string(view.edges.size()) +
                       " (active " + std::to_string(counters.active_edges) + ") | push " +
                       std::string(model::to_string(view.connection.state));
    if (view.connection.reconnect_attempts > 0) {
        line += " (attempt " + std::to_string(view.connection.reconnect_attempts) + ")";
    }
    line += view.connection.pull_healthy ? " | pull ok" : " | pull failing";
    if (!view.connection.last_error.empty()) {
        line += " | last error: " + view.connection.last_error;
    }
    return line;
}

int run(const Options& options) {
    try {
        auto config = config::load_config(options.config_path);
        config::apply_env_overrides(config);
        if (options.strategy) {
            config.layout.strategy = *options.strategy;
        }
        util::configure_logging(config.logging);

        session::TopologySession monitor(
            session::SessionSettings{config.layout.strategy, config.layout.bounds, config.layout.seed});

        boost::asio::io_context io_context;
        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        std::atomic_bool finishing{false};
        auto finish = [&] {
            if (finishing.exchange(true)) {
                return;
            }
            boost::asio::post(io_context, [&] {
                signals.cancel();
                monitor.stop();
            });
        };

        monitor.subscribe([&](const model::TopologyView& view) {
            std::cout << summarize(view) << std::endl;
            if (options.once && view.connection.last_pull && view.connection.pull_healthy) {
                finish();
            }
        });

        signals.async_wait([&](const boost::system::error_code& ec, int) {
            if (ec) {
                return;
            }
            util::log::info("Signal received, shutting down...");
            finish();
        });

        monitor.start(config.transport);
        io_context.run();
    } catch (const std::exception& ex) {
        util::log::error(std::string("Fatal error: ") + ex.what());
        return 1;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        return run(parse_options(argc, argv));
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << '\n';
        print_usage(argv[0]);
        return 1;
    }
}
