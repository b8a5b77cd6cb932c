#include "config/Config.hpp"
#include "exec/ActionExecutor.hpp"
#include "keymap/KeymapTree.hpp"
#include "keymap/Matcher.hpp"
#include "session/OverlaySession.hpp"
#include "session/Preselection.hpp"
#include "ui/PangoPainter.hpp"
#include "util/Errors.hpp"
#include "util/Logger.hpp"
#include "wayland/WaylandCompositor.hpp"
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <format>
#include <getopt.h>
#include <iostream>
#include <optional>
#include <string>

#ifndef WHICHKEY_VERSION
#define WHICHKEY_VERSION "unknown"
#endif

using whichkey::util::ExitCode;
using whichkey::util::to_int;

namespace {

struct Options {
    std::string config_name = "config";
    std::optional<std::string> initial_keys;
    std::optional<std::chrono::milliseconds> timeout;
};

void print_usage(std::ostream& out) {
    out << "Usage: whichkey [OPTIONS] [CONFIG]\n"
           "\n"
           "Show a which-key style overlay and run the chosen command.\n"
           "\n"
           "CONFIG is a file name in $XDG_CONFIG_HOME/whichkey (\".yaml\" optional)\n"
           "or a path. Defaults to \"config\".\n"
           "\n"
           "Options:\n"
           "  -k, --initial-keys KEYS  walk KEYS (e.g. \"p s\") before showing the overlay\n"
           "  -t, --timeout SECONDS    close after SECONDS without input (0 disables, max 86400)\n"
           "  -h, --help               show this help and exit\n"
           "  -V, --version            show the version and exit\n";
}

// Returns the exit code to stop with, or std::nullopt to continue
std::optional<int> parse_args(int argc, char** argv, Options& options) {
    static const option long_options[] = {
        {"initial-keys", required_argument, nullptr, 'k'},
        {"timeout", required_argument, nullptr, 't'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'V'},
        {nullptr, 0, nullptr, 0},
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "k:t:hV", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'k':
                options.initial_keys = optarg;
                break;
            case 't': {
                errno = 0;
                char* end = nullptr;
                double seconds = std::strtod(optarg, &end);
                auto timeout = whichkey::config::timeout_from_seconds(seconds);
                if (errno != 0 || end == optarg || *end != '\0' || !timeout) {
                    std::cerr << "whichkey: invalid timeout '" << optarg << "' (0 to "
                              << whichkey::config::MAX_TIMEOUT.count() << " seconds)\n";
                    return to_int(ExitCode::Failure);
                }
                options.timeout = *timeout;
                break;
            }
            case 'h':
                print_usage(std::cout);
                return to_int(ExitCode::Ok);
            case 'V':
                std::cout << "whichkey " << WHICHKEY_VERSION << "\n";
                return to_int(ExitCode::Ok);
            default:
                print_usage(std::cerr);
                return to_int(ExitCode::Failure);
        }
    }

    if (optind < argc) {
        options.config_name = argv[optind++];
    }
    if (optind < argc) {
        std::cerr << "whichkey: unexpected argument '" << argv[optind] << "'\n";
        print_usage(std::cerr);
        return to_int(ExitCode::Failure);
    }
    return std::nullopt;
}

}  // namespace

int main(int argc, char** argv) {
    Options options;
    if (auto code = parse_args(argc, argv, options)) {
        return *code;
    }

    try {
        whichkey::util::Logger::init();
        whichkey::util::Logger::info(std::format("whichkey {} starting", WHICHKEY_VERSION));

        auto config = whichkey::config::ConfigLoader::load(options.config_name);
        if (options.timeout) {
            config.timeout = *options.timeout;
        }

        auto tree = whichkey::keymap::KeymapTree::build(config.menu, {config.title});
        auto policy = whichkey::keymap::MatchPolicy::from_config(config);
        whichkey::util::Logger::info(std::format("Keymap: {} nodes", tree.size()));

        whichkey::exec::ShellExecutor executor;
        whichkey::session::SessionOptions session_options;
        session_options.idle_timeout = config.timeout;

        if (options.initial_keys) {
            auto pre = whichkey::session::preselect(tree, policy, *options.initial_keys, executor);
            if (pre.exit) {
                if (!pre.error.empty()) {
                    std::cerr << "whichkey: --initial-keys: " << pre.error << "\n";
                }
                return to_int(*pre.exit);
            }
            session_options.start = pre.start;
        }

        whichkey::ui::PangoPainter painter(config.theme);
        whichkey::wayland::WaylandCompositor compositor(config, painter);

        whichkey::session::OverlaySession session(std::move(tree), std::move(policy), config,
                                                  std::move(session_options), compositor, painter, executor);
        auto code = session.run();

        whichkey::util::Logger::info(std::format("whichkey exiting with {}", to_int(code)));
        return to_int(code);
    } catch (const whichkey::util::ConfigError& e) {
        whichkey::util::Logger::error(std::format("Configuration error: {}", e.what()));
        return to_int(ExitCode::Config);
    } catch (const whichkey::util::GrabError& e) {
        whichkey::util::Logger::error(std::format("Keyboard grab failed: {}", e.what()));
        return to_int(ExitCode::Grab);
    } catch (const whichkey::util::ProtocolError& e) {
        whichkey::util::Logger::error(std::format("Compositor error: {}", e.what()));
        return to_int(ExitCode::Protocol);
    } catch (const std::exception& e) {
        whichkey::util::Logger::error(std::format("Fatal error: {}", e.what()));
        return to_int(ExitCode::Failure);
    }
}
