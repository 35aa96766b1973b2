//=============================================================================
// cardview - animated card display fed by an NFC card event server
//
// Main entry point. Parses the command line, builds the config and runs the
// viewer on a libuv loop until SIGINT/SIGTERM.
//=============================================================================

#include <cardview/card-viewer.h>
#include <cardview/config.h>
#include <cardview/viewer-settings.h>
#include <ytrace/ytrace.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <args.hxx>
#include <uv.h>
#include <iostream>
#include <csignal>
#include <optional>
#include <utility>

using namespace cardview;

#define CHECK_RESULT(expr)                                                     \
  do {                                                                         \
    if (auto _res = (expr); !_res) {                                           \
      yerror("{}: {}", #expr, error_msg(_res));                                \
      return 1;                                                                \
    }                                                                          \
  } while (0)

struct CommandLine {
    std::string configPath;
    YAML::Node overrides;
    bool verbose = false;
};

// Returns nullopt when the program should exit (help or parse error)
static std::optional<CommandLine> parseArgs(int argc, char* argv[], int& exitCode) {
    args::ArgumentParser parser("cardview - animated card viewer for NFC card events");
    args::HelpFlag help(parser, "help", "Display this help menu", {'h', "help"});

    args::ValueFlag<std::string> configFile(parser, "path", "Config file path", {'c', "config"});
    args::ValueFlag<std::string> hostArg(parser, "host", "Card event server host", {"host"});
    args::ValueFlag<uint32_t> portArg(parser, "port", "Card event server port (default 41112)", {'p', "port"});
    args::Flag ackFlag(parser, "ack", "Acknowledge every frame with ACK", {"ack"});

    args::Flag setIdFlag(parser, "setid", "Show the set id", {"show-limitations-setid"});
    args::Flag passcodeFlag(parser, "passcode", "Show the passcode", {"show-limitations-passcode"});
    args::Flag copyrightFlag(parser, "copyright", "Show the copyright line", {"show-limitations-copyright"});
    args::Flag stickerFlag(parser, "sticker", "Show the authenticity sticker", {"show-limitations-sticker"});
    args::Flag editionFlag(parser, "edition", "Show the edition", {"show-limitations-edition"});
    args::Flag staticFlag(parser, "static", "Use a static background", {"static"});

    args::ValueFlag<std::string> titleFont(parser, "font", "Title font", {"title-font"});
    args::ValueFlag<std::string> loreFont(parser, "font", "Lore font", {"lore-font"});
    args::ValueFlag<std::string> mainFont(parser, "font", "Main font", {"main-font"});
    args::ValueFlag<std::string> linkFont(parser, "font", "Link rating font", {"link-font"});

    args::Flag verboseFlag(parser, "verbose", "Debug logging", {'v', "verbose"});

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        exitCode = 0;
        return std::nullopt;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        exitCode = 1;
        return std::nullopt;
    } catch (const args::ValidationError& e) {
        std::cerr << e.what() << std::endl;
        exitCode = 1;
        return std::nullopt;
    }

    CommandLine cl;
    cl.configPath = configFile ? args::get(configFile) : "";
    cl.verbose = verboseFlag;

    auto& o = cl.overrides;
    if (hostArg) Config::setOverride(o, Config::KEY_TRANSPORT_HOST, args::get(hostArg));
    if (portArg) Config::setOverride(o, Config::KEY_TRANSPORT_PORT, args::get(portArg));
    if (ackFlag) Config::setOverride(o, Config::KEY_TRANSPORT_ACK, true);

    if (setIdFlag) Config::setOverride(o, "style.limitations.set-id", true);
    if (passcodeFlag) Config::setOverride(o, "style.limitations.passcode", true);
    if (copyrightFlag) Config::setOverride(o, "style.limitations.copyright", true);
    if (stickerFlag) Config::setOverride(o, "style.limitations.sticker", true);
    if (editionFlag) Config::setOverride(o, "style.limitations.edition", true);
    if (staticFlag) Config::setOverride(o, Config::KEY_STYLE_STATIC_BACKGROUND, true);

    if (titleFont) Config::setOverride(o, "style.fonts.title", args::get(titleFont));
    if (loreFont) Config::setOverride(o, "style.fonts.lore", args::get(loreFont));
    if (mainFont) Config::setOverride(o, "style.fonts.main", args::get(mainFont));
    if (linkFont) Config::setOverride(o, "style.fonts.link", args::get(linkFont));

    return cl;
}

int main(int argc, char* argv[]) {
    // Declared ahead of the loop so they outlive its destructor
    uv_signal_t sigint;
    uv_signal_t sigterm;

    spdlog::set_level(spdlog::level::info);

    int exitCode = 0;
    auto commandLine = parseArgs(argc, argv, exitCode);
    if (!commandLine) return exitCode;

    if (commandLine->verbose) {
        spdlog::set_level(spdlog::level::debug);
    }
    spdlog::cfg::load_env_levels();

    auto configResult = Config::create(commandLine->configPath, commandLine->overrides);
    if (!configResult) {
        yerror("Failed to load configuration: {}", error_msg(configResult));
        return 1;
    }

    auto settingsResult = ViewerSettings::fromConfig(**configResult);
    if (!settingsResult) {
        yerror("Invalid configuration: {}", error_msg(settingsResult));
        return 1;
    }

    auto loopResult = base::EventLoop::create();
    if (!loopResult) {
        yerror("Failed to create event loop: {}", error_msg(loopResult));
        return 1;
    }
    auto loop = *loopResult;

    auto composer = std::make_shared<LogComposer>();
    auto viewerResult = CardViewer::create(loop, *settingsResult, composer,
        [](const InvariantViolation& v) {
            yerror("invariant violation: {} (expected '{}', active '{}')", v.what, v.expectedId, v.actualId);
        });
    if (!viewerResult) {
        yerror("Failed to create viewer: {}", error_msg(viewerResult));
        return 1;
    }
    auto viewer = *viewerResult;

    // Stop cleanly on SIGINT/SIGTERM
    for (auto [handle, signum] : {std::pair{&sigint, SIGINT}, std::pair{&sigterm, SIGTERM}}) {
        int r = uv_signal_init(loop->uvLoop(), handle);
        if (r != 0) {
            yerror("uv_signal_init failed: {}", uv_strerror(r));
            return 1;
        }
        handle->data = loop.get();
        r = uv_signal_start(handle, [](uv_signal_t* h, int sig) {
            yinfo("signal {} received, stopping", sig);
            if (auto res = static_cast<base::EventLoop*>(h->data)->stop(); !res) {
                yerror("{}", error_msg(res));
            }
        }, signum);
        if (r != 0) {
            ywarn("uv_signal_start({}) failed: {}", signum, uv_strerror(r));
        }
    }

    CHECK_RESULT(viewer->start());
    int alive = loop->start();
    ydebug("event loop exited, handles still active: {}", alive != 0);

    auto stats = viewer->stats();
    yinfo("cardview: {} frames accepted, {} rejected, {} rendered, {} invariant violations",
          stats.framesAccepted, stats.schemaErrors, stats.renders, stats.invariantViolations);

    CHECK_RESULT(viewer->shutdown());
    uv_close(reinterpret_cast<uv_handle_t*>(&sigint), nullptr);
    uv_close(reinterpret_cast<uv_handle_t*>(&sigterm), nullptr);
    viewer.reset();
    loop.reset();
    return 0;
}
