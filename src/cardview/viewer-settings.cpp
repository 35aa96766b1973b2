#include <cardview/viewer-settings.h>
#include <fmt/format.h>
#include <limits>

namespace cardview {

namespace {

// Reads an integer key and checks it against [lo, hi]
template<typename T>
Result<T> boundedInt(const Config& config, const char* key, T fallback, int64_t lo, int64_t hi) {
    if (!config.has(key)) return Ok(fallback);
    auto value = config.get<int64_t>(key);
    if (!value) {
        return Err<T>(fmt::format("{}: expected an integer", key));
    }
    if (*value < lo || *value > hi) {
        return Err<T>(fmt::format("{}: {} out of range [{}, {}]", key, *value, lo, hi));
    }
    return Ok(static_cast<T>(*value));
}

} // namespace

Result<ViewerSettings> ViewerSettings::fromConfig(const Config& config) {
    ViewerSettings s;

    //-------------------------------------------------------------------------
    // transport
    //-------------------------------------------------------------------------
    s.transport.host = config.get<std::string>(Config::KEY_TRANSPORT_HOST, s.transport.host);
    if (s.transport.host.empty()) {
        return Err<ViewerSettings>(fmt::format("{}: must not be empty", Config::KEY_TRANSPORT_HOST));
    }

    auto port = boundedInt<uint16_t>(config, Config::KEY_TRANSPORT_PORT, s.transport.port, 1, 65535);
    if (!port) return Err<ViewerSettings>("Invalid transport settings", port);
    s.transport.port = *port;

    auto backoffInitial = boundedInt<uint64_t>(config, Config::KEY_TRANSPORT_BACKOFF_INITIAL,
                                               s.transport.backoffInitialMs, 1, 3600000);
    if (!backoffInitial) return Err<ViewerSettings>("Invalid transport settings", backoffInitial);
    s.transport.backoffInitialMs = *backoffInitial;

    auto backoffMax = boundedInt<uint64_t>(config, Config::KEY_TRANSPORT_BACKOFF_MAX,
                                           s.transport.backoffMaxMs, 1, 3600000);
    if (!backoffMax) return Err<ViewerSettings>("Invalid transport settings", backoffMax);
    s.transport.backoffMaxMs = *backoffMax;
    if (s.transport.backoffMaxMs < s.transport.backoffInitialMs) {
        return Err<ViewerSettings>(fmt::format("{} must not be below {}",
                                               Config::KEY_TRANSPORT_BACKOFF_MAX,
                                               Config::KEY_TRANSPORT_BACKOFF_INITIAL));
    }

    auto maxFrame = boundedInt<size_t>(config, Config::KEY_TRANSPORT_MAX_FRAME,
                                       s.transport.maxFrameBytes, 64, std::numeric_limits<int32_t>::max());
    if (!maxFrame) return Err<ViewerSettings>("Invalid transport settings", maxFrame);
    s.transport.maxFrameBytes = *maxFrame;

    s.transport.ack = config.get<bool>(Config::KEY_TRANSPORT_ACK, s.transport.ack);

    //-------------------------------------------------------------------------
    // animation
    //-------------------------------------------------------------------------
    auto tick = boundedInt<uint32_t>(config, Config::KEY_ANIMATION_TICK, s.timing.tickMs, 1, 1000);
    if (!tick) return Err<ViewerSettings>("Invalid animation settings", tick);
    s.timing.tickMs = *tick;

    auto enter = boundedInt<uint32_t>(config, Config::KEY_ANIMATION_ENTER, s.timing.enterMs, 0, 60000);
    if (!enter) return Err<ViewerSettings>("Invalid animation settings", enter);
    s.timing.enterMs = *enter;

    auto swap = boundedInt<uint32_t>(config, Config::KEY_ANIMATION_SWAP, s.timing.swapMs, 0, 60000);
    if (!swap) return Err<ViewerSettings>("Invalid animation settings", swap);
    s.timing.swapMs = *swap;

    auto exit = boundedInt<uint32_t>(config, Config::KEY_ANIMATION_EXIT, s.timing.exitMs, 0, 60000);
    if (!exit) return Err<ViewerSettings>("Invalid animation settings", exit);
    s.timing.exitMs = *exit;

    std::string easingName = config.get<std::string>(Config::KEY_ANIMATION_EASING, "in-out-quad");
    auto easing = easingFromName(easingName);
    if (!easing) {
        return Err<ViewerSettings>(fmt::format("{}: unknown easing '{}'", Config::KEY_ANIMATION_EASING, easingName));
    }
    s.timing.easing = *easing;

    //-------------------------------------------------------------------------
    // presence / style
    //-------------------------------------------------------------------------
    s.presence.clearOnDisconnect = config.get<bool>(Config::KEY_PRESENCE_CLEAR_ON_DISCONNECT, false);

    s.style.staticBackground = config.get<bool>(Config::KEY_STYLE_STATIC_BACKGROUND, false);
    s.style.limitations.setId = config.get<bool>("style.limitations.set-id", false);
    s.style.limitations.passcode = config.get<bool>("style.limitations.passcode", false);
    s.style.limitations.copyright = config.get<bool>("style.limitations.copyright", false);
    s.style.limitations.sticker = config.get<bool>("style.limitations.sticker", false);
    s.style.limitations.edition = config.get<bool>("style.limitations.edition", false);

    s.style.fonts.title = config.get<std::string>("style.fonts.title", s.style.fonts.title);
    s.style.fonts.lore = config.get<std::string>("style.fonts.lore", s.style.fonts.lore);
    s.style.fonts.main = config.get<std::string>("style.fonts.main", s.style.fonts.main);
    s.style.fonts.link = config.get<std::string>("style.fonts.link", s.style.fonts.link);

    return Ok(std::move(s));
}

} // namespace cardview
