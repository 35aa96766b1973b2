#pragma once

#include <cardview/config.h>
#include <cardview/style-config.h>
#include <cardview/transition.h>
#include <cardview/transport-client.h>

namespace cardview {

struct PresenceSettings {
    // Treat a dropped connection as a card removal
    bool clearOnDisconnect = false;
};

// Typed view of the config tree. Every field has a default.
struct ViewerSettings {
    TransportSettings transport;
    TimingSettings timing;
    PresenceSettings presence;
    StyleConfig style;

    // Fails on out-of-range numbers or an unknown easing name
    static Result<ViewerSettings> fromConfig(const Config& config);
};

} // namespace cardview
