#pragma once

#include <string>

namespace cardview {

// Which limitation texts a composer should draw
struct LimitationToggles {
    bool setId = false;
    bool passcode = false;
    bool copyright = false;
    bool sticker = false;
    bool edition = false;

    bool operator==(const LimitationToggles&) const = default;
};

struct FontOverrides {
    std::string title = "MatrixRegularSmallCaps";
    std::string lore = "Stone Serif ITC Medium";
    std::string main = "ITC Stone Serif";
    std::string link = "EurostileCandyW01";

    bool operator==(const FontOverrides&) const = default;
};

// Passed through to composers untouched; the core never interprets it
struct StyleConfig {
    LimitationToggles limitations;
    bool staticBackground = false;
    FontOverrides fonts;

    bool operator==(const StyleConfig&) const = default;
};

} // namespace cardview
