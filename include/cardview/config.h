#pragma once

#include <cardview/result.hpp>
#include <yaml-cpp/yaml.h>
#include <string>
#include <optional>
#include <vector>
#include <filesystem>
#include <memory>

namespace cardview {

// Layered configuration tree.
//
// Precedence, lowest first: built-in defaults, YAML file, CARDVIEW_* environment
// variables, command-line overrides. Keys are dotted paths ("transport.port").
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Empty configPath means the XDG location, used only when the file exists
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Returns nullopt if the key doesn't exist or doesn't convert to T
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    // Path of the file that was actually loaded, empty if none
    const std::string& loadedFrom() const { return _loadedFrom; }

    const YAML::Node& root() const { return _config; }

    static std::filesystem::path getXDGConfigPath();

    // Convert dotted path to env var name ("transport.max-frame-bytes" -> "CARDVIEW_TRANSPORT_MAX_FRAME_BYTES")
    static std::string pathToEnvVar(const std::string& path);

    // Build a nested override node from a dotted path, for merging into cmdOverrides
    template<typename T>
    static void setOverride(YAML::Node& overrides, const std::string& path, const T& value);

    static constexpr const char* ENV_PREFIX = "CARDVIEW_";

    static constexpr const char* KEY_TRANSPORT_HOST = "transport.host";
    static constexpr const char* KEY_TRANSPORT_PORT = "transport.port";
    static constexpr const char* KEY_TRANSPORT_BACKOFF_INITIAL = "transport.backoff-initial-ms";
    static constexpr const char* KEY_TRANSPORT_BACKOFF_MAX = "transport.backoff-max-ms";
    static constexpr const char* KEY_TRANSPORT_MAX_FRAME = "transport.max-frame-bytes";
    static constexpr const char* KEY_TRANSPORT_ACK = "transport.ack";
    static constexpr const char* KEY_ANIMATION_TICK = "animation.tick-ms";
    static constexpr const char* KEY_ANIMATION_ENTER = "animation.enter-ms";
    static constexpr const char* KEY_ANIMATION_SWAP = "animation.swap-ms";
    static constexpr const char* KEY_ANIMATION_EXIT = "animation.exit-ms";
    static constexpr const char* KEY_ANIMATION_EASING = "animation.easing";
    static constexpr const char* KEY_PRESENCE_CLEAR_ON_DISCONNECT = "presence.clear-on-disconnect";
    static constexpr const char* KEY_STYLE_STATIC_BACKGROUND = "style.static-background";

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    Result<void> loadFile(const std::string& path);

    // Every default leaf may be overridden by its environment variable
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    // Merge YAML nodes (source into target)
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    std::string _loadedFrom;
    YAML::Node _cmdOverrides;
};

// Template implementations
template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull() || !node.IsScalar()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

template<typename T>
void Config::setOverride(YAML::Node& overrides, const std::string& path, const T& value) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t dot = path.find('.', start);
        if (dot == std::string::npos) dot = path.size();
        if (dot > start) parts.push_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    if (parts.empty()) return;

    YAML::Node leaf(value);
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        YAML::Node map(YAML::NodeType::Map);
        map[*it] = leaf;
        leaf.reset(map);
    }
    if (!overrides || !overrides.IsMap()) {
        overrides.reset(leaf);
    } else {
        mergeNodes(overrides, leaf);
    }
}

} // namespace cardview
