#include <cardview/config.h>
#include <ytrace/ytrace.hpp>
#include <fstream>
#include <cctype>
#include <cstdlib>
#include <utility>

namespace cardview {

// ─── Defaults ────────────────────────────────────────────────────────────────

static constexpr const char* kDefaultConfig = R"(
transport:
  host: 127.0.0.1
  port: 41112
  backoff-initial-ms: 1000
  backoff-max-ms: 30000
  max-frame-bytes: 16777216
  ack: false
animation:
  tick-ms: 16
  enter-ms: 500
  swap-ms: 350
  exit-ms: 250
  easing: in-out-quad
presence:
  clear-on-disconnect: false
style:
  static-background: false
  limitations:
    set-id: false
    passcode: false
    copyright: false
    sticker: false
    edition: false
  fonts:
    title: MatrixRegularSmallCaps
    lore: Stone Serif ITC Medium
    main: ITC Stone Serif
    link: EurostileCandyW01
)";

// ─── Helpers ─────────────────────────────────────────────────────────────────

static std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t dot = path.find('.', start);
        if (dot == std::string::npos) dot = path.size();
        if (dot > start) parts.push_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

static bool isBoolScalar(const std::string& s) {
    return s == "true" || s == "false";
}

// ─── Config ──────────────────────────────────────────────────────────────────

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _configPath(configPath) {
    _cmdOverrides.reset(cmdOverrides);
}

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to init Config", res);
    }
    return Ok(config);
}

Result<void> Config::init() noexcept {
    try {
        _config = YAML::Load(kDefaultConfig);
    } catch (const YAML::Exception& e) {
        return Err<void>("Invalid built-in defaults: " + std::string(e.what()));
    }

    std::string effectivePath = _configPath;
    if (effectivePath.empty()) {
        auto xdgPath = getXDGConfigPath();
        std::error_code ec;
        if (std::filesystem::exists(xdgPath, ec)) {
            effectivePath = xdgPath.string();
        }
    }

    if (!effectivePath.empty()) {
        if (auto res = loadFile(effectivePath); !res) {
            // An explicitly requested file must load; the XDG one is best effort
            if (!_configPath.empty()) {
                return Err<void>("Cannot load " + effectivePath, res);
            }
            ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
        } else {
            _loadedFrom = effectivePath;
            yinfo("Loaded config from: {}", effectivePath);
        }
    }

    applyEnvOverrides(_config, "");

    if (_cmdOverrides && _cmdOverrides.IsMap()) {
        mergeNodes(_config, _cmdOverrides);
    }

    return Ok();
}

Result<void> Config::loadFile(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err<void>("Cannot open config file: " + path);
        }
        YAML::Node fileConfig = YAML::Load(file);
        if (fileConfig && !fileConfig.IsNull()) {
            if (!fileConfig.IsMap()) {
                return Err<void>("Config file top level must be a map: " + path);
            }
            mergeNodes(_config, fileConfig);
        }
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()));
    }
}

void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string fullPath = prefix.empty() ? key : prefix + "." + key;
        YAML::Node value = it->second;

        if (value.IsMap()) {
            applyEnvOverrides(value, fullPath);
            continue;
        }
        if (!value.IsScalar()) continue;

        std::string envVar = pathToEnvVar(fullPath);
        const char* env = std::getenv(envVar.c_str());
        if (!env) continue;

        std::string s(env);
        if (isBoolScalar(value.Scalar())) {
            if (s == "1") s = "true";
            else if (s == "0") s = "false";
        }
        ydebug("Config: {} overridden by {}={}", fullPath, envVar, s);
        node[key] = s;
    }
}

YAML::Node Config::getNode(const std::string& path) const {
    auto parts = splitPath(path);
    if (parts.empty()) return YAML::Node();

    YAML::Node current;
    current.reset(_config);
    for (const auto& part : parts) {
        if (!current.IsMap()) return YAML::Node();
        const YAML::Node& constCurrent = current;
        YAML::Node next = constCurrent[part];
        if (!next) return YAML::Node();
        current.reset(next);
    }
    return current;
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    if (!source.IsMap()) return;
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        if (value.IsMap()) {
            YAML::Node child = target[key];
            if (!child.IsMap()) {
                target[key] = YAML::Node(YAML::NodeType::Map);
            }
            mergeNodes(target[key], value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;

    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }

    return configDir / "cardview" / "config.yaml";
}

} // namespace cardview
