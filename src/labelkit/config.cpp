#include <labelkit/config.h>
#include <ytrace/ytrace.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace labelkit {

static std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string item;
    while (std::getline(ss, item, '.')) {
        if (!item.empty()) parts.push_back(item);
    }
    return parts;
}

static YAML::Node nestValue(const std::vector<std::string>& parts, size_t index,
                            const std::string& value) {
    if (index == parts.size()) return YAML::Node(value);
    YAML::Node map(YAML::NodeType::Map);
    map[parts[index]] = nestValue(parts, index + 1, value);
    return map;
}

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map), _configPath(configPath), _cmdOverrides(cmdOverrides) {}

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<void> Config::init() noexcept {
    loadDefaults();

    if (!_configPath.empty()) {
        if (auto res = loadFile(_configPath); !res) {
            return res;
        }
        yinfo("Loaded config from: {}", _configPath);
    } else {
        auto xdgPath = getXDGConfigPath();
        std::error_code ec;
        if (std::filesystem::exists(xdgPath, ec)) {
            if (auto res = loadFile(xdgPath.string()); !res) {
                ywarn("Failed to load config file {}: {}", xdgPath.string(), error_msg(res));
            } else {
                yinfo("Loaded config from: {}", xdgPath.string());
            }
        }
    }

    applyEnvOverrides(_config, "");

    if (_cmdOverrides && _cmdOverrides.IsMap()) {
        mergeNodes(_config, _cmdOverrides);
    }
    return Ok();
}

void Config::loadDefaults() {
    _config["fonts"]["default"] = std::string("");
    _config["render"]["background"] = std::string("#FFFFFFFF");
    _config["log"]["level"] = std::string("info");
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
                return Err<void>("Config file is not a map: " + path);
            }
            mergeNodes(_config, fileConfig);
        }
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error in " + path + ": " + std::string(e.what()));
    }
}

// Only keys already present (defaults or file) can be overridden from the environment
void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string fullPath = prefix.empty() ? key : prefix + "." + key;

        if (it->second.IsMap()) {
            applyEnvOverrides(it->second, fullPath);
            continue;
        }

        std::string envVar = pathToEnvVar(fullPath);
        if (const char* val = std::getenv(envVar.c_str())) {
            node[key] = std::string(val);
            ydebug("Config override from env: {}={}", envVar, val);
        }
    }
}

void Config::mergeNodes(YAML::Node& target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        if (it->second.IsMap() && target[key] && target[key].IsMap()) {
            YAML::Node child = target[key];
            mergeNodes(child, it->second);
        } else {
            target[key] = YAML::Clone(it->second);
        }
    }
}

YAML::Node Config::getNode(const std::string& path) const {
    auto parts = splitPath(path);
    if (parts.empty()) return YAML::Node();

    YAML::Node current = _config;
    for (const auto& part : parts) {
        if (!current.IsMap()) return YAML::Node();
        const YAML::Node& view = current;
        YAML::Node next = view[part];
        if (!next) return YAML::Node();
        current.reset(next);
    }
    return current;
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else if (const char* home = std::getenv("HOME")) {
        configDir = std::filesystem::path(home) / ".config";
    } else {
        configDir = "/tmp";
    }
    return configDir / "labelkit" / "config.yaml";
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

Result<void> Config::addOverride(YAML::Node& overrides, const std::string& assignment) {
    auto eq = assignment.find('=');
    if (eq == std::string::npos || eq == 0) {
        return Err<void>("Invalid override '" + assignment + "', expected key=value");
    }
    auto parts = splitPath(assignment.substr(0, eq));
    if (parts.empty()) {
        return Err<void>("Invalid override key in '" + assignment + "'");
    }
    std::string value = assignment.substr(eq + 1);

    if (!overrides || !overrides.IsMap()) {
        overrides = YAML::Node(YAML::NodeType::Map);
    }
    mergeNodes(overrides, nestValue(parts, 0, value));
    return Ok();
}

} // namespace labelkit
