#pragma once

#include <labelkit/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace labelkit {

class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Layers: built-in defaults < config file < LABELKIT_* environment < cmdOverrides.
    // An empty configPath falls back to the XDG location if that file exists.
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by dotted path (e.g. "fonts.default")
    // Returns nullopt if the key doesn't exist or doesn't convert
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    // $XDG_CONFIG_HOME/labelkit/config.yaml
    static std::filesystem::path getXDGConfigPath();

    // "fonts.default" -> "LABELKIT_FONTS_DEFAULT"
    static std::string pathToEnvVar(const std::string& path);

    // Parse "a.b=value" into a nested override node
    static Result<void> addOverride(YAML::Node& overrides, const std::string& assignment);

    static constexpr const char* ENV_PREFIX = "LABELKIT_";

    static constexpr const char* KEY_FONTS_DEFAULT = "fonts.default";
    static constexpr const char* KEY_RENDER_BACKGROUND = "render.background";
    static constexpr const char* KEY_LOG_LEVEL = "log.level";

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    static void mergeNodes(YAML::Node& target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    YAML::Node _cmdOverrides;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
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

} // namespace labelkit
