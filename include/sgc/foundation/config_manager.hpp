#pragma once

/// @file config_manager.hpp
/// @brief Flattened view of a YAML rules document.

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "sgc/foundation/game_result.hpp"

namespace sgc::foundation {

/// A YAML document keyed by dotted paths.
///
/// Nested maps become "section.key" entries ("status.burn_damage",
/// "enemies.ogre.health").  Sequences and scalars are leaves; a sequence
/// stays whole under its parent key.  yaml-cpp exceptions never escape:
/// load failures and conversion failures come back as GameError.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Replace all entries with the contents of a YAML file.
    GameResult<void> load(const std::filesystem::path& path);

    /// Replace all entries with the contents of YAML text.
    GameResult<void> loadFromString(std::string_view yaml);

    /// Typed lookup.  ConfigKeyNotFound or ConfigTypeMismatch on failure;
    /// the error context holds the key as std::string.
    template <typename T>
    [[nodiscard]] GameResult<T> get(std::string_view key) const;

    /// Override or add a single entry.
    template <typename T>
    void set(std::string_view key, const T& value);

    [[nodiscard]] bool hasKey(std::string_view key) const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    /// Every dotted key, in lexical order.
    [[nodiscard]] std::vector<std::string> keys() const;

private:
    GameResult<void> replaceWith(const YAML::Node& root);
    void flatten(const std::string& prefix, const YAML::Node& node);

    std::map<std::string, YAML::Node, std::less<>> entries_;
};

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return GameResult<T>::err(GameError(ErrorCode::ConfigKeyNotFound,
                                            "no such rules key: " + std::string(key),
                                            std::string(key)));
    }
    try {
        return GameResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(GameError(ErrorCode::ConfigTypeMismatch,
                                            "wrong value type for " + std::string(key),
                                            std::string(key)));
    }
}

template <typename T>
void ConfigManager::set(std::string_view key, const T& value) {
    entries_.insert_or_assign(std::string(key), YAML::Node(value));
}

} // namespace sgc::foundation
