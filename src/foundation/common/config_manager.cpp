/// @file config_manager.cpp
/// @brief YAML loading and flattening for ConfigManager.

#include "sgc/foundation/config_manager.hpp"

namespace sgc::foundation {

GameResult<void> ConfigManager::load(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return GameResult<void>::err(GameError(ErrorCode::ConfigLoadFailed,
                                               "cannot open rules file " + path.string(),
                                               path.string()));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(GameError(ErrorCode::ConfigLoadFailed,
                                               path.string() + ": " + e.what(),
                                               path.string()));
    }
    return replaceWith(root);
}

GameResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::ParserException& e) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, std::string("malformed rules YAML: ") + e.what()));
    }
    return replaceWith(root);
}

bool ConfigManager::hasKey(std::string_view key) const {
    return entries_.find(key) != entries_.end();
}

std::vector<std::string> ConfigManager::keys() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [key, node] : entries_) {
        out.push_back(key);
    }
    return out;
}

GameResult<void> ConfigManager::replaceWith(const YAML::Node& root) {
    // An empty file parses to a null node and means "no overrides".
    if (root.IsDefined() && !root.IsNull() && !root.IsMap()) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "rules document must be a mapping"));
    }
    entries_.clear();
    flatten("", root);
    return GameResult<void>::ok();
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (const auto& child : node) {
            auto name = child.first.as<std::string>();
            flatten(prefix.empty() ? name : prefix + "." + name, child.second);
        }
    } else if (!prefix.empty()) {
        entries_[prefix] = YAML::Clone(node);
    }
}

} // namespace sgc::foundation
