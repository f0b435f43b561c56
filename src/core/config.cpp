/**
 * @file config.cpp
 * @brief Config defaults, environment overrides and config directory lookup.
 */

#include "core/config.hpp"
#include <sstream>

namespace vellumsh::core {

    namespace fs = std::filesystem;

    std::vector<std::string> split_words(const std::string& text) {
        std::vector<std::string> words;
        std::istringstream in(text);
        std::string word;
        while (in >> word) words.push_back(word);
        return words;
    }

    void apply_env_overrides(Config& config, const Environment& env) {
        if (auto v = env.get("VELLUM_HISTORY_ARGS")) config.history_args = split_words(*v);
        if (auto v = env.get("VELLUM_MOVE_ARGS")) config.move_args = split_words(*v);

        if (auto v = env.get("FZF_CTRL_R_OPTS"); v && !v->empty()) {
            config.selector_opts = config.selector_opts.empty() ? *v : *v + " " + config.selector_opts;
        }
        if (env.has("VELLUM_EDITOR")) config.editor = *env.get("VELLUM_EDITOR");

        if (auto v = env.get("VELLUMSH_DEBUG")) config.debug = (*v == "1" || *v == "true");
    }

    std::optional<fs::path> find_config_dir(const Environment& env, const fs::path& root) {
        std::vector<fs::path> candidates;
        if (env.has("VELLUMSH_CONFIG_DIR")) candidates.emplace_back(*env.get("VELLUMSH_CONFIG_DIR"));

        if (env.has("XDG_CONFIG_HOME")) {
            candidates.push_back(fs::path(*env.get("XDG_CONFIG_HOME")) / "vellumsh");
        } else if (env.has("HOME")) {
            candidates.push_back(fs::path(*env.get("HOME")) / ".config" / "vellumsh");
        }
        if (!root.empty()) candidates.push_back(root / "config");

        for (const auto& dir : candidates) {
            std::error_code ec;
            if (fs::is_directory(dir, ec)) return dir;
        }
        return std::nullopt;
    }

}
