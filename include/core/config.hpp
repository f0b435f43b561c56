/**
 * @file config.hpp
 * @brief Runtime configuration and the non-Python parts of loading it.
 *
 * Values come from config.py (see ConfigLoader) and are then overridden by
 * the environment variables the shell frameworks already honour.
 */

#pragma once
#include "core/environment.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vellumsh::core {

    struct Config {
        std::string backend = "vellum";
        std::string selector = "fzf";
        std::vector<std::string> history_args;
        std::vector<std::string> move_args;
        bool search_session_only = false;
        std::string selector_opts;
        std::string editor;
        std::vector<std::string> shell_prompts = {"$ ", "# ", "% ", "> ", "\xe2\x9d\xaf "};
        std::vector<std::string> continuation_prompts = {"> "};
        std::string plugins_dir;
        bool debug = false;
    };

    /// Splits on runs of whitespace, the way an unquoted shell expansion does.
    std::vector<std::string> split_words(const std::string& text);

    /**
     * @brief Applies VELLUM_HISTORY_ARGS, VELLUM_MOVE_ARGS, FZF_CTRL_R_OPTS,
     *        VELLUM_EDITOR and VELLUMSH_DEBUG on top of `config`.
     */
    void apply_env_overrides(Config& config, const Environment& env);

    /**
     * @brief The first existing configuration directory.
     *
     * Searched in order: $VELLUMSH_CONFIG_DIR, $XDG_CONFIG_HOME/vellumsh
     * (~/.config/vellumsh when unset), `<root>/config`.
     */
    std::optional<std::filesystem::path> find_config_dir(const Environment& env, const std::filesystem::path& root);

}
