/**
 * @file test_config.cpp
 * @brief Unit tests for environment overrides and config directory lookup.
 */

#include "test_harness.hpp"
#include "core/config.hpp"
#include "core/environment.hpp"
#include <filesystem>
#include <unistd.h>

using namespace vellumsh::core;
namespace fs = std::filesystem;

TEST(test_split_words) {
    auto words = split_words("  --limit   500\t--no-duplicates ");
    ASSERT_EQ(words.size(), 3u, "three words");
    ASSERT_EQ(words[2], std::string("--no-duplicates"), "last word");
    ASSERT_TRUE(split_words("").empty(), "empty input");
    PASS("Whitespace splitting");
}

TEST(test_env_overrides) {
    Config config;
    config.move_args = {"--from-config"};
    config.selector_opts = "--exact";
    MapEnvironment env;
    env.set("VELLUM_MOVE_ARGS", "--no-duplicates");
    env.set("VELLUM_HISTORY_ARGS", "--limit 10");
    env.set("FZF_CTRL_R_OPTS", "--reverse");
    env.set("VELLUM_EDITOR", "nvim");
    env.set("VELLUMSH_DEBUG", "1");
    apply_env_overrides(config, env);

    ASSERT_EQ(config.move_args.size(), 1u, "environment replaces config");
    ASSERT_EQ(config.move_args[0], std::string("--no-duplicates"), "move args");
    ASSERT_EQ(config.history_args.size(), 2u, "history args split");
    ASSERT_EQ(config.selector_opts, std::string("--reverse --exact"), "FZF_CTRL_R_OPTS first");
    ASSERT_EQ(config.editor, std::string("nvim"), "editor");
    ASSERT_TRUE(config.debug, "debug enabled");
    PASS("Environment overrides applied");
}

TEST(test_defaults_survive_empty_env) {
    Config config;
    MapEnvironment env;
    apply_env_overrides(config, env);
    ASSERT_EQ(config.backend, std::string("vellum"), "backend default");
    ASSERT_EQ(config.selector, std::string("fzf"), "selector default");
    ASSERT_EQ(config.continuation_prompts.size(), 1u, "one continuation prompt");
    ASSERT_FALSE(config.debug, "debug off");
    PASS("Defaults kept without overrides");
}

TEST(test_find_config_dir_order) {
    fs::path base = fs::temp_directory_path() / ("vellumsh-config-" + std::to_string(getpid()));
    fs::path explicit_dir = base / "explicit";
    fs::path xdg = base / "xdg";
    fs::path root = base / "root";
    fs::create_directories(xdg / "vellumsh");
    fs::create_directories(root / "config");

    MapEnvironment env;
    env.set("XDG_CONFIG_HOME", xdg.string());
    env.set("VELLUMSH_CONFIG_DIR", explicit_dir.string());
    auto dir = find_config_dir(env, root);
    ASSERT_TRUE(dir.has_value(), "found");
    ASSERT_EQ(dir->string(), (xdg / "vellumsh").string(), "missing explicit dir skipped, XDG next");

    fs::create_directories(explicit_dir);
    ASSERT_EQ(find_config_dir(env, root)->string(), explicit_dir.string(), "explicit dir wins");

    MapEnvironment bare;
    bare.set("HOME", (base / "nohome").string());
    ASSERT_EQ(find_config_dir(bare, root)->string(), (root / "config").string(), "install root last");

    fs::remove_all(base);
    PASS("Config directory search order");
}

int main() {
    print_banner("vellumsh Config Unit Tests");

    std::cout << "\n[Overrides]" << std::endl;
    test_split_words();
    test_env_overrides();
    test_defaults_survive_empty_env();

    std::cout << "\n[Directories]" << std::endl;
    test_find_config_dir_order();

    return print_results();
}
