/**
 * @file config_loader.cpp
 * @brief Implementation of the ConfigLoader.
 */

#include "core/config_loader.hpp"
#include "core/config.hpp"
#include "core/theme.hpp"
#include <pybind11/embed.h>
#include <pybind11/stl.h>
#include <filesystem>
#include <iostream>

namespace py = pybind11;

namespace vellumsh::core {

    namespace {
        void report_mismatch(const char* name, const std::exception& e) {
            print_status(std::cerr, Theme::WARNING,
                         std::string("Config type mismatch for '") + name + "': " + e.what());
        }

        /** @brief Loads a simple property (bool, string, list) from a python module. */
        template <typename T>
        void load_prop(const py::module_& m, const char* name, T& target) {
            if (!py::hasattr(m, name)) return;
            try {
                target = m.attr(name).cast<T>();
            } catch (const std::exception& e) {
                report_mismatch(name, e);
            }
        }

        /** @brief Loads a dictionary item into a specific target reference. */
        template <typename T>
        void load_dict_item(const py::dict& d, const char* key, T& target) {
            if (!d.contains(key)) return;
            try {
                target = d[key].cast<T>();
            } catch (const std::exception& e) {
                report_mismatch(key, e);
            }
        }
    }

    bool ConfigLoader::load(Config& config, const std::string& path) {
        namespace fs = std::filesystem;

        try {
            py::module_ sys = py::module_::import("sys");
            sys.attr("path").attr("insert")(0, fs::absolute(fs::path(path)).string());
            py::module_ conf_module = py::module_::import("config");

            // 1. Backing programs
            load_prop(conf_module, "BACKEND", config.backend);
            load_prop(conf_module, "SELECTOR", config.selector);
            load_prop(conf_module, "EDITOR", config.editor);

            // 2. Navigation and search
            load_prop(conf_module, "HISTORY_ARGS", config.history_args);
            load_prop(conf_module, "MOVE_ARGS", config.move_args);
            load_prop(conf_module, "SEARCH_SESSION_ONLY", config.search_session_only);
            load_prop(conf_module, "SELECTOR_OPTS", config.selector_opts);

            // 3. Prompt detection
            load_prop(conf_module, "SHELL_PROMPTS", config.shell_prompts);
            load_prop(conf_module, "CONTINUATION_PROMPTS", config.continuation_prompts);

            // 4. Plugins and diagnostics
            load_prop(conf_module, "PLUGINS_DIR", config.plugins_dir);
            load_prop(conf_module, "DEBUG", config.debug);

            // 5. Theme
            if (py::hasattr(conf_module, "THEME")) {
                py::dict theme = conf_module.attr("THEME").cast<py::dict>();
                load_dict_item(theme, "RESET", Theme::RESET);
                load_dict_item(theme, "SUCCESS", Theme::SUCCESS);
                load_dict_item(theme, "WARNING", Theme::WARNING);
                load_dict_item(theme, "ERROR", Theme::ERROR);
                load_dict_item(theme, "NOTICE", Theme::NOTICE);
                load_dict_item(theme, "DEBUG", Theme::DEBUG);
            }

            if (!config.plugins_dir.empty()) {
                fs::path plugins(config.plugins_dir);
                if (plugins.is_relative()) config.plugins_dir = (fs::path(path) / plugins).string();
            }
            return true;

        } catch (const std::exception& e) {
            print_status(std::cerr, Theme::NOTICE,
                         std::string("No usable config.py (") + e.what() + "). Using defaults.");
            return false;
        }
    }

}
