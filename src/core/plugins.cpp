/**
 * @file plugins.cpp
 * @brief Python plugin discovery and hook registration.
 */

#include "core/plugins.hpp"
#include "core/theme.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

// ==================================================================================
// EMBEDDED MODULE DEFINITION
// ==================================================================================
/**
 * @brief The 'vellumsh' module available to plugins.
 */
PYBIND11_EMBEDDED_MODULE(vellumsh, m) {
    // The terminal is in raw mode while plugins run
    m.def("log", [](const std::string& msg) {
        std::cout << "\r\n";
        vellumsh::core::print_status(std::cout, vellumsh::core::Theme::SUCCESS, msg, "\r\n");
    });
}

namespace vellumsh::core {

    size_t PluginHost::load(const std::string& path) {
        namespace fs = std::filesystem;
        fs::path p(path);

        std::error_code ec;
        if (path.empty() || !fs::is_directory(p, ec)) {
            if (!path.empty()) {
                print_status(std::cerr, Theme::WARNING,
                             "Plugin path '" + path + "' invalid. Skipping Python plugins.");
            }
            return 0;
        }

        // import in a stable order so hook order does not depend on the filesystem
        std::vector<fs::path> scripts;
        for (const auto& entry : fs::directory_iterator(p, ec)) {
            if (entry.path().extension() == ".py") scripts.push_back(entry.path());
        }
        std::sort(scripts.begin(), scripts.end());

        size_t loaded = 0;
        try {
            py::module_ sys = py::module_::import("sys");
            sys.attr("path").attr("append")(fs::absolute(p).string());
        } catch (const py::error_already_set& e) {
            print_status(std::cerr, Theme::ERROR, std::string("Failed to load plugins: ") + e.what());
            return 0;
        }

        for (const auto& script : scripts) {
            std::string module_name = script.stem().string();
            if (module_name == "__init__" || module_name == "config") continue;

            try {
                py::module_ plugin = py::module_::import(module_name.c_str());
                register_hooks(module_name, plugin);
                loaded_plugins_.push_back(plugin);
                loaded++;
                print_status(std::cout, Theme::NOTICE, "Loaded .py plugin: " + module_name);
            } catch (const py::error_already_set& e) {
                print_status(std::cerr, Theme::ERROR, "Plugin '" + module_name + "' failed: " + e.what());
            }
        }
        return loaded;
    }

    void PluginHost::register_hooks(const std::string& module_name, const py::module_& plugin) {
        if (py::hasattr(plugin, "on_command")) {
            py::object fn = plugin.attr("on_command");
            hooks_.add(HookEvent::PreExec, "py:" + module_name + ".on_command",
                       [fn](const std::string& cmd) { fn(cmd); });
        }
        if (py::hasattr(plugin, "on_prompt")) {
            py::object fn = plugin.attr("on_prompt");
            hooks_.add(HookEvent::PreCmd, "py:" + module_name + ".on_prompt",
                       [fn](const std::string&) { fn(); });
        }
    }

}
