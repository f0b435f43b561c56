/**
 * @file plugins.hpp
 * @brief Python plugins hooked into the shell lifecycle.
 *
 * A plugin is a `.py` file in PLUGINS_DIR. `on_command(cmd)` runs for every
 * submitted command, `on_prompt()` before every prompt; both are registered
 * with the HookRegistry after the built-in hooks.
 */

#pragma once
#include "core/hooks.hpp"
#include <string>
#include <vector>
#include <pybind11/embed.h>

namespace py = pybind11;

namespace vellumsh::core {

    class PluginHost {
    public:
        explicit PluginHost(HookRegistry& hooks) : hooks_(hooks) {}

        /**
         * @brief Imports every plugin in `path` and registers its hooks.
         * Requires a live interpreter. @return number of modules loaded.
         */
        size_t load(const std::string& path);

        size_t count() const { return loaded_plugins_.size(); }

    private:
        HookRegistry& hooks_;
        std::vector<py::module_> loaded_plugins_;

        void register_hooks(const std::string& module_name, const py::module_& plugin);
    };

}
