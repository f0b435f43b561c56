/**
 * @file config_loader.hpp
 * @brief Definition of the ConfigLoader class.
 *
 * Loads user configuration from a plain Python file (`config.py`) through the
 * embedded interpreter, so the file can compute values instead of just
 * listing them.
 */

#pragma once
#include <string>

namespace vellumsh::core {
    struct Config;

    /**
     * @class ConfigLoader
     * @brief Static helper to bridge C++ configuration with Python scripts.
     */
    class ConfigLoader {
    public:
        /**
         * @brief Reflects the variables of `<path>/config.py` into `config`.
         *
         * Requires a live interpreter (py::scoped_interpreter). Variables that
         * are missing keep their defaults; a variable of the wrong type is
         * reported and skipped.
         *
         * @return false when config.py could not be imported.
         */
        static bool load(Config& config, const std::string& path);
    };
}
