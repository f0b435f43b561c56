/**
 * @file theme.hpp
 * @brief Console palette and status-line helpers.
 *
 * Every user-visible line printed by vellumsh has the form `[-] message`,
 * where the dash is coloured by one of the Theme entries. The values are
 * plain ANSI sequences and can be overridden from the THEME dict in config.py.
 */

#pragma once
#include <iostream>
#include <string>

namespace vellumsh::core {

    struct Theme {
        static inline std::string RESET   = "\x1b[0m";
        static inline std::string SUCCESS = "\x1b[92m";
        static inline std::string WARNING = "\x1b[93m";
        static inline std::string ERROR   = "\x1b[91m";
        static inline std::string NOTICE  = "\x1b[94m";
        static inline std::string DEBUG   = "\x1b[90m";
    };

    /**
     * @brief Writes a `[-] msg` status line.
     * @param eol Line terminator; raw-mode callers pass "\r\n".
     */
    inline void print_status(std::ostream& os, const std::string& colour,
                             const std::string& msg, const char* eol = "\n") {
        os << "[" << colour << "-" << Theme::RESET << "] " << msg << eol << std::flush;
    }

    /// Debug traces, enabled by DEBUG in config.py or VELLUMSH_DEBUG=1.
    inline bool& debug_enabled() {
        static bool enabled = false;
        return enabled;
    }

    inline void debug_log(const std::string& msg) {
        if (!debug_enabled()) return;
        std::cerr << Theme::DEBUG << "[debug] " << msg << Theme::RESET << "\r\n" << std::flush;
    }

}
