/**
 * @file dialect.hpp
 * @brief What differs between the shells vellumsh can wrap.
 *
 * The state machine and hooks are the same for every shell; only the line
 * editor details captured here change.
 */

#pragma once
#include <string>

namespace vellumsh::core {

    enum class ShellDialect { Bash, Zsh, Fish, Other };

    struct DialectProfile {
        ShellDialect dialect = ShellDialect::Other;
        std::string name = "sh";
        /// Multi-line detection looks at the side of the point the key moves towards
        /// (zsh: LBUFFER for up, RBUFFER for down). Otherwise the whole buffer.
        bool split_at_point = false;
        /// Alt-Enter inserts a literal newline into the buffer.
        bool alt_enter_newline = false;
        /// Keys that empty the line editor's buffer (or, with kill_per_line, one line of it).
        std::string kill_line = "\x05\x15";  // Ctrl-E, Ctrl-U
        bool kill_per_line = false;
        /// Keys that insert a literal newline outside of bracketed paste.
        std::string literal_newline = "\x16\n";  // Ctrl-V Ctrl-J
    };

    /// Profile for a shell path such as /usr/bin/zsh.
    DialectProfile detect_dialect(const std::string& shell_path);

    /// Keys that empty the shell's buffer, given the mirror of what it holds.
    std::string clear_sequence(const DialectProfile& profile, const std::string& text, size_t point);

    /**
     * @brief Keys that type `text` into an empty buffer without submitting it.
     * Newlines go through bracketed paste when the shell enabled it.
     */
    std::string type_sequence(const DialectProfile& profile, const std::string& text, bool bracketed_paste);

}
