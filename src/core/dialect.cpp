/**
 * @file dialect.cpp
 * @brief Per-shell profiles and line-editor key sequences.
 */

#include "core/dialect.hpp"
#include <algorithm>
#include <filesystem>

namespace vellumsh::core {

    namespace {
        constexpr auto kRightArrow = "\x1b[C";
        constexpr auto kPasteStart = "\x1b[200~";
        constexpr auto kPasteEnd = "\x1b[201~";

        size_t count_chars(const std::string& s) {
            return static_cast<size_t>(std::count_if(s.begin(), s.end(), [](char c) {
                return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
            }));
        }
    }

    DialectProfile detect_dialect(const std::string& shell_path) {
        DialectProfile profile;
        std::string base = std::filesystem::path(shell_path).filename().string();

        if (base.find("zsh") != std::string::npos) {
            profile.dialect = ShellDialect::Zsh;
            profile.name = "zsh";
            profile.split_at_point = true;
            profile.alt_enter_newline = true;
            profile.kill_line = "\x18\x0b";  // ^X^K kill-buffer
        } else if (base.find("fish") != std::string::npos) {
            profile.dialect = ShellDialect::Fish;
            profile.name = "fish";
            profile.split_at_point = true;
            profile.alt_enter_newline = true;
            profile.kill_line = "\x15";      // backward-kill-line, also eats the newline before it
            profile.kill_per_line = true;
            profile.literal_newline = "\x1b\r";
        } else if (base.find("bash") != std::string::npos) {
            profile.dialect = ShellDialect::Bash;
            profile.name = "bash";
        }
        return profile;
    }

    std::string clear_sequence(const DialectProfile& profile, const std::string& text, size_t point) {
        if (!profile.kill_per_line) return profile.kill_line;

        std::string keys;
        if (point < text.size()) {
            size_t remaining = count_chars(text.substr(point));
            for (size_t i = 0; i < remaining; ++i) keys += kRightArrow;
        }
        size_t lines = static_cast<size_t>(std::count(text.begin(), text.end(), '\n')) + 1;
        for (size_t i = 0; i < 2 * lines - 1; ++i) keys += profile.kill_line;
        return keys;
    }

    std::string type_sequence(const DialectProfile& profile, const std::string& text, bool bracketed_paste) {
        if (text.find('\n') == std::string::npos) return text;
        if (bracketed_paste) return kPasteStart + text + kPasteEnd;

        std::string keys;
        for (char c : text) {
            if (c == '\n') keys += profile.literal_newline;
            else keys += c;
        }
        return keys;
    }

}
