/**
 * @file line_recovery.cpp
 * @brief Terminal replay and prompt matching.
 */

#include "core/line_recovery.hpp"
#include <algorithm>
#include <cstddef>
#include <string>

namespace vellumsh::core {

    namespace {
        constexpr char kEsc = '\x1b';
        constexpr char kBell = '\x07';
        constexpr char kCtrlA = '\x01';
        constexpr char kCtrlK = '\x0b';
        constexpr char kCtrlU = '\x15';

        /// Widest line the model keeps; movement past it saturates.
        constexpr size_t kMaxColumns = 4096;

        /** @brief Leading decimal parameter of a CSI sequence, at least 1 and at most kMaxColumns. */
        size_t csi_count(const std::string& seq) {
            size_t n = 0;
            for (char c : seq) {
                if (c < '0' || c > '9') break;
                n = n * 10 + static_cast<size_t>(c - '0');
                if (n >= kMaxColumns) return kMaxColumns;
            }
            return n == 0 ? 1 : n;
        }

        size_t utf8_length(unsigned char lead) {
            if (lead >= 0xF0) return 4;
            if (lead >= 0xE0) return 3;
            return 2;
        }

        /**
         * @brief One screen row, one cell per code point.
         *
         * Invariant: cursor <= cells.size() <= kMaxColumns.
         */
        struct CellRow {
            std::vector<std::string> cells;
            size_t cursor = 0;

            void put(const std::string& glyph) {
                if (cursor >= kMaxColumns) return;
                if (cursor < cells.size()) cells[cursor] = glyph;
                else cells.push_back(glyph);
                cursor++;
            }

            void move_to(size_t column) {
                cursor = std::min(column, kMaxColumns);
                if (cursor > cells.size()) cells.resize(cursor, " ");
            }

            void truncate() {
                if (cursor < cells.size()) cells.resize(cursor);
            }

            TerminalLine flatten() const {
                TerminalLine line;
                for (size_t i = 0; i < cells.size(); ++i) {
                    if (i == cursor) line.cursor = line.text.size();
                    line.text += cells[i];
                }
                if (cursor >= cells.size()) line.cursor = line.text.size();
                return line;
            }
        };
    }

    TerminalLine simulate_line(std::string_view bytes) {
        CellRow row;

        enum AnsiState { TEXT, ESC, CSI, OSC, OSC_ESC };
        AnsiState state = TEXT;
        std::string csi_seq;
        std::string glyph;          // multibyte character being assembled
        size_t glyph_len = 0;

        for (char c : bytes) {
            auto u = static_cast<unsigned char>(c);
            if (state == TEXT) {
                if ((u & 0xC0) == 0x80) {
                    // continuation byte; strays are dropped
                    if (glyph.empty()) continue;
                    glyph += c;
                    if (glyph.size() == glyph_len) {
                        row.put(glyph);
                        glyph.clear();
                    }
                    continue;
                }
                glyph.clear();

                if (c == kEsc) {
                    state = ESC;
                } else if (c == '\b' || c == 0x7f) {
                    if (row.cursor > 0) row.cursor--;
                } else if (c == '\r' || c == kCtrlA) {
                    row.cursor = 0;
                } else if (c == kCtrlK) {
                    row.truncate();
                } else if (c == kCtrlU) {
                    row.cells.clear();
                    row.cursor = 0;
                } else if (c == '\n') {
                    // wrapped continuation of the same logical line
                    row.cursor = row.cells.size();
                } else if (u >= 0xC0) {
                    glyph = c;
                    glyph_len = utf8_length(u);
                } else if (u >= 32) {
                    row.put(std::string(1, c));
                }
            } else if (state == ESC) {
                if (c == '[') { state = CSI; csi_seq.clear(); }
                else if (c == ']') state = OSC;
                else state = TEXT;
            } else if (state == CSI) {
                if (c < 0x40 || c > 0x7E) {
                    if (csi_seq.size() < 32) csi_seq += c;
                    continue;
                }
                switch (c) {
                    case 'K':   // erase in line
                        if (csi_seq.empty() || csi_seq == "0") {
                            row.truncate();
                        } else if (csi_seq == "1") {
                            for (size_t k = 0; k <= row.cursor && k < row.cells.size(); ++k) row.cells[k] = " ";
                        } else if (csi_seq == "2") {
                            row.cells.assign(row.cursor, " ");
                        }
                        break;
                    case 'J':   // erase in display, single-line view
                        if (csi_seq.empty() || csi_seq == "0") {
                            row.truncate();
                        } else if (csi_seq == "2") {
                            row.cells.clear();
                            row.cursor = 0;
                        }
                        break;
                    case 'C':
                        row.move_to(row.cursor + csi_count(csi_seq));
                        break;
                    case 'D': {
                        size_t n = csi_count(csi_seq);
                        row.cursor = row.cursor >= n ? row.cursor - n : 0;
                        break;
                    }
                    case 'G':   // cursor horizontal absolute, 1-indexed
                        row.move_to(csi_count(csi_seq) - 1);
                        break;
                    case 'P': { // delete characters
                        size_t n = std::min(csi_count(csi_seq), row.cells.size() - row.cursor);
                        auto first = row.cells.begin() + static_cast<std::ptrdiff_t>(row.cursor);
                        row.cells.erase(first, first + static_cast<std::ptrdiff_t>(n));
                        break;
                    }
                    case '@':   // insert blanks
                        row.cells.insert(row.cells.begin() + static_cast<std::ptrdiff_t>(row.cursor),
                                         csi_count(csi_seq), " ");
                        if (row.cells.size() > kMaxColumns) row.cells.resize(kMaxColumns);
                        break;
                    default:
                        break;
                }
                state = TEXT;
            } else if (state == OSC) {
                if (c == kEsc) state = OSC_ESC;
                else if (c == kBell) state = TEXT;
            } else if (state == OSC_ESC) {
                state = (c == '\\') ? TEXT : OSC;
            }
        }
        return row.flatten();
    }

    std::optional<EditBuffer> recover_buffer(const TerminalLine& line, const std::vector<std::string>& prompts) {
        size_t best_pos = std::string::npos;
        size_t prompt_len = 0;
        for (const auto& prompt : prompts) {
            if (prompt.empty()) continue;
            size_t pos = line.text.rfind(prompt);
            if (pos != std::string::npos && (best_pos == std::string::npos || pos > best_pos)) {
                best_pos = pos;
                prompt_len = prompt.size();
            }
        }
        if (best_pos == std::string::npos) return std::nullopt;

        // blanks right of the cursor are erasure or padding; the ones
        // before it were typed
        size_t start = best_pos + prompt_len;
        size_t cursor = std::min(line.cursor, line.text.size());
        size_t end = line.text.size();
        while (end > std::max(start, cursor) && line.text[end - 1] == ' ') end--;

        std::string command = line.text.substr(start, end - start);
        size_t point = cursor > start ? cursor - start : 0;
        return EditBuffer(command, point);
    }

    PromptKind classify_prompt(const TerminalLine& line,
                               const std::vector<std::string>& primary,
                               const std::vector<std::string>& continuation) {
        // the shell parks the cursor right after its prompt; anything to the
        // right of it (zsh RPROMPT) is ignored
        std::string left = line.text.substr(0, std::min(line.cursor, line.text.size()));

        for (const auto& prompt : continuation) {
            if (!prompt.empty() && left == prompt) return PromptKind::Continuation;
        }
        for (const auto& prompt : primary) {
            if (prompt.empty() || left.size() < prompt.size()) continue;
            if (left.compare(left.size() - prompt.size(), prompt.size(), prompt) == 0) {
                return PromptKind::Primary;
            }
        }
        return PromptKind::None;
    }

}
