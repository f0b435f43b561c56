/**
 * @file line_tracker.cpp
 * @brief Key decoding and edit-line mirroring.
 */

#include "core/line_tracker.hpp"

namespace vellumsh::core {

    namespace {
        constexpr char kEsc = '\x1b';

        bool is_continuation(char c) {
            return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
        }

        /// Length of the UTF-8 sequence a lead byte announces.
        size_t utf8_length(char c) {
            auto u = static_cast<unsigned char>(c);
            if (u >= 0xF0) return 4;
            if (u >= 0xE0) return 3;
            if (u >= 0xC0) return 2;
            return 1;
        }

        KeyKind control_key(char c) {
            switch (c) {
                case '\r':
                case '\n':   return KeyKind::Enter;
                case '\t':   return KeyKind::Tab;
                case 0x7f:
                case '\b':   return KeyKind::Backspace;
                case '\x01': return KeyKind::Home;
                case '\x02': return KeyKind::Left;
                case '\x03': return KeyKind::Interrupt;
                case '\x04': return KeyKind::Delete;
                case '\x05': return KeyKind::End;
                case '\x06': return KeyKind::Right;
                case '\x0b': return KeyKind::KillToEnd;
                case '\x12': return KeyKind::Search;
                case '\x15': return KeyKind::KillLine;
                case '\x17': return KeyKind::KillWord;
                default:     return KeyKind::Unknown;
            }
        }

        KeyKind csi_key(const std::string& params, char final) {
            switch (final) {
                case 'A': return params.empty() ? KeyKind::Up : KeyKind::Unknown;
                case 'B': return params.empty() ? KeyKind::Down : KeyKind::Unknown;
                case 'C': return params.empty() ? KeyKind::Right : KeyKind::Unknown;
                case 'D': return params.empty() ? KeyKind::Left : KeyKind::Unknown;
                case 'H': return KeyKind::Home;
                case 'F': return KeyKind::End;
                case '~':
                    if (params == "1" || params == "7") return KeyKind::Home;
                    if (params == "4" || params == "8") return KeyKind::End;
                    if (params == "3") return KeyKind::Delete;
                    if (params == "200") return KeyKind::PasteStart;
                    if (params == "201") return KeyKind::PasteEnd;
                    return KeyKind::Unknown;
                default:
                    return KeyKind::Unknown;
            }
        }

        KeyKind ss3_key(char c) {
            switch (c) {
                case 'A': return KeyKind::Up;
                case 'B': return KeyKind::Down;
                case 'C': return KeyKind::Right;
                case 'D': return KeyKind::Left;
                case 'H': return KeyKind::Home;
                case 'F': return KeyKind::End;
                default:  return KeyKind::Unknown;
            }
        }
    }

    // ==================================================================================
    // KeyDecoder
    // ==================================================================================

    std::vector<Key> KeyDecoder::feed(std::string_view input) {
        std::string data = pending_;
        data.append(input);
        pending_.clear();

        std::vector<Key> keys;
        size_t i = 0;
        while (i < data.size()) {
            char c = data[i];

            if (c == kEsc) {
                if (i + 1 >= data.size()) { pending_ = data.substr(i); break; }
                char next = data[i + 1];

                if (next == '[') {
                    size_t j = i + 2;
                    while (j < data.size() && (data[j] < 0x40 || data[j] > 0x7E)) j++;
                    if (j >= data.size()) { pending_ = data.substr(i); break; }
                    std::string params = data.substr(i + 2, j - i - 2);
                    keys.push_back({csi_key(params, data[j]), data.substr(i, j - i + 1)});
                    i = j + 1;
                } else if (next == 'O') {
                    if (i + 2 >= data.size()) { pending_ = data.substr(i); break; }
                    keys.push_back({ss3_key(data[i + 2]), data.substr(i, 3)});
                    i += 3;
                } else if (next == '\r' || next == '\n') {
                    keys.push_back({KeyKind::AltEnter, data.substr(i, 2)});
                    i += 2;
                } else {
                    // Alt+key or an unknown sequence
                    keys.push_back({KeyKind::Unknown, data.substr(i, 2)});
                    i += 2;
                }
                continue;
            }

            auto u = static_cast<unsigned char>(c);
            if (u < 0x20 || u == 0x7f) {
                keys.push_back({control_key(c), std::string(1, c)});
                i++;
                continue;
            }

            // printable run, never splitting a UTF-8 sequence
            size_t j = i;
            while (j < data.size()) {
                auto b = static_cast<unsigned char>(data[j]);
                if (b < 0x20 || b == 0x7f) break;
                size_t len = utf8_length(data[j]);
                if (j + len > data.size()) break;
                j += len;
            }
            if (j == i) { pending_ = data.substr(i); break; }
            keys.push_back({KeyKind::Text, data.substr(i, j - i)});
            i = j;
        }
        return keys;
    }

    std::vector<Key> KeyDecoder::flush() {
        std::vector<Key> keys;
        if (pending_.empty()) return keys;
        keys.push_back({KeyKind::Unknown, pending_});
        pending_.clear();
        return keys;
    }

    // ==================================================================================
    // LineTracker
    // ==================================================================================

    void LineTracker::insert(std::string_view text) {
        buffer_.text.insert(buffer_.point, text);
        buffer_.point += text.size();
    }

    void LineTracker::erase_before() {
        if (buffer_.point == 0) return;
        size_t start = buffer_.point - 1;
        while (start > 0 && is_continuation(buffer_.text[start])) start--;
        buffer_.text.erase(start, buffer_.point - start);
        buffer_.point = start;
    }

    void LineTracker::erase_at() {
        if (buffer_.point >= buffer_.text.size()) return;
        size_t len = utf8_length(buffer_.text[buffer_.point]);
        buffer_.text.erase(buffer_.point, len);
    }

    void LineTracker::apply(const Key& key) {
        std::string& text = buffer_.text;
        size_t& point = buffer_.point;

        // zsh and fish edit multi-line buffers line by line; readline treats
        // the whole buffer as one line
        bool line_scoped = dialect_.split_at_point;
        size_t line_start = 0;
        size_t line_end = text.size();
        if (line_scoped) {
            size_t nl = point == 0 ? std::string::npos : text.rfind('\n', point - 1);
            line_start = nl == std::string::npos ? 0 : nl + 1;
            size_t next = text.find('\n', point);
            line_end = next == std::string::npos ? text.size() : next;
        }

        switch (key.kind) {
            case KeyKind::Text:
                insert(key.bytes);
                break;
            case KeyKind::Enter:
                if (in_paste_) insert("\n");
                break;
            case KeyKind::AltEnter:
                if (dialect_.alt_enter_newline) insert("\n");
                else reliable_ = false;
                break;
            case KeyKind::Tab:
                if (in_paste_) insert("\t");
                else reliable_ = false;
                break;
            case KeyKind::Left:
                if (point > 0) {
                    point--;
                    while (point > 0 && is_continuation(text[point])) point--;
                }
                break;
            case KeyKind::Right:
                if (point < text.size()) point += utf8_length(text[point]);
                if (point > text.size()) point = text.size();
                break;
            case KeyKind::Home:
                point = line_start;
                break;
            case KeyKind::End:
                point = line_end;
                break;
            case KeyKind::Backspace:
                erase_before();
                break;
            case KeyKind::Delete:
                erase_at();
                break;
            case KeyKind::KillLine:
                if (dialect_.dialect == ShellDialect::Zsh) {
                    // kill-whole-line
                    size_t end = line_end < text.size() ? line_end + 1 : line_end;
                    if (line_start > 0 && end == text.size()) line_start--;
                    text.erase(line_start, end - line_start);
                    point = line_start;
                } else {
                    text.erase(line_start, point - line_start);
                    point = line_start;
                }
                break;
            case KeyKind::KillToEnd:
                text.erase(point, line_end - point);
                break;
            case KeyKind::KillWord:
                if (dialect_.dialect != ShellDialect::Bash) {
                    // word characters differ per shell configuration
                    reliable_ = false;
                    break;
                }
                {
                    size_t start = point;
                    while (start > 0 && text[start - 1] == ' ') start--;
                    while (start > 0 && text[start - 1] != ' ') start--;
                    text.erase(start, point - start);
                    point = start;
                }
                break;
            case KeyKind::Interrupt:
                buffer_ = EditBuffer();
                reliable_ = true;
                in_paste_ = false;
                break;
            case KeyKind::PasteStart:
                in_paste_ = true;
                break;
            case KeyKind::PasteEnd:
                in_paste_ = false;
                break;
            case KeyKind::Up:
            case KeyKind::Down:
            case KeyKind::Search:
            case KeyKind::Unknown:
                reliable_ = false;
                break;
        }
    }

}
