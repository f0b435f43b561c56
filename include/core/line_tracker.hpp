/**
 * @file line_tracker.hpp
 * @brief Keyboard decoding and the mirror of the shell's edit line.
 *
 * The wrapped shell owns its line editor; vellumsh only watches the keys on
 * their way to it and keeps a best-effort copy of the buffer. Keys whose effect
 * cannot be predicted (Tab, unknown bindings) mark the mirror unreliable, and
 * the engine then reads the line back from the shell's echo instead.
 */

#pragma once
#include "core/context.hpp"
#include "core/dialect.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace vellumsh::core {

    enum class KeyKind {
        Text, Up, Down, Left, Right, Home, End, Backspace, Delete,
        KillLine, KillToEnd, KillWord, Interrupt, Search, Enter, AltEnter,
        Tab, PasteStart, PasteEnd, Unknown
    };

    struct Key {
        KeyKind kind = KeyKind::Unknown;
        std::string bytes;  ///< raw bytes, forwarded to the shell when not consumed
    };

    /**
     * @class KeyDecoder
     * @brief Splits raw terminal input into keys.
     *
     * Escape sequences cut in half by a read() are held back until the next
     * feed(); flush() releases them (a lone ESC press).
     */
    class KeyDecoder {
    public:
        std::vector<Key> feed(std::string_view input);
        std::vector<Key> flush();
        bool has_pending() const { return !pending_.empty(); }

    private:
        std::string pending_;
    };

    class LineTracker {
    public:
        explicit LineTracker(const DialectProfile& dialect) : dialect_(dialect) {}

        /// Updates the mirror for editing keys; navigation/submit keys are the engine's.
        void apply(const Key& key);

        const EditBuffer& buffer() const { return buffer_; }
        bool reliable() const { return reliable_; }
        bool in_paste() const { return in_paste_; }

        /// Adopts a buffer known to match the shell (after injection or recovery).
        void set(EditBuffer buffer) {
            buffer_ = std::move(buffer);
            reliable_ = true;
        }

        void clear() { set(EditBuffer()); }

    private:
        DialectProfile dialect_;
        EditBuffer buffer_;
        bool reliable_ = true;
        bool in_paste_ = false;

        void insert(std::string_view text);
        void erase_before();
        void erase_at();
    };

}
