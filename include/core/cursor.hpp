/**
 * @file cursor.hpp
 * @brief Arrow-key navigation through the remote history.
 *
 * States:
 *   Idle              cursor empty; the next request filters by the buffer text
 *   Navigating(id)    cursor holds the id on display; requests resume from it
 *
 * Any prompt resets to Idle, so every sequence starts from the newest entry
 * matching what was typed, and the list stays stable while scrolling.
 */

#pragma once
#include "core/backend.hpp"
#include "core/context.hpp"
#include <string>
#include <vector>

namespace vellumsh::core {

    enum class Direction : int {
        Previous = -1,  ///< older
        Next = 1        ///< newer
    };

    enum class NavigationOutcome {
        Applied,    ///< buffer replaced, cursor advanced
        Bypassed,   ///< multi-line buffer: point moved within the buffer, no request sent
        Unchanged   ///< backend failed or replied malformed; nothing touched
    };

    class CursorStateMachine {
    public:
        enum class State { Idle, Navigating };

        /**
         * @param move_args Extra `move` arguments (VELLUM_MOVE_ARGS).
         * @param split_at_point Whether multi-line detection looks only at the
         *        side of the buffer the key moves towards. Dialects whose line
         *        editor cannot report that check the whole buffer.
         */
        CursorStateMachine(SessionContext& ctx, Backend& backend,
                           std::vector<std::string> move_args, bool split_at_point = true);

        State state() const { return ctx_.cursor.empty() ? State::Idle : State::Navigating; }
        const std::string& cursor() const { return ctx_.cursor; }

        NavigationOutcome navigate(Direction direction, EditBuffer& buffer);

        /// Back to Idle, whatever the current id.
        void reset() { ctx_.cursor.clear(); }

        /// True when the key must move within the buffer instead of through history.
        bool should_bypass(Direction direction, const EditBuffer& buffer) const;

        /// Moves the point one line up or down, keeping the column where possible.
        static void move_within(Direction direction, EditBuffer& buffer);

    private:
        SessionContext& ctx_;
        Backend& backend_;
        std::vector<std::string> move_args_;
        bool split_at_point_;
    };

}
