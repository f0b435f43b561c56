/**
 * @file search.hpp
 * @brief Ctrl-R: full-text search through the selector.
 */

#pragma once
#include "core/backend.hpp"
#include "core/context.hpp"
#include "core/selector.hpp"
#include <string>
#include <vector>

namespace vellumsh::core {

    class SearchBridge {
    public:
        /**
         * @param history_args Extra `history --fzf` arguments (VELLUM_HISTORY_ARGS).
         * @param session_only Restrict the listing to the current session.
         */
        SearchBridge(SessionContext& ctx, Backend& backend, Selector& selector,
                     std::vector<std::string> history_args, bool session_only = false);

        /**
         * @brief Runs the selector over the history and applies the pick.
         *
         * On a selection the buffer is replaced, the id is remembered in
         * SessionContext::last_selected_id and the cursor returns to Idle. When
         * nothing is selected (cancel, failure) buffer and state are untouched.
         *
         * @return The selector's exit status; non-zero with nothing applied on
         *         cancel, 1 when the history listing failed.
         */
        int search(EditBuffer& buffer);

        /// Arguments passed after `history --fzf`.
        std::vector<std::string> listing_args() const;

    private:
        SessionContext& ctx_;
        Backend& backend_;
        Selector& selector_;
        std::vector<std::string> history_args_;
        bool session_only_;
    };

}
