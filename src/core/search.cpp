/**
 * @file search.cpp
 * @brief The Ctrl-R search widget.
 */

#include "core/search.hpp"
#include "core/protocol.hpp"
#include "core/theme.hpp"

namespace vellumsh::core {

    SearchBridge::SearchBridge(SessionContext& ctx, Backend& backend, Selector& selector,
                               std::vector<std::string> history_args, bool session_only)
        : ctx_(ctx), backend_(backend), selector_(selector),
          history_args_(std::move(history_args)), session_only_(session_only) {}

    std::vector<std::string> SearchBridge::listing_args() const {
        std::vector<std::string> args;
        if (session_only_) args.push_back("--session");
        args.insert(args.end(), history_args_.begin(), history_args_.end());
        return args;
    }

    int SearchBridge::search(EditBuffer& buffer) {
        auto records = backend_.history(ctx_.session, listing_args());
        if (!records) {
            debug_log("search: empty history listing");
            return 1;
        }

        SelectorResult result = selector_.select(*records, buffer.text);
        auto selection = protocol::decode_selection(result.out);
        if (!selection) {
            // cancelled or failed: the caller only redraws
            return result.status == 0 ? 1 : result.status;
        }

        ctx_.last_selected_id = selection->entry_id;
        ctx_.cursor.clear();
        buffer.replace(std::move(selection->line));
        return result.status;
    }

}
