/**
 * @file protocol.hpp
 * @brief Wire format exchanged with the `vellum` backing process.
 *
 * Navigation replies are single lines of the form `<id>|<line>` and are
 * split on the first delimiter only, since the command text may contain
 * `|` itself. Selector records use a tab instead: `<id>\t<line>`.
 */

#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace vellumsh::core::protocol {

    constexpr char kReplyDelimiter = '|';
    constexpr char kSelectionDelimiter = '\t';

    /**
     * @brief One `vellum move` call.
     * @note `prefix` is only meaningful when `cursor` is empty (start of a sequence).
     */
    struct NavigationRequest {
        int direction = -1;                 ///< -1 older, +1 newer
        std::string session;
        std::string cursor;                 ///< entry id, empty when idle
        std::optional<std::string> prefix;
        std::vector<std::string> extra_args;
    };

    struct NavigationResponse {
        std::string entry_id;               ///< may be empty: "no identifiable entry"
        std::string line;
    };

    struct MalformedReply {
        std::string raw;
    };

    using NavigationReply = std::variant<NavigationResponse, MalformedReply>;

    struct SearchSelection {
        std::string entry_id;
        std::string line;
    };

    /**
     * @brief Builds the argument vector for `vellum move`.
     *
     * Layout: `move --with-id --session [--prefix=<text>] [extra...] -- <dir> <cursor>`.
     * The cursor positional is always emitted, even when empty. The session
     * token travels in the environment, not on the command line.
     */
    std::vector<std::string> encode(const NavigationRequest& request);

    /// Parses a `move --with-id` reply. A trailing newline is ignored.
    NavigationReply decode(std::string_view raw);

    /// Parses the record printed by the selector; nullopt when nothing was selected.
    std::optional<SearchSelection> decode_selection(std::string_view raw);

    inline bool is_malformed(const NavigationReply& reply) {
        return std::holds_alternative<MalformedReply>(reply);
    }

}
