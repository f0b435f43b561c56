/**
 * @file protocol.cpp
 * @brief Encoding of navigation requests and decoding of backend replies.
 */

#include "core/protocol.hpp"

namespace vellumsh::core::protocol {

    namespace {
        /** @brief Drops one trailing line terminator ("\n" or "\r\n"). */
        std::string_view chomp(std::string_view s) {
            if (!s.empty() && s.back() == '\n') s.remove_suffix(1);
            if (!s.empty() && s.back() == '\r') s.remove_suffix(1);
            return s;
        }
    }

    std::vector<std::string> encode(const NavigationRequest& request) {
        std::vector<std::string> args = {"move", "--with-id", "--session"};
        if (request.cursor.empty() && request.prefix) {
            args.push_back("--prefix=" + *request.prefix);
        }
        args.insert(args.end(), request.extra_args.begin(), request.extra_args.end());
        args.push_back("--");
        args.push_back(std::to_string(request.direction));
        args.push_back(request.cursor);
        return args;
    }

    NavigationReply decode(std::string_view raw) {
        std::string_view line = chomp(raw);
        size_t pos = line.find(kReplyDelimiter);
        if (pos == std::string_view::npos) {
            return MalformedReply{std::string(raw)};
        }
        return NavigationResponse{
            std::string(line.substr(0, pos)),
            std::string(line.substr(pos + 1))
        };
    }

    std::optional<SearchSelection> decode_selection(std::string_view raw) {
        // --read0 records end with NUL when the selector echoes them back
        std::string_view line = raw;
        while (!line.empty() && line.back() == '\0') line.remove_suffix(1);
        line = chomp(line);
        if (line.empty()) return std::nullopt;

        size_t pos = line.find(kSelectionDelimiter);
        if (pos == std::string_view::npos) {
            return SearchSelection{"", std::string(line)};
        }
        return SearchSelection{
            std::string(line.substr(0, pos)),
            std::string(line.substr(pos + 1))
        };
    }

}
