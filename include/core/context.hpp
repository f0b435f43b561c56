/**
 * @file context.hpp
 * @brief Per-shell state shared by every hook and widget.
 *
 * One SessionContext exists per wrapped shell. It is created at start-up,
 * owned by the Integration facade and passed by reference to the components;
 * nothing in vellumsh keeps this state in globals.
 */

#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vellumsh::core {

    constexpr auto kSessionVar      = "VELLUM_SESSION";
    constexpr auto kSessionStartVar = "VELLUM_SESSION_START";
    constexpr auto kSentinelVar     = "__VELLUM_SETUP";

    struct Session {
        std::string token;
        std::optional<std::string> start;
    };

    /**
     * @brief Mirror of the line editor's buffer.
     * `point` is the byte offset of the editing cursor, clamped to text.size().
     */
    struct EditBuffer {
        std::string text;
        size_t point = 0;

        EditBuffer() = default;
        explicit EditBuffer(std::string t) : text(std::move(t)), point(text.size()) {}
        EditBuffer(std::string t, size_t p) : text(std::move(t)), point(p) {
            if (point > text.size()) point = text.size();
        }

        std::string left() const { return text.substr(0, point); }
        std::string right() const { return text.substr(point); }

        void replace(std::string t) {
            text = std::move(t);
            point = text.size();
        }

        bool operator==(const EditBuffer& other) const {
            return text == other.text && point == other.point;
        }
    };

    using EnvEdits = std::vector<std::pair<std::string, std::optional<std::string>>>;

    /// Variables every backend call must see.
    inline EnvEdits session_env(const Session& session) {
        EnvEdits env;
        if (session.token.empty()) env.emplace_back(kSessionVar, std::nullopt);
        else env.emplace_back(kSessionVar, session.token);
        if (session.start) env.emplace_back(kSessionStartVar, *session.start);
        return env;
    }

    struct SessionContext {
        Session session;
        std::string cursor;             ///< entry id on display; empty = idle
        std::string last_selected_id;   ///< id picked in the last search
    };

}
