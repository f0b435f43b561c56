/**
 * @file cursor.cpp
 * @brief Implementation of the navigation state machine.
 */

#include "core/cursor.hpp"
#include "core/protocol.hpp"
#include "core/theme.hpp"
#include <algorithm>
#include <variant>

namespace vellumsh::core {

    CursorStateMachine::CursorStateMachine(SessionContext& ctx, Backend& backend,
                                           std::vector<std::string> move_args, bool split_at_point)
        : ctx_(ctx), backend_(backend), move_args_(std::move(move_args)), split_at_point_(split_at_point) {}

    bool CursorStateMachine::should_bypass(Direction direction, const EditBuffer& buffer) const {
        if (!split_at_point_) {
            return buffer.text.find('\n') != std::string::npos;
        }
        const std::string side = direction == Direction::Previous ? buffer.left() : buffer.right();
        return side.find('\n') != std::string::npos;
    }

    void CursorStateMachine::move_within(Direction direction, EditBuffer& buffer) {
        const std::string& text = buffer.text;
        size_t line_start = buffer.point == 0 ? std::string::npos : text.rfind('\n', buffer.point - 1);
        line_start = (line_start == std::string::npos) ? 0 : line_start + 1;
        size_t column = buffer.point - line_start;

        if (direction == Direction::Previous) {
            if (line_start == 0) return;
            size_t prev_end = line_start - 1;
            size_t prev_start = prev_end == 0 ? std::string::npos : text.rfind('\n', prev_end - 1);
            prev_start = (prev_start == std::string::npos) ? 0 : prev_start + 1;
            buffer.point = prev_start + std::min(column, prev_end - prev_start);
        } else {
            size_t line_end = text.find('\n', buffer.point);
            if (line_end == std::string::npos) return;
            size_t next_start = line_end + 1;
            size_t next_end = text.find('\n', next_start);
            if (next_end == std::string::npos) next_end = text.size();
            buffer.point = next_start + std::min(column, next_end - next_start);
        }
    }

    NavigationOutcome CursorStateMachine::navigate(Direction direction, EditBuffer& buffer) {
        if (should_bypass(direction, buffer)) {
            move_within(direction, buffer);
            return NavigationOutcome::Bypassed;
        }

        protocol::NavigationRequest request;
        request.direction = static_cast<int>(direction);
        request.session = ctx_.session.token;
        request.cursor = ctx_.cursor;
        if (ctx_.cursor.empty()) {
            request.prefix = buffer.text;
        }
        request.extra_args = move_args_;

        auto raw = backend_.move(ctx_.session, request);
        if (!raw) return NavigationOutcome::Unchanged;

        auto reply = protocol::decode(*raw);
        if (auto* malformed = std::get_if<protocol::MalformedReply>(&reply)) {
            debug_log("move: malformed reply '" + malformed->raw + "'");
            return NavigationOutcome::Unchanged;
        }

        auto& response = std::get<protocol::NavigationResponse>(reply);
        ctx_.cursor = response.entry_id;
        buffer.replace(std::move(response.line));
        return NavigationOutcome::Applied;
    }

}
