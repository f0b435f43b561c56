/**
 * @file test_cursor.cpp
 * @brief Unit tests for the Up/Down navigation state machine.
 */

#include "test_harness.hpp"
#include "fakes.hpp"
#include "core/cursor.hpp"

using namespace vellumsh::core;
using vellumsh::test::FakeBackend;

namespace {
    const std::string kIdlePrefix = "move --with-id --session --prefix=git co -- -1 ";
}

// ============================================================================
// Request sequence
// ============================================================================

TEST(test_prefix_sequence_round_trip) {
    SessionContext ctx;
    ctx.session.token = "sess-1";
    FakeBackend backend;
    backend.move_replies[kIdlePrefix] = "10|git commit";
    backend.move_replies["move --with-id --session -- -1 10"] = "7|git checkout main";
    backend.move_replies["move --with-id --session -- 1 7"] = "10|git commit";

    CursorStateMachine cursor(ctx, backend, {});
    EditBuffer buffer("git co");

    ASSERT_TRUE(cursor.navigate(Direction::Previous, buffer) == NavigationOutcome::Applied, "first up");
    ASSERT_EQ(buffer.text, std::string("git commit"), "first up buffer");
    ASSERT_TRUE(cursor.state() == CursorStateMachine::State::Navigating, "navigating after first up");

    ASSERT_TRUE(cursor.navigate(Direction::Previous, buffer) == NavigationOutcome::Applied, "second up");
    ASSERT_EQ(buffer.text, std::string("git checkout main"), "second up buffer");

    ASSERT_TRUE(cursor.navigate(Direction::Next, buffer) == NavigationOutcome::Applied, "down");
    ASSERT_EQ(buffer.text, std::string("git commit"), "down buffer");
    ASSERT_EQ(cursor.cursor(), std::string("10"), "cursor id");
    ASSERT_EQ(buffer.point, buffer.text.size(), "point at end");

    ASSERT_EQ(backend.move_requests.size(), 3u, "three requests");
    ASSERT_EQ(backend.move_requests[0], kIdlePrefix, "only the first request is prefixed");
    ASSERT_EQ(backend.sessions_seen[0], std::string("sess-1"), "session passed to backend");
    PASS("Up, up, down walks the history by id");
}

TEST(test_move_args_forwarded) {
    SessionContext ctx;
    FakeBackend backend;
    CursorStateMachine cursor(ctx, backend, {"--no-duplicates"});
    EditBuffer buffer("");
    cursor.navigate(Direction::Previous, buffer);

    ASSERT_EQ(backend.move_requests.size(), 1u, "one request");
    ASSERT_EQ(backend.move_requests[0],
              std::string("move --with-id --session --prefix= --no-duplicates -- -1 "), "layout");
    PASS("Extra move arguments reach the backend");
}

// ============================================================================
// Failure handling
// ============================================================================

TEST(test_malformed_reply_changes_nothing) {
    SessionContext ctx;
    ctx.cursor = "5";
    FakeBackend backend;
    backend.move_replies["move --with-id --session -- -1 5"] = "garbage without delimiter";

    CursorStateMachine cursor(ctx, backend, {});
    EditBuffer buffer("make", 2);
    ASSERT_TRUE(cursor.navigate(Direction::Previous, buffer) == NavigationOutcome::Unchanged, "unchanged");
    ASSERT_EQ(buffer.text, std::string("make"), "buffer kept");
    ASSERT_EQ(buffer.point, 2u, "point kept");
    ASSERT_EQ(ctx.cursor, std::string("5"), "cursor kept");
    PASS("Malformed reply leaves buffer and cursor alone");
}

TEST(test_backend_failure_changes_nothing) {
    SessionContext ctx;
    FakeBackend backend;  // no replies: every move fails
    CursorStateMachine cursor(ctx, backend, {});
    EditBuffer buffer("ls");
    ASSERT_TRUE(cursor.navigate(Direction::Previous, buffer) == NavigationOutcome::Unchanged, "unchanged");
    ASSERT_EQ(buffer.text, std::string("ls"), "buffer kept");
    ASSERT_TRUE(cursor.state() == CursorStateMachine::State::Idle, "still idle");
    PASS("Backend failure leaves the state machine idle");
}

TEST(test_empty_id_stays_idle) {
    SessionContext ctx;
    FakeBackend backend;
    backend.move_replies["move --with-id --session --prefix=x -- -1 "] = "|x --help";
    CursorStateMachine cursor(ctx, backend, {});
    EditBuffer buffer("x");
    ASSERT_TRUE(cursor.navigate(Direction::Previous, buffer) == NavigationOutcome::Applied, "applied");
    ASSERT_EQ(buffer.text, std::string("x --help"), "buffer replaced");
    ASSERT_TRUE(cursor.state() == CursorStateMachine::State::Idle, "empty id means idle");
    PASS("Reply without id is shown but keeps the machine idle");
}

// ============================================================================
// Reset
// ============================================================================

TEST(test_reset_from_any_state) {
    SessionContext ctx;
    FakeBackend backend;
    CursorStateMachine cursor(ctx, backend, {});

    cursor.reset();
    ASSERT_TRUE(cursor.state() == CursorStateMachine::State::Idle, "idle stays idle");

    ctx.cursor = "99";
    ASSERT_TRUE(cursor.state() == CursorStateMachine::State::Navigating, "navigating");
    cursor.reset();
    ASSERT_TRUE(cursor.state() == CursorStateMachine::State::Idle, "reset to idle");
    ASSERT_TRUE(ctx.cursor.empty(), "cursor cleared");
    PASS("Reset returns to idle");
}

// ============================================================================
// Multi-line bypass
// ============================================================================

TEST(test_multiline_bypass_split_at_point) {
    SessionContext ctx;
    FakeBackend backend;
    CursorStateMachine cursor(ctx, backend, {}, true);

    // point on the second line, column 3
    EditBuffer buffer("echo one\necho two", 12);
    ASSERT_TRUE(cursor.navigate(Direction::Previous, buffer) == NavigationOutcome::Bypassed, "up bypassed");
    ASSERT_EQ(buffer.point, 3u, "moved to the same column on line one");
    ASSERT_EQ(buffer.text, std::string("echo one\necho two"), "text untouched");

    // nothing below line two: down goes to history
    EditBuffer last("echo one\necho two", 12);
    cursor.navigate(Direction::Next, last);
    ASSERT_EQ(backend.move_requests.size(), 1u, "down at the last line asks the backend");
    PASS("Multi-line buffer: up moves within, down on the last line navigates");
}

TEST(test_multiline_bypass_whole_buffer) {
    SessionContext ctx;
    FakeBackend backend;
    CursorStateMachine cursor(ctx, backend, {}, false);

    EditBuffer buffer("a\nb");
    ASSERT_TRUE(cursor.navigate(Direction::Next, buffer) == NavigationOutcome::Bypassed, "down bypassed");
    ASSERT_TRUE(cursor.navigate(Direction::Previous, buffer) == NavigationOutcome::Bypassed, "up bypassed");
    ASSERT_EQ(backend.move_requests.size(), 0u, "no backend calls");
    PASS("Whole-buffer check bypasses both directions");
}

TEST(test_move_within_clamps_column) {
    EditBuffer buffer("a\nlonger line", 12);
    CursorStateMachine::move_within(Direction::Previous, buffer);
    ASSERT_EQ(buffer.point, 1u, "clamped to end of the short line");
    CursorStateMachine::move_within(Direction::Next, buffer);
    ASSERT_EQ(buffer.point, 3u, "column one on the long line");
    PASS("Column clamped to shorter lines");
}

int main() {
    print_banner("vellumsh Cursor Unit Tests");

    std::cout << "\n[Request Sequence]" << std::endl;
    test_prefix_sequence_round_trip();
    test_move_args_forwarded();

    std::cout << "\n[Failures]" << std::endl;
    test_malformed_reply_changes_nothing();
    test_backend_failure_changes_nothing();
    test_empty_id_stays_idle();

    std::cout << "\n[Reset]" << std::endl;
    test_reset_from_any_state();

    std::cout << "\n[Multi-line]" << std::endl;
    test_multiline_bypass_split_at_point();
    test_multiline_bypass_whole_buffer();
    test_move_within_clamps_column();

    return print_results();
}
