/**
 * @file test_search.cpp
 * @brief Unit tests for Ctrl-R: listing, selection and the fzf option string.
 */

#include "test_harness.hpp"
#include "fakes.hpp"
#include "core/search.hpp"
#include "core/selector.hpp"

using namespace vellumsh::core;
using vellumsh::test::FakeBackend;
using vellumsh::test::FakeSelector;

// ============================================================================
// Selection
// ============================================================================

TEST(test_selection_replaces_buffer) {
    SessionContext ctx;
    ctx.cursor = "31";
    FakeBackend backend;
    backend.history_out = std::string("1\tls\0" "2\tgit push\0", 16);
    FakeSelector selector;
    selector.result = {0, "2\tgit push\n"};

    SearchBridge bridge(ctx, backend, selector, {});
    EditBuffer buffer("git");
    int status = bridge.search(buffer);

    ASSERT_EQ(status, 0, "selector status returned");
    ASSERT_EQ(buffer.text, std::string("git push"), "buffer replaced");
    ASSERT_EQ(buffer.point, buffer.text.size(), "point at end");
    ASSERT_EQ(ctx.last_selected_id, std::string("2"), "selected id remembered");
    ASSERT_TRUE(ctx.cursor.empty(), "cursor back to idle");
    ASSERT_EQ(selector.last_query, std::string("git"), "buffer used as query");
    ASSERT_EQ(selector.last_records.size(), 16u, "records passed through untouched");
    PASS("Selection replaces the buffer and resets the cursor");
}

TEST(test_cancel_leaves_everything) {
    SessionContext ctx;
    ctx.cursor = "31";
    FakeBackend backend;
    backend.history_out = "1\tls";
    FakeSelector selector;
    selector.result = {130, ""};

    SearchBridge bridge(ctx, backend, selector, {});
    EditBuffer buffer("make", 2);
    int status = bridge.search(buffer);

    ASSERT_EQ(status, 130, "non-zero status returned");
    ASSERT_EQ(buffer.text, std::string("make"), "buffer kept");
    ASSERT_EQ(buffer.point, 2u, "point kept");
    ASSERT_EQ(ctx.cursor, std::string("31"), "cursor kept");
    ASSERT_TRUE(ctx.last_selected_id.empty(), "no selection recorded");
    PASS("Cancel leaves buffer and cursor untouched");
}

TEST(test_history_failure_skips_selector) {
    SessionContext ctx;
    FakeBackend backend;  // history_out unset: listing fails
    FakeSelector selector;
    SearchBridge bridge(ctx, backend, selector, {});
    EditBuffer buffer("x");

    ASSERT_TRUE(bridge.search(buffer) != 0, "failure status");
    ASSERT_EQ(selector.calls, 0, "selector not started");
    ASSERT_EQ(buffer.text, std::string("x"), "buffer kept");
    PASS("Failed listing never opens the selector");
}

// ============================================================================
// Listing arguments
// ============================================================================

TEST(test_listing_args) {
    SessionContext ctx;
    FakeBackend backend;
    FakeSelector selector;

    SearchBridge all(ctx, backend, selector, {"--limit", "500"});
    ASSERT_EQ(vellumsh::test::join(all.listing_args()), std::string("--limit 500"), "global listing");

    SearchBridge session(ctx, backend, selector, {"--limit", "500"}, true);
    ASSERT_EQ(vellumsh::test::join(session.listing_args()), std::string("--session --limit 500"), "session listing");

    backend.history_out = "1\tls";
    EditBuffer buffer;
    session.search(buffer);
    ASSERT_EQ(backend.history_requests.size(), 1u, "one listing");
    ASSERT_EQ(vellumsh::test::join(backend.history_requests[0]), std::string("--session --limit 500"), "args reach the backend");
    PASS("Listing arguments honour session-only mode");
}

// ============================================================================
// fzf options
// ============================================================================

TEST(test_build_options_defaults) {
    std::string opts = ProcessSelector::build_options("", "", "");
    ASSERT_TRUE(opts.rfind("--height 40% --bind=ctrl-z:ignore", 0) == 0, "default height first");
    ASSERT_TRUE(opts.find("--scheme=history") != std::string::npos, "history scheme");
    ASSERT_TRUE(opts.find("--bind=ctrl-r:toggle-sort") != std::string::npos, "ctrl-r toggles sort");
    ASSERT_TRUE(opts.size() >= 11 && opts.compare(opts.size() - 11, 11, " +m --read0") == 0, "ends with +m --read0");
    PASS("Default option string");
}

TEST(test_build_options_user_layers) {
    std::string opts = ProcessSelector::build_options("60%", "--layout=reverse", "--exact");
    ASSERT_TRUE(opts.rfind("--height 60%", 0) == 0, "height honoured");
    size_t def = opts.find("--layout=reverse");
    size_t scheme = opts.find("--scheme=history");
    size_t user = opts.find("--exact");
    ASSERT_TRUE(def != std::string::npos && user != std::string::npos, "both layers present");
    ASSERT_TRUE(def < scheme && scheme < user, "defaults, then ours, then the user's");
    PASS("FZF_DEFAULT_OPTS before and FZF_CTRL_R_OPTS after the built-in options");
}

int main() {
    print_banner("vellumsh Search Unit Tests");

    std::cout << "\n[Selection]" << std::endl;
    test_selection_replaces_buffer();
    test_cancel_leaves_everything();
    test_history_failure_skips_selector();

    std::cout << "\n[Listing]" << std::endl;
    test_listing_args();

    std::cout << "\n[Selector Options]" << std::endl;
    test_build_options_defaults();
    test_build_options_user_layers();

    return print_results();
}
