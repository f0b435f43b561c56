/**
 * @file test_process.cpp
 * @brief Tests for the subprocess helpers, against real /bin/sh children.
 */

#include "test_harness.hpp"
#include "core/backend.hpp"
#include "core/process.hpp"
#include "core/selector.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace vellumsh::core;

// ============================================================================
// run_process
// ============================================================================

TEST(test_capture_stdout) {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", "printf 'a|b\\n'"};
    ProcessResult r = run_process(spec);
    ASSERT_TRUE(r.ok(), "exit 0");
    ASSERT_EQ(r.out, std::string("a|b\n"), "stdout captured");
    PASS("Stdout captured");
}

TEST(test_stdin_fed) {
    ProcessSpec spec;
    spec.argv = {"cat"};
    spec.input = std::string("one\0two", 7);
    ProcessResult r = run_process(spec);
    ASSERT_TRUE(r.ok(), "exit 0");
    ASSERT_EQ(r.out.size(), 7u, "NUL-delimited input round-trips");
    PASS("Stdin fed to the child");
}

TEST(test_large_input_no_deadlock) {
    ProcessSpec spec;
    spec.argv = {"cat"};
    spec.input = std::string(1 << 20, 'x');
    ProcessResult r = run_process(spec);
    ASSERT_TRUE(r.ok(), "exit 0");
    ASSERT_EQ(r.out.size(), static_cast<size_t>(1 << 20), "all bytes back");
    PASS("Large input and output pumped together");
}

TEST(test_exit_status) {
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", "exit 3"};
    ProcessResult r = run_process(spec);
    ASSERT_TRUE(r.launched, "launched");
    ASSERT_FALSE(r.ok(), "not ok");
    ASSERT_EQ(r.exit_code, 3, "exit code");
    PASS("Exit status reported");
}

TEST(test_missing_program) {
    ProcessSpec spec;
    spec.argv = {"vellumsh-no-such-program"};
    ProcessResult r = run_process(spec);
    ASSERT_FALSE(r.launched, "not launched");
    ASSERT_EQ(r.exit_code, 127, "127 like a shell");
    PASS("Missing program reported as not launched");
}

TEST(test_env_edits) {
    setenv("VELLUMSH_TEST_UNSET_ME", "present", 1);
    ProcessSpec spec;
    spec.argv = {"/bin/sh", "-c", "printf '%s:%s' \"$VELLUM_SESSION\" \"${VELLUMSH_TEST_UNSET_ME-unset}\""};
    spec.env = {{"VELLUM_SESSION", std::string("tok")}, {"VELLUMSH_TEST_UNSET_ME", std::nullopt}};
    ProcessResult r = run_process(spec);
    ASSERT_EQ(r.out, std::string("tok:unset"), "set and unset in the child");

    auto parent = std::getenv("VELLUMSH_TEST_UNSET_ME");
    ASSERT_TRUE(parent != nullptr, "parent environment untouched");
    unsetenv("VELLUMSH_TEST_UNSET_ME");
    PASS("Environment edits apply to the child only");
}

TEST(test_find_executable) {
    ASSERT_TRUE(find_executable("sh").has_value(), "sh found");
    ASSERT_TRUE(find_executable("/bin/sh").has_value(), "absolute path accepted");
    ASSERT_FALSE(find_executable("vellumsh-no-such-program").has_value(), "unknown program");
    PASS("PATH lookup");
}

// ============================================================================
// ProcessBackend against a scripted stand-in
// ============================================================================

namespace {
    std::filesystem::path write_script(const std::string& name, const std::string& body) {
        auto path = std::filesystem::temp_directory_path() / (name + "-" + std::to_string(getpid()));
        std::ofstream script(path);
        script << "#!/bin/sh\n" << body;
        script.close();
        std::filesystem::permissions(path, std::filesystem::perms::owner_all);
        return path;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream in(path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    /// Writes an executable script that answers like the backing binary.
    /// `store` has no output, so it records what it saw in "<script>.log".
    std::filesystem::path write_fake_backend() {
        return write_script("vellumsh-fake-backend",
            "case \"$1\" in\n"
            "  init) [ \"$2\" = session ] && echo tok-123 || echo 1700000000 ;;\n"
            "  move) echo \"$VELLUM_SESSION|$*\" ;;\n"
            "  history) printf '1\\tls\\0' ;;\n"
            "  store) printf '%s|%s|%s|%s\\n' \"$VELLUM_SESSION\" \"$VELLUM_SESSION_START\" "
            "\"${VELLUM_EDITOR-unset}\" \"$*\" > \"$0.log\" ;;\n"
            "esac\n");
    }
}

TEST(test_process_backend) {
    auto path = write_fake_backend();
    ProcessBackend backend(path.string());

    ASSERT_EQ(backend.init_session().value_or(""), std::string("tok-123"), "session token");
    ASSERT_EQ(backend.init_timestamp().value_or(""), std::string("1700000000"), "timestamp");

    Session session{"tok-123", std::string("1700000000")};
    protocol::NavigationRequest req;
    req.prefix = "ls";
    auto reply = backend.move(session, req);
    ASSERT_TRUE(reply.has_value(), "move replied");
    ASSERT_EQ(*reply, std::string("tok-123|move --with-id --session --prefix=ls -- -1 "), "argv and session env");

    auto records = backend.history(session, {});
    ASSERT_EQ(records.value_or("").size(), 5u, "raw records kept");

    std::filesystem::remove(path);
    PASS("ProcessBackend argv and environment");
}

TEST(test_process_backend_store) {
    unsetenv("VELLUM_EDITOR");
    unsetenv("VELLUM_SESSION_START");
    auto path = write_fake_backend();
    auto log = std::filesystem::path(path.string() + ".log");

    ProcessBackend plain(path.string());
    plain.store(Session{"tok-9", std::string("1700000123")}, "git commit -m 'a b'");
    ASSERT_EQ(read_file(log), std::string("tok-9|1700000123|unset|store -- git commit -m 'a b'\n"),
              "store argv and session variables");

    ProcessBackend with_editor(path.string(), {{"VELLUM_EDITOR", std::string("nvim")}});
    with_editor.store(Session{"tok-9", std::nullopt}, "ls");
    ASSERT_EQ(read_file(log), std::string("tok-9||nvim|store -- ls\n"), "extra variables reach every call");

    std::filesystem::remove(log);
    std::filesystem::remove(path);
    PASS("ProcessBackend store argv and environment");
}

// ============================================================================
// ProcessSelector against a scripted stand-in
// ============================================================================

TEST(test_process_selector) {
    // prints its argv and option variables, then echoes the records it was fed
    auto path = write_script("vellumsh-fake-selector",
        "printf '%s|%s|%s|' \"$*\" \"$FZF_DEFAULT_OPTS\" \"${FZF_DEFAULT_OPTS_FILE-unset}\"\n"
        "cat\n");
    ProcessSelector selector(path.string(), "--height 40% +m --read0");

    std::string records("2\tmake\0" "1\tls\0", 12);
    SelectorResult r = selector.select(records, "ma");
    ASSERT_EQ(r.status, 0, "selection accepted");
    ASSERT_EQ(r.out, "--query ma|--height 40% +m --read0||" + records, "argv, options, empty options file and stdin");

    std::filesystem::remove(path);
    PASS("ProcessSelector argv, environment and records");
}

TEST(test_process_selector_cancelled) {
    auto path = write_script("vellumsh-fake-selector-cancel", "cat > /dev/null\nexit 130\n");
    ProcessSelector selector(path.string(), "+m --read0");

    SelectorResult r = selector.select(std::string("1\tls\0", 5), "");
    ASSERT_EQ(r.status, 130, "cancel status passed through");
    ASSERT_TRUE(r.out.empty(), "nothing selected");

    std::filesystem::remove(path);
    PASS("Cancelled selection reported");
}

int main() {
    print_banner("vellumsh Process Tests");

    std::cout << "\n[Subprocesses]" << std::endl;
    test_capture_stdout();
    test_stdin_fed();
    test_large_input_no_deadlock();
    test_exit_status();
    test_missing_program();
    test_env_edits();
    test_find_executable();

    std::cout << "\n[Backend]" << std::endl;
    test_process_backend();
    test_process_backend_store();

    std::cout << "\n[Selector]" << std::endl;
    test_process_selector();
    test_process_selector_cancelled();

    return print_results();
}
