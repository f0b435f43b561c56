#include "core/config.hpp"
#include "core/context.hpp"
#include "core/engine.hpp"
#include "core/environment.hpp"
#include "core/theme.hpp"
#include <cerrno>
#include <csignal>      // signal()
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <sys/ioctl.h>  // ioctl()
#include <unistd.h>     // isatty(), execlp()

namespace fs = std::filesystem;

// Global pointer to allow signal handler to access the engine instance
static vellumsh::core::Engine* global_engine = nullptr;

/**
 * @brief Handles the Window Resize signal (SIGWINCH).
 * Updates the PTY size to match the new terminal window size.
 */
void handle_winch(int /*sig*/) {
    if (global_engine) {
        struct winsize w;
        if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) != -1) {
            global_engine->resize_window(w.ws_row, w.ws_col);
        }
    }
}

/**
 * @brief Replaces this process with the plain shell.
 * @return Only on failure, with the exit status to use.
 */
static int exec_plain_shell(const std::string& shell) {
    execlp(shell.c_str(), shell.c_str(), static_cast<char*>(nullptr));
    std::cerr << "vellumsh: cannot exec " << shell << ": " << std::strerror(errno) << "\n";
    return 127;
}

int main() {
    vellumsh::core::ProcessEnvironment env;
    std::string shell = env.get("SHELL").value_or("/bin/sh");
    if (shell.empty()) shell = "/bin/sh";

    // Not interactive, or already inside an integrated shell: stay out of the way
    if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO) || env.has(vellumsh::core::kSentinelVar)) {
        return exec_plain_shell(shell);
    }

    // Get the baked-in absolute path to the project root
#ifdef VELLUMSH_ROOT
    fs::path project_root = VELLUMSH_ROOT;
#else
    fs::path project_root = fs::current_path();
#endif

    vellumsh::core::Engine engine(shell);
    engine.load_configuration(vellumsh::core::find_config_dir(env, project_root));

    if (auto missing = engine.missing_dependency()) {
        vellumsh::core::print_status(std::cerr, vellumsh::core::Theme::WARNING,
                                     "vellumsh: '" + *missing + "' not found on PATH, starting " + shell + " without history integration.");
        return exec_plain_shell(shell);
    }

    if (!engine.initialize()) return exec_plain_shell(shell);

    global_engine = &engine;
    signal(SIGWINCH, handle_winch);

    int status = engine.run();
    global_engine = nullptr;
    return status;
}
