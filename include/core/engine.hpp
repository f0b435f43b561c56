/**
 * @file engine.hpp
 * @brief The PTY adapter: runs the user's shell and maps its events onto Integration.
 *
 * Two loops share the terminal. The output thread forwards shell output to
 * the screen and watches it for prompts, the alternate screen and bracketed
 * paste mode. The input loop (main thread) decodes the keyboard, keeps the
 * edit-line mirror and is the only caller of Integration, so hooks and
 * plugins never run concurrently.
 */

#pragma once

#include "core/config.hpp"
#include "core/dialect.hpp"
#include "core/environment.hpp"
#include "core/integration.hpp"
#include "core/line_tracker.hpp"
#include "core/plugins.hpp"
#include "core/session.hpp"
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <pybind11/embed.h>

namespace py = pybind11;

namespace vellumsh::core {

    class Engine {
    public:
        explicit Engine(std::string shell);
        ~Engine();

        /// Loads config.py from `dir` (when given) and applies the environment overrides.
        void load_configuration(const std::optional<std::filesystem::path>& dir);

        /// The first of BACKEND / SELECTOR missing from PATH.
        std::optional<std::string> missing_dependency() const;

        /**
         * @brief Establishes the session, registers hooks and loads plugins.
         * @return false when this environment is already integrated.
         */
        bool initialize();

        /// Runs the shell until it exits. @return the shell's exit status.
        int run();

        void resize_window(unsigned short rows, unsigned short cols);

        const Config& config() const { return config_; }

    private:
        enum class ShellState { STARTING, AT_PROMPT, AT_CONTINUATION, RUNNING };

        // python state; first member so it outlives every py::object below
        py::scoped_interpreter guard_{};

        std::string shell_;
        DialectProfile dialect_;
        Config config_;
        ProcessEnvironment env_;
        std::unique_ptr<Backend> backend_;
        std::unique_ptr<Selector> selector_;
        std::unique_ptr<Integration> integration_;
        std::unique_ptr<PluginHost> plugins_;
        PTYSession pty_;

        std::atomic<bool> running_{false};

        // --- written by the output thread ---
        std::atomic<bool> in_alt_screen_{false};
        std::atomic<bool> shell_paste_mode_{false};
        std::atomic<int> prompt_event_{0};      // a PromptKind, consumed by the input loop
        std::atomic<bool> awaiting_prompt_{true};
        std::mutex line_mutex_;
        std::string current_line_;              // raw bytes of the last output line

        // --- input loop only ---
        ShellState state_ = ShellState::STARTING;
        KeyDecoder decoder_;
        LineTracker tracker_;
        std::string pending_command_;

        // The background thread that reads from the shell -> screen
        void forward_shell_output();
        void track_output(const std::string& chunk);

        // The main loop that reads keyboard -> shell
        void process_user_input();
        void sync_shell_state();
        void handle_key(const Key& key);
        void submit_line();
        void navigate(Direction direction, const Key& key);
        void search(const Key& key);

        bool at_prompt() const;
        std::optional<EditBuffer> current_buffer();
        void replace_line(const EditBuffer& old_buffer, const EditBuffer& new_buffer);
        void await_prompt();
    };

}
