/**
 * @file engine.cpp
 * @brief Core implementation of the vellumsh runtime engine.
 * * This file contains the main logic for:
 * 1. Managing the Pseudoterminal (PTY) session.
 * 2. Bi-directional I/O forwarding (User <-> Shell).
 * 3. Detecting prompts and submitted commands to drive the history hooks.
 * 4. Intercepting Up/Down and Ctrl-R at the prompt.
 */

#include "core/engine.hpp"
#include "core/backend.hpp"
#include "core/config_loader.hpp"
#include "core/line_recovery.hpp"
#include "core/selector.hpp"
#include "core/theme.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <iostream>
#include <poll.h>
#include <thread>
#include <unistd.h>

namespace vellumsh::core {

    constexpr size_t BUFFER_SIZE = 4096;
    constexpr size_t MAX_LINE_BYTES = 4096;
    constexpr int POLL_TIMEOUT_MS = 100;

    namespace {
        constexpr auto kLeftArrow = "\x1b[D";
        constexpr auto kRightArrow = "\x1b[C";

        size_t count_chars(const std::string& s, size_t from, size_t to) {
            size_t n = 0;
            for (size_t i = from; i < to && i < s.size(); ++i) {
                if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) n++;
            }
            return n;
        }

        void write_stdout(const char* data, size_t len) {
            while (len > 0) {
                ssize_t n = write(STDOUT_FILENO, data, len);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return;
                }
                data += n;
                len -= static_cast<size_t>(n);
            }
        }
    }

    Engine::Engine(std::string shell)
        : shell_(std::move(shell)), dialect_(detect_dialect(shell_)), tracker_(dialect_) {}

    // Ensure we kill the child shell if the engine is destroyed while running
    Engine::~Engine() { if (running_) kill(pty_.get_child_pid(), SIGTERM); }

    // ==================================================================================
    // CONFIGURATION & INITIALIZATION
    // ==================================================================================

    void Engine::load_configuration(const std::optional<std::filesystem::path>& dir) {
        if (dir) {
            if (ConfigLoader::load(config_, dir->string())) {
                print_status(std::cout, Theme::NOTICE, "Config loaded from " + dir->string());
            }
        }
        apply_env_overrides(config_, env_);
        debug_enabled() = config_.debug;
    }

    std::optional<std::string> Engine::missing_dependency() const {
        return find_missing_dependency({config_.backend, config_.selector});
    }

    bool Engine::initialize() {
        EnvEdits backend_env;
        if (!config_.editor.empty()) backend_env.emplace_back("VELLUM_EDITOR", config_.editor);
        backend_ = std::make_unique<ProcessBackend>(config_.backend, std::move(backend_env));

        auto env_or_empty = [this](const char* name) { return env_.get(name).value_or(""); };
        std::string options = ProcessSelector::build_options(
            env_or_empty("FZF_TMUX_HEIGHT"), env_or_empty("FZF_DEFAULT_OPTS"), config_.selector_opts);
        selector_ = std::make_unique<ProcessSelector>(config_.selector, options);

        Integration::Options opts;
        opts.move_args = config_.move_args;
        opts.history_args = config_.history_args;
        opts.search_session_only = config_.search_session_only;
        opts.split_at_point = dialect_.split_at_point;
        integration_ = std::make_unique<Integration>(env_, *backend_, *selector_, opts);

        if (!integration_->initialize()) return false;
        debug_log("session " + integration_->context().session.token + " (" + dialect_.name + ")");

        plugins_ = std::make_unique<PluginHost>(integration_->hooks());
        plugins_->load(config_.plugins_dir);
        return true;
    }

    void Engine::resize_window(unsigned short rows, unsigned short cols) {
        pty_.resize(rows, cols);
    }

    // ==================================================================================
    // MAIN LOOP
    // ==================================================================================

    int Engine::run() {
        if (!integration_ || !pty_.start(shell_)) return 1;

        if (!pty_.enter_raw_mode()) {
            print_status(std::cerr, Theme::ERROR, "Could not put the terminal into raw mode.");
            pty_.stop();
            return pty_.wait();
        }

        running_ = true;

        // Spawn the output reader thread (Child -> Screen)
        std::thread output_thread(&Engine::forward_shell_output, this);

        // Run the input processing loop (Keyboard -> Child) in the main thread
        process_user_input();

        // The output thread notices within one poll interval
        running_ = false;
        if (output_thread.joinable()) output_thread.join();
        pty_.restore_terminal();

        // Closing the master hangs up a shell that is still running
        pty_.stop();

        int status = pty_.wait();
        debug_log("shell exited with status " + std::to_string(status));
        return status;
    }

    // ==================================================================================
    // OUTPUT: shell -> screen
    // ==================================================================================

    /**
     * @brief Reads output from the shell (PTY master) and writes it to stdout,
     * keeping just enough terminal state to know when a prompt is showing.
     */
    void Engine::forward_shell_output() {
        std::array<char, BUFFER_SIZE> buffer;
        struct pollfd pfd{};
        pfd.fd = pty_.get_master_fd();
        pfd.events = POLLIN;

        while (running_) {
            int ret = poll(&pfd, 1, POLL_TIMEOUT_MS);

            if (ret < 0) {
                if (errno == EINTR) continue; // Resize signal received, just continue
                break;
            }
            if (ret == 0) continue;

            if (pfd.revents & POLLIN) {
                ssize_t bytes_read = read(pty_.get_master_fd(), buffer.data(), buffer.size());
                if (bytes_read <= 0) {
                    // PTY Closed (Shell Exited)
                    running_ = false;
                    break;
                }

                write_stdout(buffer.data(), static_cast<size_t>(bytes_read));
                track_output(std::string(buffer.data(), static_cast<size_t>(bytes_read)));
            } else if (pfd.revents & (POLLERR | POLLHUP)) {
                running_ = false;
                break;
            }
        }
    }

    void Engine::track_output(const std::string& chunk) {
        // --- ALT SCREEN DETECTION ---
        // Keys are never intercepted inside vim/less/htop.
        if (chunk.find("\x1b[?1049h") != std::string::npos || chunk.find("\x1b[?47h") != std::string::npos) {
            in_alt_screen_ = true;
        }
        if (chunk.find("\x1b[?1049l") != std::string::npos || chunk.find("\x1b[?47l") != std::string::npos) {
            in_alt_screen_ = false;
        }

        // --- BRACKETED PASTE MODE OF THE SHELL ---
        size_t on = chunk.rfind("\x1b[?2004h");
        size_t off = chunk.rfind("\x1b[?2004l");
        if (on != std::string::npos && (off == std::string::npos || on > off)) shell_paste_mode_ = true;
        else if (off != std::string::npos) shell_paste_mode_ = false;

        TerminalLine line;
        {
            std::lock_guard<std::mutex> lock(line_mutex_);
            size_t nl = chunk.rfind('\n');
            if (nl == std::string::npos) current_line_ += chunk;
            else current_line_ = chunk.substr(nl + 1);
            if (current_line_.size() > MAX_LINE_BYTES) {
                current_line_.erase(0, current_line_.size() - MAX_LINE_BYTES);
            }
            line = simulate_line(current_line_);
        }

        // --- PROMPT DETECTION ---
        // Only while a prompt is expected, and only when the shell itself owns
        // the terminal: program output that happens to end in "$ " is not a prompt.
        if (!awaiting_prompt_ || in_alt_screen_ || !pty_.is_shell_idle()) return;

        PromptKind kind = classify_prompt(line, config_.shell_prompts, config_.continuation_prompts);
        if (kind == PromptKind::None) return;
        awaiting_prompt_ = false;
        prompt_event_ = static_cast<int>(kind);
    }

    // ==================================================================================
    // INPUT: keyboard -> shell
    // ==================================================================================

    void Engine::process_user_input() {
        std::array<char, BUFFER_SIZE> buffer;
        struct pollfd pfd{};
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;

        while (running_) {
            sync_shell_state();

            int ret = poll(&pfd, 1, POLL_TIMEOUT_MS);
            if (ret < 0) {
                if (errno == EINTR) continue; // Signal interrupted, keep going
                break;
            }

            if (ret == 0) {
                // a lone ESC (or a truncated sequence) is released after a pause
                for (const auto& key : decoder_.flush()) handle_key(key);
                continue;
            }

            if (pfd.revents & POLLIN) {
                ssize_t n = read(STDIN_FILENO, buffer.data(), buffer.size());
                if (n <= 0) break;
                std::string_view data(buffer.data(), static_cast<size_t>(n));

                sync_shell_state();
                if (!at_prompt()) {
                    // --- PASS-THROUGH MODE ---
                    for (const auto& key : decoder_.flush()) pty_.write(key.bytes);
                    pty_.write(data);
                    continue;
                }

                for (const auto& key : decoder_.feed(data)) handle_key(key);
            } else if (pfd.revents & (POLLERR | POLLHUP)) {
                break;
            }
        }
    }

    /**
     * @brief Turns the output thread's observations into lifecycle events.
     *
     * A submitted command is captured as soon as the shell hands the terminal
     * to a foreground job, or at the next primary prompt if the command never
     * left the shell (builtins, syntax errors). PreCmd follows at every
     * primary prompt.
     */
    void Engine::sync_shell_state() {
        if (state_ == ShellState::RUNNING && !pending_command_.empty() && !pty_.is_shell_idle()) {
            integration_->command_submitted(pending_command_);
            pending_command_.clear();
        }

        auto kind = static_cast<PromptKind>(prompt_event_.exchange(0));
        if (kind == PromptKind::Primary) {
            if (!pending_command_.empty()) {
                integration_->command_submitted(pending_command_);
                pending_command_.clear();
            }
            integration_->prompt_shown();
            tracker_.clear();
            state_ = ShellState::AT_PROMPT;
        } else if (kind == PromptKind::Continuation) {
            if (state_ == ShellState::STARTING) {
                awaiting_prompt_ = true;
                return;
            }
            tracker_.clear();
            state_ = ShellState::AT_CONTINUATION;
        }
    }

    bool Engine::at_prompt() const {
        return (state_ == ShellState::AT_PROMPT || state_ == ShellState::AT_CONTINUATION) && !in_alt_screen_;
    }

    void Engine::await_prompt() {
        tracker_.clear();
        state_ = ShellState::RUNNING;
        awaiting_prompt_ = true;
    }

    void Engine::handle_key(const Key& key) {
        if (!at_prompt()) {
            pty_.write(key.bytes);
            return;
        }

        bool primary = state_ == ShellState::AT_PROMPT && !tracker_.in_paste() && pty_.is_shell_idle();

        switch (key.kind) {
            case KeyKind::Enter:
                if (tracker_.in_paste()) break;
                submit_line();
                pty_.write(key.bytes);
                return;
            case KeyKind::Interrupt:
                // the shell drops the line, and a continued command with it
                pending_command_.clear();
                await_prompt();
                pty_.write(key.bytes);
                return;
            case KeyKind::Up:
                if (primary) { navigate(Direction::Previous, key); return; }
                break;
            case KeyKind::Down:
                if (primary) { navigate(Direction::Next, key); return; }
                break;
            case KeyKind::Search:
                if (primary) { search(key); return; }
                break;
            default:
                break;
        }

        tracker_.apply(key);
        pty_.write(key.bytes);
    }

    void Engine::submit_line() {
        std::string line;
        if (auto buffer = current_buffer()) line = buffer->text;

        if (state_ == ShellState::AT_CONTINUATION && !pending_command_.empty()) {
            pending_command_ += "\n" + line;
        } else {
            pending_command_ = line;
        }
        await_prompt();
    }

    void Engine::navigate(Direction direction, const Key& key) {
        auto current = current_buffer();
        if (!current) {
            // the line cannot be read back; let the shell handle the key
            tracker_.apply(key);
            pty_.write(key.bytes);
            return;
        }

        EditBuffer buffer = *current;
        switch (integration_->navigate(direction, buffer)) {
            case NavigationOutcome::Applied:
                replace_line(*current, buffer);
                break;
            case NavigationOutcome::Bypassed: {
                std::string keys;
                if (buffer.point < current->point) {
                    size_t n = count_chars(buffer.text, buffer.point, current->point);
                    for (size_t i = 0; i < n; ++i) keys += kLeftArrow;
                } else {
                    size_t n = count_chars(buffer.text, current->point, buffer.point);
                    for (size_t i = 0; i < n; ++i) keys += kRightArrow;
                }
                pty_.write(keys);
                tracker_.set(buffer);
                break;
            }
            case NavigationOutcome::Unchanged:
                break;
        }
    }

    void Engine::search(const Key& key) {
        auto current = current_buffer();
        if (!current) {
            tracker_.apply(key);
            pty_.write(key.bytes);
            return;
        }

        EditBuffer buffer = *current;
        pty_.restore_terminal();
        int status = integration_->search(buffer);
        if (!pty_.enter_raw_mode()) {
            print_status(std::cerr, Theme::ERROR, "Could not restore raw mode after search.", "\r\n");
        }
        debug_log("search exited with status " + std::to_string(status));

        if (status == 0 && !(buffer == *current)) replace_line(*current, buffer);
    }

    std::optional<EditBuffer> Engine::current_buffer() {
        if (tracker_.reliable()) return tracker_.buffer();

        std::string raw;
        {
            std::lock_guard<std::mutex> lock(line_mutex_);
            raw = current_line_;
        }
        auto recovered = recover_buffer(simulate_line(raw), config_.shell_prompts);
        if (recovered) {
            debug_log("recovered line '" + recovered->text + "'");
            tracker_.set(*recovered);
        }
        return recovered;
    }

    void Engine::replace_line(const EditBuffer& old_buffer, const EditBuffer& new_buffer) {
        std::string keys = clear_sequence(dialect_, old_buffer.text, old_buffer.point);
        keys += type_sequence(dialect_, new_buffer.text, shell_paste_mode_);
        pty_.write(keys);
        tracker_.set(EditBuffer(new_buffer.text));
    }

}
