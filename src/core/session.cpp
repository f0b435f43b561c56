/**
 * @file session.cpp
 * @brief PTY lifecycle and terminal mode handling.
 */

#include "core/session.hpp"
#include "core/theme.hpp"
#include <cerrno>
#include <cstring>
#include <pty.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace vellumsh::core {

    PTYSession::~PTYSession() {
        restore_terminal();
        stop();
    }

    bool PTYSession::start(const std::string& shell) {
        struct winsize ws{};
        bool have_size = ioctl(STDIN_FILENO, TIOCGWINSZ, &ws) == 0;

        pid_t pid = forkpty(&master_fd_, nullptr, nullptr, have_size ? &ws : nullptr);
        if (pid < 0) {
            print_status(std::cerr, Theme::ERROR, std::string("forkpty failed: ") + std::strerror(errno));
            master_fd_ = -1;
            return false;
        }

        if (pid == 0) {
            execlp(shell.c_str(), shell.c_str(), static_cast<char*>(nullptr));
            _exit(127);
        }

        child_pid_ = pid;
        return true;
    }

    void PTYSession::stop() {
        if (master_fd_ >= 0) {
            close(master_fd_);
            master_fd_ = -1;
        }
    }

    int PTYSession::wait() {
        if (child_pid_ <= 0) return 0;
        int status = 0;
        while (waitpid(child_pid_, &status, 0) < 0) {
            if (errno != EINTR) return 1;
        }
        child_pid_ = -1;
        if (WIFEXITED(status)) return WEXITSTATUS(status);
        if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
        return 1;
    }

    void PTYSession::resize(unsigned short rows, unsigned short cols) {
        if (master_fd_ < 0) return;
        struct winsize ws{};
        ws.ws_row = rows;
        ws.ws_col = cols;
        ioctl(master_fd_, TIOCSWINSZ, &ws);
    }

    bool PTYSession::is_shell_idle() const {
        if (master_fd_ < 0) return false;
        return tcgetpgrp(master_fd_) == child_pid_;
    }

    bool PTYSession::write(std::string_view data) const {
        while (!data.empty()) {
            ssize_t n = ::write(master_fd_, data.data(), data.size());
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            data.remove_prefix(static_cast<size_t>(n));
        }
        return true;
    }

    bool PTYSession::enter_raw_mode() {
        if (!raw_) {
            if (tcgetattr(STDIN_FILENO, &orig_termios_) != 0) return false;
        }
        struct termios raw = orig_termios_;
        cfmakeraw(&raw);
        if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) != 0) return false;
        raw_ = true;
        return true;
    }

    void PTYSession::restore_terminal() {
        if (!raw_) return;
        tcsetattr(STDIN_FILENO, TCSADRAIN, &orig_termios_);
        raw_ = false;
    }

}
