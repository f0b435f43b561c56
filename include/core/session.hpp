/**
 * @file session.hpp
 * @brief The pseudoterminal the wrapped shell runs in.
 */

#pragma once
#include <string>
#include <string_view>
#include <sys/types.h>
#include <termios.h>

namespace vellumsh::core {

    class PTYSession {
    public:
        PTYSession() = default;
        ~PTYSession();

        PTYSession(const PTYSession&) = delete;
        PTYSession& operator=(const PTYSession&) = delete;

        /**
         * @brief Forks `shell` on a new PTY sized like the controlling terminal.
         * @return false if forkpty failed; an error line has been printed.
         */
        bool start(const std::string& shell);

        /// Closes the master side; the shell gets SIGHUP.
        void stop();

        /// Reaps the shell. @return its exit status, 128+signal when killed.
        int wait();

        void resize(unsigned short rows, unsigned short cols);

        /// True when the shell itself owns the PTY foreground (no job is running).
        bool is_shell_idle() const;

        /// Writes all of `data` to the shell. @return false on a closed PTY.
        bool write(std::string_view data) const;

        int get_master_fd() const { return master_fd_; }
        pid_t get_child_pid() const { return child_pid_; }

        /// Puts the real terminal into raw mode. @return false when stdin is not a terminal.
        bool enter_raw_mode();
        /// Restores the mode saved by enter_raw_mode().
        void restore_terminal();

    private:
        int master_fd_ = -1;
        pid_t child_pid_ = -1;
        struct termios orig_termios_{};
        bool raw_ = false;
    };

}
