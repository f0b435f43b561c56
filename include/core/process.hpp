/**
 * @file process.hpp
 * @brief Blocking subprocess execution with captured stdout.
 *
 * Every external call made by vellumsh (backend and selector) goes through
 * run_process(). It never throws: a program that cannot be started is
 * reported as `launched == false` with exit code 127.
 */

#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>

namespace vellumsh::core {

    /**
     * @class UniqueFd
     * @brief Owning wrapper around a file descriptor.
     */
    class UniqueFd {
    public:
        UniqueFd() = default;
        explicit UniqueFd(int fd) : fd_(fd) {}
        ~UniqueFd() { reset(); }

        UniqueFd(const UniqueFd&) = delete;
        UniqueFd& operator=(const UniqueFd&) = delete;

        UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
        UniqueFd& operator=(UniqueFd&& other) noexcept {
            if (this != &other) {
                reset();
                fd_ = other.fd_;
                other.fd_ = -1;
            }
            return *this;
        }

        int get() const { return fd_; }
        explicit operator bool() const { return fd_ >= 0; }

        void reset(int new_fd = -1) {
            if (fd_ >= 0) ::close(fd_);
            fd_ = new_fd;
        }

    private:
        int fd_ = -1;
    };

    struct ProcessSpec {
        std::vector<std::string> argv;
        /// Environment edits applied in the child; nullopt unsets the variable.
        std::vector<std::pair<std::string, std::optional<std::string>>> env;
        /// Data written to the child's stdin. Without it stdin is /dev/null.
        std::optional<std::string> input;
    };

    struct ProcessResult {
        bool launched = false;
        int exit_code = 127;   ///< 128+N when killed by signal N
        std::string out;

        bool ok() const { return launched && exit_code == 0; }
    };

    ProcessResult run_process(const ProcessSpec& spec);

    /// Resolves a program name against $PATH (names containing '/' are checked directly).
    std::optional<std::string> find_executable(const std::string& name);

}
