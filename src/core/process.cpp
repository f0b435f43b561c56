/**
 * @file process.cpp
 * @brief fork/exec plumbing behind run_process().
 *
 * stdin and stdout are multiplexed with poll() so that a child producing a
 * lot of output while we are still feeding it input cannot deadlock us.
 * An extra close-on-exec pipe reports exec() failures back to the parent.
 */

#include "core/process.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>

extern char** environ;

namespace vellumsh::core {

    namespace {
        constexpr size_t kReadChunk = 4096;

        bool make_pipe(UniqueFd& read_end, UniqueFd& write_end) {
            int fds[2] = {-1, -1};
            if (pipe2(fds, O_CLOEXEC) != 0) return false;
            read_end.reset(fds[0]);
            write_end.reset(fds[1]);
            return true;
        }

        /** @brief argv/envp vectors prepared before fork(); the child only execs. */
        struct ExecImage {
            std::vector<std::string> env_storage;
            std::vector<char*> argv;
            std::vector<char*> envp;
        };

        ExecImage build_image(const ProcessSpec& spec) {
            ExecImage image;
            for (char** e = environ; *e; ++e) {
                std::string entry(*e);
                std::string name = entry.substr(0, entry.find('='));
                bool overridden = false;
                for (const auto& edit : spec.env) {
                    if (edit.first == name) { overridden = true; break; }
                }
                if (!overridden) image.env_storage.push_back(std::move(entry));
            }
            for (const auto& [name, value] : spec.env) {
                if (value) image.env_storage.push_back(name + "=" + *value);
            }

            for (const auto& arg : spec.argv) image.argv.push_back(const_cast<char*>(arg.c_str()));
            image.argv.push_back(nullptr);
            for (auto& entry : image.env_storage) image.envp.push_back(entry.data());
            image.envp.push_back(nullptr);
            return image;
        }

        /** @brief Runs in the child after fork(); never returns. */
        [[noreturn]] void exec_child(ExecImage& image, int stdin_fd, int stdout_fd, int status_fd) {
            signal(SIGPIPE, SIG_DFL);
            signal(SIGINT, SIG_DFL);
            signal(SIGQUIT, SIG_DFL);
            signal(SIGTSTP, SIG_DFL);

            if (stdin_fd >= 0) {
                dup2(stdin_fd, STDIN_FILENO);
            } else {
                int devnull = open("/dev/null", O_RDONLY);
                if (devnull >= 0) dup2(devnull, STDIN_FILENO);
            }
            dup2(stdout_fd, STDOUT_FILENO);

            execvpe(image.argv[0], image.argv.data(), image.envp.data());

            int err = errno;
            ssize_t ignored = write(status_fd, &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        int wait_for(pid_t pid) {
            int status = 0;
            while (waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) return 127;
            }
            if (WIFEXITED(status)) return WEXITSTATUS(status);
            if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
            return 127;
        }

        /**
         * @brief Feeds `input` to the child and drains its stdout until both sides close.
         */
        void pump(UniqueFd& in_fd, UniqueFd& out_fd, const std::string& input, std::string& out) {
            size_t written = 0;
            std::array<char, kReadChunk> buffer;

            if (in_fd && input.empty()) in_fd.reset();
            if (in_fd) fcntl(in_fd.get(), F_SETFL, fcntl(in_fd.get(), F_GETFL) | O_NONBLOCK);

            while (in_fd || out_fd) {
                std::array<pollfd, 2> pfds{};
                nfds_t count = 0;
                int out_idx = -1;
                int in_idx = -1;
                if (out_fd) {
                    pfds[count] = {out_fd.get(), POLLIN, 0};
                    out_idx = static_cast<int>(count++);
                }
                if (in_fd) {
                    pfds[count] = {in_fd.get(), POLLOUT, 0};
                    in_idx = static_cast<int>(count++);
                }

                int ret = poll(pfds.data(), count, -1);
                if (ret < 0) {
                    if (errno == EINTR) continue;
                    break;
                }

                if (out_idx >= 0 && pfds[out_idx].revents & (POLLIN | POLLHUP | POLLERR)) {
                    ssize_t n = read(out_fd.get(), buffer.data(), buffer.size());
                    if (n > 0) {
                        out.append(buffer.data(), static_cast<size_t>(n));
                    } else if (n == 0 || errno != EINTR) {
                        out_fd.reset();
                    }
                }

                if (in_idx >= 0 && pfds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP)) {
                    ssize_t n = write(in_fd.get(), input.data() + written, input.size() - written);
                    if (n > 0) {
                        written += static_cast<size_t>(n);
                        if (written == input.size()) in_fd.reset();
                    } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
                        // EPIPE: the child stopped reading (e.g. the selector was cancelled)
                        in_fd.reset();
                    }
                }
            }
        }

        /** @brief Ignores SIGPIPE for the lifetime of the object. */
        class SigpipeGuard {
        public:
            SigpipeGuard() {
                struct sigaction ignore{};
                ignore.sa_handler = SIG_IGN;
                sigemptyset(&ignore.sa_mask);
                sigaction(SIGPIPE, &ignore, &previous_);
            }
            ~SigpipeGuard() { sigaction(SIGPIPE, &previous_, nullptr); }
        private:
            struct sigaction previous_{};
        };
    }

    ProcessResult run_process(const ProcessSpec& spec) {
        ProcessResult result;
        if (spec.argv.empty()) return result;

        SigpipeGuard sigpipe_guard;

        UniqueFd in_read, in_write, out_read, out_write, status_read, status_write;
        if (spec.input && !make_pipe(in_read, in_write)) return result;
        if (!make_pipe(out_read, out_write)) return result;
        if (!make_pipe(status_read, status_write)) return result;

        ExecImage image = build_image(spec);
        pid_t pid = fork();
        if (pid < 0) return result;

        if (pid == 0) {
            exec_child(image, in_read.get(), out_write.get(), status_write.get());
        }

        in_read.reset();
        out_write.reset();
        status_write.reset();

        int exec_errno = 0;
        ssize_t n;
        do {
            n = read(status_read.get(), &exec_errno, sizeof(exec_errno));
        } while (n < 0 && errno == EINTR);

        if (n > 0) {
            // exec failed; the child exits without reading or writing anything
            in_write.reset();
            out_read.reset();
            wait_for(pid);
            return result;
        }

        result.launched = true;
        pump(in_write, out_read, spec.input ? *spec.input : std::string(), result.out);
        result.exit_code = wait_for(pid);
        return result;
    }

    std::optional<std::string> find_executable(const std::string& name) {
        namespace fs = std::filesystem;
        if (name.empty()) return std::nullopt;

        auto is_executable = [](const fs::path& p) {
            std::error_code ec;
            return fs::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
        };

        if (name.find('/') != std::string::npos) {
            if (is_executable(name)) return name;
            return std::nullopt;
        }

        const char* path_env = std::getenv("PATH");
        if (!path_env) return std::nullopt;

        std::string path(path_env);
        size_t start = 0;
        while (start <= path.size()) {
            size_t end = path.find(':', start);
            if (end == std::string::npos) end = path.size();
            std::string dir = path.substr(start, end - start);
            if (dir.empty()) dir = ".";
            fs::path candidate = fs::path(dir) / name;
            if (is_executable(candidate)) return candidate.string();
            start = end + 1;
        }
        return std::nullopt;
    }

}
