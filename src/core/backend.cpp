/**
 * @file backend.cpp
 * @brief Subprocess implementation of the Backend interface.
 */

#include "core/backend.hpp"
#include "core/process.hpp"
#include "core/theme.hpp"

namespace vellumsh::core {

    namespace {
        /** @brief First line of a reply without its terminator. */
        std::string first_line(const std::string& out) {
            std::string line = out.substr(0, out.find('\n'));
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }

        /** @brief Removes every trailing newline, as command substitution does. */
        std::string trim_trailing_newlines(std::string out) {
            while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) out.pop_back();
            return out;
        }

        std::string describe(const std::vector<std::string>& args) {
            std::string s;
            for (const auto& arg : args) {
                if (!s.empty()) s += ' ';
                if (arg.empty() || arg.find(' ') != std::string::npos) s += "'" + arg + "'";
                else s += arg;
            }
            return s;
        }
    }

    ProcessBackend::ProcessBackend(std::string program, EnvEdits extra_env)
        : program_(std::move(program)), extra_env_(std::move(extra_env)) {}

    std::optional<std::string> ProcessBackend::call(const std::vector<std::string>& args, const Session* session) {
        ProcessSpec spec;
        spec.argv.push_back(program_);
        spec.argv.insert(spec.argv.end(), args.begin(), args.end());
        spec.env = extra_env_;
        if (session) {
            auto vars = session_env(*session);
            spec.env.insert(spec.env.end(), vars.begin(), vars.end());
        }

        debug_log("backend: " + describe(spec.argv));
        ProcessResult result = run_process(spec);
        if (!result.ok()) {
            debug_log("backend: exit " + std::to_string(result.exit_code) +
                      (result.launched ? "" : " (not launched)"));
            return std::nullopt;
        }
        return result.out;
    }

    std::optional<std::string> ProcessBackend::init_session() {
        auto out = call({"init", "session"}, nullptr);
        if (!out) return std::nullopt;
        std::string token = first_line(*out);
        if (token.empty()) return std::nullopt;
        return token;
    }

    std::optional<std::string> ProcessBackend::init_timestamp() {
        auto out = call({"init", "timestamp"}, nullptr);
        if (!out) return std::nullopt;
        std::string ts = first_line(*out);
        if (ts.empty()) return std::nullopt;
        return ts;
    }

    void ProcessBackend::store(const Session& session, const std::string& command) {
        // fire-and-forget, the status is not inspected
        call({"store", "--", command}, &session);
    }

    std::optional<std::string> ProcessBackend::move(const Session& session,
                                                    const protocol::NavigationRequest& request) {
        auto out = call(protocol::encode(request), &session);
        if (!out) return std::nullopt;
        std::string reply = trim_trailing_newlines(*out);
        if (reply.empty()) return std::nullopt;
        return reply;
    }

    std::optional<std::string> ProcessBackend::history(const Session& session,
                                                       const std::vector<std::string>& args) {
        std::vector<std::string> full = {"history", "--fzf"};
        full.insert(full.end(), args.begin(), args.end());
        auto out = call(full, &session);
        if (!out || out->empty()) return std::nullopt;
        return out;
    }

}
