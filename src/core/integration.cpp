/**
 * @file integration.cpp
 * @brief Wiring of the lifecycle, hooks, cursor and search components.
 */

#include "core/integration.hpp"
#include "core/lifecycle.hpp"
#include "core/process.hpp"
#include "core/theme.hpp"

namespace vellumsh::core {

    Integration::Integration(Environment& env, Backend& backend, Selector& selector, Options options)
        : env_(env),
          backend_(backend),
          cursor_(ctx_, backend, std::move(options.move_args), options.split_at_point),
          search_(ctx_, backend, selector, std::move(options.history_args), options.search_session_only) {}

    bool Integration::initialize() {
        if (initialized_) return false;

        auto session = SessionLifecycle::establish(env_, backend_);
        if (!session) return false;

        ctx_.session = std::move(*session);
        ctx_.cursor.clear();
        initialized_ = true;

        hooks_.add(HookEvent::PreExec, kCaptureHook, [this](const std::string& cmd) { capture(cmd); });
        hooks_.add(HookEvent::PreCmd, kResetHook, [this](const std::string&) { reset(); });
        return true;
    }

    void Integration::capture(const std::string& command) {
        backend_.store(ctx_.session, command);
    }

    void Integration::reset() {
        cursor_.reset();
    }

    void Integration::command_submitted(const std::string& command) {
        if (!initialized_ || command.empty()) return;
        hooks_.dispatch(HookEvent::PreExec, command);
    }

    void Integration::prompt_shown() {
        if (!initialized_) return;
        hooks_.dispatch(HookEvent::PreCmd);
    }

    NavigationOutcome Integration::navigate(Direction direction, EditBuffer& buffer) {
        if (!initialized_) return NavigationOutcome::Unchanged;
        return cursor_.navigate(direction, buffer);
    }

    int Integration::search(EditBuffer& buffer) {
        if (!initialized_) return 1;
        return search_.search(buffer);
    }

    std::optional<std::string> find_missing_dependency(const std::vector<std::string>& programs) {
        for (const auto& program : programs) {
            if (!find_executable(program)) return program;
        }
        return std::nullopt;
    }

}
