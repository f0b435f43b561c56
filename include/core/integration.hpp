/**
 * @file integration.hpp
 * @brief The facade shell adapters talk to.
 *
 * An adapter only has to map its native events onto four operations:
 *   command_submitted()  -> PreExec hooks (capture)
 *   prompt_shown()       -> PreCmd hooks (reset)
 *   navigate(direction)  -> cursor state machine
 *   search()             -> search bridge
 * All state lives in the SessionContext owned here; adapters stay stateless
 * with respect to history.
 */

#pragma once
#include "core/backend.hpp"
#include "core/context.hpp"
#include "core/cursor.hpp"
#include "core/environment.hpp"
#include "core/hooks.hpp"
#include "core/search.hpp"
#include "core/selector.hpp"
#include <optional>
#include <string>
#include <vector>

namespace vellumsh::core {

    class Integration {
    public:
        struct Options {
            std::vector<std::string> move_args;
            std::vector<std::string> history_args;
            bool search_session_only = false;
            bool split_at_point = true;
        };

        static constexpr auto kCaptureHook = "vellum-store";
        static constexpr auto kResetHook = "vellum-reset";

        Integration(Environment& env, Backend& backend, Selector& selector, Options options);

        /**
         * @brief Establishes the session and registers the built-in hooks.
         *
         * Guarded twice: by the environment sentinel (another initialization
         * already claimed this environment) and by a flag on this object.
         * @return false when it was a no-op.
         */
        bool initialize();
        bool initialized() const { return initialized_; }

        /// Forwards one command to the store. Registered as the PreExec hook.
        void capture(const std::string& command);
        /// Cursor back to Idle. Registered as the PreCmd hook.
        void reset();

        /// Adapter entry points for the shell lifecycle events.
        void command_submitted(const std::string& command);
        void prompt_shown();

        NavigationOutcome navigate(Direction direction, EditBuffer& buffer);
        int search(EditBuffer& buffer);

        HookRegistry& hooks() { return hooks_; }
        const SessionContext& context() const { return ctx_; }
        CursorStateMachine::State cursor_state() const { return cursor_.state(); }

    private:
        Environment& env_;
        Backend& backend_;
        SessionContext ctx_;
        HookRegistry hooks_;
        CursorStateMachine cursor_;
        SearchBridge search_;
        bool initialized_ = false;
    };

    /**
     * @brief Checks that every program can be found on PATH.
     * @return The first missing program, or nullopt.
     */
    std::optional<std::string> find_missing_dependency(const std::vector<std::string>& programs);

}
