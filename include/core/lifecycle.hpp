/**
 * @file lifecycle.hpp
 * @brief Establishes the session of an interactive shell, exactly once.
 */

#pragma once
#include "core/backend.hpp"
#include "core/context.hpp"
#include "core/environment.hpp"
#include <optional>

namespace vellumsh::core {

    class SessionLifecycle {
    public:
        /**
         * @brief Claims the environment and exports the session variables.
         *
         * When the sentinel is already present (re-initialization, or a nested
         * shell that inherited it) nothing is done and nullopt is returned; the
         * caller must then skip hook registration entirely.
         *
         * Otherwise the sentinel is set first, then VELLUM_SESSION and
         * VELLUM_SESSION_START are requested from the backend unless already
         * present, and exported.
         *
         * @return The session now in effect, or nullopt if already initialized.
         */
        static std::optional<Session> establish(Environment& env, Backend& backend);
    };

}
