/**
 * @file lifecycle.cpp
 * @brief Session establishment at shell start.
 */

#include "core/lifecycle.hpp"
#include "core/theme.hpp"

namespace vellumsh::core {

    std::optional<Session> SessionLifecycle::establish(Environment& env, Backend& backend) {
        if (env.has(kSentinelVar)) {
            debug_log("lifecycle: already initialized");
            return std::nullopt;
        }
        env.set(kSentinelVar, "1");

        Session session;

        if (auto existing = env.get(kSessionVar); existing && !existing->empty()) {
            session.token = *existing;
        } else if (auto token = backend.init_session()) {
            session.token = *token;
            env.set(kSessionVar, session.token);
        }

        if (auto existing = env.get(kSessionStartVar); existing && !existing->empty()) {
            session.start = *existing;
        } else if (auto ts = backend.init_timestamp()) {
            session.start = *ts;
            env.set(kSessionStartVar, *ts);
        }

        debug_log("lifecycle: session " + (session.token.empty() ? std::string("<none>") : session.token));
        return session;
    }

}
