/**
 * @file backend.hpp
 * @brief Calls into the `vellum` backing process.
 *
 * The Backend interface is the boundary of this layer: everything behind it
 * (storage, encryption, sync) is opaque. Failures are reported as nullopt;
 * callers treat them as "nothing happened".
 */

#pragma once
#include "core/context.hpp"
#include "core/protocol.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace vellumsh::core {

    class Backend {
    public:
        virtual ~Backend() = default;

        /// `init session`: a new session token.
        virtual std::optional<std::string> init_session() = 0;
        /// `init timestamp`: the session start time.
        virtual std::optional<std::string> init_timestamp() = 0;
        /// `store -- <command>`; fire-and-forget.
        virtual void store(const Session& session, const std::string& command) = 0;
        /// `move ...`; the raw reply line.
        virtual std::optional<std::string> move(const Session& session,
                                                const protocol::NavigationRequest& request) = 0;
        /// `history --fzf [args]`; the raw record stream.
        virtual std::optional<std::string> history(const Session& session,
                                                   const std::vector<std::string>& args) = 0;
    };

    /**
     * @class ProcessBackend
     * @brief Backend implemented by spawning the `vellum` binary.
     */
    class ProcessBackend : public Backend {
    public:
        /**
         * @param program Name or path of the backing binary.
         * @param extra_env Variables added to every call (e.g. VELLUM_EDITOR).
         */
        explicit ProcessBackend(std::string program, EnvEdits extra_env = {});

        std::optional<std::string> init_session() override;
        std::optional<std::string> init_timestamp() override;
        void store(const Session& session, const std::string& command) override;
        std::optional<std::string> move(const Session& session,
                                        const protocol::NavigationRequest& request) override;
        std::optional<std::string> history(const Session& session,
                                           const std::vector<std::string>& args) override;

    private:
        std::string program_;
        EnvEdits extra_env_;

        std::optional<std::string> call(const std::vector<std::string>& args, const Session* session);
    };

}
