/**
 * @file hooks.hpp
 * @brief Ordered registry of named shell-lifecycle callbacks.
 *
 * Replaces the `preexec_functions` / `precmd_functions` arrays of the shell
 * frameworks. Callbacks run in registration order. A failing callback never
 * stops the ones after it.
 */

#pragma once
#include <functional>
#include <string>
#include <vector>

namespace vellumsh::core {

    enum class HookEvent {
        PreExec,    ///< a command line was submitted; payload is the command text
        PreCmd      ///< a new prompt is about to take input; payload is empty
    };

    class HookRegistry {
    public:
        using Callback = std::function<void(const std::string&)>;

        struct Entry {
            HookEvent event;
            std::string name;
            Callback callback;
        };

        void add(HookEvent event, std::string name, Callback callback);

        /// Runs every callback registered for `event`, in order. Returns how many ran.
        size_t dispatch(HookEvent event, const std::string& payload = "") const;

        size_t count(HookEvent event) const;
        std::vector<std::string> names(HookEvent event) const;

    private:
        std::vector<Entry> entries_;
    };

}
