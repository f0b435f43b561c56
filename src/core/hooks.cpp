/**
 * @file hooks.cpp
 * @brief PreExec / PreCmd callback registry.
 */

#include "core/hooks.hpp"
#include "core/theme.hpp"
#include <exception>

namespace vellumsh::core {

    void HookRegistry::add(HookEvent event, std::string name, Callback callback) {
        entries_.push_back({event, std::move(name), std::move(callback)});
    }

    size_t HookRegistry::dispatch(HookEvent event, const std::string& payload) const {
        size_t ran = 0;
        for (const auto& entry : entries_) {
            if (entry.event != event) continue;
            try {
                entry.callback(payload);
            } catch (const std::exception& e) {
                print_status(std::cerr, Theme::ERROR, "hook '" + entry.name + "' failed: " + e.what(), "\r\n");
            }
            ++ran;
        }
        return ran;
    }

    size_t HookRegistry::count(HookEvent event) const {
        size_t n = 0;
        for (const auto& entry : entries_) {
            if (entry.event == event) ++n;
        }
        return n;
    }

    std::vector<std::string> HookRegistry::names(HookEvent event) const {
        std::vector<std::string> result;
        for (const auto& entry : entries_) {
            if (entry.event == event) result.push_back(entry.name);
        }
        return result;
    }

}
