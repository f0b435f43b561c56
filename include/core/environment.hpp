/**
 * @file environment.hpp
 * @brief Access to the exported environment of the wrapped shell.
 */

#pragma once
#include <map>
#include <optional>
#include <string>

namespace vellumsh::core {

    class Environment {
    public:
        virtual ~Environment() = default;
        virtual std::optional<std::string> get(const std::string& name) const = 0;
        virtual void set(const std::string& name, const std::string& value) = 0;

        /// True when the variable exists and is non-empty.
        bool has(const std::string& name) const {
            auto value = get(name);
            return value && !value->empty();
        }
    };

    /**
     * @class ProcessEnvironment
     * @brief The real process environment (getenv/setenv), inherited by the shell child.
     */
    class ProcessEnvironment : public Environment {
    public:
        std::optional<std::string> get(const std::string& name) const override;
        void set(const std::string& name, const std::string& value) override;
    };

    /**
     * @class MapEnvironment
     * @brief In-memory environment, used where the process environment must stay untouched.
     */
    class MapEnvironment : public Environment {
    public:
        std::optional<std::string> get(const std::string& name) const override {
            auto it = vars_.find(name);
            if (it == vars_.end()) return std::nullopt;
            return it->second;
        }

        void set(const std::string& name, const std::string& value) override { vars_[name] = value; }

    private:
        std::map<std::string, std::string> vars_;
    };

}
