/**
 * @file selector.hpp
 * @brief The external interactive filter used for full-text search (fzf).
 */

#pragma once
#include <string>

namespace vellumsh::core {

    struct SelectorResult {
        int status = 1;     ///< non-zero on cancel or failure
        std::string out;    ///< selected record, empty when nothing was chosen
    };

    class Selector {
    public:
        virtual ~Selector() = default;
        /**
         * @brief Blocks while the user picks one record.
         * @param records NUL-delimited records to filter.
         * @param query Initial query (the current buffer).
         */
        virtual SelectorResult select(const std::string& records, const std::string& query) = 0;
    };

    /**
     * @class ProcessSelector
     * @brief Runs fzf with the Ctrl-R option set.
     *
     * The option string is placed in FZF_DEFAULT_OPTS the same way fzf's own
     * key bindings do it, so a user's FZF_DEFAULT_OPTS and FZF_CTRL_R_OPTS keep
     * working.
     */
    class ProcessSelector : public Selector {
    public:
        /**
         * @param program Selector binary.
         * @param options Value for FZF_DEFAULT_OPTS, see build_options().
         */
        ProcessSelector(std::string program, std::string options);

        SelectorResult select(const std::string& records, const std::string& query) override;

        /// The complete FZF_DEFAULT_OPTS value handed to the selector.
        const std::string& options() const { return options_; }

        /**
         * @brief Builds the option string.
         * @param height FZF_TMUX_HEIGHT, "40%" when unset.
         * @param default_opts The user's FZF_DEFAULT_OPTS.
         * @param user_opts FZF_CTRL_R_OPTS plus SELECTOR_OPTS.
         */
        static std::string build_options(const std::string& height,
                                         const std::string& default_opts,
                                         const std::string& user_opts);

    private:
        std::string program_;
        std::string options_;
    };

}
