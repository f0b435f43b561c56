/**
 * @file selector.cpp
 * @brief fzf invocation for the search widget.
 */

#include "core/selector.hpp"
#include "core/process.hpp"
#include "core/theme.hpp"

namespace vellumsh::core {

    ProcessSelector::ProcessSelector(std::string program, std::string options)
        : program_(std::move(program)), options_(std::move(options)) {}

    std::string ProcessSelector::build_options(const std::string& height,
                                               const std::string& default_opts,
                                               const std::string& user_opts) {
        std::string opts = "--height " + (height.empty() ? std::string("40%") : height);
        opts += " --bind=ctrl-z:ignore";
        if (!default_opts.empty()) opts += " " + default_opts;
        opts += " -n2..,.. --scheme=history --bind=ctrl-r:toggle-sort";
        opts += " --wrap-sign '\t\xe2\x86\xb3 ' --highlight-line";
        if (!user_opts.empty()) opts += " " + user_opts;
        opts += " +m --read0";
        return opts;
    }

    SelectorResult ProcessSelector::select(const std::string& records, const std::string& query) {
        ProcessSpec spec;
        spec.argv = {program_, "--query", query};
        spec.env = {
            {"FZF_DEFAULT_OPTS", options_},
            {"FZF_DEFAULT_OPTS_FILE", std::string()},
        };
        spec.input = records;

        debug_log("selector: " + program_ + " --query '" + query + "'");
        ProcessResult result = run_process(spec);

        SelectorResult selection;
        selection.status = result.exit_code;
        if (result.launched) selection.out = std::move(result.out);
        return selection;
    }

}
