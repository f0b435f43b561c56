/**
 * @file line_recovery.hpp
 * @brief Reconstructs the visible prompt line from raw shell output.
 *
 * When the keyboard mirror cannot be trusted (Tab completion, unknown editing
 * keys) the command is read back from what the shell echoed: the bytes of the
 * current output line are replayed through a small terminal model, and the
 * text after the rightmost prompt suffix is the edit buffer.
 */

#pragma once
#include "core/context.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vellumsh::core {

    /// A single screen line after replaying cursor movement and erasures.
    struct TerminalLine {
        std::string text;
        size_t cursor = 0;
    };

    TerminalLine simulate_line(std::string_view bytes);

    /**
     * @brief The edit buffer following the rightmost prompt suffix.
     * @return nullopt when no prompt is on the line.
     */
    std::optional<EditBuffer> recover_buffer(const TerminalLine& line, const std::vector<std::string>& prompts);

    enum class PromptKind { None, Primary, Continuation };

    /**
     * @brief Classifies a replayed line.
     *
     * Continuation prompts must make up the whole line (bash's PS2 "> " would
     * otherwise match the tail of many primary prompts); primary prompts only
     * have to end it.
     */
    PromptKind classify_prompt(const TerminalLine& line,
                               const std::vector<std::string>& primary,
                               const std::vector<std::string>& continuation);

}
