#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace cairn::shell {

// Collects interactive input one line at a time until it forms a command the
// ShellEngine can run. A backslash command is complete on its own line. SQL is
// complete once its last significant character is a ';' outside quotes,
// comments and parentheses.
class InputBuffer final {
public:
    // Returns true when the buffered text is ready to hand to the engine.
    bool append_line(std::string_view line);

    [[nodiscard]] bool empty() const noexcept { return text_.empty(); }
    [[nodiscard]] bool complete() const noexcept;
    [[nodiscard]] const std::string& text() const noexcept { return text_; }

    // Returns the buffered text and resets the lexical state.
    [[nodiscard]] std::string take();
    void clear() noexcept;

private:
    enum class LexState : std::uint8_t {
        Code = 0,
        SingleQuoted,
        DoubleQuoted,
        BlockComment
    };

    void scan(std::string_view line);

    std::string text_{};
    LexState state_ = LexState::Code;
    std::uint32_t paren_depth_ = 0U;
    bool has_code_ = false;
    bool ends_with_terminator_ = false;
    bool meta_command_ = false;
};

}  // namespace cairn::shell
