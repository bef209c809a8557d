#include "cairn/shell/input_buffer.hpp"

#include <cctype>
#include <utility>

namespace cairn::shell {

namespace {

[[nodiscard]] bool is_blank(char ch) noexcept
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

[[nodiscard]] std::string_view strip_carriage_return(std::string_view line) noexcept
{
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1U);
    }
    return line;
}

}  // namespace

bool InputBuffer::append_line(std::string_view line)
{
    line = strip_carriage_return(line);

    if (text_.empty() && state_ == LexState::Code) {
        std::size_t first = 0U;
        while (first < line.size() && is_blank(line[first])) {
            ++first;
        }
        if (first < line.size() && line[first] == '\\') {
            text_.assign(line.substr(first));
            while (is_blank(text_.back())) {
                text_.pop_back();
            }
            meta_command_ = true;
            return true;
        }
    }

    scan(line);
    text_.append(line);
    text_.push_back('\n');

    // Blank and comment-only lines do not open a command.
    if (!has_code_ && state_ == LexState::Code) {
        clear();
        return false;
    }
    return complete();
}

bool InputBuffer::complete() const noexcept
{
    if (meta_command_) {
        return true;
    }
    return state_ == LexState::Code && paren_depth_ == 0U && ends_with_terminator_;
}

std::string InputBuffer::take()
{
    auto text = std::move(text_);
    clear();
    return text;
}

void InputBuffer::clear() noexcept
{
    text_.clear();
    state_ = LexState::Code;
    paren_depth_ = 0U;
    has_code_ = false;
    ends_with_terminator_ = false;
    meta_command_ = false;
}

void InputBuffer::scan(std::string_view line)
{
    for (std::size_t index = 0U; index < line.size(); ++index) {
        const char ch = line[index];
        const char next = index + 1U < line.size() ? line[index + 1U] : '\0';

        switch (state_) {
        case LexState::BlockComment:
            if (ch == '*' && next == '/') {
                state_ = LexState::Code;
                ++index;
            }
            continue;
        case LexState::SingleQuoted:
        case LexState::DoubleQuoted: {
            const char quote = state_ == LexState::SingleQuoted ? '\'' : '"';
            if (ch == quote) {
                if (next == quote) {
                    ++index;
                } else {
                    state_ = LexState::Code;
                }
            }
            continue;
        }
        case LexState::Code:
        default:
            break;
        }

        if (is_blank(ch)) {
            continue;
        }
        if (ch == '-' && next == '-') {
            return;
        }
        if (ch == '/' && next == '*') {
            state_ = LexState::BlockComment;
            ++index;
            continue;
        }

        has_code_ = true;
        ends_with_terminator_ = false;
        if (ch == '\'') {
            state_ = LexState::SingleQuoted;
        } else if (ch == '"') {
            state_ = LexState::DoubleQuoted;
        } else if (ch == '(') {
            ++paren_depth_;
        } else if (ch == ')') {
            if (paren_depth_ > 0U) {
                --paren_depth_;
            }
        } else if (ch == ';' && paren_depth_ == 0U) {
            ends_with_terminator_ = true;
        }
    }
}

}  // namespace cairn::shell
