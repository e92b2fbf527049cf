// One-character lookahead over a char_source with line/column tracking
#pragma once
#include "ednstream/error.hpp"
#include "ednstream/source.hpp"
#include <memory>
#include <optional>
#include <string>

namespace ednstream
{

    struct position
    {
        int line = 1;
        int col = 1;
    };

    // The position always names the current lookahead character. Moving past '\n' starts a new
    // line at column 1; reaching end-of-stream leaves the position where it was.
    class cursor
    {
    public:
        static constexpr char32_t end_of_stream = 0xFFFFFFFFu;

        // Pulls the first character immediately; the cursor starts at 1:1.
        explicit cursor(std::unique_ptr<char_source> src);

        // Moves to the next character. Returns false at end-of-stream or on a source failure.
        bool advance();

        char32_t current() const { return ch_; }
        bool eof() const { return ch_ == end_of_stream; }
        bool is(char32_t c) const { return ch_ == c; }
        int line() const { return pos_.line; }
        int col() const { return pos_.col; }
        position pos() const { return pos_; }

        // Set when the source reported a decoding or I/O failure; the cursor then behaves as eof.
        const std::optional<parser_error> &failure() const { return failure_; }

    private:
        void pull(position at);

        std::unique_ptr<char_source> src_;
        char32_t ch_ = end_of_stream;
        position pos_;
        std::optional<parser_error> failure_;
    };

    // Space, tab, newline, carriage return and the element separator ','.
    inline bool is_whitespace(char32_t c) { return c == ' ' || c == ',' || c == '\t' || c == '\n' || c == '\r'; }

    // Consumes a maximal run of whitespace (and ';' line comments when allowed). Returns the consumed
    // text, or std::nullopt when nothing was consumed. Never errors.
    std::optional<std::string> skip_whitespace(cursor &cur, bool allow_comments = true);

} // namespace ednstream
