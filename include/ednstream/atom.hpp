// Atom recognition by parallel incremental candidate matching
#pragma once
#include "ednstream/cursor.hpp"
#include "ednstream/event.hpp"
#include <string>
#include <vector>

namespace ednstream
{

    // Non-ASCII code points count as alphabetic.
    inline bool is_alpha(char32_t c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= 0x80 && c != cursor::end_of_stream); }
    inline bool is_digit(char32_t c) { return c >= '0' && c <= '9'; }
    inline bool is_alnum(char32_t c) { return is_alpha(c) || is_digit(c); }
    inline bool is_hex_digit(char32_t c) { return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'); }
    inline bool is_leading_special(char32_t c) { return c == '+' || c == '-' || c == '.'; }
    inline bool is_general_special(char32_t c)
    {
        switch (c)
        {
        case '.': case '*': case '+': case '!': case '-': case '_': case '?':
        case '$': case '%': case '&': case '=': case '<': case '>': case '/':
            return true;
        default:
            return false;
        }
    }
    inline bool is_extended_special(char32_t c) { return c == '#' || c == ':'; }
    // Characters that may appear inside a symbol, keyword or number token.
    inline bool is_constituent(char32_t c) { return is_alnum(c) || is_general_special(c) || is_extended_special(c); }

    // Liveness only ever moves toward dead: unknown -> alive -> dead, or unknown -> dead.
    enum class liveness
    {
        unknown,
        alive,
        dead,
    };

    class candidate
    {
    public:
        virtual ~candidate() = default;

        void offer(char32_t c)
        {
            if (state_ == liveness::dead)
                return;
            state_ = accept(c) ? liveness::alive : liveness::dead;
        }
        liveness state() const { return state_; }
        bool dead() const { return state_ == liveness::dead; }

        // Whole-token acceptance, asked once the scan has stopped.
        virtual bool complete() const = 0;
        virtual event make_event(position start, position end) const = 0;
        // Error reported when this candidate is the one that dies last.
        virtual error_code rejected_code() const { return error_code::invalid_syntax; }
        // Error reported when this candidate survives the scan but is not complete.
        virtual error_code incomplete_code() const { return error_code::invalid_syntax; }

    protected:
        virtual bool accept(char32_t c) = 0;

    private:
        liveness state_ = liveness::unknown;
    };

    // Exact, case-sensitive match of an ASCII word (nil, true, false, character names).
    class literal_candidate : public candidate
    {
    public:
        literal_candidate(std::string text, event_kind kind, event_payload value)
            : text_(std::move(text)), kind_(kind), value_(std::move(value)) {}
        bool complete() const override { return matched_ == text_.size(); }
        event make_event(position start, position end) const override;

    protected:
        bool accept(char32_t c) override;

    private:
        std::string text_;
        event_kind kind_;
        event_payload value_;
        size_t matched_ = 0;
    };

    // Bare symbols, or keywords when constructed with keyword = true (the ':' sigil comes first).
    class symbol_candidate : public candidate
    {
    public:
        explicit symbol_candidate(bool keyword = false) : keyword_(keyword) {}
        bool complete() const override;
        event make_event(position start, position end) const override;
        const std::string &text() const { return text_; }

    protected:
        bool accept(char32_t c) override;

    private:
        bool keyword_;
        bool sigil_seen_ = false;
        size_t count_ = 0; // characters after the sigil
        char32_t first_ = 0;
        char32_t last_ = 0;
        std::string text_;
    };

    // [+-]? digits N? for integers; fraction, exponent or M suffix for floats.
    class number_candidate : public candidate
    {
    public:
        bool complete() const override;
        event make_event(position start, position end) const override;
        error_code rejected_code() const override { return error_code::invalid_number; }
        error_code incomplete_code() const override { return error_code::invalid_number; }

    protected:
        bool accept(char32_t c) override;

    private:
        enum class phase
        {
            begin,
            sign,
            integer,
            fraction,
            exponent,
            exponent_sign,
            exponent_digits,
            big_int,     // after N
            big_decimal, // after M
        };
        phase phase_ = phase::begin;
        bool leading_zero_ = false;
        bool is_float_ = false;
        std::string text_;
    };

    // Character literal forms after the backslash.
    class single_char_candidate : public candidate
    {
    public:
        bool complete() const override { return count_ == 1; }
        event make_event(position start, position end) const override;

    protected:
        bool accept(char32_t c) override;

    private:
        size_t count_ = 0;
        char32_t ch_ = 0;
    };

    class unicode_char_candidate : public candidate
    {
    public:
        bool complete() const override { return count_ == 5; }
        event make_event(position start, position end) const override;
        error_code rejected_code() const override { return count_ >= 1 && count_ < 5 ? error_code::unrecognized_hex : error_code::invalid_syntax; }
        error_code incomplete_code() const override { return count_ >= 2 ? error_code::not_four_digit : error_code::invalid_syntax; }

    protected:
        bool accept(char32_t c) override;

    private:
        size_t count_ = 0; // 'u' plus hex digits seen
        char32_t value_ = 0;
    };

    // Classifies the token at the cursor as nil, true, false, a number, a symbol or a keyword.
    // Consumes the token; on failure the cursor stays on the offending character.
    event recognize_atom(cursor &cur);

    // Cursor on the opening '"'. Handles escapes including \uXXXX surrogate pairs.
    event read_string_literal(cursor &cur);

    // Cursor on the backslash.
    event read_character_literal(cursor &cur);

    // Cursor on the first character of the tag name ('#' already consumed at hash_pos).
    event read_tag(cursor &cur, position hash_pos);

} // namespace ednstream
