#include "ednstream/atom.hpp"
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace ednstream {

namespace {

// Offers c to every candidate. Returns false when none survived; code then names the failure
// reported by the first candidate that died on c.
bool offer_all(const std::vector<candidate *> &cands, char32_t c, error_code &code)
{
    bool any = false;
    bool coded = false;
    for (auto *k : cands) {
        bool was_live = !k->dead();
        k->offer(c);
        if (!k->dead()) {
            any = true;
        } else if (was_live && !coded) {
            code = k->rejected_code();
            coded = true;
        }
    }
    return any;
}

// Candidates are ordered by precedence: the first complete one wins.
event finish(cursor &cur, const std::vector<candidate *> &cands, position start)
{
    if (cur.failure())
        return error_event(*cur.failure());
    for (auto *k : cands) {
        if (!k->dead() && k->complete())
            return k->make_event(start, cur.pos());
    }
    error_code code = error_code::invalid_syntax;
    for (auto *k : cands) {
        if (!k->dead()) {
            code = k->incomplete_code();
            break;
        }
    }
    return error_event(code, cur.pos());
}

event scan(cursor &cur, const std::vector<candidate *> &cands, position start)
{
    while (!cur.eof() && is_constituent(cur.current())) {
        error_code code = error_code::invalid_syntax;
        if (!offer_all(cands, cur.current(), code))
            return error_event(code, cur.pos());
        cur.advance();
    }
    return finish(cur, cands, start);
}

event eof_or_failure(const cursor &cur, error_code code)
{
    if (cur.failure())
        return error_event(*cur.failure());
    return error_event(code, cur.pos());
}

int hex_value(char32_t c)
{
    if (c >= '0' && c <= '9') return static_cast<int>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<int>(c - 'a' + 10);
    return static_cast<int>(c - 'A' + 10);
}

// Cursor on the 'u'. Leaves the cursor after the fourth digit.
std::optional<event> read_hex4(cursor &cur, char32_t &out)
{
    cur.advance();
    out = 0;
    for (int i = 0; i < 4; ++i) {
        if (cur.eof())
            return eof_or_failure(cur, error_code::not_four_digit);
        if (!is_hex_digit(cur.current()))
            return error_event(error_code::unrecognized_hex, cur.pos());
        out = out * 16 + static_cast<char32_t>(hex_value(cur.current()));
        cur.advance();
    }
    return std::nullopt;
}

std::optional<event> read_unicode_escape(cursor &cur, std::string &out)
{
    char32_t u = 0;
    if (auto err = read_hex4(cur, u))
        return err;
    if (u >= 0xDC00 && u <= 0xDFFF)
        return error_event(error_code::invalid_unicode_code_point, cur.pos());
    if (u >= 0xD800 && u <= 0xDBFF) {
        // A leading surrogate must be followed by \u and a trailing surrogate.
        if (!cur.is('\\'))
            return eof_or_failure(cur, error_code::unexpected_end_of_hex_escape);
        cur.advance();
        if (!cur.is('u'))
            return eof_or_failure(cur, error_code::unexpected_end_of_hex_escape);
        char32_t u2 = 0;
        if (auto err = read_hex4(cur, u2))
            return err;
        if (u2 < 0xDC00 || u2 > 0xDFFF)
            return error_event(error_code::lone_leading_surrogate_in_hex_escape, cur.pos());
        u = 0x10000 + ((u - 0xD800) << 10) + (u2 - 0xDC00);
    }
    append_utf8(out, u);
    return std::nullopt;
}

} // namespace

bool literal_candidate::accept(char32_t c)
{
    if (matched_ < text_.size() && c == static_cast<unsigned char>(text_[matched_])) {
        ++matched_;
        return true;
    }
    return false;
}

event literal_candidate::make_event(position start, position) const
{
    return ednstream::make_event(kind_, start, value_);
}

bool symbol_candidate::accept(char32_t c)
{
    if (keyword_ && !sigil_seen_) {
        sigil_seen_ = (c == ':');
        return sigil_seen_;
    }
    bool ok = false;
    if (count_ == 0)
        ok = is_alpha(c) || is_leading_special(c);
    else if (count_ == 1 && is_leading_special(first_))
        ok = is_alpha(c) || is_general_special(c) || is_extended_special(c);
    else if (last_ == '/')
        ok = is_alpha(c) || (is_general_special(c) && c != '/');
    else
        ok = is_alnum(c) || is_general_special(c) || is_extended_special(c);
    if (!ok)
        return false;
    if (count_ == 0)
        first_ = c;
    last_ = c;
    ++count_;
    append_utf8(text_, c);
    return true;
}

bool symbol_candidate::complete() const
{
    return count_ > 0 && last_ != '/';
}

event symbol_candidate::make_event(position start, position) const
{
    return ednstream::make_event(keyword_ ? event_kind::keyword_value : event_kind::symbol_value, start, text_);
}

bool number_candidate::accept(char32_t c)
{
    bool ok = false;
    switch (phase_) {
    case phase::begin:
        if (c == '+' || c == '-') { phase_ = phase::sign; ok = true; }
        else if (is_digit(c)) { phase_ = phase::integer; leading_zero_ = (c == '0'); ok = true; }
        break;
    case phase::sign:
        if (is_digit(c)) { phase_ = phase::integer; leading_zero_ = (c == '0'); ok = true; }
        break;
    case phase::integer:
        if (is_digit(c)) ok = !leading_zero_;
        else if (c == '.') { phase_ = phase::fraction; is_float_ = true; ok = true; }
        else if (c == 'e' || c == 'E') { phase_ = phase::exponent; is_float_ = true; ok = true; }
        else if (c == 'N') { phase_ = phase::big_int; ok = true; }
        else if (c == 'M') { phase_ = phase::big_decimal; is_float_ = true; ok = true; }
        break;
    case phase::fraction:
        if (is_digit(c)) ok = true;
        else if (c == 'e' || c == 'E') { phase_ = phase::exponent; ok = true; }
        else if (c == 'M') { phase_ = phase::big_decimal; ok = true; }
        break;
    case phase::exponent:
        if (c == '+' || c == '-') { phase_ = phase::exponent_sign; ok = true; }
        else if (is_digit(c)) { phase_ = phase::exponent_digits; ok = true; }
        break;
    case phase::exponent_sign:
        if (is_digit(c)) { phase_ = phase::exponent_digits; ok = true; }
        break;
    case phase::exponent_digits:
        if (is_digit(c)) ok = true;
        else if (c == 'M') { phase_ = phase::big_decimal; ok = true; }
        break;
    case phase::big_int:
    case phase::big_decimal:
        break;
    }
    if (ok && c != 'N' && c != 'M')
        text_ += static_cast<char>(c);
    return ok;
}

bool number_candidate::complete() const
{
    switch (phase_) {
    case phase::integer:
    case phase::fraction:
    case phase::exponent_digits:
    case phase::big_int:
    case phase::big_decimal:
        return true;
    default:
        return false;
    }
}

event number_candidate::make_event(position start, position end) const
{
    errno = 0;
    if (!is_float_) {
        long long v = std::strtoll(text_.c_str(), nullptr, 10);
        if (errno == ERANGE)
            return error_event(error_code::invalid_number, end);
        return ednstream::make_event(event_kind::integer_value, start, static_cast<int64_t>(v));
    }
    double d = std::strtod(text_.c_str(), nullptr);
    if (errno == ERANGE && std::isinf(d))
        return error_event(error_code::invalid_number, end);
    return ednstream::make_event(event_kind::float_value, start, d);
}

bool single_char_candidate::accept(char32_t c)
{
    if (count_ != 0)
        return false;
    ch_ = c;
    ++count_;
    return true;
}

event single_char_candidate::make_event(position start, position) const
{
    return ednstream::make_event(event_kind::character_value, start, ch_);
}

bool unicode_char_candidate::accept(char32_t c)
{
    if (count_ == 0) {
        if (c != 'u')
            return false;
    } else if (count_ < 5 && is_hex_digit(c)) {
        value_ = value_ * 16 + static_cast<char32_t>(hex_value(c));
    } else {
        return false;
    }
    ++count_;
    return true;
}

event unicode_char_candidate::make_event(position start, position) const
{
    if (value_ >= 0xD800 && value_ <= 0xDFFF)
        return error_event(error_code::invalid_unicode_code_point, start);
    return ednstream::make_event(event_kind::character_value, start, value_);
}

event recognize_atom(cursor &cur)
{
    position start = cur.pos();
    if (cur.is(':')) {
        symbol_candidate kw(true);
        return scan(cur, {&kw}, start);
    }
    literal_candidate nil_c("nil", event_kind::nil_value, std::monostate{});
    literal_candidate true_c("true", event_kind::boolean_value, true);
    literal_candidate false_c("false", event_kind::boolean_value, false);
    number_candidate num;
    symbol_candidate sym;
    return scan(cur, {&nil_c, &true_c, &false_c, &num, &sym}, start);
}

event read_string_literal(cursor &cur)
{
    position start = cur.pos();
    cur.advance();
    std::string out;
    for (;;) {
        if (cur.eof())
            return eof_or_failure(cur, error_code::eof_while_parsing_string);
        char32_t c = cur.current();
        if (c == '"') {
            cur.advance();
            return make_event(event_kind::string_value, start, std::move(out));
        }
        if (c != '\\') {
            append_utf8(out, c);
            cur.advance();
            continue;
        }
        cur.advance();
        if (cur.eof())
            return eof_or_failure(cur, error_code::eof_while_parsing_string);
        switch (cur.current()) {
        case '"': out += '"'; break;
        case '\\': out += '\\'; break;
        case '/': out += '/'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 'u':
            if (auto err = read_unicode_escape(cur, out))
                return *err;
            continue; // already past the digits
        default:
            return error_event(error_code::invalid_escape, cur.pos());
        }
        cur.advance();
    }
}

event read_character_literal(cursor &cur)
{
    position start = cur.pos();
    cur.advance();
    if (cur.eof())
        return eof_or_failure(cur, error_code::eof_while_parsing_value);
    char32_t first = cur.current();
    if (is_whitespace(first))
        return error_event(error_code::invalid_syntax, cur.pos());

    single_char_candidate single;
    literal_candidate newline("newline", event_kind::character_value, U'\n');
    literal_candidate space("space", event_kind::character_value, U' ');
    literal_candidate tab("tab", event_kind::character_value, U'\t');
    literal_candidate ret("return", event_kind::character_value, U'\r');
    literal_candidate formfeed("formfeed", event_kind::character_value, U'\f');
    literal_candidate backspace("backspace", event_kind::character_value, U'\b');
    unicode_char_candidate uni;
    std::vector<candidate *> cands{&single, &newline, &space, &tab, &ret, &formfeed, &backspace, &uni};

    error_code code = error_code::invalid_syntax;
    offer_all(cands, first, code); // the single-character form accepts anything
    cur.advance();
    if (!is_constituent(first))
        return finish(cur, cands, start);
    return scan(cur, cands, start);
}

event read_tag(cursor &cur, position hash_pos)
{
    symbol_candidate name;
    event ev = scan(cur, {&name}, hash_pos);
    if (ev.is_error())
        return ev;
    return make_event(event_kind::tag, hash_pos, ev.text());
}

} // namespace ednstream
