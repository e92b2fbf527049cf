#include "ednstream/cursor.hpp"

namespace ednstream {

cursor::cursor(std::unique_ptr<char_source> src) : src_(std::move(src))
{
    pull(pos_);
}

void cursor::pull(position at)
{
    auto r = src_->next();
    switch (r.status) {
    case source_status::ok:
        ch_ = r.ch;
        pos_ = at;
        break;
    case source_status::eof:
        ch_ = end_of_stream;
        break;
    case source_status::error:
        ch_ = end_of_stream;
        pos_ = at;
        failure_ = parser_error{r.code, r.code == error_code::io_error ? error_origin::io : error_origin::syntax,
                                at.line, at.col, std::move(r.message)};
        break;
    }
}

bool cursor::advance()
{
    if (eof())
        return false;
    position next = pos_;
    if (ch_ == '\n') {
        ++next.line;
        next.col = 1;
    } else {
        ++next.col;
    }
    pull(next);
    return !eof();
}

std::optional<std::string> skip_whitespace(cursor &cur, bool allow_comments)
{
    std::string span;
    bool consumed = false;
    while (!cur.eof()) {
        char32_t c = cur.current();
        if (is_whitespace(c)) {
            append_utf8(span, c);
            cur.advance();
            consumed = true;
            continue;
        }
        if (allow_comments && c == ';') {
            while (!cur.eof() && !cur.is('\n')) {
                append_utf8(span, cur.current());
                cur.advance();
            }
            consumed = true;
            continue;
        }
        break;
    }
    if (!consumed)
        return std::nullopt;
    return span;
}

} // namespace ednstream
