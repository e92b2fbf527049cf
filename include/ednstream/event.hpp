// Parse events produced by the pull parser
#pragma once
#include "ednstream/cursor.hpp"
#include "ednstream/error.hpp"
#include <cstdint>
#include <string>
#include <variant>

namespace ednstream
{

    enum class event_kind
    {
        nil_value,
        boolean_value,
        string_value,
        character_value,
        symbol_value,
        keyword_value,
        integer_value,
        float_value,
        tag, // the next complete value is the tagged one
        list_start,
        list_end,
        vector_start,
        vector_end,
        set_start,
        set_end,
        map_start,
        map_end,
        error,
    };

    enum class collection_kind
    {
        list,
        vector,
        set,
        map,
    };

    using event_payload = std::variant<std::monostate, bool, int64_t, double, char32_t, std::string, parser_error>;

    struct event
    {
        event_kind kind = event_kind::nil_value;
        event_payload payload;
        // Position of the first character of the construct (for errors: where it was detected).
        int line = 1;
        int col = 1;

        bool is_error() const { return kind == event_kind::error; }
        const parser_error &error() const { return std::get<parser_error>(payload); }
        // Text of string, symbol, keyword and tag events.
        const std::string &text() const { return std::get<std::string>(payload); }
        bool boolean() const { return std::get<bool>(payload); }
        int64_t integer() const { return std::get<int64_t>(payload); }
        double floating() const { return std::get<double>(payload); }
        char32_t character() const { return std::get<char32_t>(payload); }
    };

    inline bool operator==(const event &a, const event &b)
    {
        return a.kind == b.kind && a.payload == b.payload && a.line == b.line && a.col == b.col;
    }
    inline bool operator!=(const event &a, const event &b) { return !(a == b); }

    inline event make_event(event_kind k, position at, event_payload payload = {})
    {
        return event{k, std::move(payload), at.line, at.col};
    }
    inline event error_event(parser_error e)
    {
        int l = e.line, c = e.col;
        return event{event_kind::error, std::move(e), l, c};
    }
    inline event error_event(error_code code, position at) { return error_event(make_error(code, at.line, at.col)); }

    bool is_scalar(event_kind k);
    bool is_collection_start(event_kind k);
    bool is_collection_end(event_kind k);
    // Only valid for start/end kinds.
    collection_kind collection_of(event_kind k);
    event_kind start_event(collection_kind c);
    event_kind end_event(collection_kind c);
    char32_t closer_of(collection_kind c);

    const char *to_string(event_kind k);
    const char *to_string(collection_kind c);

    // One-line human readable rendering, e.g. `integer 42` or `error expected separator at 1:4`.
    std::string describe(const event &e);

} // namespace ednstream
