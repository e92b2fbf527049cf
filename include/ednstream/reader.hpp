// Builds node trees from the event stream (explicit stack, no recursion)
#pragma once
#include "ednstream/error.hpp"
#include "ednstream/options.hpp"
#include "ednstream/parser.hpp"
#include "ednstream/value.hpp"
#include <optional>
#include <string_view>

namespace ednstream
{

    struct read_result
    {
        node_ptr value;                     // set on success
        std::optional<parser_error> error;  // set on failure
        bool ok() const { return value != nullptr; }
        // Neither a value nor an error: the event stream had already ended.
        bool exhausted() const { return !value && !error; }
    };

    // Reads one complete value: a scalar, a whole collection, or a tag with its value.
    // Meeting the end of a collection opened before the call closes the parser and returns an exhausted result.
    // Nodes carry line/col metadata of their first character. A key rejected by
    // opts.key_validator yields key_must_be_a_value (origin foreign) and closes the parser.
    read_result read_value(parser &p, const reader_options &opts = {});

    // Parses a whole document holding exactly one value. Throws parse_error.
    node_ptr read_one(std::string_view src, const parser_options &popts = {}, const reader_options &ropts = {});

} // namespace ednstream
