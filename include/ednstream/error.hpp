// Error taxonomy shared by sources, the event stream and the reader
#pragma once
#include <stdexcept>
#include <string>

namespace ednstream
{

    enum class error_code
    {
        invalid_syntax,
        invalid_number,
        invalid_escape,
        invalid_unicode_code_point,
        lone_leading_surrogate_in_hex_escape,
        unexpected_end_of_hex_escape,
        unrecognized_hex,
        not_four_digit,
        not_utf8,
        eof_while_parsing_object,
        eof_while_parsing_array,
        eof_while_parsing_value,
        eof_while_parsing_string,
        key_must_be_a_value,
        expected_separator,
        trailing_characters,
        trailing_comma,
        io_error,
    };

    // Where an error came from: the grammar, the character source, or a value-model collaborator.
    enum class error_origin
    {
        syntax,
        io,
        foreign,
    };

    struct parser_error
    {
        error_code code = error_code::invalid_syntax;
        error_origin origin = error_origin::syntax;
        int line = 1;
        int col = 1;
        std::string message;
    };

    inline bool operator==(const parser_error &a, const parser_error &b)
    {
        return a.code == b.code && a.origin == b.origin && a.line == b.line && a.col == b.col && a.message == b.message;
    }
    inline bool operator!=(const parser_error &a, const parser_error &b) { return !(a == b); }

    const char *to_string(error_code c);
    const char *to_string(error_origin o);

    // Builds a syntax-origin error whose message is the code's text.
    parser_error make_error(error_code c, int line, int col);

    // "invalid syntax at 3:7" style rendering used for logs and exceptions.
    std::string format_error(const parser_error &e);

    // Thrown by the tree-level convenience API (read_one).
    struct parse_error : std::runtime_error
    {
        explicit parse_error(parser_error e) : std::runtime_error(format_error(e)), detail(std::move(e)) {}
        parser_error detail;
    };

} // namespace ednstream
