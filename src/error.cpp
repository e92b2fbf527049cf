#include "ednstream/error.hpp"
#include <sstream>

namespace ednstream {

const char* to_string(error_code c){
    switch(c){
        case error_code::invalid_syntax: return "invalid syntax";
        case error_code::invalid_number: return "invalid number";
        case error_code::invalid_escape: return "invalid escape";
        case error_code::invalid_unicode_code_point: return "invalid unicode code point";
        case error_code::lone_leading_surrogate_in_hex_escape: return "lone leading surrogate in hex escape";
        case error_code::unexpected_end_of_hex_escape: return "unexpected end of hex escape";
        case error_code::unrecognized_hex: return "invalid \\u escape (unrecognized hex)";
        case error_code::not_four_digit: return "invalid \\u escape (not four digits)";
        case error_code::not_utf8: return "contents not utf-8";
        case error_code::eof_while_parsing_object: return "EOF while parsing map";
        case error_code::eof_while_parsing_array: return "EOF while parsing collection";
        case error_code::eof_while_parsing_value: return "EOF while parsing value";
        case error_code::eof_while_parsing_string: return "EOF while parsing string";
        case error_code::key_must_be_a_value: return "key must be a value of an acceptable type";
        case error_code::expected_separator: return "expected separator";
        case error_code::trailing_characters: return "trailing characters";
        case error_code::trailing_comma: return "trailing comma";
        case error_code::io_error: return "I/O error";
    }
    return "unknown error";
}

const char* to_string(error_origin o){
    switch(o){
        case error_origin::syntax: return "syntax";
        case error_origin::io: return "io";
        case error_origin::foreign: return "foreign";
    }
    return "unknown";
}

parser_error make_error(error_code c, int line, int col){
    return parser_error{c, error_origin::syntax, line, col, to_string(c)};
}

std::string format_error(const parser_error& e){
    std::ostringstream os;
    os<<e.message<<" at "<<e.line<<":"<<e.col;
    if(e.origin!=error_origin::syntax) os<<" ("<<to_string(e.origin)<<")";
    return os.str();
}

} // namespace ednstream
