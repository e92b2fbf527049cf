// Parser and reader configuration, optionally sourced from the environment
#pragma once
#include "ednstream/value.hpp"
#include <functional>

namespace ednstream {

struct parser_options {
    bool allow_comments = true;  // ';' runs to end of line and counts as whitespace
    bool strict_commas = false;  // report a comma directly before a closing delimiter
    bool trace = false;          // log every produced event to stderr
};

struct reader_options {
    // Accepts or rejects a map key / set element. Empty = accept everything.
    std::function<bool(const node&)> key_validator;
};

// 1/t/T/y/Y enable.
bool flag_enabled(const char* name);
// 0/f/F/n/N disable; unset leaves the default.
bool flag_disabled(const char* name);

// Reads EDNSTREAM_COMMENTS, EDNSTREAM_STRICT_COMMAS and EDNSTREAM_TRACE on top of the defaults.
parser_options detect_options();

} // namespace ednstream
