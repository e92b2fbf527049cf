// diagnostics_json.hpp - JSON serialization of parser errors and event traces
#pragma once
#include "ednstream/error.hpp"
#include "ednstream/event.hpp"
#include <string>
#include <vector>

namespace ednstream {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// {"code":"expected separator","origin":"syntax","message":...,"line":1,"col":4}
std::string error_to_json(const parser_error& e);

// Array of {"event":kind,"line":..,"col":..[,"text"|"value"|"error"]} objects.
std::string events_to_json(const std::vector<event>& events);

// If EDNSTREAM_DIAG_JSON=1 in the environment, print the error as JSON to stderr.
void maybe_print_json(const parser_error& e);

} // namespace ednstream
