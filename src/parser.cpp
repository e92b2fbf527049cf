#include "ednstream/parser.hpp"
#include "ednstream/diagnostics_json.hpp"
#include <cstdio>

namespace ednstream {

namespace {

bool is_closer(char32_t c) { return c == ')' || c == ']' || c == '}'; }

parser_state in_state_for(collection_kind k)
{
	return k == collection_kind::map ? parser_state::in_object : parser_state::in_array;
}

parser_state awaiting_state_for(collection_kind k)
{
	return k == collection_kind::map ? parser_state::awaiting_object_comma : parser_state::awaiting_array_comma;
}

// True when the separator run before a closer contains a comma outside comments.
bool has_comma(const std::string& span)
{
	bool in_comment = false;
	for (char c : span) {
		if (in_comment) {
			in_comment = (c != '\n');
			continue;
		}
		if (c == ';')
			in_comment = true;
		else if (c == ',')
			return true;
	}
	return false;
}

} // namespace

const char* to_string(parser_state s)
{
	switch (s) {
	case parser_state::start: return "start";
	case parser_state::in_array: return "in-array";
	case parser_state::awaiting_array_comma: return "awaiting-array-comma";
	case parser_state::in_object: return "in-object";
	case parser_state::awaiting_object_comma: return "awaiting-object-comma";
	case parser_state::before_finish: return "before-finish";
	case parser_state::finished: return "finished";
	}
	return "unknown";
}

parser::parser(std::unique_ptr<char_source> src, parser_options opts)
	: cur_(std::move(src)), opts_(opts) {}

parser parser::from_string(std::string text, parser_options opts)
{
	return parser(std::make_unique<utf8_string_source>(std::move(text)), opts);
}

parser parser::from_stream(std::istream& in, parser_options opts)
{
	return parser(std::make_unique<utf8_stream_source>(in), opts);
}

std::optional<event> parser::next()
{
	if (state_ == parser_state::finished)
		return std::nullopt;
	auto ev = step();
	if (!ev)
		return ev;
	if (ev->is_error()) {
		state_ = parser_state::finished;
		maybe_print_json(ev->error());
	}
	if (opts_.trace)
		trace(*ev);
	return ev;
}

std::optional<event> parser::step()
{
	switch (state_) {
	case parser_state::finished:
		return std::nullopt;
	case parser_state::before_finish:
		skip_whitespace(cur_, opts_.allow_comments);
		if (cur_.eof()) {
			if (cur_.failure())
				return error_event(*cur_.failure());
			state_ = parser_state::finished;
			return std::nullopt;
		}
		return error_event(error_code::trailing_characters, cur_.pos());
	case parser_state::start:
		skip_whitespace(cur_, opts_.allow_comments);
		if (cur_.eof())
			return eof_error();
		return parse_element();
	case parser_state::in_array:
	case parser_state::in_object: {
		auto span = skip_whitespace(cur_, opts_.allow_comments);
		if (cur_.eof())
			return eof_error();
		if (is_closer(cur_.current()))
			return close_collection(span);
		return parse_element();
	}
	case parser_state::awaiting_array_comma:
	case parser_state::awaiting_object_comma: {
		auto span = skip_whitespace(cur_, opts_.allow_comments);
		if (cur_.eof())
			return eof_error();
		if (is_closer(cur_.current()))
			return close_collection(span);
		if (!span)
			return error_event(error_code::expected_separator, cur_.pos());
		return parse_element();
	}
	}
	return std::nullopt;
}

event parser::parse_element()
{
	position at = cur_.pos();
	char32_t c = cur_.current();
	switch (c) {
	case '(':
		cur_.advance();
		return open_collection(collection_kind::list, at);
	case '[':
		cur_.advance();
		return open_collection(collection_kind::vector, at);
	case '{':
		cur_.advance();
		return open_collection(collection_kind::map, at);
	case '#': {
		cur_.advance();
		if (cur_.eof())
			return eof_error();
		if (cur_.is('{')) {
			cur_.advance();
			return open_collection(collection_kind::set, at);
		}
		event ev = read_tag(cur_, at);
		if (!ev.is_error())
			mark_tag_pending();
		return ev;
	}
	case '"':
		return complete(read_string_literal(cur_));
	case '\\':
		return complete(read_character_literal(cur_));
	default:
		break;
	}
	if (is_constituent(c))
		return complete(recognize_atom(cur_));
	// Includes a closer with nothing open.
	return error_event(error_code::invalid_syntax, at);
}

event parser::open_collection(collection_kind kind, position at)
{
	stack_.push_back(frame{kind, true, false});
	state_ = in_state_for(kind);
	first_ = true;
	return make_event(start_event(kind), at);
}

event parser::close_collection(const std::optional<std::string>& span)
{
	position at = cur_.pos();
	const frame& f = stack_.back();
	if (cur_.current() != closer_of(f.kind))
		return error_event(error_code::invalid_syntax, at);
	if (f.tag_pending)
		return error_event(error_code::invalid_syntax, at);
	if (f.kind == collection_kind::map && !f.expecting_key)
		return error_event(error_code::expected_separator, at); // key without value
	if (opts_.strict_commas && span && has_comma(*span))
		return error_event(error_code::trailing_comma, at);
	collection_kind kind = f.kind;
	cur_.advance();
	stack_.pop_back();
	return complete(make_event(end_event(kind), at));
}

// Bookkeeping for a finished element (scalar, or a collection that just closed).
event parser::complete(event ev)
{
	if (ev.is_error())
		return ev;
	if (stack_.empty()) {
		state_ = parser_state::before_finish;
		return ev;
	}
	frame& f = stack_.back();
	f.tag_pending = false;
	if (f.kind == collection_kind::map)
		f.expecting_key = !f.expecting_key;
	state_ = awaiting_state_for(f.kind);
	first_ = false;
	return ev;
}

// The tag and its value form one element, so no separator is required in between.
void parser::mark_tag_pending()
{
	if (stack_.empty())
		return; // stay in start until the tagged value arrives
	frame& f = stack_.back();
	f.tag_pending = true;
	state_ = in_state_for(f.kind);
	first_ = false;
}

event parser::eof_error() const
{
	if (cur_.failure())
		return error_event(*cur_.failure());
	error_code code = error_code::eof_while_parsing_value;
	if (!stack_.empty())
		code = stack_.back().kind == collection_kind::map ? error_code::eof_while_parsing_object
		                                                  : error_code::eof_while_parsing_array;
	return error_event(code, cur_.pos());
}

void parser::trace(const event& ev) const
{
	std::fprintf(stderr, "[ednstream][trace] %s | state=%s depth=%zu next=%d:%d\n",
	             describe(ev).c_str(), to_string(state_), stack_.size(), cur_.line(), cur_.col());
}

std::vector<event> drain(parser& p)
{
	std::vector<event> out;
	while (auto ev = p.next())
		out.push_back(std::move(*ev));
	return out;
}

} // namespace ednstream
