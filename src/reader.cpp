#include "ednstream/reader.hpp"
#include <string>
#include <utility>
#include <vector>

namespace ednstream {

namespace {

struct pending_tag {
	std::string name;
	int line;
	int col;
};

struct build_frame {
	node_ptr coll;
	std::vector<pending_tag> outer_tags; // tags that apply to this collection once it closes
	std::vector<pending_tag> tags;       // tags waiting for the next element inside it
	node_ptr key;                        // maps: key waiting for its value
};

node_ptr scalar_node(const event& ev)
{
	switch (ev.kind) {
	case event_kind::nil_value: return n_nil();
	case event_kind::boolean_value: return n_bool(ev.boolean());
	case event_kind::string_value: return n_str(ev.text());
	case event_kind::character_value: return n_char(ev.character());
	case event_kind::symbol_value: return n_sym(ev.text());
	case event_kind::keyword_value: return n_kw(ev.text());
	case event_kind::integer_value: return n_i64(ev.integer());
	case event_kind::float_value: return n_f64(ev.floating());
	default: return nullptr;
	}
}

node_ptr collection_node(collection_kind k)
{
	switch (k) {
	case collection_kind::list: return detail::make_node(list{});
	case collection_kind::vector: return detail::make_node(vector_t{});
	case collection_kind::set: return detail::make_node(set{});
	case collection_kind::map: return detail::make_node(map{});
	}
	return nullptr;
}

// Innermost tag applies first: #a #b 1 => (a (b 1)).
node_ptr wrap_tags(node_ptr n, std::vector<pending_tag>& tags)
{
	for (auto it = tags.rbegin(); it != tags.rend(); ++it) {
		auto t = n_tagged(it->name, std::move(n));
		detail::attach_pos(*t, it->line, it->col);
		n = std::move(t);
	}
	tags.clear();
	return n;
}

parser_error rejected_key(const node& n)
{
	return parser_error{error_code::key_must_be_a_value, error_origin::foreign, line(n), col(n),
	                    std::string("key of type ") + kind_name(n) + " rejected by the value model"};
}

} // namespace

read_result read_value(parser& p, const reader_options& opts)
{
	std::vector<build_frame> stack;
	std::vector<pending_tag> top_tags;

	// Adds a finished node to the innermost collection; returns an error when a key is rejected.
	auto add = [&](node_ptr n) -> std::optional<parser_error> {
		build_frame& f = stack.back();
		node& c = *f.coll;
		if (auto* l = std::get_if<list>(&c.data)) {
			l->elems.push_back(std::move(n));
		} else if (auto* v = std::get_if<vector_t>(&c.data)) {
			v->elems.push_back(std::move(n));
		} else if (auto* s = std::get_if<set>(&c.data)) {
			if (opts.key_validator && !opts.key_validator(*n))
				return rejected_key(*n);
			set_insert(*s, std::move(n));
		} else if (auto* m = std::get_if<map>(&c.data)) {
			if (!f.key) {
				if (opts.key_validator && !opts.key_validator(*n))
					return rejected_key(*n);
				f.key = std::move(n);
			} else {
				map_insert(*m, std::move(f.key), std::move(n));
				f.key = nullptr;
			}
		}
		return std::nullopt;
	};

	while (auto ev = p.next()) {
		if (ev->is_error())
			return read_result{nullptr, ev->error()};

		auto& tags = stack.empty() ? top_tags : stack.back().tags;
		node_ptr done;
		if (ev->kind == event_kind::tag) {
			tags.push_back(pending_tag{ev->text(), ev->line, ev->col});
			continue;
		} else if (is_collection_start(ev->kind)) {
			build_frame f;
			f.coll = collection_node(collection_of(ev->kind));
			detail::attach_pos(*f.coll, ev->line, ev->col);
			f.outer_tags = std::move(tags);
			tags.clear();
			stack.push_back(std::move(f));
			continue;
		} else if (is_collection_end(ev->kind)) {
			// The caller pulled the start event itself: its collection is over, nothing left to read.
			if (stack.empty()) {
				p.close();
				return read_result{};
			}
			build_frame f = std::move(stack.back());
			stack.pop_back();
			done = wrap_tags(std::move(f.coll), f.outer_tags);
		} else {
			done = scalar_node(*ev);
			detail::attach_pos(*done, ev->line, ev->col);
			done = wrap_tags(std::move(done), tags);
		}

		if (stack.empty())
			return read_result{std::move(done), std::nullopt};
		if (auto err = add(std::move(done))) {
			p.close();
			return read_result{nullptr, std::move(err)};
		}
	}
	return read_result{};
}

node_ptr read_one(std::string_view src, const parser_options& popts, const reader_options& ropts)
{
	auto p = parser::from_string(std::string(src), popts);
	auto r = read_value(p, ropts);
	if (r.error)
		throw parse_error(*r.error);
	if (!r.value)
		throw parse_error(make_error(error_code::eof_while_parsing_value, p.line(), p.col()));
	// Drives before_finish: trailing characters surface here.
	if (auto ev = p.next()) {
		if (ev->is_error())
			throw parse_error(ev->error());
		throw parse_error(make_error(error_code::trailing_characters, ev->line, ev->col));
	}
	return r.value;
}

} // namespace ednstream
