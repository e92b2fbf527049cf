// Structural equality and set/map insertion for the node model.
#include "ednstream/value.hpp"
#include <utility>
#include <vector>

namespace ednstream {

namespace {

bool equal_nodes(const node_ptr& a, const node_ptr& b, bool ignore_meta);

bool equal_seq(const std::vector<node_ptr>& x, const std::vector<node_ptr>& y, bool ignore_meta) {
	if (x.size() != y.size()) return false;
	for (size_t i = 0; i < x.size(); ++i)
		if (!equal_nodes(x[i], y[i], ignore_meta)) return false;
	return true;
}

bool contains(const std::vector<node_ptr>& xs, const node_ptr& e, bool ignore_meta) {
	for (const auto& x : xs)
		if (equal_nodes(x, e, ignore_meta)) return true;
	return false;
}

const std::pair<node_ptr, node_ptr>* find_entry(const map& m, const node_ptr& k, bool ignore_meta) {
	for (const auto& kv : m.entries)
		if (equal_nodes(kv.first, k, ignore_meta)) return &kv;
	return nullptr;
}

// Metadata maps are ordered, so they compare in lockstep.
bool equal_meta(const node& a, const node& b) {
	if (a.metadata.size() != b.metadata.size()) return false;
	auto ib = b.metadata.begin();
	for (auto ia = a.metadata.begin(); ia != a.metadata.end(); ++ia, ++ib) {
		if (ia->first != ib->first || !equal_nodes(ia->second, ib->second, false)) return false;
	}
	return true;
}

// Visits one side; the other side is known to hold the same alternative.
struct same_value {
	const node_data& other;
	bool ignore_meta;

	template <typename T> const T& peer() const { return std::get<T>(other); }

	bool operator()(std::monostate) const { return true; }
	bool operator()(bool v) const { return v == peer<bool>(); }
	bool operator()(int64_t v) const { return v == peer<int64_t>(); }
	bool operator()(double v) const { return v == peer<double>(); }
	bool operator()(const std::string& v) const { return v == peer<std::string>(); }
	bool operator()(const character& v) const { return v.code_point == peer<character>().code_point; }
	bool operator()(const keyword& v) const { return v.name == peer<keyword>().name; }
	bool operator()(const symbol& v) const { return v.name == peer<symbol>().name; }
	bool operator()(const list& v) const { return equal_seq(v.elems, peer<list>().elems, ignore_meta); }
	bool operator()(const vector_t& v) const { return equal_seq(v.elems, peer<vector_t>().elems, ignore_meta); }
	// Sets and maps are duplicate-free: equal size plus containment is equality.
	bool operator()(const set& v) const {
		const auto& o = peer<set>().elems;
		if (v.elems.size() != o.size()) return false;
		for (const auto& e : v.elems)
			if (!contains(o, e, ignore_meta)) return false;
		return true;
	}
	bool operator()(const map& v) const {
		const auto& o = peer<map>();
		if (v.entries.size() != o.entries.size()) return false;
		for (const auto& kv : v.entries) {
			auto* hit = find_entry(o, kv.first, ignore_meta);
			if (!hit || !equal_nodes(hit->second, kv.second, ignore_meta)) return false;
		}
		return true;
	}
	bool operator()(const tagged_value& v) const {
		const auto& o = peer<tagged_value>();
		return v.tag.name == o.tag.name && equal_nodes(v.inner, o.inner, ignore_meta);
	}
};

bool equal_nodes(const node_ptr& a, const node_ptr& b, bool ignore_meta) {
	if (a == b) return true;
	if (!a || !b || a->data.index() != b->data.index()) return false;
	if (!ignore_meta && !equal_meta(*a, *b)) return false;
	return std::visit(same_value{b->data, ignore_meta}, a->data);
}

} // namespace

bool equal(const node_ptr& a, const node_ptr& b, bool ignore_metadata) { return equal_nodes(a, b, ignore_metadata); }

bool set_insert(set& s, node_ptr e) {
	if (contains(s.elems, e, true)) return false;
	s.elems.push_back(std::move(e));
	return true;
}

bool map_insert(map& m, node_ptr k, node_ptr v) {
	for (auto& kv : m.entries) {
		if (equal_nodes(kv.first, k, true)) {
			kv.second = std::move(v);
			return false;
		}
	}
	m.entries.emplace_back(std::move(k), std::move(v));
	return true;
}

node_ptr map_get(const map& m, const node_ptr& k) {
	auto* hit = find_entry(m, k, true);
	return hit ? hit->second : nullptr;
}

const char* kind_name(const node& n) {
	struct V {
		const char* operator()(std::monostate) const { return "nil"; }
		const char* operator()(bool) const { return "boolean"; }
		const char* operator()(int64_t) const { return "integer"; }
		const char* operator()(double) const { return "float"; }
		const char* operator()(const std::string&) const { return "string"; }
		const char* operator()(const character&) const { return "character"; }
		const char* operator()(const keyword&) const { return "keyword"; }
		const char* operator()(const symbol&) const { return "symbol"; }
		const char* operator()(const list&) const { return "list"; }
		const char* operator()(const vector_t&) const { return "vector"; }
		const char* operator()(const set&) const { return "set"; }
		const char* operator()(const map&) const { return "map"; }
		const char* operator()(const tagged_value&) const { return "tag"; }
	};
	return std::visit(V{}, n.data);
}

} // namespace ednstream
