// Node-based EDN value model with metadata & source positions
#pragma once
#include <string>
#include <variant>
#include <vector>
#include <memory>
#include <map>
#include <cstdint>
#include <initializer_list>
#include <utility>

namespace ednstream
{

    struct keyword
    {
        std::string name;
    };
    struct symbol
    {
        std::string name;
    };
    struct character
    {
        char32_t code_point = 0;
    };
    struct list;
    struct vector_t;
    struct set;
    struct map;
    struct tagged_value;
    struct node; // forward declarations

    using node_ptr = std::shared_ptr<node>;

    struct list
    {
        std::vector<node_ptr> elems;
    };
    struct vector_t
    {
        std::vector<node_ptr> elems;
    };
    // Elements are unique by structural equality; use set_insert to add.
    struct set
    {
        std::vector<node_ptr> elems;
    };
    // Keys are unique by structural equality; use map_insert to add.
    struct map
    {
        std::vector<std::pair<node_ptr, node_ptr>> entries;
    };
    struct tagged_value
    {
        symbol tag;
        node_ptr inner;
    };

    using node_data = std::variant<std::monostate, bool, int64_t, double, std::string, character, keyword, symbol, list, vector_t, set, map, tagged_value>;

    struct node
    {
        node_data data;
        std::map<std::string, node_ptr> metadata;
    };

    // Structural deep equality of two EDN nodes. If ignore_metadata is true, metadata maps are ignored.
    bool equal(const node_ptr &a, const node_ptr &b, bool ignore_metadata = true);

    // Adds e unless an equal element is already present. Returns true if inserted.
    bool set_insert(set &s, node_ptr e);

    // Adds k -> v, replacing the value of an equal key. Returns true if the key was new.
    bool map_insert(map &m, node_ptr k, node_ptr v);

    // Lookup by structural key equality; nullptr when absent.
    node_ptr map_get(const map &m, const node_ptr &k);

    // Name of the active alternative ("nil", "integer", "map", ...).
    const char *kind_name(const node &n);

    namespace detail
    {
        inline node_ptr make_node(node_data d) { return std::make_shared<node>(node{std::move(d), {}}); }
        inline node_ptr make_int(int64_t v) { return make_node(node_data{v}); }
        inline void attach_pos(node &n, int line, int col)
        {
            n.metadata["line"] = make_int(line);
            n.metadata["col"] = make_int(col);
        }
    }

    inline bool is_nil(const node &n) { return std::holds_alternative<std::monostate>(n.data); }
    inline bool is_symbol(const node &n) { return std::holds_alternative<symbol>(n.data); }
    inline bool is_keyword(const node &n) { return std::holds_alternative<keyword>(n.data); }
    inline bool is_list(const node &n) { return std::holds_alternative<list>(n.data); }
    inline bool is_vector(const node &n) { return std::holds_alternative<vector_t>(n.data); }
    inline bool is_set(const node &n) { return std::holds_alternative<set>(n.data); }
    inline bool is_map(const node &n) { return std::holds_alternative<map>(n.data); }
    inline bool is_tagged(const node &n) { return std::holds_alternative<tagged_value>(n.data); }
    inline const list *as_list(const node &n) { return is_list(n) ? &std::get<list>(n.data) : nullptr; }
    inline const vector_t *as_vector(const node &n) { return is_vector(n) ? &std::get<vector_t>(n.data) : nullptr; }
    inline const set *as_set(const node &n) { return is_set(n) ? &std::get<set>(n.data) : nullptr; }
    inline const map *as_map(const node &n) { return is_map(n) ? &std::get<map>(n.data) : nullptr; }
    inline const symbol *as_symbol(const node &n) { return is_symbol(n) ? &std::get<symbol>(n.data) : nullptr; }
    inline const tagged_value *as_tagged(const node &n) { return is_tagged(n) ? &std::get<tagged_value>(n.data) : nullptr; }

    inline int meta_int(const node &n, const std::string &k, int def = -1)
    {
        auto it = n.metadata.find(k);
        if (it == n.metadata.end())
            return def;
        auto &nd = *it->second;
        if (std::holds_alternative<int64_t>(nd.data))
            return (int)std::get<int64_t>(nd.data);
        return def;
    }
    inline int line(const node &n) { return meta_int(n, "line"); }
    inline int col(const node &n) { return meta_int(n, "col"); }

    // Factory helpers
    inline node_ptr n_nil() { return detail::make_node(std::monostate{}); }
    inline node_ptr n_sym(std::string name) { return detail::make_node(symbol{std::move(name)}); }
    inline node_ptr n_kw(std::string name) { return detail::make_node(keyword{std::move(name)}); }
    inline node_ptr n_str(std::string s) { return detail::make_node(std::move(s)); }
    inline node_ptr n_char(char32_t c) { return detail::make_node(character{c}); }
    inline node_ptr n_i64(int64_t v) { return detail::make_node(v); }
    inline node_ptr n_f64(double v) { return detail::make_node(v); }
    inline node_ptr n_bool(bool b) { return detail::make_node(b); }
    inline node_ptr n_tagged(std::string tag, node_ptr inner) { return detail::make_node(tagged_value{symbol{std::move(tag)}, std::move(inner)}); }

    inline node_ptr node_list(std::initializer_list<node_ptr> xs = {})
    {
        list l;
        l.elems.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(l));
    }
    inline node_ptr node_vec(std::initializer_list<node_ptr> xs = {})
    {
        vector_t v;
        v.elems.assign(xs.begin(), xs.end());
        return detail::make_node(std::move(v));
    }
    inline node_ptr node_set(std::initializer_list<node_ptr> xs = {})
    {
        set s;
        for (auto &x : xs)
            set_insert(s, x);
        return detail::make_node(std::move(s));
    }
    inline node_ptr node_map(std::initializer_list<std::pair<node_ptr, node_ptr>> xs = {})
    {
        map m;
        for (auto &kv : xs)
            map_insert(m, kv.first, kv.second);
        return detail::make_node(std::move(m));
    }

    inline std::pair<node_ptr, node_ptr> kvp(node_ptr k, node_ptr v) { return {std::move(k), std::move(v)}; }

} // namespace ednstream
