// Resumable pull parser: one logical step per next() call, nesting kept on an explicit stack
#pragma once
#include "ednstream/atom.hpp"
#include "ednstream/cursor.hpp"
#include "ednstream/event.hpp"
#include "ednstream/options.hpp"
#include "ednstream/source.hpp"
#include <cstddef>
#include <iosfwd>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ednstream
{

    enum class parser_state
    {
        start,
        in_array,              // list, vector or set; see parser::first()
        awaiting_array_comma,  // after an element of a list, vector or set
        in_object,             // map
        awaiting_object_comma, // after a key or value of a map
        before_finish,         // top-level value complete, only whitespace may follow
        finished,              // absorbing
    };

    const char *to_string(parser_state s);

    struct frame
    {
        collection_kind kind = collection_kind::vector;
        bool expecting_key = true; // maps pair elements positionally: odd = key, even = value
        bool tag_pending = false;  // a tag was read and its value has not completed yet
    };

    class parser
    {
    public:
        explicit parser(std::unique_ptr<char_source> src, parser_options opts = {});

        // UTF-8 text; the parser keeps its own copy.
        static parser from_string(std::string text, parser_options opts = {});
        // UTF-8 stream; the stream must outlive the parser.
        static parser from_stream(std::istream &in, parser_options opts = {});

        // Next event, or std::nullopt once the stream has ended. An error event is always the last one.
        std::optional<event> next();

        // Moves to the finished state without producing an event.
        void close() { state_ = parser_state::finished; }

        parser_state state() const { return state_; }
        // For in_array / in_object: no element has been started in the innermost collection yet.
        bool first() const { return first_; }
        size_t depth() const { return stack_.size(); }
        const std::vector<frame> &stack() const { return stack_; }
        int line() const { return cur_.line(); }
        int col() const { return cur_.col(); }
        const parser_options &options() const { return opts_; }

        class iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = event;
            using difference_type = std::ptrdiff_t;
            using pointer = const event *;
            using reference = const event &;

            iterator() = default;
            explicit iterator(parser *p) : p_(p) { ++*this; }

            reference operator*() const { return *ev_; }
            pointer operator->() const { return &*ev_; }
            iterator &operator++()
            {
                ev_ = p_->next();
                if (!ev_)
                    p_ = nullptr;
                return *this;
            }
            bool operator==(const iterator &o) const { return p_ == o.p_; }
            bool operator!=(const iterator &o) const { return p_ != o.p_; }

        private:
            parser *p_ = nullptr;
            std::optional<event> ev_;
        };

        // Single pass: begin() pulls the first event.
        iterator begin() { return iterator(this); }
        iterator end() { return iterator(); }

    private:
        std::optional<event> step();
        event parse_element();
        event open_collection(collection_kind kind, position at);
        event close_collection(const std::optional<std::string> &span);
        event complete(event ev);
        void mark_tag_pending();
        event eof_error() const;
        void trace(const event &ev) const;

        cursor cur_;
        parser_options opts_;
        parser_state state_ = parser_state::start;
        bool first_ = false;
        std::vector<frame> stack_;
    };

    // Pulls every remaining event.
    std::vector<event> drain(parser &p);

} // namespace ednstream
