// Code-point sources consumed by the cursor (forward-only, no pushback)
#pragma once
#include "ednstream/error.hpp"
#include <istream>
#include <string>
#include <string_view>

namespace ednstream
{

    enum class source_status
    {
        ok,
        eof,
        error,
    };

    struct source_result
    {
        source_status status = source_status::eof;
        char32_t ch = 0;
        error_code code = error_code::io_error; // meaningful only when status == error
        std::string message;

        static source_result of(char32_t c) { return source_result{source_status::ok, c, error_code::io_error, {}}; }
        static source_result end() { return source_result{}; }
        static source_result failure(error_code c, std::string msg) { return source_result{source_status::error, 0, c, std::move(msg)}; }
    };

    class char_source
    {
    public:
        virtual ~char_source() = default;
        // Produces the next code point, end-of-stream, or a failure. After eof or error, keeps returning eof.
        virtual source_result next() = 0;
    };

    // Strict UTF-8 decoding of an owned byte string.
    class utf8_string_source : public char_source
    {
    public:
        explicit utf8_string_source(std::string text) : text_(std::move(text)) {}
        source_result next() override;

    private:
        std::string text_;
        size_t pos_ = 0;
        bool done_ = false;
    };

    // Strict UTF-8 decoding of a stream; the stream must outlive the source.
    class utf8_stream_source : public char_source
    {
    public:
        explicit utf8_stream_source(std::istream &in) : in_(in) {}
        source_result next() override;

    private:
        std::istream &in_;
        bool done_ = false;
    };

    // Code points as given; surrogates and values above U+10FFFF are not_utf8.
    class u32_string_source : public char_source
    {
    public:
        explicit u32_string_source(std::u32string_view text) : text_(text) {}
        source_result next() override;

    private:
        std::u32string text_;
        size_t pos_ = 0;
        bool done_ = false;
    };

    // Appends the UTF-8 encoding of c to out.
    void append_utf8(std::string &out, char32_t c);

} // namespace ednstream
