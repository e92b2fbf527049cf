#include "ednstream/source.hpp"

namespace ednstream {

namespace {

// fetch() yields the next byte (0..255) or -1 at end of input.
template <typename Fetch>
source_result decode_utf8(Fetch&& fetch)
{
	int b0 = fetch();
	if (b0 < 0) return source_result::end();
	if (b0 < 0x80) return source_result::of(static_cast<char32_t>(b0));

	int extra = 0;
	char32_t cp = 0;
	char32_t min = 0;
	if (b0 >= 0xC2 && b0 <= 0xDF) { extra = 1; cp = b0 & 0x1F; min = 0x80; }
	else if (b0 >= 0xE0 && b0 <= 0xEF) { extra = 2; cp = b0 & 0x0F; min = 0x800; }
	else if (b0 >= 0xF0 && b0 <= 0xF4) { extra = 3; cp = b0 & 0x07; min = 0x10000; }
	else return source_result::failure(error_code::not_utf8, "invalid utf-8 lead byte");

	for (int i = 0; i < extra; ++i) {
		int b = fetch();
		if (b < 0) return source_result::failure(error_code::not_utf8, "truncated utf-8 sequence");
		if ((b & 0xC0) != 0x80) return source_result::failure(error_code::not_utf8, "invalid utf-8 continuation byte");
		cp = (cp << 6) | static_cast<char32_t>(b & 0x3F);
	}
	if (cp < min) return source_result::failure(error_code::not_utf8, "overlong utf-8 sequence");
	if (cp >= 0xD800 && cp <= 0xDFFF) return source_result::failure(error_code::not_utf8, "utf-8 encoded surrogate");
	if (cp > 0x10FFFF) return source_result::failure(error_code::not_utf8, "code point out of range");
	return source_result::of(cp);
}

} // namespace

source_result utf8_string_source::next()
{
	if (done_) return source_result::end();
	auto r = decode_utf8([this]() -> int {
		if (pos_ >= text_.size()) return -1;
		return static_cast<unsigned char>(text_[pos_++]);
	});
	if (r.status != source_status::ok) done_ = true;
	return r;
}

source_result utf8_stream_source::next()
{
	if (done_) return source_result::end();
	bool io_failed = false;
	auto r = decode_utf8([this, &io_failed]() -> int {
		if (in_.bad()) { io_failed = true; return -1; }
		auto c = in_.get();
		if (c == std::char_traits<char>::eof()) {
			if (in_.bad()) io_failed = true;
			return -1;
		}
		return static_cast<unsigned char>(c);
	});
	if (io_failed) r = source_result::failure(error_code::io_error, "stream read failed");
	if (r.status != source_status::ok) done_ = true;
	return r;
}

source_result u32_string_source::next()
{
	if (done_ || pos_ >= text_.size()) return source_result::end();
	char32_t c = text_[pos_++];
	// Also rejects the end-of-stream sentinel.
	if ((c >= 0xD800 && c <= 0xDFFF) || c > 0x10FFFF) {
		done_ = true;
		return source_result::failure(error_code::not_utf8, "invalid code point");
	}
	return source_result::of(c);
}

void append_utf8(std::string& out, char32_t c)
{
	if (c < 0x80) {
		out += static_cast<char>(c);
	} else if (c < 0x800) {
		out += static_cast<char>(0xC0 | (c >> 6));
		out += static_cast<char>(0x80 | (c & 0x3F));
	} else if (c < 0x10000) {
		out += static_cast<char>(0xE0 | (c >> 12));
		out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (c & 0x3F));
	} else {
		out += static_cast<char>(0xF0 | (c >> 18));
		out += static_cast<char>(0x80 | ((c >> 12) & 0x3F));
		out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (c & 0x3F));
	}
}

} // namespace ednstream
