#include <gtest/gtest.h>
#include "ednstream/event.hpp"

using namespace ednstream;

TEST(Event, CollectionKindMapping){
    for(auto k : {collection_kind::list, collection_kind::vector, collection_kind::set, collection_kind::map}){
        EXPECT_TRUE(is_collection_start(start_event(k)));
        EXPECT_TRUE(is_collection_end(end_event(k)));
        EXPECT_EQ(collection_of(start_event(k)), k);
        EXPECT_EQ(collection_of(end_event(k)), k);
    }
    EXPECT_EQ(closer_of(collection_kind::set), U'}');
    EXPECT_TRUE(is_scalar(event_kind::keyword_value));
    EXPECT_FALSE(is_scalar(event_kind::tag));
}

TEST(Event, Describe){
    EXPECT_EQ(describe(make_event(event_kind::integer_value, position{1, 1}, int64_t(42))), "integer 42");
    EXPECT_EQ(describe(make_event(event_kind::keyword_value, position{1, 1}, std::string("k"))), "keyword k");
    EXPECT_EQ(describe(make_event(event_kind::character_value, position{1, 1}, U'A')), "character U+41");
    EXPECT_EQ(describe(make_event(event_kind::map_end, position{2, 3})), "map-end");
    EXPECT_EQ(describe(error_event(error_code::expected_separator, position{1, 4})), "error expected separator at 1:4");
}

TEST(Error, Formatting){
    auto e = make_error(error_code::trailing_comma, 2, 5);
    EXPECT_EQ(e.origin, error_origin::syntax);
    EXPECT_EQ(e.message, "trailing comma");
    EXPECT_EQ(format_error(e), "trailing comma at 2:5");
    parser_error io{error_code::io_error, error_origin::io, 1, 1, "stream read failed"};
    EXPECT_EQ(format_error(io), "stream read failed at 1:1 (io)");
    EXPECT_STREQ(to_string(error_code::eof_while_parsing_object), "EOF while parsing map");
}
