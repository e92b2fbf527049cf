#include <gtest/gtest.h>
#include "ednstream/diagnostics_json.hpp"
#include "ednstream/parser.hpp"
#include "test_env.hpp"
#include "test_util.hpp"
#include <cstdlib>
#include <string>

using namespace ednstream;

TEST(DiagnosticsJson, Escaping){
    EXPECT_EQ(json_escape("a\"b\\c\n"), "\"a\\\"b\\\\c\\n\"");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\"\\u0001\"");
}

TEST(DiagnosticsJson, ErrorObject){
    auto js = error_to_json(make_error(error_code::expected_separator, 1, 4));
    EXPECT_EQ(js, "{\"code\":\"expected separator\",\"origin\":\"syntax\",\"message\":\"expected separator\",\"line\":1,\"col\":4}");
}

TEST(DiagnosticsJson, EventArray){
    auto js = events_to_json(ednstream_test::events_of("[:a 1)"));
    EXPECT_EQ(js.front(), '[');
    EXPECT_NE(js.find("{\"event\":\"vector-start\",\"line\":1,\"col\":1}"), std::string::npos);
    EXPECT_NE(js.find("{\"event\":\"keyword\",\"line\":1,\"col\":2,\"text\":\"a\"}"), std::string::npos);
    EXPECT_NE(js.find("\"value\":1"), std::string::npos);
    EXPECT_NE(js.find("\"error\":{\"code\":\"invalid syntax\""), std::string::npos);
}

TEST(DiagnosticsJson, FloatsKeepFullPrecision){
    auto js = events_to_json(ednstream_test::events_of("1.2345678"));
    EXPECT_NE(js.find("\"value\":1.23456780"), std::string::npos) << js;
}

TEST(DiagnosticsJson, PrintedOnParseErrorWhenEnabled){
    ednstream_test::scoped_env env("EDNSTREAM_DIAG_JSON", "1");
    testing::internal::CaptureStderr();
    ednstream_test::events_of("[1)");
    std::string out = testing::internal::GetCapturedStderr();
    EXPECT_NE(out.find("\"code\":\"invalid syntax\""), std::string::npos);
    EXPECT_NE(out.find("\"col\":3"), std::string::npos);
}

TEST(DiagnosticsJson, SilentByDefault){
    if(std::getenv("EDNSTREAM_DIAG_JSON")) GTEST_SKIP() << "EDNSTREAM_DIAG_JSON set in the environment";
    testing::internal::CaptureStderr();
    ednstream_test::events_of("[1)");
    EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
}
