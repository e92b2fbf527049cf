#include <gtest/gtest.h>
#include "ednstream/options.hpp"
#include "ednstream/parser.hpp"
#include "test_env.hpp"
#include <string>

using namespace ednstream;
using ednstream_test::scoped_env;

TEST(Options, Defaults){
    parser_options o;
    EXPECT_TRUE(o.allow_comments);
    EXPECT_FALSE(o.strict_commas);
    EXPECT_FALSE(o.trace);
}

TEST(Options, FlagSpellings){
    {
        scoped_env e("EDNSTREAM_TEST_FLAG", "yes");
        EXPECT_TRUE(flag_enabled("EDNSTREAM_TEST_FLAG"));
        EXPECT_FALSE(flag_disabled("EDNSTREAM_TEST_FLAG"));
    }
    {
        scoped_env e("EDNSTREAM_TEST_FLAG", "F");
        EXPECT_FALSE(flag_enabled("EDNSTREAM_TEST_FLAG"));
        EXPECT_TRUE(flag_disabled("EDNSTREAM_TEST_FLAG"));
    }
    EXPECT_FALSE(flag_enabled("EDNSTREAM_TEST_FLAG"));
    EXPECT_FALSE(flag_disabled("EDNSTREAM_TEST_FLAG"));
}

TEST(Options, DetectFromEnvironment){
    scoped_env c("EDNSTREAM_COMMENTS", "0");
    scoped_env s("EDNSTREAM_STRICT_COMMAS", "1");
    auto o = detect_options();
    EXPECT_FALSE(o.allow_comments);
    EXPECT_TRUE(o.strict_commas);
    EXPECT_FALSE(o.trace);
}

TEST(Options, TraceLogsEveryEvent){
    parser_options o;
    o.trace = true;
    auto p = parser::from_string("[1]", o);
    testing::internal::CaptureStderr();
    drain(p);
    std::string log = testing::internal::GetCapturedStderr();
    EXPECT_NE(log.find("[ednstream][trace] vector-start | state=in-array depth=1 next=1:2"), std::string::npos);
    EXPECT_NE(log.find("[ednstream][trace] integer 1 | state=awaiting-array-comma depth=1 next=1:3"), std::string::npos);
    EXPECT_NE(log.find("[ednstream][trace] vector-end | state=before-finish depth=0"), std::string::npos);
}
