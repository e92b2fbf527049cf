// Test entry point. We link GTest::gtest (not gtest_main) and dispatch explicitly.
#include <gtest/gtest.h>
#include <cstdlib>
#include <iostream>

int main(int argc, char** argv){
    // Diagnostics JSON would interleave with gtest output.
    if(std::getenv("EDNSTREAM_DIAG_JSON")) std::cerr << "[tests] EDNSTREAM_DIAG_JSON is set; error JSON will be printed\n";
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
