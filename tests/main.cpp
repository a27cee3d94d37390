#include <iostream>
#include <exception>
// We only link GTest::gtest, not gtest_main, so the runner is invoked explicitly.
#include <gtest/gtest.h>

int main(int argc, char** argv){
    try{
        ::testing::InitGoogleTest(&argc, argv);
        return RUN_ALL_TESTS();
    }catch(const std::exception& e){ std::cerr << "[rainbow_tests] exception: " << e.what() << "\n"; return 1; }
}
