#include <gtest/gtest.h>

// top-level test entrypoint: just bootstraps the test runner. The tests
// themselves are placed in other compilation units

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
