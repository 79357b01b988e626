#include <gtest/gtest.h>

// top-level test entrypoint: tests are placed in other compilation units
// (`*.tests.cpp` beside the sources, plus anything in this directory)

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
