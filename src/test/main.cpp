// src/test/main.cpp
#include "gtest/gtest.h"

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Layer files are written under per-test directories below the current
    // working directory; each fixture removes its own.
    return RUN_ALL_TESTS();
}
