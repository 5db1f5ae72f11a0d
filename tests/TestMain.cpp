#include "core/Log.hpp"

#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Console only; keep test output readable
    imseries::Log::Init("", imseries::Log::Level::Warn);

    const int result = RUN_ALL_TESTS();

    imseries::Log::Shutdown();
    return result;
}
