#include <gtest/gtest.h>

#include <invar/util/util.hpp>

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    invar::Log::Context log_context(argc, argv);
    return RUN_ALL_TESTS();
}
