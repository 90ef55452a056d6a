#include <gtest/gtest.h>

#include <syncset/util/util.hpp>

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    syncset::Log::Context log_context(argc, argv);
    return RUN_ALL_TESTS();
}
