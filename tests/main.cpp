#include <gtest/gtest.h>
#include "TestReporter.hpp"

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);

    // keep the default printer, add the summary on top
    auto& listeners = ::testing::UnitTest::GetInstance()->listeners();
    listeners.Append(new SummaryReporter());

    return RUN_ALL_TESTS();
}
