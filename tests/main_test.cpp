#include <gtest/gtest.h>

#include "utils/Logger.hpp"
#include "utils/ResourceMonitor.hpp"

using namespace DiffExpr::Utils;

class ResourceListener : public testing::EmptyTestEventListener {
public:
    void OnTestStart(const testing::TestInfo& /*test_info*/) override {
        monitor_.reset();
    }

    void OnTestEnd(const testing::TestInfo& test_info) override {
        std::string test_name = std::string(test_info.test_suite_name()) + "." + test_info.name();
        monitor_.print_stats(test_name);
    }

private:
    ResourceMonitor monitor_;
};

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);

    // Expected warnings and errors from negative tests would drown the test output
    Logger::instance().set_log_level(DiffExpr::LogLevel::LOG_ERROR);

    testing::TestEventListeners& listeners = testing::UnitTest::GetInstance()->listeners();
    listeners.Append(new ResourceListener);

    return RUN_ALL_TESTS();
}
