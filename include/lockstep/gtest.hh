#ifndef LOCKSTEP_GTEST_HH
#define LOCKSTEP_GTEST_HH

#include "gtest/gtest.h"
#include "lockstep/reporter.hh"

namespace lockstep {

//! reports through the running GoogleTest test
//
//! fatal() adds a test failure and then throws, so the failing task
//! unwinds. run worker tasks with task::spawn so the failure reaches the
//! test body through join().
class gtest_reporter : public reporter {
public:
    void log(const std::string &msg) override {
        const ::testing::TestInfo *info =
            ::testing::UnitTest::GetInstance()->current_test_info();
        if (info) {
            LOG(INFO) << info->test_case_name() << "." << info->name() << ": " << msg;
        } else {
            LOG(INFO) << msg;
        }
    }

    [[noreturn]] void fatal(const failure &f) override {
        ADD_FAILURE() << f.what() << "\n" << f.backtrace();
        throw f;
    }
};

} // end namespace lockstep

#endif // LOCKSTEP_GTEST_HH
