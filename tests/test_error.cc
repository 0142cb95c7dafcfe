#include "gtest/gtest.h"
#include <algorithm>
#include <cstring>
#include <sstream>
#include "lockstep/error.hh"
#include "lockstep/reporter.hh"

using namespace lockstep;

TEST(Error, Printf) {
    errorx e("%s waited %dms", "x", 100);
    EXPECT_STREQ("x waited 100ms", e.what());
}

TEST(Error, KeepsWholeMessage) {
    const std::string long_msg(1000, 'm');
    errorx e(long_msg);
    EXPECT_EQ(1000u, strlen(e.what()));

    errorx f("%s!", long_msg.c_str());
    EXPECT_EQ(long_msg + "!", f.what());
}

TEST(Error, Strprintf) {
    EXPECT_EQ("", strprintf("%s", ""));
    EXPECT_EQ("timeout 10ms", strprintf("timeout %dms", 10));
    EXPECT_EQ(std::string(300, 'x'), strprintf("%s", std::string(300, 'x').c_str()));
}

TEST(Error, CallStack) {
    call_stack here;
    EXPECT_GT(here.depth(), 0u);
    const std::string s = here.str();
    EXPECT_EQ(0u, s.find("#0 "));
    EXPECT_EQ(here.depth(), static_cast<size_t>(std::count(s.begin(), s.end(), '\n')));
}

TEST(Failure, What) {
    EXPECT_STREQ("double wait for x",
            failure(failure_kind::double_wait, {"x"}).what());
    EXPECT_STREQ("timeout emitting go1",
            failure(failure_kind::emit_timeout, {"go1"}).what());
    EXPECT_STREQ("timeout waiting for done1, done2",
            failure(failure_kind::wait_timeout, {"done2", "done1"}).what());
}

TEST(Failure, CarriesBacktrace) {
    failure f(failure_kind::emit_timeout, {"x"});
    EXPECT_NE(std::string::npos, f.backtrace().find("#0 "));
}

TEST(Failure, MessagesSorted) {
    failure f(failure_kind::wait_timeout, {"z", "x", "y"});
    EXPECT_EQ((std::vector<std::string>{"x", "y", "z"}), f.messages());
}

TEST(Failure, KindPrints) {
    std::stringstream ss;
    ss << failure_kind::double_wait << " " << failure_kind::wait_timeout;
    EXPECT_EQ("double_wait wait_timeout", ss.str());
}

TEST(Reporter, ThrowingReporterThrows) {
    throwing_reporter r;
    EXPECT_THROW(r.fatal(failure(failure_kind::wait_timeout, {"y"})), failure);
}

TEST(Reporter, DefaultIsThrowing) {
    reporter &r = default_reporter();
    EXPECT_EQ(&r, &default_reporter());
    EXPECT_THROW(r.fatal(failure(failure_kind::double_wait, {"x"})), failure);
}

TEST(ReporterDeathTest, GlogReporterAborts) {
    glog_reporter r;
    EXPECT_DEATH(r.fatal(failure(failure_kind::emit_timeout, {"x"})), "timeout emitting x");
}

TEST(MessageList, SortedAndJoined) {
    EXPECT_EQ("", message_list(std::vector<std::string>{}));
    EXPECT_EQ("a", message_list(std::vector<std::string>{"a"}));
    EXPECT_EQ("a, b, c", message_list(std::vector<std::string>{"c", "a", "b"}));
}
