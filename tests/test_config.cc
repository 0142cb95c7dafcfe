#include "gtest/gtest.h"
#include <cstdlib>
#include "lockstep/config.hh"
#include "lockstep/error.hh"
#include "lockstep/rendezvous.hh"

using namespace lockstep;
using namespace std::chrono;

// restores the environment variables it touched
struct env_guard {
    ~env_guard() {
        unsetenv(timeout_env);
        unsetenv(verbose_env);
    }
};

TEST(Config, Defaults) {
    config c;
    EXPECT_EQ(seconds{10}, c.timeout);
    EXPECT_FALSE(c.verbose);
}

TEST(Config, FromEmptyEnv) {
    env_guard g;
    unsetenv(timeout_env);
    unsetenv(verbose_env);
    config c = config::from_env();
    EXPECT_EQ(default_timeout, c.timeout);
    EXPECT_FALSE(c.verbose);
}

TEST(Config, FromEnv) {
    env_guard g;
    setenv(timeout_env, "60000", 1);
    setenv(verbose_env, "true", 1);
    config c = config::from_env();
    EXPECT_EQ(milliseconds{60000}, c.timeout);
    EXPECT_TRUE(c.verbose);

    // a rendezvous built without a config picks the environment up
    rendezvous rv;
    EXPECT_EQ(minutes{1}, rv.timeout());
    EXPECT_TRUE(rv.verbose());
}

TEST(Config, BadEnv) {
    env_guard g;
    setenv(timeout_env, "soon", 1);
    EXPECT_THROW(config::from_env(), errorx);
    try {
        config::from_env();
    } catch (errorx &e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find(timeout_env));
    }

    setenv(timeout_env, "100", 1);
    setenv(verbose_env, "maybe", 1);
    EXPECT_THROW(config::from_env(), errorx);
}

TEST(Config, ParseTimeout) {
    EXPECT_EQ(milliseconds{1}, parse_timeout("t", "1"));
    EXPECT_EQ(milliseconds{250}, parse_timeout("t", " 250 "));
    // far too long to add to a clock; rendezvous saturates it
    EXPECT_EQ(milliseconds::max(), parse_timeout("t", "9223372036854775807"));
    EXPECT_THROW(parse_timeout("t", "0"), errorx);
    EXPECT_THROW(parse_timeout("t", "-10"), errorx);
    EXPECT_THROW(parse_timeout("t", "10s"), errorx);
    EXPECT_THROW(parse_timeout("t", ""), errorx);
}

TEST(Config, ParseFlag) {
    EXPECT_TRUE(parse_flag("v", "1"));
    EXPECT_TRUE(parse_flag("v", "TRUE"));
    EXPECT_TRUE(parse_flag("v", "yes"));
    EXPECT_FALSE(parse_flag("v", "0"));
    EXPECT_FALSE(parse_flag("v", "False"));
    EXPECT_FALSE(parse_flag("v", ""));
    EXPECT_THROW(parse_flag("v", "2"), errorx);
}

TEST(Config, CommandLine) {
    config c;
    po::options_description desc;
    c.add_options(desc);

    const char *argv[] = {"test", "--timeout-ms", "1500", "--verbose"};
    po::variables_map vm;
    po::store(po::parse_command_line(4, argv, desc), vm);
    po::notify(vm);

    EXPECT_EQ(milliseconds{1500}, c.timeout);
    EXPECT_TRUE(c.verbose);
}

TEST(Config, CommandLineKeepsDefaults) {
    config c;
    c.timeout = milliseconds{700};
    po::options_description desc;
    c.add_options(desc);

    const char *argv[] = {"test"};
    po::variables_map vm;
    po::store(po::parse_command_line(1, argv, desc), vm);
    po::notify(vm);

    EXPECT_EQ(milliseconds{700}, c.timeout);
    EXPECT_FALSE(c.verbose);
}

TEST(Config, CommandLineRejectsZeroTimeout) {
    config c;
    po::options_description desc;
    c.add_options(desc);

    const char *argv[] = {"test", "--timeout-ms", "0"};
    po::variables_map vm;
    po::store(po::parse_command_line(3, argv, desc), vm);
    EXPECT_THROW(po::notify(vm), errorx);
}
