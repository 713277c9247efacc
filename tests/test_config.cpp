#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>
#include "simplelife/config.hpp"

using namespace simplelife;

namespace {

AppConfig parse(std::vector<std::string> args) {
    args.insert(args.begin(), "simplelife_demo");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

}

TEST(Config, Defaults) {
    AppConfig cfg = parse({});
    EXPECT_FLOAT_EQ(0.1f, cfg.dt);
    EXPECT_EQ(1, cfg.steps);
    EXPECT_FALSE(cfg.quiet);
    EXPECT_FALSE(cfg.help);
}

TEST(Config, LongAndShortFlags) {
    AppConfig cfg = parse({"--dt", "-2.5", "--steps", "12", "--quiet"});
    EXPECT_FLOAT_EQ(-2.5f, cfg.dt);
    EXPECT_EQ(12, cfg.steps);
    EXPECT_TRUE(cfg.quiet);

    cfg = parse({"-t", "0.5", "-s", "3", "-q", "-?"});
    EXPECT_FLOAT_EQ(0.5f, cfg.dt);
    EXPECT_EQ(3, cfg.steps);
    EXPECT_TRUE(cfg.quiet);
    EXPECT_TRUE(cfg.help);
}

TEST(Config, ZeroStepIsAccepted) {
    AppConfig cfg = parse({"--dt", "0"});
    EXPECT_EQ(0.0f, cfg.dt);
}

TEST(Config, RejectsBadInput) {
    EXPECT_THROW(parse({"--bogus"}), std::runtime_error);
    EXPECT_THROW(parse({"--dt"}), std::runtime_error);
    EXPECT_THROW(parse({"--dt", "abc"}), std::runtime_error);
    EXPECT_THROW(parse({"--dt", "0.5x"}), std::runtime_error);
    EXPECT_THROW(parse({"--dt", "1000"}), std::runtime_error);
    EXPECT_THROW(parse({"--steps", "0"}), std::runtime_error);
    EXPECT_THROW(parse({"--steps", "2.5"}), std::runtime_error);
}
