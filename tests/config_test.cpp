#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "config.h"

static AppConfig parse(std::vector<const char*> args) {
    args.insert(args.begin(), "chipbyte");
    return parse_args(static_cast<int>(args.size()), args.data());
}

TEST(ConfigTest, Defaults) {
    AppConfig config = parse({});

    EXPECT_EQ(config.screen_scale, 20u);
    EXPECT_EQ(config.frames_per_second, 60u);
    EXPECT_TRUE(config.font_path.empty());
    EXPECT_TRUE(config.program_path.empty());
    EXPECT_FALSE(config.quirks.assign_before_shift);
    EXPECT_FALSE(config.quirks.set_flag_on_index_overflow);
    EXPECT_FALSE(config.quirks.modify_index_on_dump_or_load);
    EXPECT_FALSE(config.trace);
    EXPECT_FALSE(config.show_help);
}

TEST(ConfigTest, ParsesAllOptions) {
    AppConfig config = parse({ "--scale", "10", "--fps", "30", "--font", "font.bin",
                               "--shift-uses-vy", "--index-overflow-flag", "--increment-index",
                               "--trace", "pong.ch8" });

    EXPECT_EQ(config.screen_scale, 10u);
    EXPECT_EQ(config.frames_per_second, 30u);
    EXPECT_EQ(config.font_path, "font.bin");
    EXPECT_EQ(config.program_path, "pong.ch8");
    EXPECT_TRUE(config.quirks.assign_before_shift);
    EXPECT_TRUE(config.quirks.set_flag_on_index_overflow);
    EXPECT_TRUE(config.quirks.modify_index_on_dump_or_load);
    EXPECT_TRUE(config.trace);
}

TEST(ConfigTest, Help) {
    EXPECT_TRUE(parse({ "--help" }).show_help);
    EXPECT_TRUE(parse({ "-h" }).show_help);
    EXPECT_NE(usage("chipbyte").find("--scale"), std::string::npos);
}

TEST(ConfigTest, RejectsBadNumbers) {
    EXPECT_THROW(parse({ "--scale", "0" }), std::invalid_argument);
    EXPECT_THROW(parse({ "--scale", "1001" }), std::invalid_argument);
    EXPECT_THROW(parse({ "--scale", "-4" }), std::invalid_argument);
    EXPECT_THROW(parse({ "--fps", "sixty" }), std::invalid_argument);
    EXPECT_THROW(parse({ "--fps", "60hz" }), std::invalid_argument);
}

TEST(ConfigTest, RejectsMissingValue) {
    EXPECT_THROW(parse({ "--scale" }), std::invalid_argument);
    EXPECT_THROW(parse({ "--font" }), std::invalid_argument);
}

TEST(ConfigTest, RejectsUnknownOption) {
    EXPECT_THROW(parse({ "--turbo" }), std::invalid_argument);
}

TEST(ConfigTest, RejectsSecondProgram) {
    EXPECT_THROW(parse({ "a.ch8", "b.ch8" }), std::invalid_argument);
}
