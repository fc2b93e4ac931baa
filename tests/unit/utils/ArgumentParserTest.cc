#include "oddity/utils/ArgumentParser.hh"
#include "gtest/gtest.h"

#include <vector>

using namespace oddity;

class ArgumentParserTest : public ::testing::Test {
protected:
  void SetUp() override {
    parser.addArgument("--config", "Path to a TOML config", true);
    parser.addArgument("--dump", "Print recorded history");
  }

  Result<void> parse(std::vector<const char *> args) {
    args.insert(args.begin(), "oddity");
    return parser.parse(static_cast<int>(args.size()), args.data());
  }

  ArgumentParser parser;
};

TEST_F(ArgumentParserTest, ParsesFlagsAndValues) {
  auto result = parse({"--dump", "--config", "level.toml"});
  ASSERT_TRUE(result.isOk()) << result.message();

  EXPECT_TRUE(parser.hasArgument("--dump"));
  EXPECT_FALSE(parser.getValue("--dump").has_value());
  EXPECT_EQ(parser.getValue("--config").value_or(""), "level.toml");
}

TEST_F(ArgumentParserTest, NoArgumentsIsValid) {
  EXPECT_TRUE(parse({}).isOk());
  EXPECT_FALSE(parser.hasArgument("--config"));
}

TEST_F(ArgumentParserTest, RejectsUnknownOption) {
  auto result = parse({"--fast"});
  EXPECT_EQ(result.code(), ErrorCode::InvalidArgument);
  EXPECT_NE(result.message().find("--fast"), std::string::npos);
}

TEST_F(ArgumentParserTest, RejectsMissingValue) {
  auto result = parse({"--config"});
  EXPECT_EQ(result.code(), ErrorCode::InvalidArgument);
  EXPECT_NE(result.message().find("--config"), std::string::npos);
}

TEST_F(ArgumentParserTest, ReparseClearsPreviousValues) {
  ASSERT_TRUE(parse({"--dump"}).isOk());
  ASSERT_TRUE(parse({}).isOk());
  EXPECT_FALSE(parser.hasArgument("--dump"));
}

TEST_F(ArgumentParserTest, UsageListsOptionsInOrder) {
  std::string usage = parser.usage();
  auto config = usage.find("--config <value>");
  auto dump = usage.find("--dump");
  ASSERT_NE(config, std::string::npos);
  ASSERT_NE(dump, std::string::npos);
  EXPECT_LT(config, dump);
  EXPECT_NE(usage.find("Print recorded history"), std::string::npos);
}
