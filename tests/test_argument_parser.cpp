#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cli/argument_parser.hpp"
#include "cli/grammar.hpp"

using namespace dyn;

namespace {

Grammar sample_grammar() {
  Grammar g("dynamite sample", "Sample grammar");
  g.add_flag(map_parameter(make_param("name", SemanticType::string(), "Node name")));
  g.add_flag(map_parameter(make_param("count", SemanticType::integer(), YAML::Node(3), "How many")));
  g.add_flag(map_parameter(
      make_param("ids", SemanticType::optional_of(SemanticType::list_of(SemanticType::integer())), "Ids")));
  g.add_flag(map_parameter(make_param("ratio", SemanticType::optional_of(SemanticType::floating()))));
  g.add_flag(map_parameter(make_param("verbose", SemanticType::boolean(), "Chatty")));
  return g;
}

CliErrc parse_error_code(const Grammar& g, const std::vector<std::string>& args, std::string* what = nullptr) {
  try {
    parse_arguments(g, args);
  } catch (const CliError& e) {
    if (what) *what = e.what();
    return e.code();
  }
  return CliErrc::Unknown;
}

}  // namespace

TEST(ArgumentParserTest, FillsEveryDestination) {
  auto values = parse_arguments(sample_grammar(), {"--name", "sensor-1"});
  EXPECT_EQ(values["name"].as<std::string>(), "sensor-1");
  EXPECT_EQ(values["count"].as<int>(), 3);
  EXPECT_TRUE(values["ids"].IsNull());
  EXPECT_TRUE(values["ratio"].IsNull());
  EXPECT_FALSE(values["verbose"].as<bool>());
}

TEST(ArgumentParserTest, CoercesDeclaredTypes) {
  auto values = parse_arguments(sample_grammar(),
                                {"--name", "n", "--count", "7", "--ratio", "0.5", "--verbose"});
  EXPECT_EQ(values["count"].as<int>(), 7);
  EXPECT_DOUBLE_EQ(values["ratio"].as<double>(), 0.5);
  EXPECT_TRUE(values["verbose"].as<bool>());
}

TEST(ArgumentParserTest, ListConsumesFollowingValues) {
  auto values = parse_arguments(sample_grammar(), {"--ids", "1", "2", "3", "--name", "n"});
  ASSERT_TRUE(values["ids"].IsSequence());
  EXPECT_EQ(values["ids"].as<std::vector<int>>(), (std::vector<int>{1, 2, 3}));
  EXPECT_EQ(values["name"].as<std::string>(), "n");
}

TEST(ArgumentParserTest, MissingRequiredFlag) {
  std::string what;
  EXPECT_EQ(parse_error_code(sample_grammar(), {"--count", "2"}, &what), CliErrc::Usage);
  EXPECT_NE(what.find("the following arguments are required: --name"), std::string::npos);
}

TEST(ArgumentParserTest, RejectsBadInteger) {
  std::string what;
  EXPECT_EQ(parse_error_code(sample_grammar(), {"--name", "n", "--count", "abc"}, &what), CliErrc::Usage);
  EXPECT_NE(what.find("invalid int value: 'abc'"), std::string::npos);
  EXPECT_EQ(parse_error_code(sample_grammar(), {"--name", "n", "--count", "4x"}), CliErrc::Usage);
}

TEST(ArgumentParserTest, RejectsIntegerOutOfRange) {
  std::string what;
  EXPECT_EQ(parse_error_code(sample_grammar(), {"--name", "n", "--count", "99999999999"}, &what),
            CliErrc::Usage);
  EXPECT_NE(what.find("invalid int value: '99999999999'"), std::string::npos);
  EXPECT_EQ(parse_error_code(sample_grammar(), {"--name", "n", "--ids", "1", "4294967296"}), CliErrc::Usage);

  auto values = parse_arguments(sample_grammar(), {"--name", "n", "--count", "2147483647"});
  EXPECT_EQ(values["count"].as<int>(), 2147483647);
}

TEST(ArgumentParserTest, RejectsUnknownOptionAndStrayPositional) {
  std::string what;
  EXPECT_EQ(parse_error_code(sample_grammar(), {"--name", "n", "--bogus"}, &what), CliErrc::Usage);
  EXPECT_NE(what.find("unrecognized arguments"), std::string::npos);
  EXPECT_EQ(parse_error_code(sample_grammar(), {"--name", "n", "extra"}), CliErrc::Usage);
}

TEST(ArgumentParserTest, MissingValue) {
  EXPECT_EQ(parse_error_code(sample_grammar(), {"--name"}), CliErrc::Usage);
}

TEST(ArgumentParserTest, ActionSelector) {
  Grammar g("dynamite svc process", "");
  g.add_flag(map_parameter(make_param("stdout", SemanticType::boolean(), YAML::Node(true), "Print")));
  g.set_action({"start", "stop", "status"});

  auto values = parse_arguments(g, {"stop"});
  EXPECT_EQ(values[kActionKey].as<std::string>(), "stop");
  // an absent toggle is false whatever the declared default
  EXPECT_FALSE(values["stdout"].as<bool>());
  EXPECT_TRUE(parse_arguments(g, {"--stdout", "stop"})["stdout"].as<bool>());

  std::string what;
  EXPECT_EQ(parse_error_code(g, {"restart"}, &what), CliErrc::Usage);
  EXPECT_NE(what.find("invalid choice: 'restart'"), std::string::npos);
  EXPECT_EQ(parse_error_code(g, {}), CliErrc::Usage);
}

TEST(ArgumentParserTest, ParsesRepeatedly) {
  auto g = sample_grammar();
  auto first = parse_arguments(g, {"--name", "a", "--verbose"});
  auto second = parse_arguments(g, {"--name", "b"});
  EXPECT_TRUE(first["verbose"].as<bool>());
  EXPECT_FALSE(second["verbose"].as<bool>());
  EXPECT_EQ(second["name"].as<std::string>(), "b");
}

TEST(ArgumentParserTest, WantsHelp) {
  EXPECT_TRUE(wants_help({"--ids", "1", "-h"}));
  EXPECT_TRUE(wants_help({"--help"}));
  EXPECT_FALSE(wants_help({"--ids", "1"}));
}

TEST(GrammarTest, FirstDefinitionWins) {
  Grammar g("g", "");
  EXPECT_TRUE(g.add_flag(map_parameter(make_param("port", SemanticType::integer()))));
  EXPECT_FALSE(g.add_flag(map_parameter(make_param("port", SemanticType::string()))));
  ASSERT_EQ(g.flags().size(), 1u);
  EXPECT_EQ(g.flags()[0].value_type, ValueType::Int);
}

TEST(GrammarTest, HelpAndJson) {
  auto g = sample_grammar();
  const std::string help = g.format_help();
  EXPECT_NE(help.find("usage: dynamite sample"), std::string::npos);
  EXPECT_NE(help.find("--name NAME"), std::string::npos);
  EXPECT_NE(help.find("(required)"), std::string::npos);
  EXPECT_NE(help.find("[default: 3]"), std::string::npos);

  auto j = g.to_json();
  EXPECT_EQ(j["prog"], "dynamite sample");
  ASSERT_EQ(j["flags"].size(), 5u);
  EXPECT_EQ(j["flags"][4]["action"], "store_true");
  EXPECT_EQ(j["flags"][1]["type"], "int");
}
