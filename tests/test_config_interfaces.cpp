#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "cli/argument_parser.hpp"
#include "config/config_interfaces.hpp"
#include "config/filebeat_targets.hpp"

using namespace dyn;

namespace {

AnalyzerCollection three_items() {
  return AnalyzerCollection("scripts", false, {
      {1, "A", false, std::nullopt},
      {2, "B", true, std::string("x;")},
      {3, "C", false, std::nullopt},
  });
}

YAML::Node select_ids(std::vector<int> ids) {
  YAML::Node args;
  args["analyzer_ids"] = ids;
  return args;
}

class HostTarget : public TargetConfigObject {
 public:
  std::string host;
  int port = 0;

  std::string target_name() const override { return "host"; }
  const std::vector<FieldSpec>& fields() const override {
    static const std::vector<FieldSpec> specs = {
        {"host", SemanticType::string(), "Host to send events to"},
        {"port", SemanticType::integer(), "Port on that host"},
    };
    return specs;
  }
  YAML::Node get(const std::string& field) const override {
    if (field == "host") return YAML::Node(host);
    if (field == "port") return YAML::Node(port);
    unknown_field(field);
  }
  void set(const std::string& field, const YAML::Node& value) override {
    if (field == "host") host = value.as<std::string>();
    else if (field == "port") port = value.as<int>();
    else unknown_field(field);
  }
};

}  // namespace

TEST(AnalyzersInterfaceTest, EnablesSelectedItems) {
  auto collection = three_items();
  AnalyzersInterface iface(collection);
  auto args = select_ids({1, 3});
  args["enable"] = true;

  auto result = iface.execute(args);
  ASSERT_TRUE(result.mutated());
  EXPECT_EQ(result.object, &collection);
  EXPECT_FALSE(result.report.has_value());
  EXPECT_TRUE(collection.find(1)->enabled);
  EXPECT_TRUE(collection.find(2)->enabled);
  EXPECT_EQ(*collection.find(2)->value, "x;");
  EXPECT_TRUE(collection.find(3)->enabled);
  EXPECT_EQ(result.changes.size(), 2u);
  EXPECT_NE(result.changes.find("1"), nullptr);
  EXPECT_NE(result.changes.find("3"), nullptr);
}

TEST(AnalyzersInterfaceTest, NoSelectionReports) {
  auto collection = three_items();
  AnalyzersInterface iface(collection);
  auto result = iface.execute(select_ids({}));
  EXPECT_FALSE(result.mutated());
  ASSERT_TRUE(result.report.has_value());
  EXPECT_TRUE(result.changes.empty());
  EXPECT_EQ(result.report->headers, (std::vector<std::string>{"Id", "Name", "Enabled", "Value"}));
  ASSERT_EQ(result.report->rows.size(), 3u);
  EXPECT_EQ(result.report->rows[0], (std::vector<std::string>{"1", "A", "False", "N/A"}));
  EXPECT_EQ(result.report->rows[1], (std::vector<std::string>{"2", "B", "True", "x;"}));
  EXPECT_FALSE(collection.find(1)->enabled);
}

TEST(AnalyzersInterfaceTest, EnableWinsOverDisable) {
  auto collection = three_items();
  AnalyzersInterface iface(collection);
  auto args = select_ids({1});
  args["enable"] = true;
  args["disable"] = true;
  iface.execute(args);
  EXPECT_TRUE(collection.find(1)->enabled);

  auto off = select_ids({2});
  off["disable"] = true;
  iface.execute(off);
  EXPECT_FALSE(collection.find(2)->enabled);
}

TEST(AnalyzersInterfaceTest, ValuesGetATerminator) {
  AnalyzerCollection defs("definitions", true, {
      {1, "Site::local_nets", true, std::string("{ 10.0.0.0/8 };")},
      {2, "Notice::mail_dest", false, std::nullopt},
  });
  AnalyzersInterface iface(defs);
  ASSERT_NE(iface.grammar().find_flag("--value"), nullptr);

  auto args = select_ids({2});
  args["value"] = "\"soc@example.com\"";
  iface.execute(args);
  EXPECT_EQ(*defs.find(2)->value, "\"soc@example.com\";");

  auto again = select_ids({1});
  again["value"] = "{ 192.168.0.0/16 };";
  iface.execute(again);
  EXPECT_EQ(*defs.find(1)->value, "{ 192.168.0.0/16 };");
}

TEST(AnalyzersInterfaceTest, UnknownIdsAreIgnored) {
  auto collection = three_items();
  AnalyzersInterface iface(collection);
  auto args = select_ids({9});
  args["enable"] = true;
  auto result = iface.execute(args);
  EXPECT_TRUE(result.changes.empty());
  EXPECT_FALSE(collection.find(1)->enabled);
  EXPECT_FALSE(collection.find(3)->enabled);
}

TEST(AnalyzersInterfaceTest, GrammarFromCommandLine) {
  auto collection = three_items();
  AnalyzersInterface iface(collection);
  Grammar g = iface.grammar("dynamite zeek scripts");
  EXPECT_EQ(g.find_flag("--value"), nullptr);
  const FlagSpec* ids = g.find_flag("--ids");
  ASSERT_NE(ids, nullptr);
  EXPECT_EQ(ids->dest, "analyzer_ids");
  EXPECT_TRUE(ids->takes_many());

  auto report = iface.execute(parse_arguments(g, {}));
  EXPECT_TRUE(report.report.has_value());

  auto result = iface.execute(parse_arguments(g, {"--ids", "3", "--enable"}));
  ASSERT_TRUE(result.mutated());
  EXPECT_TRUE(collection.find(3)->enabled);
}

TEST(TargetsInterfaceTest, AssignsNonEmptyFields) {
  HostTarget target;
  TargetsInterface iface(target);
  YAML::Node args;
  args["host"] = "10.0.0.5";
  auto result = iface.execute(args);
  ASSERT_TRUE(result.mutated());
  EXPECT_EQ(target.host, "10.0.0.5");
  ASSERT_EQ(result.changes.size(), 1u);
  EXPECT_NE(result.changes.find("host"), nullptr);
  EXPECT_EQ(result.changes.find("port"), nullptr);
}

TEST(TargetsInterfaceTest, EmptyInputReportsCurrentValues) {
  HostTarget target;
  target.host = "es.local";
  TargetsInterface iface(target);
  auto result = iface.execute(parse_arguments(iface.grammar(), {}));
  EXPECT_FALSE(result.mutated());
  ASSERT_TRUE(result.report.has_value());
  EXPECT_EQ(result.report->headers, (std::vector<std::string>{"Config Option", "Value"}));
  ASSERT_EQ(result.report->rows.size(), 3u);
  EXPECT_EQ(result.report->rows[0], (std::vector<std::string>{"host", "es.local"}));
  EXPECT_EQ(result.report->rows[1], (std::vector<std::string>{"port", "N/A"}));
  EXPECT_EQ(result.report->rows[2], (std::vector<std::string>{"enabled", "False"}));
}

TEST(TargetsInterfaceTest, ToggleIsAlwaysRecorded) {
  HostTarget target;
  TargetsInterface iface(target);
  auto result = iface.execute(parse_arguments(iface.grammar(), {"--enable", "--disable"}));
  ASSERT_TRUE(result.mutated());
  EXPECT_TRUE(target.enabled());
  ASSERT_EQ(result.changes.size(), 1u);
  EXPECT_EQ(result.changes.entries()[0].key, "enabled");
  EXPECT_TRUE(result.changes.entries()[0].new_value.as<bool>());
}

TEST(TargetsInterfaceTest, DefaultedFieldsAreLeftAlone) {
  HostTarget target;
  YAML::Node defaults;
  defaults["host"] = "fixed.local";
  TargetsInterface iface(target, defaults);
  Grammar g = iface.grammar();
  EXPECT_EQ(g.find_dest("host")->default_value.as<std::string>(), "fixed.local");

  auto result = iface.execute(parse_arguments(g, {"--port", "5044"}));
  ASSERT_TRUE(result.mutated());
  EXPECT_EQ(target.host, "");
  EXPECT_EQ(target.port, 5044);
  EXPECT_EQ(result.changes.find("host"), nullptr);
}

TEST(TargetsInterfaceTest, LogstashFromCommandLine) {
  LogstashTarget target;
  TargetsInterface iface(target);
  Grammar g = iface.grammar("dynamite filebeat logstash");
  EXPECT_EQ(g.find_dest("enabled"), nullptr);
  EXPECT_TRUE(g.find_flag("--load-balance")->is_toggle());

  auto result = iface.execute(parse_arguments(
      g, {"--target-strings", "10.0.0.5:5044", "10.0.0.6:5044", "--pipelining", "4", "--load-balance"}));
  ASSERT_TRUE(result.mutated());
  EXPECT_EQ(target.target_strings, (std::vector<std::string>{"10.0.0.5:5044", "10.0.0.6:5044"}));
  EXPECT_EQ(target.pipelining, 4);
  EXPECT_TRUE(target.load_balance);
  EXPECT_EQ(result.changes.size(), 3u);
}

TEST(TargetConfigObjectTest, TypedFieldAccess) {
  KafkaTarget kafka;
  kafka.set("topic", YAML::Node("zeek-events"));
  EXPECT_EQ(kafka.get("topic").as<std::string>(), "zeek-events");
  try {
    kafka.set("max_message_bytes", YAML::Node("lots"));
    FAIL() << "expected InvalidValue";
  } catch (const CliError& e) {
    EXPECT_EQ(e.code(), CliErrc::InvalidValue);
  }
  try {
    kafka.get("partition");
    FAIL() << "expected UnknownField";
  } catch (const CliError& e) {
    EXPECT_EQ(e.code(), CliErrc::UnknownField);
  }

  kafka.set_enabled(true);
  KafkaTarget copy;
  copy.load_yaml(kafka.to_yaml());
  EXPECT_TRUE(copy.enabled());
  EXPECT_EQ(copy.topic, "zeek-events");
}

TEST(ChangeSetTest, ReportRows) {
  ChangeSet changes;
  changes.record("host", YAML::Node(""), YAML::Node("10.0.0.5"));
  changes.record("target_strings", YAML::Node(std::vector<std::string>{"a", "b"}),
                 YAML::Node(std::vector<std::string>{"c"}));
  auto report = change_set_report(changes);
  EXPECT_EQ(report.headers, (std::vector<std::string>{"Changed", "Old Value", "New Value"}));
  EXPECT_EQ(report.rows[0], (std::vector<std::string>{"host", "N/A", "10.0.0.5"}));
  EXPECT_EQ(report.rows[1], (std::vector<std::string>{"target_strings", "a, b", "c"}));

  auto j = report.to_json();
  ASSERT_EQ(j.size(), 2u);
  EXPECT_EQ(j[0]["New Value"], "10.0.0.5");
  EXPECT_NE(report.render().find("10.0.0.5"), std::string::npos);
}
