#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

#include "cli/argument_parser.hpp"
#include "cli/interfaces.hpp"
#include "cli/process_command.hpp"
#include "cli_config.hpp"
#include "config/filebeat_targets.hpp"
#include "nsm_state.hpp"
#include "services/builtin_targets.hpp"
#include "services/service_error.hpp"

using namespace dyn;

namespace {

std::string temp_path(const std::string& name) {
  auto p = fs::temp_directory_path() / ("dynamite_test_" + name);
  fs::remove(p);
  return p.string();
}

// Built-in surface over a state file in the temp directory.
class FrontEndTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config.state_path = temp_path("state.yaml");
    config.install_root = "/tmp/dynamite/opt";
    config.config_root = "/tmp/dynamite/etc";
    config.log_root = "/tmp/dynamite/log";
    state = NsmState::defaults();
    register_builtin_targets(registry, state);
    components = build_components(registry, config);
  }

  int run(const std::vector<std::string>& args) {
    out.str("");
    CliContext ctx{config, state, registry, components, out};
    return process_command(args, ctx);
  }

  CliConfig config;
  NsmState state;
  TargetRegistry registry;
  std::vector<Component> components;
  std::ostringstream out;
};

}  // namespace

TEST(CliConfigTest, RoundTrip) {
  const std::string path = temp_path("config.yaml");
  CliConfig config;
  config.state_path = "/var/dynamite/state.yaml";
  config.report_format = "json";
  config.print_results = false;
  ASSERT_TRUE(write_config_to_file(config, path));

  CliConfig loaded;
  load_or_create_config(path, loaded);
  EXPECT_EQ(loaded.state_path, "/var/dynamite/state.yaml");
  EXPECT_EQ(loaded.report_format, "json");
  EXPECT_FALSE(loaded.print_results);
  EXPECT_EQ(loaded.install_root, "/opt/dynamite");
  EXPECT_FALSE(loaded.loaded_config_path.empty());
}

TEST(CliConfigTest, UnknownReportFormatFallsBack) {
  const std::string path = temp_path("bad_config.yaml");
  {
    std::ofstream f(path);
    f << "report_format: xml\n";
  }
  CliConfig loaded;
  load_or_create_config(path, loaded);
  EXPECT_EQ(loaded.report_format, "table");
}

TEST(NsmStateTest, MissingFileGivesDefaults) {
  NsmState state = NsmState::load(temp_path("missing.yaml"));
  EXPECT_EQ(state.service_names().size(), builtin_services().size());
  EXPECT_FALSE(state.find_service("zeek")->installed);
  EXPECT_TRUE(state.analyzers("zeek.definitions").supports_values());
  EXPECT_EQ(state.filebeat_target_names(), (std::vector<std::string>{"elasticsearch", "kafka", "logstash"}));
}

TEST(NsmStateTest, SaveAndLoad) {
  const std::string path = temp_path("roundtrip.yaml");
  NsmState state = NsmState::defaults();
  state.service("suricata").installed = true;
  state.service("suricata").install_directory = "/opt/dynamite/suricata";
  state.analyzers("suricata.rules").find(3)->enabled = true;
  auto& kafka = static_cast<KafkaTarget&>(state.filebeat_target("kafka"));
  kafka.target_strings = {"kafka1.local:9092"};
  kafka.set_enabled(true);
  state.save(path);

  NsmState loaded = NsmState::load(path);
  EXPECT_TRUE(loaded.find_service("suricata")->installed);
  EXPECT_EQ(loaded.find_service("suricata")->install_directory, "/opt/dynamite/suricata");
  EXPECT_TRUE(loaded.analyzers("suricata.rules").find(3)->enabled);
  const auto& loaded_kafka = static_cast<KafkaTarget&>(loaded.filebeat_target("kafka"));
  EXPECT_TRUE(loaded_kafka.enabled());
  EXPECT_EQ(loaded_kafka.target_strings, std::vector<std::string>{"kafka1.local:9092"});
}

TEST(NsmStateTest, MalformedFile) {
  const std::string path = temp_path("malformed.yaml");
  {
    std::ofstream f(path);
    f << "services: [unterminated\n";
  }
  try {
    NsmState::load(path);
    FAIL() << "expected InvalidYaml";
  } catch (const CliError& e) {
    EXPECT_EQ(e.code(), CliErrc::InvalidYaml);
  }
}

TEST(BuiltinTargetsTest, ZeekRedefinesStatusAndSetup) {
  NsmState state = NsmState::defaults();
  TargetRegistry registry;
  register_builtin_targets(registry, state);

  const auto& process = registry.at("zeek.process");
  EXPECT_EQ(process.operation_names(), (std::vector<std::string>{"status", "start", "stop", "restart"}));
  const auto& install = registry.at("zeek.install");
  ASSERT_EQ(install.operation_names(), std::vector<std::string>{"setup"});
  ASSERT_EQ(install.find_operation("setup")->parameters.size(), 1u);
  EXPECT_EQ(install.find_operation("setup")->parameters[0].name, "capture_network_interfaces");

  EXPECT_EQ(registry.at("logstash.install").find_operation("setup")->parameters.size(), 0u);
}

TEST(BuiltinTargetsTest, StdoutToggleDefaultsOff) {
  NsmState state = NsmState::defaults();
  TargetRegistry registry;
  register_builtin_targets(registry, state);
  MultipleResponsibilityInterface process(registry.at("logstash.process"), {"start", "stop", "restart", "status"},
                                          "dynamite logstash process");

  auto quiet = parse_arguments(process.grammar(), {"status"});
  auto loud = parse_arguments(process.grammar(), {"--stdout", "status"});
  EXPECT_FALSE(quiet["stdout"].as<bool>());
  EXPECT_TRUE(loud["stdout"].as<bool>());
  EXPECT_FALSE(quiet["verbose"].as<bool>());
  EXPECT_FALSE(process.grammar().find_dest("stdout")->has_default());
}

TEST_F(FrontEndTest, ProcessRequiresInstall) {
  testing::internal::CaptureStderr();
  try {
    run({"logstash", "process", "start"});
    FAIL() << "expected a ServiceError";
  } catch (const ServiceError& e) {
    EXPECT_NE(std::string(e.what()).find("logstash is not installed"), std::string::npos);
  }
  // reported once, by the top-level handler
  EXPECT_EQ(testing::internal::GetCapturedStderr(), "");
}

TEST_F(FrontEndTest, OutOfRangeIdIsUsageError) {
  try {
    run({"zeek", "scripts", "--ids", "99999999999", "--enable"});
    FAIL() << "expected a usage error";
  } catch (const CliError& e) {
    EXPECT_EQ(e.code(), CliErrc::Usage);
  }
  EXPECT_FALSE(fs::exists(config.state_path));
}

TEST_F(FrontEndTest, InstallThenStartPrintsStatus) {
  EXPECT_EQ(run({"logstash", "install"}), 0);
  const ServiceStatus* s = state.find_service("logstash");
  ASSERT_TRUE(s->installed);
  EXPECT_EQ(s->install_directory, (fs::path("/tmp/dynamite/opt") / "logstash").string());

  EXPECT_EQ(run({"logstash", "process", "start"}), 0);
  EXPECT_TRUE(state.find_service("logstash")->running);
  EXPECT_NE(out.str().find("running: true"), std::string::npos);

  EXPECT_EQ(run({"logstash", "process", "stop"}), 0);
  EXPECT_FALSE(state.find_service("logstash")->running);

  NsmState persisted = NsmState::load(config.state_path);
  EXPECT_TRUE(persisted.find_service("logstash")->installed);
}

TEST_F(FrontEndTest, UnlistedActionIsUsageError) {
  try {
    run({"kibana", "process", "reload"});
    FAIL() << "expected a usage error";
  } catch (const CliError& e) {
    EXPECT_EQ(e.code(), CliErrc::Usage);
  }
}

TEST_F(FrontEndTest, AnalyzerReportAndMutation) {
  EXPECT_EQ(run({"zeek", "scripts"}), 0);
  EXPECT_NE(out.str().find("policy/protocols/conn/known-services"), std::string::npos);
  EXPECT_FALSE(fs::exists(config.state_path));

  EXPECT_EQ(run({"zeek", "scripts", "--ids", "3", "4", "--enable"}), 0);
  EXPECT_TRUE(state.analyzers("zeek.scripts").find(3)->enabled);
  EXPECT_TRUE(state.analyzers("zeek.scripts").find(4)->enabled);
  EXPECT_TRUE(fs::exists(config.state_path));

  EXPECT_EQ(run({"zeek", "definitions", "--ids", "3", "--value", "\"soc@example.com\""}), 0);
  EXPECT_EQ(*state.analyzers("zeek.definitions").find(3)->value, "\"soc@example.com\";");
}

TEST_F(FrontEndTest, FilebeatTargetAsJson) {
  config.report_format = "json";
  EXPECT_EQ(run({"filebeat", "kafka", "--topic", "sensor-events", "--enable"}), 0);
  auto changes = nlohmann::json::parse(out.str());
  ASSERT_EQ(changes.size(), 2u);
  EXPECT_EQ(changes[0]["Changed"], "topic");
  EXPECT_EQ(changes[1]["Changed"], "enabled");
  EXPECT_TRUE(state.filebeat_target("kafka").enabled());
}

TEST_F(FrontEndTest, GrammarDump) {
  EXPECT_EQ(run({"grammar", "zeek", "install"}), 0);
  auto j = nlohmann::json::parse(out.str());
  EXPECT_EQ(j["prog"], "dynamite zeek install");
  bool found = false;
  for (const auto& f : j["flags"]) {
    if (f["dest"] == "capture_network_interfaces") {
      found = true;
      EXPECT_EQ(f["nargs"], "+");
      EXPECT_FALSE(f["required"].get<bool>());
    }
    if (f["dest"] == "install_directory") EXPECT_FALSE(f["required"].get<bool>());
  }
  EXPECT_TRUE(found);
}

TEST_F(FrontEndTest, HelpAndTargets) {
  EXPECT_EQ(run({"--help"}), 0);
  EXPECT_NE(out.str().find("filebeat"), std::string::npos);

  EXPECT_EQ(run({"zeek", "scripts", "--help"}), 0);
  EXPECT_NE(out.str().find("--ids"), std::string::npos);

  EXPECT_EQ(run({"targets"}), 0);
  EXPECT_NE(out.str().find("zeek.install"), std::string::npos);
  EXPECT_NE(out.str().find("capture_network_interfaces: optional<list<str>>"), std::string::npos);

  EXPECT_THROW(run({"rumble"}), CliError);
}
