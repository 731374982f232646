#include "config/filebeat_targets.hpp"

#include "dyn_types.hpp"

namespace dyn {

namespace {

template <typename V>
V convert_field(const TargetConfigObject& t, const std::string& field, const YAML::Node& value) {
    try {
        return value.as<V>();
    } catch (const YAML::Exception& e) {
        throw CliError(CliErrc::InvalidValue,
                       t.target_name() + "." + field + ": " + std::string(e.what()));
    }
}

// A single scalar is accepted where a list is expected.
std::vector<std::string> convert_list(const TargetConfigObject& t, const std::string& field,
                                      const YAML::Node& value) {
    if (value.IsScalar()) return {value.Scalar()};
    return convert_field<std::vector<std::string>>(t, field, value);
}

const SemanticType kStr = SemanticType::string();
const SemanticType kStrList = SemanticType::list_of(SemanticType::string());

}  // namespace

const std::vector<FieldSpec>& ElasticsearchTarget::fields() const {
    static const std::vector<FieldSpec> specs = {
        {"target_strings", kStrList, "One or more Elasticsearch hosts (E.G https://es1.local:9200)"},
        {"index", kStr, "The name of the index where events are written"},
        {"username", kStr, "The username used to authenticate to Elasticsearch"},
        {"password", kStr, "The password used to authenticate to Elasticsearch"},
    };
    return specs;
}

YAML::Node ElasticsearchTarget::get(const std::string& field) const {
    if (field == "target_strings") return YAML::Node(target_strings);
    if (field == "index") return YAML::Node(index);
    if (field == "username") return YAML::Node(username);
    if (field == "password") return YAML::Node(password);
    unknown_field(field);
}

void ElasticsearchTarget::set(const std::string& field, const YAML::Node& value) {
    if (field == "target_strings") target_strings = convert_list(*this, field, value);
    else if (field == "index") index = convert_field<std::string>(*this, field, value);
    else if (field == "username") username = convert_field<std::string>(*this, field, value);
    else if (field == "password") password = convert_field<std::string>(*this, field, value);
    else unknown_field(field);
}

const std::vector<FieldSpec>& LogstashTarget::fields() const {
    static const std::vector<FieldSpec> specs = {
        {"target_strings", kStrList, "One or more Logstash hosts and ports (E.G 10.0.0.5:5044)"},
        {"index", kStr, "The name of the index where events are written"},
        {"load_balance", SemanticType::boolean(), "Spread events across all configured hosts"},
        {"socks_5_proxy_url", kStr, "Full URL of a SOCKS5 proxy to route events through"},
        {"pipelining", SemanticType::integer(), "Number of batches sent asynchronously while waiting for ACK"},
    };
    return specs;
}

YAML::Node LogstashTarget::get(const std::string& field) const {
    if (field == "target_strings") return YAML::Node(target_strings);
    if (field == "index") return YAML::Node(index);
    if (field == "load_balance") return YAML::Node(load_balance);
    if (field == "socks_5_proxy_url") return YAML::Node(socks_5_proxy_url);
    if (field == "pipelining") return YAML::Node(pipelining);
    unknown_field(field);
}

void LogstashTarget::set(const std::string& field, const YAML::Node& value) {
    if (field == "target_strings") target_strings = convert_list(*this, field, value);
    else if (field == "index") index = convert_field<std::string>(*this, field, value);
    else if (field == "load_balance") load_balance = convert_field<bool>(*this, field, value);
    else if (field == "socks_5_proxy_url") socks_5_proxy_url = convert_field<std::string>(*this, field, value);
    else if (field == "pipelining") pipelining = convert_field<int>(*this, field, value);
    else unknown_field(field);
}

const std::vector<FieldSpec>& KafkaTarget::fields() const {
    static const std::vector<FieldSpec> specs = {
        {"target_strings", kStrList, "One or more Kafka brokers (E.G kafka1.local:9092)"},
        {"topic", kStr, "The Kafka topic events are published to"},
        {"username", kStr, "The SASL username used to authenticate to Kafka"},
        {"password", kStr, "The SASL password used to authenticate to Kafka"},
        {"max_message_bytes", SemanticType::integer(), "Largest permitted message size in bytes"},
    };
    return specs;
}

YAML::Node KafkaTarget::get(const std::string& field) const {
    if (field == "target_strings") return YAML::Node(target_strings);
    if (field == "topic") return YAML::Node(topic);
    if (field == "username") return YAML::Node(username);
    if (field == "password") return YAML::Node(password);
    if (field == "max_message_bytes") return YAML::Node(max_message_bytes);
    unknown_field(field);
}

void KafkaTarget::set(const std::string& field, const YAML::Node& value) {
    if (field == "target_strings") target_strings = convert_list(*this, field, value);
    else if (field == "topic") topic = convert_field<std::string>(*this, field, value);
    else if (field == "username") username = convert_field<std::string>(*this, field, value);
    else if (field == "password") password = convert_field<std::string>(*this, field, value);
    else if (field == "max_message_bytes") max_message_bytes = convert_field<int>(*this, field, value);
    else unknown_field(field);
}

} // namespace dyn
