// Filebeat downstream targets
#pragma once

#include <string>
#include <vector>

#include "config/config_objects.hpp"

namespace dyn {

class ElasticsearchTarget : public TargetConfigObject {
public:
    std::vector<std::string> target_strings;
    std::string index;
    std::string username;
    std::string password;

    std::string target_name() const override { return "elasticsearch"; }
    const std::vector<FieldSpec>& fields() const override;
    YAML::Node get(const std::string& field) const override;
    void set(const std::string& field, const YAML::Node& value) override;
};

class LogstashTarget : public TargetConfigObject {
public:
    std::vector<std::string> target_strings;
    std::string index;
    bool load_balance = false;
    std::string socks_5_proxy_url;
    int pipelining = 0;

    std::string target_name() const override { return "logstash"; }
    const std::vector<FieldSpec>& fields() const override;
    YAML::Node get(const std::string& field) const override;
    void set(const std::string& field, const YAML::Node& value) override;
};

class KafkaTarget : public TargetConfigObject {
public:
    std::vector<std::string> target_strings;
    std::string topic;
    std::string username;
    std::string password;
    int max_message_bytes = 0;

    std::string target_name() const override { return "kafka"; }
    const std::vector<FieldSpec>& fields() const override;
    YAML::Node get(const std::string& field) const override;
    void set(const std::string& field, const YAML::Node& value) override;
};

} // namespace dyn
