#include "query/query_options.h"
#include "utils/logger.h"
#include <yaml-cpp/yaml.h>

namespace sidx {
namespace query {

namespace {
// 0 ist kein gültiges Intervall: jeder Datensatz würde einen Checkpoint auslösen
size_t sanitizeInterval(long long v) {
    return v <= 0 ? 1 : static_cast<size_t>(v);
}
} // namespace

QueryOptions QueryOptions::loadFromYaml(const std::string& yaml_path) {
    try {
        YAML::Node config = YAML::LoadFile(yaml_path);
        QueryOptions result;

        if (config["query"]) {
            auto q = config["query"];
            result.time_quota = std::chrono::milliseconds(q["time_quota_ms"].as<long long>(5000));
            result.checkpoint_interval = sanitizeInterval(q["checkpoint_interval"].as<long long>(1024));
            result.result_limit = q["result_limit"].as<size_t>(0);
        }
        if (config["logging"] && config["logging"]["level"]) {
            result.log_level = config["logging"]["level"].as<std::string>();
        }

        SIDX_INFO("Loaded query options from {}", yaml_path);
        return result;
    } catch (const std::exception& e) {
        SIDX_ERROR("Failed to load query options from {}: {}", yaml_path, e.what());
        return QueryOptions();
    }
}

QueryOptions QueryOptions::fromJson(const json& j) {
    QueryOptions result;

    try {
        result.time_quota = std::chrono::milliseconds(j.value("time_quota_ms", 5000LL));
        result.checkpoint_interval = sanitizeInterval(j.value("checkpoint_interval", 1024LL));
        result.result_limit = j.value("result_limit", static_cast<size_t>(0));
        result.log_level = j.value("log_level", std::string("info"));
    } catch (const json::exception& e) {
        SIDX_ERROR("Invalid query options: {}", e.what());
        return QueryOptions();
    }

    return result;
}

json QueryOptions::toJson() const {
    return {
        {"time_quota_ms", time_quota.count()},
        {"checkpoint_interval", checkpoint_interval},
        {"result_limit", result_limit},
        {"log_level", log_level}
    };
}

} // namespace query
} // namespace sidx
