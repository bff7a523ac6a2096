#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace sidx {
namespace query {

using json = nlohmann::json;

/**
 * @brief Execution settings for index backed queries
 */
struct QueryOptions {
    std::chrono::milliseconds time_quota{5000};     // wall clock budget per query
    size_t checkpoint_interval = 1024;              // rows between two checkpoint() calls
    size_t result_limit = 0;                        // 0 = unlimited
    std::string log_level = "info";

    /**
     * @brief Load options from a YAML file (section "query")
     *
     * Missing keys keep their defaults. An unreadable file logs an error and
     * yields the defaults.
     */
    static QueryOptions loadFromYaml(const std::string& yaml_path);

    static QueryOptions fromJson(const json& j);
    json toJson() const;
};

} // namespace query
} // namespace sidx
