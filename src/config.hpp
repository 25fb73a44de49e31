#pragma once

#include "x509_source.hpp"
#include <spdlog/common.h>
#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <optional>
#include <string>

namespace svidsource {

enum class picker_kind {
    default_svid,  // first SVID of each update
    hint           // SVID whose hint matches picker_hint
};

struct source_config {
    // Workload API address (overrides SPIFFE_ENDPOINT_SOCKET)
    std::string endpoint_address;

    // Wait for the first update; 0 = no limit
    uint32_t init_timeout_ms = 0;

    post_init_error_policy error_policy = post_init_error_policy::keep_last_good;

    picker_kind picker = picker_kind::default_svid;
    std::string picker_hint;

    std::string log_level = "info";
};

// Parse config from YAML file. Throws on error.
source_config load_config(const std::string& path);

// Parse config from an already loaded YAML document. Throws on error.
source_config parse_config(const YAML::Node& root);

// Parse post_init_error_policy from string. Returns nullopt if invalid.
std::optional<post_init_error_policy> parse_error_policy(const std::string& s);

// Parse picker_kind from string. Returns nullopt if invalid.
std::optional<picker_kind> parse_picker_kind(const std::string& s);

// Parse spdlog level name. Returns nullopt if invalid.
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s);

// Fold a loaded config into source options. Sets the level of options.log
// (or of the default logger when options.log is unset).
void apply_config(const source_config& cfg, source_options& options);

} // namespace svidsource
