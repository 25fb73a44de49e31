#include "config.hpp"
#include <chrono>
#include <stdexcept>

namespace svidsource {

std::optional<post_init_error_policy> parse_error_policy(const std::string& s) {
    if (s == "keep_last_good" || s == "keep") return post_init_error_policy::keep_last_good;
    if (s == "close")                         return post_init_error_policy::close;
    return std::nullopt;
}

std::optional<picker_kind> parse_picker_kind(const std::string& s) {
    if (s == "default" || s == "first") return picker_kind::default_svid;
    if (s == "hint")                    return picker_kind::hint;
    return std::nullopt;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& s) {
    if (s == "debug")                  return spdlog::level::debug;
    if (s == "info")                   return spdlog::level::info;
    if (s == "warn" || s == "warning") return spdlog::level::warn;
    if (s == "error")                  return spdlog::level::err;
    return std::nullopt;
}

source_config parse_config(const YAML::Node& root) {
    source_config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("config: root must be a map");

    if (auto n = root["endpoint_address"]) cfg.endpoint_address = n.as<std::string>();
    if (auto n = root["init_timeout_ms"])  cfg.init_timeout_ms = n.as<uint32_t>();

    if (auto n = root["post_init_error_policy"]) {
        auto policy = parse_error_policy(n.as<std::string>());
        if (!policy) throw std::runtime_error("config: invalid 'post_init_error_policy': " + n.as<std::string>());
        cfg.error_policy = *policy;
    }

    if (auto n = root["picker"]) {
        auto kind = parse_picker_kind(n.as<std::string>());
        if (!kind) throw std::runtime_error("config: invalid 'picker': " + n.as<std::string>());
        cfg.picker = *kind;
    }
    if (auto n = root["picker_hint"]) cfg.picker_hint = n.as<std::string>();

    if (cfg.picker == picker_kind::hint && cfg.picker_hint.empty()) {
        throw std::runtime_error("config: 'picker_hint' is required when 'picker' is 'hint'");
    }

    if (auto n = root["log_level"]) {
        cfg.log_level = n.as<std::string>();
        if (!parse_log_level(cfg.log_level)) {
            throw std::runtime_error("config: invalid 'log_level': " + cfg.log_level);
        }
    }

    return cfg;
}

source_config load_config(const std::string& path) {
    return parse_config(YAML::LoadFile(path));
}

void apply_config(const source_config& cfg, source_options& options) {
    if (!cfg.endpoint_address.empty()) options.endpoint_address = cfg.endpoint_address;

    if (cfg.init_timeout_ms > 0) {
        options.init_timeout = std::chrono::milliseconds(cfg.init_timeout_ms);
    }

    options.error_policy = cfg.error_policy;

    switch (cfg.picker) {
        case picker_kind::default_svid:
            options.picker = make_default_picker();
            break;
        case picker_kind::hint:
            options.picker = std::make_shared<const hint_svid_picker>(cfg.picker_hint);
            break;
    }

    auto level = parse_log_level(cfg.log_level).value_or(spdlog::level::info);
    if (options.log) options.log->set_level(level);
    else             spdlog::set_level(level);
}

} // namespace svidsource
