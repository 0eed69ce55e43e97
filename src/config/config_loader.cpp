#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "security/archive_validator.hpp"
#include "security/endpoint_validator.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <regex>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace egress {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10, possible circular include");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Merge: included is base, root is overlay (main wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

} // anonymous namespace

// ============================================================================
// RetryConfig
// ============================================================================

RetryPolicy RetryConfig::to_policy() const {
    RetryPolicy policy;
    policy.max_attempts = max_attempts;
    policy.base_delay = std::chrono::milliseconds(base_delay_ms);
    policy.max_delay = std::chrono::milliseconds(max_delay_ms);
    policy.max_retry_after = std::chrono::milliseconds(max_retry_after_ms);
    if (!retryable_status.empty()) {
        policy.retryable_status = [codes = retryable_status](int status) {
            for (const int code : codes) {
                if (code == status) return true;
            }
            return false;
        };
    }
    return policy;
}

// ============================================================================
// Section extractors
// ============================================================================

DeliveryConfig ConfigLoader::extract_delivery(const toml::table& root) {
    DeliveryConfig cfg;
    const auto* sec = root["delivery"].as_table();
    if (!sec) return cfg;
    const auto& d = *sec;

    cfg.webhook_url = d["webhook_url"].value_or(cfg.webhook_url);
    if (const auto* v = d["username"].as_string()) {
        cfg.username = std::string(v->get());
    }
    cfg.staging_dir = d["staging_dir"].value_or(cfg.staging_dir);
    cfg.max_attachments_per_request = static_cast<uint32_t>(
        d["max_attachments_per_request"].value_or(int64_t{cfg.max_attachments_per_request}));
    cfg.max_attachment_mb = static_cast<uint32_t>(
        d["max_attachment_mb"].value_or(int64_t{cfg.max_attachment_mb}));
    cfg.max_message_length = static_cast<uint32_t>(
        d["max_message_length"].value_or(int64_t{cfg.max_message_length}));
    cfg.collect_cdn_urls = d["collect_cdn_urls"].value_or(cfg.collect_cdn_urls);
    cfg.send_cdn_manifest = d["send_cdn_manifest"].value_or(cfg.send_cdn_manifest);
    cfg.connection_timeout_s = static_cast<uint32_t>(
        d["connection_timeout_s"].value_or(int64_t{cfg.connection_timeout_s}));
    cfg.read_timeout_s = static_cast<uint32_t>(
        d["read_timeout_s"].value_or(int64_t{cfg.read_timeout_s}));
    cfg.ca_cert_path = d["ca_cert_path"].value_or(cfg.ca_cert_path);
    return cfg;
}

ArchiveConfig ConfigLoader::extract_archive(const toml::table& root) {
    ArchiveConfig cfg;
    const auto* sec = root["archive"].as_table();
    if (!sec) return cfg;
    const auto& a = *sec;

    cfg.enabled = a["enabled"].value_or(cfg.enabled);
    cfg.repository = a["repository"].value_or(cfg.repository);
    cfg.file_path = a["file_path"].value_or(cfg.file_path);
    cfg.token = a["token"].value_or(cfg.token);
    cfg.api_base = a["api_base"].value_or(cfg.api_base);
    cfg.commit_message = a["commit_message"].value_or(cfg.commit_message);
    return cfg;
}

RetryConfig ConfigLoader::extract_retry(const toml::table& root) {
    RetryConfig cfg;
    const auto* sec = root["retry"].as_table();
    if (!sec) return cfg;
    const auto& r = *sec;

    // Negative values wrap to huge numbers and are caught by validation
    cfg.max_attempts = static_cast<uint32_t>(r["max_attempts"].value_or(int64_t{cfg.max_attempts}));
    cfg.base_delay_ms = static_cast<uint32_t>(r["base_delay_ms"].value_or(int64_t{cfg.base_delay_ms}));
    cfg.max_delay_ms = static_cast<uint32_t>(r["max_delay_ms"].value_or(int64_t{cfg.max_delay_ms}));
    cfg.max_retry_after_ms = static_cast<uint32_t>(
        r["max_retry_after_ms"].value_or(int64_t{cfg.max_retry_after_ms}));

    if (const auto* arr = r["retryable_status"].as_array()) {
        for (const auto& elem : *arr) {
            if (const auto* v = elem.as_integer()) {
                cfg.retryable_status.push_back(static_cast<int>(v->get()));
            }
        }
    }
    return cfg;
}

OutputConfig ConfigLoader::extract_output(const toml::table& root) {
    OutputConfig cfg;
    const auto* sec = root["output"].as_table();
    if (!sec) return cfg;
    cfg.save_local = (*sec)["save_local"].value_or(cfg.save_local);
    cfg.directory = (*sec)["directory"].value_or(cfg.directory);
    cfg.overwrite = (*sec)["overwrite"].value_or(cfg.overwrite);
    return cfg;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* sec = root["logging"].as_table()) {
        cfg.level = (*sec)["level"].value_or(cfg.level);
    }
    return cfg;
}

ScrubberConfig ConfigLoader::extract_scrubber(const toml::table& root) {
    ScrubberConfig cfg;
    const auto* sec = root["scrubber"].as_table();
    if (!sec) return cfg;

    if (const auto* patterns = (*sec)["patterns"].as_array()) {
        for (const auto& elem : *patterns) {
            const auto* tbl = elem.as_table();
            if (!tbl) continue;
            ScrubberPatternConfig p;
            p.name = (*tbl)["name"].value_or(""s);
            p.regex = (*tbl)["regex"].value_or(""s);
            p.replacement = (*tbl)["replacement"].value_or(p.replacement);
            cfg.patterns.push_back(std::move(p));
        }
    }
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

EgressConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    EgressConfig config;
    config.delivery = extract_delivery(tbl);
    config.archive = extract_archive(tbl);
    config.retry = extract_retry(tbl);
    config.output = extract_output(tbl);
    config.logging = extract_logging(tbl);
    config.scrubber = extract_scrubber(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(EgressConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(SecretScrubber::default_instance().scrub(
            std::format("Failed to load config: {}", e.what())));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(SecretScrubber::default_instance().scrub(
            std::format("Failed to parse config: {}", e.what())));
    }
}

std::vector<SecretScrubber::SecretPattern> ConfigLoader::build_scrubber_patterns(
    const ScrubberConfig& config) {
    std::vector<SecretScrubber::SecretPattern> out;
    out.reserve(config.patterns.size());
    for (const auto& p : config.patterns) {
        out.push_back(SecretScrubber::make_pattern(p.name, p.regex, p.replacement));
    }
    return out;
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const EgressConfig& config) {
    std::vector<std::string> errors;

    // Messages never echo the URL or token values themselves
    const auto& d = config.delivery;
    if (!d.webhook_url.empty()) {
        const auto endpoint = EndpointValidator::validate(d.webhook_url);
        if (endpoint.is_error()) {
            errors.push_back(std::format("delivery.webhook_url: {}", endpoint.error_message()));
        }
    }
    if (!utils::in_range<1, 10>(d.max_attachments_per_request)) {
        errors.push_back(std::format("delivery.max_attachments_per_request must be 1-10, got {}",
                                     d.max_attachments_per_request));
    }
    if (!utils::in_range<1, 25>(d.max_attachment_mb)) {
        errors.push_back(std::format("delivery.max_attachment_mb must be 1-25, got {}",
                                     d.max_attachment_mb));
    }
    if (!utils::in_range<1, 2000>(d.max_message_length)) {
        errors.push_back(std::format("delivery.max_message_length must be 1-2000, got {}",
                                     d.max_message_length));
    }
    if (d.staging_dir.empty()) {
        errors.push_back("delivery.staging_dir must not be empty");
    }
    if (d.send_cdn_manifest && !d.collect_cdn_urls) {
        errors.push_back("delivery.send_cdn_manifest requires delivery.collect_cdn_urls");
    }

    const auto& a = config.archive;
    if (a.enabled) {
        const auto target = ArchiveValidator::validate(a.repository, a.file_path);
        if (target.is_error()) {
            errors.push_back(std::format("archive: {}", target.error_message()));
        }
        if (a.token.empty()) {
            errors.push_back("archive.token required when archive is enabled");
        }
        if (!a.api_base.starts_with("https://")) {
            errors.push_back("archive.api_base must be an https URL");
        }
        if (!d.collect_cdn_urls) {
            errors.push_back("archive.enabled requires delivery.collect_cdn_urls");
        }
    }

    const auto& r = config.retry;
    if (!utils::in_range<1, 20>(r.max_attempts)) {
        errors.push_back(std::format("retry.max_attempts must be 1-20, got {}", r.max_attempts));
    }
    if (r.max_delay_ms < r.base_delay_ms) {
        errors.push_back(std::format("retry.max_delay_ms ({}) < base_delay_ms ({})",
                                     r.max_delay_ms, r.base_delay_ms));
    }
    for (const int code : r.retryable_status) {
        if (!utils::in_range<100, 599>(code)) {
            errors.push_back(std::format("retry.retryable_status contains invalid status {}", code));
        }
    }

    if (config.output.save_local && config.output.directory.empty()) {
        errors.push_back("output.directory required when save_local is true");
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug|info|warn|error, got '{}'",
                                     config.logging.level));
    }

    for (size_t i = 0; i < config.scrubber.patterns.size(); ++i) {
        const auto& p = config.scrubber.patterns[i];
        if (p.name.empty()) {
            errors.push_back(std::format("scrubber.patterns[{}].name must not be empty", i));
        }
        if (p.regex.empty()) {
            errors.push_back(std::format("scrubber.patterns[{}].regex must not be empty", i));
            continue;
        }
        try {
            std::regex compiled(p.regex, std::regex::ECMAScript | std::regex::icase);
            (void)compiled;
        } catch (const std::regex_error& e) {
            errors.push_back(std::format("scrubber.patterns[{}].regex is invalid: {}", i, e.what()));
        }
    }

    return errors;
}

} // namespace egress
