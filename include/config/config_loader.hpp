#pragma once

#include "config/config_types.hpp"
#include "security/secret_scrubber.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace egress {

/**
 * @brief TOML configuration loader (toml++)
 *
 * Supports `include = "other.toml"` (or an array of paths, resolved
 * relative to the including file; the including file wins on conflicts)
 * and `${VAR}` environment expansion in every string value, which is how
 * credentials reach the config without being written to disk.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        EgressConfig config;

        static LoadResult ok(EgressConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every problem found, in section order; empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const EgressConfig& config);

    /// Compile [[scrubber.patterns]]; throws std::regex_error on a bad pattern
    [[nodiscard]] static std::vector<SecretScrubber::SecretPattern> build_scrubber_patterns(
        const ScrubberConfig& config);

private:
    static DeliveryConfig extract_delivery(const toml::table& root);
    static ArchiveConfig extract_archive(const toml::table& root);
    static RetryConfig extract_retry(const toml::table& root);
    static OutputConfig extract_output(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static ScrubberConfig extract_scrubber(const toml::table& root);

    static EgressConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(EgressConfig config);
};

} // namespace egress
