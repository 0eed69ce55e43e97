#include "config/config_loader.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"
#include "delivery/cancellation.hpp"
#include "delivery/delivery_client.hpp"
#include "delivery/httplib_transport.hpp"
#include "delivery/message_builder.hpp"
#include "security/archive_validator.hpp"
#include "storage/secure_file_writer.hpp"

#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <regex>

using namespace egress;

// Global instance for signal handling
std::shared_ptr<CancellationToken> g_cancel;

namespace {

constexpr int kExitDelivered = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

struct CliOptions {
    std::string config_file;
    std::string webhook_url;
    std::string message;
    std::string username;
    std::string workflow_file;
    std::string save_dir;
    std::string prompt;
    std::string negative_prompt;
    bool info = false;
    bool archive = false;
    std::vector<std::string> files;
};

void print_usage(const char* argv0) {
    std::cerr << std::format(
        "Usage: {} [options] [FILE...]\n"
        "  --config PATH      TOML config (default: none)\n"
        "  --webhook URL      webhook URL (default: $EGRESS_WEBHOOK_URL, then config)\n"
        "  --message TEXT     message text\n"
        "  --username NAME    display name override\n"
        "  --workflow PATH    workflow JSON to attach (sanitized)\n"
        "  --save-dir DIR     also save FILEs under DIR\n"
        "  --prompt TEXT      positive generation prompt (appended to the message)\n"
        "  --negative TEXT    negative generation prompt\n"
        "  --info             append date, time and format details\n"
        "  --archive          record CDN URLs in the configured repository file\n",
        argv0);
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) return std::nullopt;
            return std::string(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg == "--archive") {
            opts.archive = true;
        } else if (arg == "--info") {
            opts.info = true;
        } else if (arg == "--config" || arg == "--webhook" || arg == "--message" ||
                   arg == "--username" || arg == "--workflow" || arg == "--save-dir" ||
                   arg == "--prompt" || arg == "--negative") {
            auto value = next();
            if (!value) {
                std::cerr << std::format("Missing value for {}\n", arg);
                return std::nullopt;
            }
            if (arg == "--config") opts.config_file = std::move(*value);
            else if (arg == "--webhook") opts.webhook_url = std::move(*value);
            else if (arg == "--message") opts.message = std::move(*value);
            else if (arg == "--username") opts.username = std::move(*value);
            else if (arg == "--workflow") opts.workflow_file = std::move(*value);
            else if (arg == "--prompt") opts.prompt = std::move(*value);
            else if (arg == "--negative") opts.negative_prompt = std::move(*value);
            else opts.save_dir = std::move(*value);
        } else if (arg.starts_with("--")) {
            std::cerr << std::format("Unknown option {}\n", arg);
            return std::nullopt;
        } else {
            opts.files.emplace_back(arg);
        }
    }
    return opts;
}

DeliveryClient::Config client_config(const EgressConfig& cfg) {
    DeliveryClient::Config c;
    c.staging_dir = cfg.delivery.staging_dir;
    c.archive_api_base = cfg.archive.api_base;
    c.max_attachments_per_request = cfg.delivery.max_attachments_per_request;
    c.max_attachment_bytes = static_cast<size_t>(cfg.delivery.max_attachment_mb) * 1024 * 1024;
    c.max_message_length = cfg.delivery.max_message_length;
    c.collect_cdn_urls = cfg.delivery.collect_cdn_urls || cfg.archive.enabled;
    c.send_cdn_manifest = cfg.delivery.send_cdn_manifest;
    return c;
}

void save_local_copies(const CliOptions& opts, const EgressConfig& cfg, const Logger& logger) {
    const std::string dir = opts.save_dir.empty() ? cfg.output.directory : opts.save_dir;
    const SecureFileWriter writer;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        logger.warn(std::format("Cannot create output directory '{}': {}", dir, ec.message()));
        return;
    }

    for (const auto& file : opts.files) {
        auto bytes = SecureFileWriter::read_file(file, 512ULL * 1024 * 1024);
        if (bytes.is_error()) {
            logger.warn(std::format("Local save skipped for '{}': {}", file, bytes.error_message()));
            continue;
        }
        WriteIntent intent;
        intent.target_path = std::filesystem::path(file).filename().string();
        intent.allow_overwrite = cfg.output.overwrite;
        intent.expected_parent_dir = dir;

        auto written = writer.write(intent, bytes.value());
        if (written.is_error()) {
            logger.warn(std::format("Local save failed for '{}' [{}]: {}", file,
                error_kind_to_string(written.error_kind()), written.error_message()));
        } else {
            logger.info(std::format("Saved {} ({} bytes){}", written.value().path,
                written.value().bytes_written, written.value().disambiguated ? " under a new name" : ""));
        }
    }
}

std::string compose_message(const CliOptions& opts) {
    std::string metadata;
    if (opts.info) {
        const auto stamp = utils::format_local_datetime(utils::now());
        MessageMetadata meta;
        meta.date = stamp.substr(0, 10);
        meta.time = stamp.substr(11);
        if (!opts.files.empty()) {
            meta.file_format = std::filesystem::path(opts.files.front()).extension().string();
            if (!meta.file_format->empty()) meta.file_format->erase(0, 1);
        }
        metadata = MessageBuilder::metadata_section(meta);
    }

    const auto as_opt = [](const std::string& s) -> std::optional<std::string_view> {
        if (s.empty()) return std::nullopt;
        return s;
    };
    return MessageBuilder::build(opts.message, metadata,
                                 MessageBuilder::prompt_section(as_opt(opts.prompt),
                                                                as_opt(opts.negative_prompt)));
}

int exit_code_for(const DeliveryResult& result) {
    if (result.delivered()) return kExitDelivered;
    if (result.error && result.error->kind == ErrorKind::CANCELLED) return kExitCancelled;
    return kExitFailed;
}

} // anonymous namespace

void signal_handler(int /*signal*/) {
    // Only the atomic flag: retry loops observe it within one poll slice
    if (g_cancel) {
        g_cancel->request_cancel();
    }
}

int main(int argc, char* argv[]) {
    try {
        const auto opts = parse_args(argc, argv);
        if (!opts) {
            print_usage(argv[0]);
            return kExitUsage;
        }

        // ===== Configuration =====

        auto config_result = opts->config_file.empty()
            ? ConfigLoader::load_from_string("")
            : ConfigLoader::load_from_file(opts->config_file);
        if (!config_result.success) {
            utils::log::detail::write(utils::log::Level::ERROR, config_result.error_message);
            return kExitUsage;
        }
        const EgressConfig& cfg = config_result.config;

        const auto scrubber = std::make_shared<const SecretScrubber>(
            ConfigLoader::build_scrubber_patterns(cfg.scrubber));
        const Logger logger(scrubber,
                            utils::log::parse_level(cfg.logging.level).value_or(utils::log::Level::INFO));

        logger.info("secure-egress starting");

        g_cancel = std::make_shared<CancellationToken>();
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // ===== Destination =====

        std::string webhook_url = opts->webhook_url;
        if (webhook_url.empty()) {
            if (const char* env = std::getenv("EGRESS_WEBHOOK_URL")) webhook_url = env;
        }
        if (webhook_url.empty()) {
            webhook_url = cfg.delivery.webhook_url;
        }
        if (webhook_url.empty()) {
            logger.error("No webhook URL: use --webhook, EGRESS_WEBHOOK_URL or delivery.webhook_url");
            return kExitUsage;
        }

        // ===== Local copies (independent of remote outcome) =====

        if (!opts->save_dir.empty() || cfg.output.save_local) {
            save_local_copies(*opts, cfg, logger);
        }

        // ===== Payload =====

        WebhookPayload payload;
        payload.message = compose_message(*opts);
        if (!opts->username.empty()) {
            payload.username = opts->username;
        } else {
            payload.username = cfg.delivery.username;
        }
        for (const auto& file : opts->files) {
            Attachment a;
            a.filename = std::filesystem::path(file).filename().string();
            a.source_path = file;
            payload.attachments.push_back(std::move(a));
        }
        if (!opts->workflow_file.empty()) {
            auto workflow = SecureFileWriter::read_file(opts->workflow_file, 16ULL * 1024 * 1024);
            if (workflow.is_error()) {
                logger.error(std::format("Cannot read workflow: {}", workflow.error_message()));
                return kExitFailed;
            }
            payload.workflow_json = std::move(workflow.value());
        }

        // ===== Delivery =====

        HttplibTransport::Config transport_cfg;
        transport_cfg.connection_timeout = std::chrono::seconds(cfg.delivery.connection_timeout_s);
        transport_cfg.read_timeout = std::chrono::seconds(cfg.delivery.read_timeout_s);
        transport_cfg.ca_cert_path = cfg.delivery.ca_cert_path;

        const DeliveryClient client(std::make_shared<HttplibTransport>(transport_cfg),
                                    client_config(cfg), logger);
        const RetryPolicy policy = cfg.retry.to_policy();

        DeliveryLedger ledger;
        const auto result = client.deliver_to_url(webhook_url, payload, policy, g_cancel.get(), &ledger);

        std::cout << std::format("status={} attempts={} requests={}/{} cdn_urls={} manifest={}\n",
            delivery_status_to_string(result.status), result.attempts,
            result.requests_delivered, result.requests_total,
            result.cdn_attachments.size(), utils::booltostr(result.manifest_delivered));
        if (result.error) {
            std::cout << std::format("error={} {}\n",
                error_kind_to_string(result.error->kind), result.error->message);
        }

        // ===== Archive =====

        if ((opts->archive || cfg.archive.enabled) && result.delivered()) {
            auto target = ArchiveValidator::validate(cfg.archive.repository, cfg.archive.file_path);
            if (target.is_error()) {
                logger.error(std::format("Archive target rejected: {}", target.error_message()));
                return kExitFailed;
            }
            if (result.cdn_attachments.empty()) {
                logger.warn("No CDN URLs returned; archive not updated");
            } else {
                ArchiveUpdate update;
                update.entries = result.cdn_attachments;
                update.commit_message = cfg.archive.commit_message;
                const auto archived = client.deliver(target.value(), update, cfg.archive.token,
                                                     policy, g_cancel.get());
                std::cout << std::format("archive_status={} attempts={}\n",
                    delivery_status_to_string(archived.status), archived.attempts);
                if (!archived.delivered()) {
                    if (archived.error) {
                        std::cout << std::format("archive_error={} {}\n",
                            error_kind_to_string(archived.error->kind), archived.error->message);
                    }
                    return exit_code_for(archived);
                }
            }
        }

        return exit_code_for(result);

    } catch (const std::regex_error& e) {
        utils::log::detail::write(utils::log::Level::ERROR,
            std::format("Invalid scrubber pattern: {}", e.what()));
        return kExitUsage;
    } catch (const std::exception& e) {
        utils::log::detail::write(utils::log::Level::ERROR,
            SecretScrubber::default_instance().scrub(std::format("Fatal: {}", e.what())));
        return kExitFailed;
    }
}
