#pragma once

#include "core/utils.hpp"
#include "security/secret_scrubber.hpp"

#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace egress {

/**
 * @brief Scrubbing log context
 *
 * Every line passes through the SecretScrubber before it reaches the sink,
 * so callers may format URLs and upstream bodies directly into messages.
 * Constructed explicitly; copies share the scrubber. There is no global
 * logger holding request-scoped secrets.
 */
class Logger {
public:
    using Level = utils::log::Level;
    using Sink = std::function<void(Level, const std::string&)>;

    explicit Logger(std::shared_ptr<const SecretScrubber> scrubber = SecretScrubber::shared_default(),
                    Level min_level = Level::INFO,
                    Sink sink = &utils::log::detail::write)
        : scrubber_(scrubber ? std::move(scrubber) : SecretScrubber::shared_default()),
          min_level_(min_level),
          sink_(std::move(sink)) {}

    void debug(std::string_view msg) const { emit(Level::DEBUG, msg, {}); }
    void info(std::string_view msg) const { emit(Level::INFO, msg, {}); }
    void warn(std::string_view msg) const { emit(Level::WARN, msg, {}); }
    void error(std::string_view msg) const { emit(Level::ERROR, msg, {}); }

    /// Log with additional literal secrets redacted (current call's tokens)
    void log(Level level, std::string_view msg, std::span<const std::string> known_secrets) const {
        emit(level, msg, known_secrets);
    }

    [[nodiscard]] bool enabled(Level level) const {
        return static_cast<int>(level) >= static_cast<int>(min_level_);
    }

    [[nodiscard]] Level min_level() const { return min_level_; }
    [[nodiscard]] const SecretScrubber& scrubber() const { return *scrubber_; }

    /// Logger that drops everything (tests, library callers without a sink)
    [[nodiscard]] static const Logger& null_logger() {
        static const Logger instance(SecretScrubber::shared_default(), Level::ERROR,
                                     [](Level, const std::string&) {});
        return instance;
    }

private:
    void emit(Level level, std::string_view msg, std::span<const std::string> known_secrets) const {
        if (!enabled(level) || !sink_) return;
        sink_(level, scrubber_->scrub(msg, known_secrets));
    }

    std::shared_ptr<const SecretScrubber> scrubber_;
    Level min_level_;
    Sink sink_;
};

} // namespace egress
