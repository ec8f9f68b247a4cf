#include "lensbridge/log/logger.hpp"

#include <mutex>

namespace lensbridge {

namespace {

std::unique_ptr<ILogger>& logger_instance() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return *logger_instance();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    const bool is_valid = (logger != nullptr);
    if (is_valid) {
        logger_instance() = std::move(logger);
    } else {
        logger_instance() = std::make_unique<NullLogger>();
    }
}

std::string redact_token(std::string_view token) {
    constexpr std::size_t max_visible = 16;
    const bool short_enough = (token.size() <= max_visible);
    if (short_enough) {
        return std::string(token);
    }
    std::string redacted(token.substr(0, 8));
    redacted += "...";
    redacted += token.substr(token.size() - 4);
    return redacted;
}

std::string clip_for_log(std::string_view text, std::size_t max_length) {
    std::string clipped(text.substr(0, max_length));
    // Control characters would break single-line log output
    for (char& c : clipped) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte < 32 || byte == 127) {
            c = '?';
        }
    }
    if (text.size() > max_length) {
        clipped += "...";
    }
    return clipped;
}

}  // namespace lensbridge
