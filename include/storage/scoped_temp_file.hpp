#pragma once

#include <filesystem>
#include <system_error>
#include <utility>

namespace egress {

/**
 * @brief RAII owner of a temporary file path
 *
 * The file is unlinked when the guard goes out of scope unless release()
 * was called (after a successful rename into place). Move-only.
 */
class ScopedTempFile {
public:
    ScopedTempFile() = default;
    explicit ScopedTempFile(std::filesystem::path path) : path_(std::move(path)), armed_(true) {}

    ~ScopedTempFile() { reset(); }

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    ScopedTempFile(ScopedTempFile&& other) noexcept
        : path_(std::move(other.path_)), armed_(std::exchange(other.armed_, false)) {}

    ScopedTempFile& operator=(ScopedTempFile&& other) noexcept {
        if (this != &other) {
            reset();
            path_ = std::move(other.path_);
            armed_ = std::exchange(other.armed_, false);
        }
        return *this;
    }

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] bool active() const { return armed_; }

    /// Stop owning the file (it has been renamed or handed off)
    void release() { armed_ = false; }

    /// Remove the file now
    void reset() noexcept {
        if (!armed_) return;
        armed_ = false;
        std::error_code ec;
        std::filesystem::remove(path_, ec);  // already gone is fine
    }

private:
    std::filesystem::path path_;
    bool armed_ = false;
};

} // namespace egress
