#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "storage/scoped_temp_file.hpp"

#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace egress {

/**
 * @brief Guarded filesystem mutation for user-influenced paths
 *
 * write() pipeline:
 *   1. canonicalize expected_parent_dir
 *   2. lexical containment of the target, then canonical containment of
 *      the target's parent (symlinked intermediate directories)
 *   3. symlink at target -> SYMLINK_ERROR, regardless of allow_overwrite
 *   4. existing file without allow_overwrite -> {stem}_{NNNNN}{ext}
 *   5. O_CREAT|O_EXCL|O_NOFOLLOW sibling temp, fsync, rename/link into place
 *
 * The temp file is owned by a ScopedTempFile and removed on every failure.
 */
class SecureFileWriter {
public:
    struct Config {
        mode_t file_mode = 0644;
        mode_t snapshot_mode = 0600;
        uint32_t max_disambiguation = 99999;
        bool create_missing_dirs = true;
        size_t max_snapshot_bytes = 512ULL * 1024 * 1024;
    };

    SecureFileWriter() = default;
    explicit SecureFileWriter(const Config& config) : config_(config) {}

    [[nodiscard]] Result<WrittenPath> write(const WriteIntent& intent, std::string_view bytes) const;

    /**
     * @brief Copy a caller-owned file into a private temp file under staging_dir
     *
     * The snapshot pins the bytes for the duration of a delivery; the caller
     * may modify or delete the source meanwhile. Symlinked sources are
     * rejected.
     */
    [[nodiscard]] Result<ScopedTempFile> stage_snapshot(const std::string& staging_dir,
                                                        const std::string& source_path) const;

    /// Read a whole regular file (no symlink following at the leaf)
    [[nodiscard]] static Result<std::string> read_file(const std::filesystem::path& path,
                                                       size_t max_bytes);

    /// "{stem}_{NNNNN}{ext}" for counter N
    [[nodiscard]] static std::string disambiguated_name(const std::string& filename, uint32_t counter);

    /// True when `child` (normalized) lies strictly inside `parent` (normalized)
    [[nodiscard]] static bool is_within(const std::filesystem::path& parent,
                                        const std::filesystem::path& child);

private:
    [[nodiscard]] Result<std::filesystem::path> resolve_parent(
        const std::filesystem::path& canonical_root,
        const std::filesystem::path& target_parent) const;

    [[nodiscard]] static Result<ScopedTempFile> create_temp(const std::filesystem::path& dir,
                                                            std::string_view tag,
                                                            mode_t mode,
                                                            std::string_view bytes);

    Config config_;
};

} // namespace egress
