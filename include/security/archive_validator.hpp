#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <string_view>

namespace egress {

/**
 * @brief Validation of repository coordinates and in-repository file paths
 *
 * Runs before any content-API call. A path that reaches the request builder
 * has already passed here; the delivery client re-runs validate() on entry.
 */
class ArchiveValidator {
public:
    static constexpr size_t kMaxFilePathLength = 1024;
    static constexpr size_t kMaxNameLength = 100;

    /**
     * @brief Validate "owner/repo" plus a repository-relative file path
     * @return ArchiveTarget with owner/repo unchanged and `.` segments removed
     *         from the path; VALIDATION_ERROR otherwise (traversal included)
     */
    [[nodiscard]] static Result<ArchiveTarget> validate(std::string_view owner_repo,
                                                        std::string_view file_path);

    [[nodiscard]] static bool is_valid_name(std::string_view part);

    /// Normalized path, or an error describing the first offending segment
    [[nodiscard]] static Result<std::string> normalize_file_path(std::string_view file_path);
};

} // namespace egress
