#include "security/archive_validator.hpp"

#include <format>

namespace egress {

namespace {

bool is_name_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '.' || c == '-';
}

bool is_path_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '+' ||
           c == '@' || c == '~' || c == '-' || c == '/';
}

} // anonymous namespace

bool ArchiveValidator::is_valid_name(std::string_view part) {
    if (part.empty() || part.size() > kMaxNameLength) return false;
    if (part == "." || part == "..") return false;
    if (part.find("..") != std::string_view::npos) return false;
    for (const char c : part) {
        if (!is_name_char(c)) return false;
    }
    return true;
}

Result<std::string> ArchiveValidator::normalize_file_path(std::string_view file_path) {
    using R = Result<std::string>;

    if (file_path.empty()) {
        return R::error(ErrorKind::VALIDATION_ERROR, "Invalid file path: empty");
    }
    if (file_path.size() > kMaxFilePathLength) {
        return R::error(ErrorKind::VALIDATION_ERROR, "Invalid file path: too long");
    }
    if (file_path.front() == '/') {
        return R::error(ErrorKind::VALIDATION_ERROR,
                        "Invalid file path: path traversal (absolute path)");
    }
    for (const char c : file_path) {
        if (c == '\\') {
            return R::error(ErrorKind::VALIDATION_ERROR,
                            "Invalid file path: path traversal (backslash)");
        }
        if (!is_path_char(c)) {
            return R::error(ErrorKind::VALIDATION_ERROR,
                std::format("Invalid file path: disallowed character 0x{:02x}",
                            static_cast<unsigned>(static_cast<unsigned char>(c))));
        }
    }

    std::string normalized;
    normalized.reserve(file_path.size());
    size_t start = 0;
    while (start <= file_path.size()) {
        auto end = file_path.find('/', start);
        if (end == std::string_view::npos) end = file_path.size();
        const std::string_view seg = file_path.substr(start, end - start);

        if (seg.empty()) {
            return R::error(ErrorKind::VALIDATION_ERROR, "Invalid file path: empty segment");
        }
        if (seg == "..") {
            return R::error(ErrorKind::VALIDATION_ERROR, "Invalid file path: path traversal");
        }
        if (seg != ".") {
            if (!normalized.empty()) normalized += '/';
            normalized += seg;
        }
        start = end + 1;
    }

    if (normalized.empty()) {
        return R::error(ErrorKind::VALIDATION_ERROR, "Invalid file path: no file name");
    }
    return R::ok(std::move(normalized));
}

Result<ArchiveTarget> ArchiveValidator::validate(std::string_view owner_repo,
                                                 std::string_view file_path) {
    using R = Result<ArchiveTarget>;

    const auto slash = owner_repo.find('/');
    if (slash == std::string_view::npos ||
        owner_repo.find('/', slash + 1) != std::string_view::npos) {
        return R::error(ErrorKind::VALIDATION_ERROR,
            "Invalid GitHub repository format: expected exactly one '/' separator");
    }

    const std::string_view owner = owner_repo.substr(0, slash);
    const std::string_view repo = owner_repo.substr(slash + 1);
    if (!is_valid_name(owner) || !is_valid_name(repo)) {
        return R::error(ErrorKind::VALIDATION_ERROR,
            "Invalid GitHub repository format: owner and repo must match [A-Za-z0-9_.-]+");
    }

    auto path = normalize_file_path(file_path);
    if (path.is_error()) {
        return R::error(path.error_kind(), path.error_message());
    }

    ArchiveTarget target;
    target.owner = std::string(owner);
    target.repo = std::string(repo);
    target.file_path = std::move(path.value());
    return R::ok(std::move(target));
}

} // namespace egress
