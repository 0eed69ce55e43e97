#include "storage/secure_file_writer.hpp"
#include "core/crypto.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <format>
#include <system_error>

namespace egress {

namespace fs = std::filesystem;

namespace {

constexpr int kTempCreateAttempts = 8;

/// Closes the descriptor on scope exit
class UniqueFd {
public:
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { if (fd_ >= 0) ::close(fd_); }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] int get() const { return fd_; }
    [[nodiscard]] bool valid() const { return fd_ >= 0; }

    /// Close now and report the result (write-back errors surface here)
    int close() {
        const int rc = ::close(fd_);
        fd_ = -1;
        return rc;
    }

private:
    int fd_;
};

std::string errno_text(int err) {
    return std::system_category().message(err);
}

bool write_all(int fd, std::string_view bytes) {
    const char* p = bytes.data();
    size_t left = bytes.size();
    while (left > 0) {
        const ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

bool contained(const fs::path& root, const fs::path& p) {
    return p == root || SecureFileWriter::is_within(root, p);
}

void fsync_directory(const fs::path& dir) {
    UniqueFd fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (fd.valid()) {
        (void)::fsync(fd.get());  // best effort: the rename itself already succeeded
    }
}

} // anonymous namespace

// ============================================================================
// Helpers
// ============================================================================

bool SecureFileWriter::is_within(const fs::path& parent, const fs::path& child) {
    const fs::path rel = child.lexically_normal().lexically_relative(parent.lexically_normal());
    if (rel.empty() || rel == ".") return false;
    return *rel.begin() != "..";
}

std::string SecureFileWriter::disambiguated_name(const std::string& filename, uint32_t counter) {
    const fs::path p(filename);
    return std::format("{}_{:05d}{}", p.stem().string(), counter, p.extension().string());
}

Result<fs::path> SecureFileWriter::resolve_parent(const fs::path& canonical_root,
                                                  const fs::path& target_parent) const {
    using R = Result<fs::path>;
    std::error_code ec;

    // Deepest ancestor that already exists decides where new dirs would land
    fs::path existing = target_parent;
    while (!fs::exists(fs::symlink_status(existing, ec)) && existing != canonical_root &&
           existing.has_parent_path() && existing != existing.parent_path()) {
        existing = existing.parent_path();
    }

    fs::path canon = fs::canonical(existing, ec);
    if (ec) {
        return R::error(ErrorKind::FILESYSTEM_ERROR,
            std::format("Cannot resolve directory: {}", ec.message()));
    }
    if (!contained(canonical_root, canon)) {
        return R::error(ErrorKind::PATH_TRAVERSAL_ERROR,
            "Write target escapes the output directory via a symlinked directory");
    }

    if (existing != target_parent) {
        if (!config_.create_missing_dirs) {
            return R::error(ErrorKind::FILESYSTEM_ERROR, "Target directory does not exist");
        }
        fs::create_directories(target_parent, ec);
        if (ec) {
            return R::error(ErrorKind::FILESYSTEM_ERROR,
                std::format("Cannot create directory: {}", ec.message()));
        }
    }

    canon = fs::canonical(target_parent, ec);
    if (ec) {
        return R::error(ErrorKind::FILESYSTEM_ERROR,
            std::format("Cannot resolve directory: {}", ec.message()));
    }
    if (!contained(canonical_root, canon)) {
        return R::error(ErrorKind::PATH_TRAVERSAL_ERROR,
            "Write target escapes the output directory via a symlinked directory");
    }
    if (!fs::is_directory(canon, ec)) {
        return R::error(ErrorKind::FILESYSTEM_ERROR, "Target parent is not a directory");
    }
    return R::ok(std::move(canon));
}

Result<ScopedTempFile> SecureFileWriter::create_temp(const fs::path& dir,
                                                     std::string_view tag,
                                                     mode_t mode,
                                                     std::string_view bytes) {
    using R = Result<ScopedTempFile>;

    for (int attempt = 0; attempt < kTempCreateAttempts; ++attempt) {
        const auto suffix = crypto::random_hex(8);
        if (!suffix) {
            return R::error(ErrorKind::INTERNAL_ERROR, "RAND_bytes failed");
        }
        // Fixed-length name: the target name may already be close to NAME_MAX
        const fs::path path = dir / std::format(".egress-{}.{}.tmp", tag, *suffix);

        UniqueFd fd(::open(path.c_str(),
                           O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, mode));
        if (!fd.valid()) {
            if (errno == EEXIST) continue;
            return R::error(ErrorKind::FILESYSTEM_ERROR,
                std::format("Cannot create temp file: {}", errno_text(errno)));
        }

        // Owned from here: any early return removes it
        ScopedTempFile guard(path);

        if (!write_all(fd.get(), bytes)) {
            return R::error(ErrorKind::FILESYSTEM_ERROR,
                std::format("Write failed: {}", errno_text(errno)));
        }
        if (::fsync(fd.get()) != 0) {
            return R::error(ErrorKind::FILESYSTEM_ERROR,
                std::format("fsync failed: {}", errno_text(errno)));
        }
        if (fd.close() != 0) {
            return R::error(ErrorKind::FILESYSTEM_ERROR,
                std::format("close failed: {}", errno_text(errno)));
        }
        return R::ok(std::move(guard));
    }
    return R::error(ErrorKind::FILESYSTEM_ERROR, "Cannot create a unique temp file");
}

// ============================================================================
// Public API
// ============================================================================

Result<WrittenPath> SecureFileWriter::write(const WriteIntent& intent, std::string_view bytes) const {
    using R = Result<WrittenPath>;
    std::error_code ec;

    if (intent.expected_parent_dir.empty()) {
        return R::error(ErrorKind::VALIDATION_ERROR, "expected_parent_dir is required");
    }
    if (intent.target_path.empty()) {
        return R::error(ErrorKind::VALIDATION_ERROR, "target_path is required");
    }

    const fs::path root = fs::canonical(intent.expected_parent_dir, ec);
    if (ec) {
        return R::error(ErrorKind::FILESYSTEM_ERROR,
            std::format("Output directory unavailable: {}", ec.message()));
    }
    if (!fs::is_directory(root, ec)) {
        return R::error(ErrorKind::FILESYSTEM_ERROR, "Output directory is not a directory");
    }

    fs::path target(intent.target_path);
    if (target.is_relative()) {
        target = root / target;
    } else {
        // Absolute targets spelled through the non-canonical parent
        // (/tmp/out/x with /tmp a symlink) are rebased onto the canonical root
        const fs::path spelled_root = fs::absolute(intent.expected_parent_dir, ec).lexically_normal();
        if (!ec && is_within(spelled_root, target)) {
            target = root / target.lexically_normal().lexically_relative(spelled_root);
        }
    }
    target = target.lexically_normal();

    const std::string filename = target.filename().string();
    if (filename.empty() || filename == "." || filename == "..") {
        return R::error(ErrorKind::VALIDATION_ERROR, "Write target has no file name");
    }
    if (!is_within(root, target)) {
        return R::error(ErrorKind::PATH_TRAVERSAL_ERROR,
            "Write target escapes the output directory");
    }

    auto parent = resolve_parent(root, target.parent_path());
    if (parent.is_error()) {
        return R::error(parent.error_kind(), parent.error_message());
    }
    const fs::path final_path = parent.value() / filename;

    const auto st = fs::symlink_status(final_path, ec);
    if (fs::is_symlink(st)) {
        return R::error(ErrorKind::SYMLINK_ERROR, "Write target is a symbolic link");
    }
    const bool exists = fs::exists(st);
    if (exists && !fs::is_regular_file(st)) {
        return R::error(ErrorKind::FILESYSTEM_ERROR, "Write target is not a regular file");
    }

    auto temp = create_temp(parent.value(), "write", config_.file_mode, bytes);
    if (temp.is_error()) {
        return R::error(temp.error_kind(), temp.error_message());
    }
    ScopedTempFile& tmp = temp.value();

    if (intent.allow_overwrite) {
        // Narrow the window for a symlink swapped in after the first check
        if (fs::is_symlink(fs::symlink_status(final_path, ec))) {
            return R::error(ErrorKind::SYMLINK_ERROR, "Write target is a symbolic link");
        }
        if (::rename(tmp.path().c_str(), final_path.c_str()) != 0) {
            return R::error(ErrorKind::FILESYSTEM_ERROR,
                std::format("rename failed: {}", errno_text(errno)));
        }
        tmp.release();
        fsync_directory(parent.value());
        return R::ok(WrittenPath{final_path.string(), bytes.size(), false});
    }

    // No-clobber placement: link(2) fails with EEXIST instead of replacing
    // anything, including a symlink created concurrently.
    auto place = [&](const fs::path& dest) -> int {
        if (::link(tmp.path().c_str(), dest.c_str()) == 0) return 0;
        return errno;
    };

    if (!exists) {
        const int err = place(final_path);
        if (err == 0) {
            tmp.reset();
            fsync_directory(parent.value());
            return R::ok(WrittenPath{final_path.string(), bytes.size(), false});
        }
        if (err != EEXIST) {
            return R::error(ErrorKind::FILESYSTEM_ERROR,
                std::format("link failed: {}", errno_text(err)));
        }
    }

    for (uint32_t counter = 1; counter <= config_.max_disambiguation; ++counter) {
        const fs::path candidate = parent.value() / disambiguated_name(filename, counter);
        const int err = place(candidate);
        if (err == 0) {
            tmp.reset();
            fsync_directory(parent.value());
            return R::ok(WrittenPath{candidate.string(), bytes.size(), true});
        }
        if (err != EEXIST) {
            return R::error(ErrorKind::FILESYSTEM_ERROR,
                std::format("link failed: {}", errno_text(err)));
        }
    }

    return R::error(ErrorKind::FILESYSTEM_ERROR, "No free file name left for disambiguation");
}

Result<std::string> SecureFileWriter::read_file(const fs::path& path, size_t max_bytes) {
    using R = Result<std::string>;

    UniqueFd fd(::open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC));
    if (!fd.valid()) {
        if (errno == ELOOP) {
            return R::error(ErrorKind::SYMLINK_ERROR, "Source file is a symbolic link");
        }
        return R::error(ErrorKind::FILESYSTEM_ERROR,
            std::format("Cannot open file: {}", errno_text(errno)));
    }

    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) {
        return R::error(ErrorKind::FILESYSTEM_ERROR,
            std::format("fstat failed: {}", errno_text(errno)));
    }
    if (!S_ISREG(st.st_mode)) {
        return R::error(ErrorKind::FILESYSTEM_ERROR, "Source is not a regular file");
    }
    if (static_cast<size_t>(st.st_size) > max_bytes) {
        return R::error(ErrorKind::FILESYSTEM_ERROR, "Source file exceeds the size limit");
    }

    std::string out;
    out.reserve(static_cast<size_t>(st.st_size));
    char buf[64 * 1024];
    while (true) {
        const ssize_t n = ::read(fd.get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            return R::error(ErrorKind::FILESYSTEM_ERROR,
                std::format("read failed: {}", errno_text(errno)));
        }
        if (n == 0) break;
        out.append(buf, static_cast<size_t>(n));
        if (out.size() > max_bytes) {
            return R::error(ErrorKind::FILESYSTEM_ERROR, "Source file exceeds the size limit");
        }
    }
    return R::ok(std::move(out));
}

Result<ScopedTempFile> SecureFileWriter::stage_snapshot(const std::string& staging_dir,
                                                        const std::string& source_path) const {
    using R = Result<ScopedTempFile>;
    std::error_code ec;

    const fs::path staging = fs::canonical(staging_dir, ec);
    if (ec || !fs::is_directory(staging, ec)) {
        return R::error(ErrorKind::FILESYSTEM_ERROR, "Staging directory unavailable");
    }

    const auto st = fs::symlink_status(source_path, ec);
    if (fs::is_symlink(st)) {
        return R::error(ErrorKind::SYMLINK_ERROR, "Source file is a symbolic link");
    }

    auto bytes = read_file(source_path, config_.max_snapshot_bytes);
    if (bytes.is_error()) {
        return R::error(bytes.error_kind(), bytes.error_message());
    }
    return create_temp(staging, "snapshot", config_.snapshot_mode, bytes.value());
}

} // namespace egress
