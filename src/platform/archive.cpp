#include "archive.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace platform {

static std::string error_of(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown error";
}

static bool is_excluded_dir(const fs::path& p, const TarOptions& options) {
    const std::string name = p.filename().string();
    return std::find(options.exclude_dirs.begin(), options.exclude_dirs.end(), name)
           != options.exclude_dirs.end();
}

static bool is_cif(const fs::path& p) {
    return p.extension() == ".cif";
}

// Fill an entry from lstat() so ownership, mode and mtime survive.
static bool stat_entry(struct archive_entry* entry, const fs::path& p, const std::string& name) {
    struct stat st;
    if (lstat(p.c_str(), &st) != 0) return false;
    archive_entry_clear(entry);
    archive_entry_copy_stat(entry, &st);
    archive_entry_set_pathname(entry, name.c_str());
    return true;
}

static Result<void> write_file_data(struct archive* a, const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) return Result<void>::Err("Cannot read " + p.string());

    char buf[65536];
    while (in) {
        in.read(buf, sizeof(buf));
        auto bytes_read = in.gcount();
        if (bytes_read > 0 &&
            archive_write_data(a, buf, static_cast<size_t>(bytes_read)) < 0) {
            return Result<void>::Err(fmt::format("Failed writing {}: {}", p.string(),
                                                 error_of(a)));
        }
    }
    return Result<void>::Ok();
}

Result<std::vector<std::string>> create_tar(const fs::path& tar_path,
                                            const fs::path& run_dir,
                                            const TarOptions& options) {
    using R = Result<std::vector<std::string>>;
    if (!fs::is_directory(run_dir)) {
        return R::Err(run_dir.string() + " is not a directory");
    }

    struct archive* a = archive_write_new();
    if (!a) return R::Err("Failed to create archive writer");

    archive_write_set_format_ustar(a);

    if (archive_write_open_filename(a, tar_path.c_str()) != ARCHIVE_OK) {
        std::string err = error_of(a);
        archive_write_free(a);
        return R::Err("Failed to open tar file: " + err);
    }

    const std::string top = run_dir.filename().string();
    std::vector<std::string> written;
    struct archive_entry* entry = archive_entry_new();
    std::string error;

    auto add = [&](const fs::path& p, const std::string& name) -> bool {
        if (!stat_entry(entry, p, name)) {
            error = "Cannot stat " + p.string();
            return false;
        }
        if (fs::is_symlink(fs::symlink_status(p))) {
            archive_entry_set_symlink(entry, fs::read_symlink(p).c_str());
        }
        if (archive_write_header(a, entry) != ARCHIVE_OK) {
            error = fmt::format("Failed to add {}: {}", name, error_of(a));
            return false;
        }
        if (archive_entry_filetype(entry) == AE_IFREG) {
            auto r = write_file_data(a, p);
            if (r.is_err()) {
                error = r.error;
                return false;
            }
        }
        written.push_back(name);
        return true;
    };

    bool ok = add(run_dir, top);
    std::error_code ec;
    fs::recursive_directory_iterator it(run_dir, ec), end;
    if (ec) {
        ok = false;
        error = fmt::format("Cannot walk {}: {}", run_dir.string(), ec.message());
    }
    for (; ok && it != end; it.increment(ec)) {
        if (ec) {
            ok = false;
            error = fmt::format("Cannot walk {}: {}", run_dir.string(), ec.message());
            break;
        }
        const fs::path& p = it->path();
        const auto status = it->symlink_status();
        if (fs::is_directory(status) && is_excluded_dir(p, options)) {
            it.disable_recursion_pending();
            continue;
        }
        if (fs::is_regular_file(status) && !options.include_cif && is_cif(p)) {
            continue;
        }
        std::string name = top + "/" + fs::relative(p, run_dir).generic_string();
        ok = add(p, name);
    }

    archive_entry_free(entry);
    if (archive_write_close(a) != ARCHIVE_OK && ok) {
        ok = false;
        error = fmt::format("Failed to close tar file: {}", error_of(a));
    }
    archive_write_free(a);

    if (!ok) return R::Err(error);
    return R::Ok(std::move(written));
}

Result<std::vector<std::string>> list_tar(const fs::path& tar_path) {
    using R = Result<std::vector<std::string>>;
    struct archive* a = archive_read_new();
    if (!a) return R::Err("Failed to create archive reader");

    archive_read_support_format_tar(a);
    if (archive_read_open_filename(a, tar_path.c_str(), 10240) != ARCHIVE_OK) {
        std::string err = error_of(a);
        archive_read_free(a);
        return R::Err("Failed to open tar file: " + err);
    }

    std::vector<std::string> names;
    struct archive_entry* entry = nullptr;
    int rc;
    while ((rc = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
        std::string name = archive_entry_pathname(entry);
        // ustar stores directories with a trailing slash
        if (!name.empty() && name.back() == '/') name.pop_back();
        names.push_back(name);
        archive_read_data_skip(a);
    }

    std::string err = (rc == ARCHIVE_EOF) ? "" : error_of(a);
    archive_read_close(a);
    archive_read_free(a);
    if (!err.empty()) return R::Err("Failed reading tar file: " + err);
    return R::Ok(std::move(names));
}

} // namespace platform
