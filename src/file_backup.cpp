/**
 * @file file_backup.cpp
 * @brief File archive strategy implementations for ResponderVault.
 *
 * The libarchive strategy writes a gzip-compressed pax tar and extracts with
 * archive_write_disk; the command strategy delegates both directions to tar.
 */

#include "file_backup.hpp"
#include "command_runner.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <filesystem>
#include <fstream>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <sys/types.h>

namespace fs = std::filesystem;

namespace {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};

struct ArchiveEntryDeleter {
    void operator()(struct archive_entry* e) const { archive_entry_free(e); }
};

using ArchiveReader = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriter = std::unique_ptr<struct archive, ArchiveWriteDeleter>;
using ArchiveEntry = std::unique_ptr<struct archive_entry, ArchiveEntryDeleter>;

std::string archiveError(struct archive* a) {
    const char* message = archive_error_string(a);
    return message ? message : "unknown libarchive error";
}

/**
 * @brief Adds one directory, regular file or symlink to the archive under @p name.
 *
 * Symlinks are stored as links, not followed. Sockets, FIFOs and devices are skipped.
 */
std::expected<void, std::string> addEntry(struct archive* a, const fs::path& path, const std::string& name) {
    std::error_code ec;
    fs::file_status status = fs::symlink_status(path, ec);
    if (ec) {
        return std::unexpected("Failed to stat " + path.string() + ": " + ec.message());
    }
    bool isLink = fs::is_symlink(status);
    if (!isLink && !fs::is_directory(status) && !fs::is_regular_file(status)) {
        return {};
    }

    ArchiveEntry entry(archive_entry_new());
    archive_entry_set_pathname(entry.get(), name.c_str());
    archive_entry_set_perm(entry.get(), static_cast<mode_t>(status.permissions() & fs::perms::mask));

    // last_write_time follows links; a dangling link keeps no mtime.
    auto lastWrite = fs::last_write_time(path, ec);
    if (!ec) {
        auto sysTime = std::chrono::file_clock::to_sys(lastWrite);
        auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(sysTime);
        auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(sysTime - seconds);
        archive_entry_set_mtime(entry.get(), seconds.time_since_epoch().count(), static_cast<long>(nanos.count()));
    }

    std::uintmax_t size = 0;
    if (isLink) {
        fs::path target = fs::read_symlink(path, ec);
        if (ec) {
            return std::unexpected("Failed to read link " + path.string() + ": " + ec.message());
        }
        archive_entry_set_filetype(entry.get(), AE_IFLNK);
        archive_entry_set_symlink(entry.get(), target.c_str());
    } else if (fs::is_directory(status)) {
        archive_entry_set_filetype(entry.get(), AE_IFDIR);
    } else {
        size = fs::file_size(path, ec);
        if (ec) {
            return std::unexpected("Failed to read size of " + path.string() + ": " + ec.message());
        }
        archive_entry_set_filetype(entry.get(), AE_IFREG);
    }
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(size));

    if (archive_write_header(a, entry.get()) < ARCHIVE_WARN) {
        return std::unexpected("Failed to write archive header for " + path.string() + ": " + archiveError(a));
    }

    if (size > 0) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::unexpected("Failed to open file: " + path.string());
        }
        char buf[8192];
        while (file) {
            file.read(buf, sizeof(buf));
            std::streamsize count = file.gcount();
            if (count > 0 && archive_write_data(a, buf, static_cast<size_t>(count)) < 0) {
                return std::unexpected("Failed to write archive data for " + path.string() + ": " + archiveError(a));
            }
        }
    }
    return {};
}

std::expected<void, std::string> copyData(struct archive* reader, struct archive* writer) {
    const void* buff;
    size_t size;
    la_int64_t offset;
    for (;;) {
        int r = archive_read_data_block(reader, &buff, &size, &offset);
        if (r == ARCHIVE_EOF) {
            return {};
        }
        if (r < ARCHIVE_WARN) {
            return std::unexpected("Failed to read archive data: " + archiveError(reader));
        }
        if (archive_write_data_block(writer, buff, size, offset) < ARCHIVE_WARN) {
            return std::unexpected("Failed to write extracted data: " + archiveError(writer));
        }
    }
}

} // namespace

std::expected<void, std::string> TarGzFileBackupStrategy::archive(const std::string& sourceDir,
                                                                  const std::string& outputFile) {
    fs::path source(sourceDir);
    std::error_code ec;
    if (!fs::is_directory(source, ec)) {
        return std::unexpected("Source directory does not exist: " + sourceDir);
    }

    ArchiveWriter writer(archive_write_new());
    archive_write_add_filter_gzip(writer.get());
    archive_write_set_format_pax_restricted(writer.get());
    if (archive_write_open_filename(writer.get(), outputFile.c_str()) != ARCHIVE_OK) {
        return std::unexpected("Failed to open archive file: " + outputFile + " (error: " +
                               archiveError(writer.get()) + ")");
    }

    // Entry names are relative, as tar strips a leading '/'.
    auto entryName = [](const fs::path& path) {
        return path.lexically_normal().relative_path().generic_string();
    };

    auto rootResult = addEntry(writer.get(), source, entryName(source));
    if (!rootResult) {
        return std::unexpected(rootResult.error());
    }

    fs::recursive_directory_iterator it(source, ec);
    if (ec) {
        return std::unexpected("Failed to read directory " + sourceDir + ": " + ec.message());
    }
    while (it != fs::recursive_directory_iterator()) {
        auto result = addEntry(writer.get(), it->path(), entryName(it->path()));
        if (!result) {
            return std::unexpected(result.error());
        }
        it.increment(ec);
        if (ec) {
            return std::unexpected("Failed to read directory " + sourceDir + ": " + ec.message());
        }
    }

    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        return std::unexpected("Failed to finalize archive file: " + outputFile + " (error: " +
                               archiveError(writer.get()) + ")");
    }
    return {};
}

std::expected<void, std::string> TarGzFileBackupStrategy::extract(const std::string& archiveFile,
                                                                  const std::string& destinationDir) {
    ArchiveReader reader(archive_read_new());
    archive_read_support_filter_gzip(reader.get());
    archive_read_support_format_tar(reader.get());
    if (archive_read_open_filename(reader.get(), archiveFile.c_str(), 10240) != ARCHIVE_OK) {
        return std::unexpected("Failed to open archive: " + archiveFile + " (error: " +
                               archiveError(reader.get()) + ")");
    }

    std::error_code ec;
    fs::path destination = fs::absolute(destinationDir, ec).lexically_normal();
    if (ec) {
        return std::unexpected("Invalid destination directory " + destinationDir + ": " + ec.message());
    }
    fs::create_directories(destination, ec);
    if (ec) {
        return std::unexpected("Failed to create destination directory " + destination.string() + ": " +
                               ec.message());
    }

    ArchiveWriter writer(archive_write_disk_new());
    archive_write_disk_set_options(writer.get(), ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                                     ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                                     ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(writer.get());

    struct archive_entry* entry;
    for (;;) {
        int r = archive_read_next_header(reader.get(), &entry);
        if (r == ARCHIVE_EOF) {
            break;
        }
        if (r < ARCHIVE_WARN) {
            return std::unexpected("Failed to read archive header from " + archiveFile + ": " +
                                   archiveError(reader.get()));
        }

        auto target = extractionTarget(destination, archive_entry_pathname(entry));
        if (!target) {
            return std::unexpected(target.error() + " in " + archiveFile);
        }
        std::string targetName = target->string();
        archive_entry_set_pathname(entry, targetName.c_str());

        if (archive_write_header(writer.get(), entry) < ARCHIVE_WARN) {
            return std::unexpected("Failed to extract " + targetName + ": " + archiveError(writer.get()));
        }
        if (archive_entry_size(entry) > 0) {
            auto copied = copyData(reader.get(), writer.get());
            if (!copied) {
                return std::unexpected(copied.error());
            }
        }
        if (archive_write_finish_entry(writer.get()) < ARCHIVE_WARN) {
            return std::unexpected("Failed to finish " + targetName + ": " + archiveError(writer.get()));
        }
    }

    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        return std::unexpected("Failed to finalize extraction: " + archiveError(writer.get()));
    }
    return {};
}

std::expected<fs::path, std::string> TarGzFileBackupStrategy::extractionTarget(const fs::path& destination,
                                                                              const char* entryName) {
    if (!entryName || !*entryName) {
        return std::unexpected("Archive entry has no readable name");
    }
    return destination / fs::path(entryName).relative_path();
}

TarCommandFileBackupStrategy::TarCommandFileBackupStrategy(std::shared_ptr<CommandRunner> runner, std::string tarProgram)
    : runner(std::move(runner)), tarProgram(std::move(tarProgram)) {
    if (!this->runner) {
        throw std::invalid_argument("TarCommandFileBackupStrategy requires a command runner");
    }
}

std::expected<void, std::string> TarCommandFileBackupStrategy::archive(const std::string& sourceDir,
                                                                       const std::string& outputFile) {
    CommandSpec command;
    command.argv = {tarProgram, "-czf", outputFile, sourceDir};
    auto result = runner->run(command);
    if (!result) {
        return std::unexpected("Failed to execute " + tarProgram + ": " + result.error());
    }
    return {};
}

std::expected<void, std::string> TarCommandFileBackupStrategy::extract(const std::string& archiveFile,
                                                                       const std::string& destinationDir) {
    CommandSpec command;
    command.argv = {tarProgram, "-xzf", archiveFile, "-C", destinationDir};
    auto result = runner->run(command);
    if (!result) {
        return std::unexpected("Failed to execute " + tarProgram + ": " + result.error());
    }
    return {};
}
