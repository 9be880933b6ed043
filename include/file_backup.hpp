/**
 * @file file_backup.hpp
 * @brief Defines file archive strategies for ResponderVault.
 *
 * Provides the interface for packing the uploaded-content directory into a tar.gz
 * artifact and extracting such an artifact back onto disk, with an in-process
 * libarchive implementation and one that drives an external tar program.
 *
 * @note TarGzFileBackupStrategy requires libarchive.
 */

#ifndef FILE_BACKUP_HPP
#define FILE_BACKUP_HPP

#include <string>
#include <memory>
#include <expected>
#include <filesystem>

class CommandRunner;

/**
 * @brief Interface for file archive strategies.
 */
class FileBackupStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~FileBackupStrategy() = default;

    /**
     * @brief Archives a directory into a tar.gz file.
     *
     * Entry names keep @p sourceDir as their prefix (e.g. "uploads/photo.jpg"), so an
     * extraction recreates the directory under the destination.
     *
     * @param sourceDir Directory to archive.
     * @param outputFile Path for the output .tar.gz file.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> archive(const std::string& sourceDir,
                                                     const std::string& outputFile) = 0;

    /**
     * @brief Extracts a tar.gz file into a directory.
     *
     * Existing files are overwritten; nothing is removed beforehand.
     *
     * @param archiveFile Path of the .tar.gz file.
     * @param destinationDir Directory receiving the entries.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> extract(const std::string& archiveFile,
                                                     const std::string& destinationDir) = 0;
};

/**
 * @brief Tar.gz strategy implemented in-process with libarchive.
 */
class TarGzFileBackupStrategy : public FileBackupStrategy {
public:
    std::expected<void, std::string> archive(const std::string& sourceDir,
                                             const std::string& outputFile) override;

    std::expected<void, std::string> extract(const std::string& archiveFile,
                                             const std::string& destinationDir) override;

    /**
     * @brief Maps an archive entry name onto the extraction destination.
     *
     * @param destination Absolute, normalised extraction root.
     * @param entryName Name reported by libarchive; null when it could not be
     *        converted in the current locale.
     * @return The target path, or an error for a missing name.
     */
    static std::expected<std::filesystem::path, std::string> extractionTarget(const std::filesystem::path& destination,
                                                                              const char* entryName);
};

/**
 * @brief Tar.gz strategy running `tar -czf` / `tar -xzf` through a CommandRunner.
 */
class TarCommandFileBackupStrategy : public FileBackupStrategy {
public:
    /**
     * @brief Constructs a tar command strategy.
     *
     * @param runner Executes the tar program.
     * @param tarProgram Program name or path (e.g. "tar").
     */
    explicit TarCommandFileBackupStrategy(std::shared_ptr<CommandRunner> runner, std::string tarProgram = "tar");

    std::expected<void, std::string> archive(const std::string& sourceDir,
                                             const std::string& outputFile) override;

    std::expected<void, std::string> extract(const std::string& archiveFile,
                                             const std::string& destinationDir) override;

private:
    std::shared_ptr<CommandRunner> runner; ///< Process executor.
    std::string tarProgram;                ///< Archive/extract capability.
};

#endif // FILE_BACKUP_HPP
