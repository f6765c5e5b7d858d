#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief File and hashing helpers shared by ingestion and the clip cache
 */
class FileUtils
{
public:
    /**
     * @brief SHA-256 of a string as lowercase hex
     */
    static std::string sha256Hex(const std::string &data);

    /**
     * @brief SHA-256 of a file's contents as lowercase hex
     * @return Empty string if the file cannot be read
     */
    static std::string computeFileHash(const std::string &file_path);

    /**
     * @brief Write bytes next to the target and rename them into place
     *
     * Readers either see the previous file or the complete new one, never a partial write.
     * @return true on success
     */
    static bool writeFileAtomically(const fs::path &target, const std::vector<uint8_t> &bytes);
    static bool writeFileAtomically(const fs::path &target, const std::string &text);

    /**
     * @brief List regular files in a directory (non-recursive) whose extension is in the list
     * @param dir_path Directory to scan
     * @param extensions Lowercase extensions including the dot; empty accepts every file
     * @return Paths sorted by name
     */
    static std::vector<std::string> listFiles(const std::string &dir_path,
                                              const std::vector<std::string> &extensions = {});

    static bool isValidDirectory(const std::string &path);
    static std::string lowercaseExtension(const std::string &file_path);
};
