#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <thread>

namespace
{
    std::string toHex(const unsigned char *hash, size_t length)
    {
        std::stringstream ss;
        for (size_t i = 0; i < length; ++i)
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
        return ss.str();
    }

    std::atomic<unsigned long> temp_counter{0};

    template <typename Container>
    bool writeAtomically(const fs::path &target, const Container &data)
    {
        std::error_code ec;
        if (target.has_parent_path())
            fs::create_directories(target.parent_path(), ec);

        std::ostringstream suffix;
        suffix << ".tmp." << std::this_thread::get_id() << "." << temp_counter.fetch_add(1);
        fs::path temp = target;
        temp += suffix.str();

        {
            std::ofstream out(temp, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                Logger::error("Cannot open temporary file for writing: " + temp.string());
                return false;
            }
            out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
            out.flush();
            if (!out.good())
            {
                Logger::error("Failed writing temporary file: " + temp.string());
                out.close();
                fs::remove(temp, ec);
                return false;
            }
        }

        fs::rename(temp, target, ec);
        if (ec)
        {
            Logger::error("Failed to publish " + target.string() + ": " + ec.message());
            std::error_code ignore;
            fs::remove(temp, ignore);
            return false;
        }
        return true;
    }
}

std::string FileUtils::sha256Hex(const std::string &data)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    SHA256_Init(&sha256);
    SHA256_Update(&sha256, data.data(), data.size());
    SHA256_Final(hash, &sha256);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

std::string FileUtils::computeFileHash(const std::string &file_path)
{
    Logger::debug("Reading entire file for hash computation: " + file_path);
    constexpr size_t buffer_size = 8192;
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    if (SHA256_Init(&sha256) != 1)
        return "";
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
        return "";
    std::vector<char> buffer(buffer_size);
    while (file.good())
    {
        file.read(buffer.data(), buffer_size);
        std::streamsize bytes_read = file.gcount();
        if (bytes_read > 0)
        {
            if (SHA256_Update(&sha256, buffer.data(), bytes_read) != 1)
                return "";
        }
    }
    if (SHA256_Final(hash, &sha256) != 1)
        return "";
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

bool FileUtils::writeFileAtomically(const fs::path &target, const std::vector<uint8_t> &bytes)
{
    return writeAtomically(target, bytes);
}

bool FileUtils::writeFileAtomically(const fs::path &target, const std::string &text)
{
    return writeAtomically(target, text);
}

std::vector<std::string> FileUtils::listFiles(const std::string &dir_path, const std::vector<std::string> &extensions)
{
    std::vector<std::string> files;
    if (!isValidDirectory(dir_path))
    {
        Logger::warn("Invalid directory path: " + dir_path);
        return files;
    }

    std::error_code ec;
    for (const auto &entry : fs::directory_iterator(dir_path, ec))
    {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec))
            continue;
        const std::string path = entry.path().string();
        if (!extensions.empty() &&
            std::find(extensions.begin(), extensions.end(), lowercaseExtension(path)) == extensions.end())
            continue;
        files.push_back(path);
    }
    if (ec)
    {
        Logger::warn("Error scanning directory " + dir_path + ": " + ec.message());
    }
    std::sort(files.begin(), files.end());
    return files;
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_directory(path, ec);
}

std::string FileUtils::lowercaseExtension(const std::string &file_path)
{
    std::string ext = fs::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}
