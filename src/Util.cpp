#include "Util.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace Util
{

auto read_entire_file(const std::filesystem::path& file_path) -> std::optional<std::string>
{
    if (!std::filesystem::exists(file_path)) {
        std::println(stderr, "[ERROR] Unable to read file {}: No such file or directory", file_path.string());
        return std::nullopt;
    }

    if (!std::filesystem::is_regular_file(file_path)) {
        std::println(stderr, "[ERROR] Unable to read file {}: Not a regular file", file_path.string());
        return std::nullopt;
    }

    std::ifstream file(file_path);
    if (!file) {
        std::println(stderr, "[ERROR] Unable to read file {}: {}", file_path.string(), strerror(errno));
        return std::nullopt;
    }

    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

auto write_to_file(const std::filesystem::path& file_path, const std::string& content) -> bool
{
    std::ofstream file(file_path, std::ios::out | std::ios::trunc);
    if (!file) {
        std::println(stderr, "[ERROR] Unable to write file {}: {}", file_path.string(), strerror(errno));
        return false;
    }

    file << content;
    if (!file) {
        std::println(stderr, "[ERROR] Failed writing to file {}", file_path.string());
        return false;
    }

    return true;
}

} // namespace Util
