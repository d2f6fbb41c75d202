#include "devkit/core/environment.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#endif

namespace devkit::core {

namespace {

std::string windows_clean_path(std::string path) {
    std::replace(path.begin(), path.end(), '/', '\\');
    std::transform(path.begin(), path.end(), path.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return path;
}

}  // namespace

std::vector<std::string> split_search_path(const std::string& value,
                                           char separator) {
    std::vector<std::string> entries;
    std::string::size_type start = 0;
    while (start <= value.size()) {
        auto end = value.find(separator, start);
        if (end == std::string::npos) {
            end = value.size();
        }
        if (end > start) {
            entries.emplace_back(value.substr(start, end - start));
        }
        start = end + 1;
    }
    return entries;
}

std::vector<std::string> Environment::search_path() const {
    auto value = get(path_key());
    if (!value) {
        return {};
    }
    return split_search_path(*value, path_separator());
}

bool Environment::same_directory(const std::string& entry,
                                 const std::string& dir) const {
    if (windows()) {
        return windows_clean_path(entry) == windows_clean_path(dir);
    }
    return entry == dir;
}

std::optional<std::string> SystemEnvironment::get(
    const std::string& name) const {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::filesystem::path SystemEnvironment::runtime_location() const {
#ifdef _WIN32
    char buffer[MAX_PATH];
    DWORD length = GetModuleFileNameA(nullptr, buffer, MAX_PATH);
    if (length == 0 || length == MAX_PATH) {
        throw std::runtime_error("Unable to resolve the running executable");
    }
    return std::filesystem::path(std::string(buffer, length));
#else
    std::error_code ec;
    auto location = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        throw std::runtime_error(
            "Unable to resolve the running executable: " + ec.message());
    }
    return location;
#endif
}

bool SystemEnvironment::exists(const std::filesystem::path& path) const {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

bool SystemEnvironment::windows() const {
#ifdef _WIN32
    return true;
#else
    return false;
#endif
}

}  // namespace devkit::core
