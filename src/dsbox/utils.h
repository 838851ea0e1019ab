#ifndef DSBOX_UTILS_H_
#define DSBOX_UTILS_H_

#include <string>
#include <optional>
#include <filesystem>

#include <dsbox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm777 = fs::perms::all;
constexpr fs::perms kPerm666 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::group_write |
    fs::perms::others_read | fs::perms::others_write;

int CloseFrom(int minfd);

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool RemoveFile(const fs::path&);

// write to a sibling file and rename it onto path, so readers never see partial content
bool WriteFileAtomic(const fs::path& path, const std::string& content, fs::perms = fs::perms::unknown);
std::optional<std::string> ReadFile(const fs::path&);
// read and delete; nullopt if the file does not exist
std::optional<std::string> ConsumeFile(const fs::path&);

// lowercase hex, for unique directory names
std::string RandomHex(size_t bytes);

#endif  // DSBOX_UTILS_H_
