#pragma once
// verzeichnisbaum durchlaufen, bilder und code files einsammeln

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace webpify {

// Which extensions count as what and which directories are never entered.
// Passed by value into the scanner, never global state.
struct ScanConfig {
    std::set<std::string> image_extensions;  // lowercase, with dot
    std::set<std::string> code_extensions;   // lowercase, with dot
    std::set<std::string> excluded_dirs;     // exact segment names

    static const ScanConfig& defaults();

    bool is_image(const std::filesystem::path& path) const;
    bool is_code(const std::filesystem::path& path) const;
    bool is_excluded(const std::filesystem::path& relative) const;
};

struct ImageFile {
    std::filesystem::path path;
    std::string extension;  // lowercase
    uintmax_t size = 0;
};

struct CodeFile {
    std::filesystem::path path;
    std::string extension;  // lowercase
};

struct ScanResult {
    std::vector<ImageFile> images;
    std::vector<CodeFile> code_files;
    std::vector<std::string> warnings;
};

// lowercase extension incl. dot, "" wenn keine
std::string lower_extension(const std::filesystem::path& path);

// Walks root recursively. Symlinks are not followed, children of each
// directory are visited in lexicographic order so the result is stable
// for an unchanged tree.
ScanResult scan(const std::filesystem::path& root, const ScanConfig& config = ScanConfig::defaults());

} // namespace webpify
