#include "scanner.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

namespace webpify {

namespace fs = std::filesystem;

const ScanConfig& ScanConfig::defaults() {
    static const ScanConfig config{
        {".jpg", ".jpeg", ".png"},
        {".html", ".htm", ".php", ".css", ".js", ".jsx", ".tsx", ".vue", ".svelte", ".md", ".markdown"},
        {".git", "node_modules", "__pycache__", ".venv", "venv", "env", ".env", "vendor", "dist", "build"},
    };
    return config;
}

std::string lower_extension(const fs::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool ScanConfig::is_image(const fs::path& path) const {
    return image_extensions.count(lower_extension(path)) > 0;
}

bool ScanConfig::is_code(const fs::path& path) const {
    return code_extensions.count(lower_extension(path)) > 0;
}

bool ScanConfig::is_excluded(const fs::path& relative) const {
    for (const auto& segment : relative) {
        if (excluded_dirs.count(segment.string()) > 0) return true;
    }
    return false;
}

namespace {

void walk(const fs::path& root, const fs::path& dir, const ScanConfig& config, ScanResult& result) {
    std::error_code ec;
    std::vector<fs::directory_entry> entries;

    // permission denied etc: warnen und den teilbaum auslassen
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        result.warnings.push_back("Cannot read directory " + dir.string() + ": " + ec.message());
        return;
    }
    for (fs::directory_iterator end; it != end;) {
        entries.push_back(*it);
        it.increment(ec);
        if (ec) {
            result.warnings.push_back("Error scanning " + dir.string() + ": " + ec.message());
            break;
        }
    }

    // directory_iterator order is unspecified, sort for stable output
    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) { return a.path() < b.path(); });

    for (const auto& entry : entries) {
        const auto relative = entry.path().lexically_relative(root);
        if (config.is_excluded(relative)) continue;

        if (entry.is_directory(ec)) {
            // SYMLINK auf ordner: nicht folgen, sonst endlosschleifen.
            // verlinkte dateien zaehlen ganz normal
            if (!entry.is_symlink(ec)) walk(root, entry.path(), config, result);
            continue;
        }
        if (!entry.is_regular_file(ec)) continue;

        if (config.is_image(entry.path())) {
            uintmax_t size = entry.file_size(ec);
            if (ec) {
                result.warnings.push_back("Cannot stat " + entry.path().string() + ": " + ec.message());
                size = 0;
            }
            result.images.push_back({entry.path(), lower_extension(entry.path()), size});
        } else if (config.is_code(entry.path())) {
            result.code_files.push_back({entry.path(), lower_extension(entry.path())});
        }
    }
}

} // namespace

ScanResult scan(const fs::path& root, const ScanConfig& config) {
    ScanResult result;
    walk(root, root, config, result);
    return result;
}

} // namespace webpify
