#pragma once
// scan -> konvertieren -> referenzen umschreiben -> originale loeschen

#include "mapping_builder.hpp"
#include "scanner.hpp"
#include "transcoder.hpp"
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace webpify {

constexpr int MIN_QUALITY = 1;
constexpr int MAX_QUALITY = 100;

struct OptimizerOptions {
    std::filesystem::path root;
    int quality = 85;
    int method = 6;           // libwebp effort, immer max
    bool dry_run = false;
    bool backup = false;
    bool verbose = false;
    bool delete_originals = false;
    size_t jobs = 1;
    ScanConfig scan = ScanConfig::defaults();
};

struct RunStatistics {
    size_t images_found = 0;
    size_t images_converted = 0;
    size_t images_failed = 0;
    uintmax_t original_bytes = 0;
    uintmax_t new_bytes = 0;
    size_t code_files = 0;
    size_t files_updated = 0;
    size_t replacements = 0;
    size_t rewrite_failures = 0;
    size_t originals_deleted = 0;
    size_t deletion_failures = 0;

    // 0 when nothing was really converted
    double size_reduction_percent() const {
        if (original_bytes == 0 || images_converted == 0) return 0;
        return 100.0 * (static_cast<double>(original_bytes) - static_cast<double>(new_bytes)) / original_bytes;
    }

    bool has_failures() const { return images_failed > 0 || rewrite_failures > 0 || deletion_failures > 0; }
};

inline bool is_valid_quality(int quality) {
    return quality >= MIN_QUALITY && quality <= MAX_QUALITY;
}

// 1536 -> "1.5 KB"
std::string format_size(uintmax_t bytes);

// Canonical absolute root. Throws std::invalid_argument if it does not
// exist or is not a directory.
std::filesystem::path resolve_root(const std::filesystem::path& root);

class Optimizer {
public:
    Optimizer(Transcoder& transcoder, std::ostream& out, std::ostream& err)
        : transcoder_(transcoder), out_(out), err_(err) {}

    // Throws std::invalid_argument for a bad quality or root before any
    // work is done. Everything after that is reported, not thrown.
    RunStatistics run(const OptimizerOptions& options);

    // Deletes each original whose converted file exists. Returns
    // (deleted, failed).
    std::pair<size_t, size_t> delete_originals(
        const std::vector<std::pair<std::filesystem::path, std::filesystem::path>>& converted,
        bool verbose);

private:
    void rewrite_references(const std::vector<CodeFile>& code_files, const ReferenceMapping& mapping,
                            const OptimizerOptions& options, RunStatistics& stats);

    Transcoder& transcoder_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace webpify
