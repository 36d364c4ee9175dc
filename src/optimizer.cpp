#include "optimizer.hpp"
#include "reference_rewriter.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace webpify {

namespace fs = std::filesystem;

std::string format_size(uintmax_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB"};
    double size = static_cast<double>(bytes);
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1);
    for (const char* unit : units) {
        if (size < 1024) {
            ss << size << " " << unit;
            return ss.str();
        }
        size /= 1024;
    }
    ss << size << " TB";
    return ss.str();
}

fs::path resolve_root(const fs::path& root) {
    std::error_code ec;
    const auto base = root.empty() ? fs::current_path(ec) : root;
    if (ec) {
        throw std::invalid_argument("Cannot determine current directory: " + ec.message());
    }
    if (!fs::exists(base, ec)) {
        throw std::invalid_argument("Directory does not exist: " + base.string());
    }
    if (!fs::is_directory(base, ec)) {
        throw std::invalid_argument("Not a directory: " + base.string());
    }
    auto resolved = fs::canonical(base, ec);
    if (ec) {
        throw std::invalid_argument("Cannot resolve " + base.string() + ": " + ec.message());
    }
    return resolved;
}

RunStatistics Optimizer::run(const OptimizerOptions& options) {
    if (!is_valid_quality(options.quality)) {
        throw std::invalid_argument("Quality must be between 1 and 100");
    }
    const auto root = resolve_root(options.root);

    RunStatistics stats;

    out_ << (options.dry_run ? "[DRY RUN] " : "") << "webpify\n";
    out_ << std::string(50, '=') << "\n";
    out_ << "Scanning: " << root.string() << "\n";
    out_ << "Quality: " << options.quality << "\n\n";

    out_ << "Finding images...\n";
    auto scanned = scan(root, options.scan);
    for (const auto& w : scanned.warnings) {
        err_ << "Warning: " << w << "\n";
    }

    stats.images_found = scanned.images.size();
    if (scanned.images.empty()) {
        out_ << "No JPG, JPEG, or PNG images found.\n";
        return stats;
    }
    out_ << "Found " << scanned.images.size() << " image(s) to convert\n\n";

    out_ << "Converting images to WebP...\n";
    BuildOptions build_options;
    build_options.transcode.quality = options.quality;
    build_options.transcode.method = options.method;
    build_options.transcode.backup = options.backup;
    build_options.dry_run = options.dry_run;
    build_options.jobs = options.jobs;

    // callback laeuft schon serialisiert, kein extra mutex noetig
    auto progress = [&](size_t done, size_t total, const TranscodeResult& r) {
        if (!r.success) {
            err_ << "  Error converting " << r.source.path.string() << ": " << r.error_message << "\n";
            return;
        }
        if (!options.verbose) return;

        out_ << "  [" << done << "/" << total << "] " << r.source.path.filename().string();
        if (options.dry_run) {
            out_ << " -> " << r.output_path.filename().string() << "\n";
        } else {
            out_ << ": " << format_size(r.source.size) << " -> " << format_size(r.output_size)
                 << " (" << std::fixed << std::setprecision(1) << r.compression_ratio() * 100 << "% smaller)\n";
        }
    };

    MappingBuilder builder(transcoder_);
    auto built = builder.build(scanned.images, build_options, progress);
    for (const auto& w : built.warnings) {
        err_ << "Warning: " << w << "\n";
    }

    stats.images_converted = built.stats.converted;
    stats.images_failed = built.stats.failed;
    stats.original_bytes = built.stats.original_bytes;
    stats.new_bytes = built.stats.new_bytes;

    out_ << "\nConverted: " << stats.images_converted << " image(s)\n";
    if (stats.images_failed > 0) {
        out_ << "Failed: " << stats.images_failed << " image(s)\n";
    }
    if (!options.dry_run && stats.images_converted > 0) {
        out_ << "Total size: " << format_size(stats.original_bytes) << " -> " << format_size(stats.new_bytes)
             << " (" << std::fixed << std::setprecision(1) << stats.size_reduction_percent() << "% smaller)\n";
    }
    out_ << "\n";

    out_ << "Updating references in code files...\n";
    stats.code_files = scanned.code_files.size();
    if (scanned.code_files.empty()) {
        out_ << "No HTML, PHP, or other code files found.\n";
    } else {
        out_ << "Scanning " << scanned.code_files.size() << " code file(s)...\n";
        rewrite_references(scanned.code_files, built.mapping, options, stats);
        out_ << "\nUpdated " << stats.files_updated << " file(s) with " << stats.replacements
             << " replacement(s)\n";
    }

    if (options.delete_originals && !options.dry_run && !built.converted.empty()) {
        out_ << "\nDeleting original images...\n";
        auto deleted = delete_originals(built.converted, options.verbose);
        stats.originals_deleted = deleted.first;
        stats.deletion_failures = deleted.second;
        out_ << "Deleted " << stats.originals_deleted << " original image(s)\n";
    }

    out_ << "\nDone!\n";
    if (options.dry_run) {
        out_ << "\nThis was a dry run. No changes were made.\n";
        out_ << "Run without --dry-run to apply changes.\n";
    }
    return stats;
}

void Optimizer::rewrite_references(const std::vector<CodeFile>& code_files, const ReferenceMapping& mapping,
                                   const OptimizerOptions& options, RunStatistics& stats) {
    ReferenceRewriter rewriter(mapping);

    for (const auto& file : code_files) {
        auto result = rewriter.rewrite(file, options.dry_run);

        if (!result.success) {
            stats.rewrite_failures++;
            err_ << "  Error processing " << file.path.string() << ": " << result.error_message << "\n";
            continue;
        }
        if (!result.decoded) {
            err_ << "  Skipped " << file.path.string() << ": unsupported text encoding\n";
            continue;
        }
        if (result.replacements == 0) continue;

        stats.replacements += result.replacements;
        stats.files_updated++;
        if (options.verbose) {
            out_ << "  " << (options.dry_run ? "Would update " : "Updated ") << file.path.string() << ": "
                 << result.replacements << " replacement(s)";
            if (result.encoding != TextEncoding::UTF8 && !options.dry_run) {
                out_ << " (re-encoded from " << encoding_name(result.encoding) << " to utf-8)";
            }
            out_ << "\n";
        }
    }
}

std::pair<size_t, size_t> Optimizer::delete_originals(
    const std::vector<std::pair<fs::path, fs::path>>& converted, bool verbose) {
    size_t deleted = 0;
    size_t failed = 0;

    for (const auto& pair : converted) {
        std::error_code ec;
        // nur loeschen wenn die webp wirklich da ist
        if (!fs::exists(pair.second, ec)) {
            if (verbose) {
                out_ << "  Kept " << pair.first.filename().string() << ": "
                     << pair.second.filename().string() << " is missing\n";
            }
            continue;
        }

        if (!fs::remove(pair.first, ec) || ec) {
            failed++;
            err_ << "  Error deleting " << pair.first.string() << ": "
                 << (ec ? ec.message() : "file not found") << "\n";
            continue;
        }
        deleted++;
        if (verbose) {
            out_ << "  Deleted: " << pair.first.filename().string() << "\n";
        }
    }
    return {deleted, failed};
}

} // namespace webpify
