#include "cli.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace webpify {

constexpr const char* WEBPIFY_VERSION = "1.0.0";

namespace {

// ganze zahl, kein muell hinten dran ("85abc" ist kaputt)
bool parse_int(const std::string& text, int& value) {
    try {
        size_t pos = 0;
        value = std::stoi(text, &pos);
        return pos == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

void CLI::print_version() {
    std::cout << "webpify " << WEBPIFY_VERSION << "\n";
    std::cout << "Convert images to WebP and update references in code files\n";
}

void CLI::print_help() {
    std::cout << R"(
webpify v)" << WEBPIFY_VERSION << R"(

  Converts every JPG/JPEG/PNG below a directory to WebP and rewrites the
  references in HTML, PHP, CSS, JS, Vue, Svelte and Markdown files.

USAGE
  webpify [options]

EXAMPLES
  webpify                             Convert everything below the current directory
  webpify --path site/ -d             Show what would change, touch nothing
  webpify --path site/ -q 75 -b       Quality 75, keep .backup copies
  webpify --path site/ --delete-originals

OPTIONS
  -q, --quality <1-100>  WebP quality (default: 85)
  -d, --dry-run          Preview changes without applying them
  -b, --backup           Copy each original to <name>.backup before converting
  -v, --verbose          Show progress and size changes for each file
      --delete-originals Delete originals after a successful conversion
  -p, --path <dir>       Directory to scan (default: current directory)
  -j, --jobs <n>         Parallel conversions (default: 1, 0 = all cores)
  -h, --help             Show this help message
      --version          Show version number

SKIPPED DIRECTORIES
  .git node_modules __pycache__ .venv venv env .env vendor dist build

)";
}

std::optional<CLIConfig> CLI::parse(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

std::optional<CLIConfig> CLI::parse(const std::vector<std::string>& args) {
    CLIConfig config;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
        }
        else if (arg == "--version") {
            config.show_version = true;
        }
        else if (arg == "-q" || arg == "--quality") {
            if (++i >= args.size()) {
                std::cerr << "Error: " << arg << " requires a number (1-100)\n";
                return std::nullopt;
            }
            if (!parse_int(args[i], config.quality)) {
                std::cerr << "Error: Invalid quality value: " << args[i] << "\n";
                return std::nullopt;
            }
            // kein clamp, falsche werte sind ein fehler
            if (!is_valid_quality(config.quality)) {
                std::cerr << "Error: Quality must be between " << MIN_QUALITY << " and " << MAX_QUALITY << "\n";
                return std::nullopt;
            }
        }
        else if (arg == "-p" || arg == "--path") {
            if (++i >= args.size()) {
                std::cerr << "Error: " << arg << " requires a directory\n";
                return std::nullopt;
            }
            config.root = args[i];
        }
        else if (arg == "-j" || arg == "--jobs") {
            int jobs = 0;
            if (++i >= args.size() || !parse_int(args[i], jobs) || jobs < 0) {
                std::cerr << "Error: " << arg << " requires a non-negative number\n";
                return std::nullopt;
            }
            config.jobs = static_cast<size_t>(jobs);
        }
        else if (arg == "-d" || arg == "--dry-run") {
            config.dry_run = true;
        }
        else if (arg == "-b" || arg == "--backup") {
            config.backup = true;
        }
        else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        }
        else if (arg == "--delete-originals") {
            config.delete_originals = true;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use 'webpify --help' for usage information.\n";
            return std::nullopt;
        }
    }

    return config;
}

ExitCode CLI::exit_code_for(const RunStatistics& stats) {
    if (stats.images_found > 0 && stats.images_failed == stats.images_found) return ExitCode::AllFailed;
    if (stats.has_failures()) return ExitCode::Failure;
    return ExitCode::Ok;
}

void CLI::print_summary(const RunStatistics& stats, bool dry_run, double total_time) {
    std::cout << "\nSummary";
    if (dry_run) std::cout << " (planned)";
    std::cout << "\n";
    std::cout << "  Images:      " << stats.images_converted << " converted, " << stats.images_failed
              << " failed, " << stats.images_found << " found\n";
    if (!dry_run && stats.images_converted > 0) {
        std::cout << "  Size:        " << format_size(stats.original_bytes) << " -> " << format_size(stats.new_bytes)
                  << " (" << std::fixed << std::setprecision(1) << stats.size_reduction_percent() << "% smaller)\n";
    }
    std::cout << "  References:  " << stats.replacements << " in " << stats.files_updated << " of "
              << stats.code_files << " file(s)";
    if (stats.rewrite_failures > 0) std::cout << ", " << stats.rewrite_failures << " file(s) failed";
    std::cout << "\n";
    if (stats.originals_deleted > 0 || stats.deletion_failures > 0) {
        std::cout << "  Deleted:     " << stats.originals_deleted << " original(s)";
        if (stats.deletion_failures > 0) std::cout << ", " << stats.deletion_failures << " failed";
        std::cout << "\n";
    }
    std::cout << "  Time:        " << std::fixed << std::setprecision(0) << total_time << " ms\n";
}

int CLI::run(const CLIConfig& config) {
    if (config.show_help) {
        print_help();
        return static_cast<int>(ExitCode::Ok);
    }
    if (config.show_version) {
        print_version();
        return static_cast<int>(ExitCode::Ok);
    }

    OptimizerOptions options;
    options.root = config.root;
    options.quality = config.quality;
    options.dry_run = config.dry_run;
    options.backup = config.backup;
    options.verbose = config.verbose;
    options.delete_originals = config.delete_originals;
    options.jobs = config.jobs;

    WebPTranscoder transcoder;
    Optimizer optimizer(transcoder, std::cout, std::cerr);

    auto start_time = std::chrono::steady_clock::now();
    RunStatistics stats;
    try {
        stats = optimizer.run(options);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return static_cast<int>(ExitCode::Failure);
    }
    auto end_time = std::chrono::steady_clock::now();
    double total_time = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    if (stats.images_found > 0) {
        print_summary(stats, options.dry_run, total_time);
    }
    return static_cast<int>(exit_code_for(stats));
}

} // namespace webpify
