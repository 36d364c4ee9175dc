#pragma once
// cli parsing und so

#include "optimizer.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace webpify {

struct CLIConfig {
    std::filesystem::path root;  // leer = aktuelles verzeichnis
    int quality = 85;
    bool dry_run = false;
    bool backup = false;
    bool verbose = false;
    bool delete_originals = false;
    size_t jobs = 1;
    bool show_help = false;
    bool show_version = false;
};

enum class ExitCode : int {
    Ok = 0,
    Failure = 1,    // bad arguments, fatal startup error or some items failed
    AllFailed = 2   // every image failed
};

class CLI {
public:
    // nullopt = bad arguments, message already on stderr
    static std::optional<CLIConfig> parse(const std::vector<std::string>& args);
    static std::optional<CLIConfig> parse(int argc, char* argv[]);
    static void print_help();
    static void print_version();
    static int run(const CLIConfig& config);

    static ExitCode exit_code_for(const RunStatistics& stats);

private:
    static void print_summary(const RunStatistics& stats, bool dry_run, double total_time);
};

} // namespace webpify
