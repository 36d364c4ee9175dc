#pragma once
// alle bilder konvertieren und old->new dateinamen tabelle bauen

#include "scanner.hpp"
#include "transcoder.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace webpify {

// Old basename -> new basename. Keys are unique, iteration follows
// insertion order so every run rewrites in the same order.
class ReferenceMapping {
public:
    using Entry = std::pair<std::string, std::string>;

    // false wenn der key schon drin ist, der erste gewinnt
    bool insert(const std::string& old_name, const std::string& new_name);

    std::optional<std::string> find(const std::string& old_name) const;

    const std::vector<Entry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

struct BuildOptions {
    TranscodeOptions transcode;
    bool dry_run = false;
    size_t jobs = 1;  // 1 = im aufrufenden thread, 0 = hardware_concurrency
};

struct BuildStats {
    size_t found = 0;
    size_t converted = 0;
    size_t failed = 0;
    uintmax_t original_bytes = 0;
    uintmax_t new_bytes = 0;  // only real conversions
};

struct MappingResult {
    ReferenceMapping mapping;
    std::vector<std::pair<std::filesystem::path, std::filesystem::path>> converted;
    std::vector<ImageFile> failed;
    std::vector<TranscodeResult> results;  // scan order, one per image
    BuildStats stats;
    std::vector<std::string> warnings;
};

class MappingBuilder {
public:
    // Called once per image as it finishes. Calls are serialized, but with
    // jobs > 1 they come from worker threads and not in scan order.
    using ProgressCallback = std::function<void(size_t done, size_t total, const TranscodeResult&)>;

    explicit MappingBuilder(Transcoder& transcoder) : transcoder_(transcoder) {}

    MappingResult build(const std::vector<ImageFile>& images, const BuildOptions& options,
                        const ProgressCallback& progress = {});

private:
    TranscodeResult process_one(const ImageFile& image, const BuildOptions& options);

    Transcoder& transcoder_;
};

} // namespace webpify
