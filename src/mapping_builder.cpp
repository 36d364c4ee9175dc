#include "mapping_builder.hpp"
#include "thread_pool.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <system_error>

namespace webpify {

namespace fs = std::filesystem;

bool ReferenceMapping::insert(const std::string& old_name, const std::string& new_name) {
    if (index_.count(old_name) > 0) return false;
    index_.emplace(old_name, entries_.size());
    entries_.emplace_back(old_name, new_name);
    return true;
}

std::optional<std::string> ReferenceMapping::find(const std::string& old_name) const {
    auto it = index_.find(old_name);
    if (it == index_.end()) return std::nullopt;
    return entries_[it->second].second;
}

TranscodeResult MappingBuilder::process_one(const ImageFile& image, const BuildOptions& options) {
    // original groesse immer frisch holen, scan kann schon ne weile her sein
    ImageFile current = image;
    std::error_code ec;
    auto size = fs::file_size(image.path, ec);
    if (!ec) current.size = size;

    if (options.dry_run) {
        // dry run: nix lesen, nix schreiben, nur den pfad ausrechnen
        TranscodeResult planned;
        planned.source = current;
        planned.output_path = transcoder_.output_path_for(image.path);
        planned.success = true;
        return planned;
    }
    return transcoder_.transcode(current, options.transcode);
}

MappingResult MappingBuilder::build(const std::vector<ImageFile>& images, const BuildOptions& options,
                                    const ProgressCallback& progress) {
    MappingResult out;
    out.stats.found = images.size();
    out.results.resize(images.size());

    std::mutex progress_mutex;
    size_t completed = 0;
    auto report = [&](size_t i) {
        std::lock_guard<std::mutex> lock(progress_mutex);
        ++completed;
        if (progress) progress(completed, images.size(), out.results[i]);
    };

    if (options.jobs == 1 || images.size() < 2) {
        for (size_t i = 0; i < images.size(); ++i) {
            out.results[i] = process_one(images[i], options);
            report(i);
        }
    } else {
        ThreadPool pool(options.jobs);
        std::vector<std::future<void>> futures;
        futures.reserve(images.size());
        for (size_t i = 0; i < images.size(); ++i) {
            futures.push_back(pool.enqueue([&, i]() {
                out.results[i] = process_one(images[i], options);
                report(i);
            }));
        }
        // barrier: mapping erst bauen wenn alles fertig ist
        for (auto& f : futures) {
            f.get();
        }
    }

    // ab hier wieder single threaded, in scan order
    std::map<std::string, fs::path> seen_names;
    std::map<fs::path, fs::path> claimed_outputs;
    for (const auto& result : out.results) {
        out.stats.original_bytes += result.source.size;

        if (!result.success) {
            out.stats.failed++;
            out.failed.push_back(result.source);
            continue;
        }

        out.stats.converted++;
        if (!options.dry_run) out.stats.new_bytes += result.output_size;
        out.converted.emplace_back(result.source.path, result.output_path);

        const auto old_name = result.source.path.filename().string();
        const auto new_name = result.output_path.filename().string();
        out.mapping.insert(old_name, new_name);

        auto seen = seen_names.emplace(old_name, result.source.path.parent_path());
        if (!seen.second && seen.first->second != result.source.path.parent_path()) {
            out.warnings.push_back("Filename " + old_name + " exists in both " + seen.first->second.string() +
                                   " and " + result.source.path.parent_path().string() +
                                   "; references are matched by filename only");
        }

        auto claimed = claimed_outputs.emplace(result.output_path, result.source.path);
        if (!claimed.second) {
            out.warnings.push_back(result.source.path.string() + " and " + claimed.first->second.string() +
                                   " both convert to " + result.output_path.string());
        }
    }

    return out;
}

} // namespace webpify
