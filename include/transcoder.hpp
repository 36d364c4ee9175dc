#pragma once
// bild -> webp, das codec zeug steckt komplett hier drin

#include "scanner.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace webpify {

constexpr const char* WEBP_EXTENSION = ".webp";
constexpr const char* BACKUP_SUFFIX = ".backup";

struct TranscodeOptions {
    int quality = 85;    // 1..100, validated by the caller
    int method = 6;      // libwebp effort 0 (fast) .. 6 (smallest)
    bool backup = false;
};

struct TranscodeResult {
    ImageFile source;
    std::filesystem::path output_path;
    uintmax_t output_size = 0;
    bool success = false;
    std::string error_message;

    double compression_ratio() const {
        if (source.size == 0) return 0;
        return 1.0 - (static_cast<double>(output_size) / source.size);
    }
};

// photo.jpg -> photo.webp, gleicher ordner
std::filesystem::path webp_path_for(const std::filesystem::path& image);

// photo.jpg -> photo.jpg.backup
std::filesystem::path backup_path_for(const std::filesystem::path& image);

// Copies image to its backup sibling unless one already exists.
// An existing backup is never touched.
bool ensure_backup(const std::filesystem::path& image, std::string& error);

// The codec capability the pipeline needs. Implementations never throw:
// every failure comes back as success == false plus the attempted path.
class Transcoder {
public:
    virtual ~Transcoder() = default;

    virtual TranscodeResult transcode(const ImageFile& image, const TranscodeOptions& options) = 0;

    // Destination a successful transcode of image would produce.
    virtual std::filesystem::path output_path_for(const std::filesystem::path& image) const = 0;
};

// Decoded pixels, always 3 (RGB) or 4 (RGBA) interleaved channels.
struct ImageData {
    std::vector<uint8_t> pixels;
    int width = 0;
    int height = 0;
    int channels = 0;

    bool has_alpha() const { return channels == 4; }
};

// stb_image decode + libwebp encode
class WebPTranscoder final : public Transcoder {
public:
    TranscodeResult transcode(const ImageFile& image, const TranscodeOptions& options) override;

    std::filesystem::path output_path_for(const std::filesystem::path& image) const override {
        return webp_path_for(image);
    }

    // jpeg/png laden, exif orientation schon angewendet.
    // Alpha nur wenn das file einen alpha-kanal hat oder tRNS pixel durchsichtig macht.
    std::optional<ImageData> load_image(const std::filesystem::path& path, std::string& error);

    // Returns the encoded bytes, empty on failure. Images with alpha are
    // encoded as RGBA, everything else as RGB.
    std::vector<uint8_t> encode_webp(const ImageData& image, int quality, int method, std::string& error);
};

} // namespace webpify
