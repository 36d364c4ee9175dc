#include "transcoder.hpp"
#include <fstream>
#include <limits>
#include <mutex>
#include <new>
#include <system_error>

// nur jpeg und png, der rest fliegt raus
#define STBI_ONLY_JPEG
#define STBI_ONLY_PNG
#define STBI_NO_HDR
#define STBI_NO_LINEAR
#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

#include <webp/encode.h>

// exif kram damit handyfotos nich auf der seite liegen
#include "exif_orient.hpp"

// mmap ist krass schneller als fread, who knew
#include "mmap_file.hpp"

namespace webpify {

namespace fs = std::filesystem;

// stbi_failure_reason() is a global string, loads and the read of the
// reason have to happen under the same lock
static std::mutex stb_operations_mutex;

fs::path webp_path_for(const fs::path& image) {
    auto out = image;
    out.replace_extension(WEBP_EXTENSION);
    return out;
}

fs::path backup_path_for(const fs::path& image) {
    auto out = image;
    out += BACKUP_SUFFIX;
    return out;
}

bool ensure_backup(const fs::path& image, std::string& error) {
    const auto backup = backup_path_for(image);
    std::error_code ec;
    if (fs::exists(backup, ec)) {
        return true;  // schon da, nicht ueberschreiben
    }
    // skip_existing: kein overwrite falls zwischen exists und copy einer auftaucht
    fs::copy_file(image, backup, fs::copy_options::skip_existing, ec);
    if (ec) {
        error = "Failed to create backup " + backup.string() + ": " + ec.message();
        return false;
    }
    return true;
}

std::optional<ImageData> WebPTranscoder::load_image(const fs::path& path, std::string& error) {
    std::string bytes;
    if (!mmapfile::read_all(path.string(), bytes)) {
        error = "Cannot read input file";
        return std::nullopt;
    }
    if (bytes.empty()) {
        error = "Input file is empty";
        return std::nullopt;
    }

    // stb nimmt int als laenge
    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        error = "Input file too large (" + std::to_string(bytes.size()) + " bytes)";
        return std::nullopt;
    }

    const auto* buf = reinterpret_cast<const uint8_t*>(bytes.data());
    int width = 0, height = 0, file_channels = 0;
    unsigned char* data = nullptr;
    {
        // immer rgba anfordern: bei tRNS liefert stb sonst mehr kanaele als es meldet
        std::lock_guard<std::mutex> lock(stb_operations_mutex);
        data = stbi_load_from_memory(buf, static_cast<int>(bytes.size()), &width, &height, &file_channels, 4);
        if (!data) {
            error = std::string("Failed to decode image: ") + stbi_failure_reason();
            return std::nullopt;
        }
    }

    // Validate dimensions before size calculation to prevent integer overflow
    constexpr int MAX_DIMENSION = 16383;  // WEBP_MAX_DIMENSION
    if (width <= 0 || height <= 0 || width > MAX_DIMENSION || height > MAX_DIMENSION) {
        stbi_image_free(data);
        error = "Unsupported image dimensions " + std::to_string(width) + "x" + std::to_string(height);
        return std::nullopt;
    }

    const size_t pixel_count = static_cast<size_t>(width) * static_cast<size_t>(height);

    // alpha-kanal im file, oder tRNS der wirklich pixel durchsichtig macht
    bool alpha = (file_channels == 2 || file_channels == 4);
    for (size_t i = 0; !alpha && i < pixel_count; ++i) {
        if (data[i * 4 + 3] != 255) alpha = true;
    }

    ImageData image;
    image.width = width;
    image.height = height;
    image.channels = alpha ? 4 : 3;

    try {
        if (alpha) {
            image.pixels.assign(data, data + pixel_count * 4);
        } else {
            image.pixels.resize(pixel_count * 3);
            for (size_t i = 0; i < pixel_count; ++i) {
                image.pixels[i * 3 + 0] = data[i * 4 + 0];
                image.pixels[i * 3 + 1] = data[i * 4 + 1];
                image.pixels[i * 3 + 2] = data[i * 4 + 2];
            }
        }
    } catch (...) {
        stbi_image_free(data);  // Exception-safe: free before re-throw
        throw;
    }
    stbi_image_free(data);

    auto ext = lower_extension(path);
    if (ext == ".jpg" || ext == ".jpeg") {
        auto orientation = exif::read_jpeg_orientation(buf, bytes.size());
        exif::apply_orientation(image.pixels, image.width, image.height, image.channels, orientation);
    }

    return image;
}

std::vector<uint8_t> WebPTranscoder::encode_webp(const ImageData& image, int quality, int method,
                                                 std::string& error) {
    std::vector<uint8_t> output;

    const bool alpha = image.has_alpha();
    if ((image.channels != 3 && image.channels != 4) ||
        image.pixels.size() != static_cast<size_t>(image.width) * static_cast<size_t>(image.height) * image.channels) {
        error = "Pixel buffer does not match " + std::to_string(image.channels) + " channels";
        return output;
    }

    WebPConfig config;
    if (!WebPConfigInit(&config)) {
        error = "libwebp version mismatch";
        return output;
    }
    config.quality = static_cast<float>(quality);
    config.method = method;
    if (!WebPValidateConfig(&config)) {
        error = "Invalid WebP encoder configuration";
        return output;
    }

    WebPPicture picture;
    if (!WebPPictureInit(&picture)) {
        error = "libwebp version mismatch";
        return output;
    }
    picture.width = image.width;
    picture.height = image.height;

    const int stride = image.width * image.channels;
    int imported = alpha ? WebPPictureImportRGBA(&picture, image.pixels.data(), stride)
                         : WebPPictureImportRGB(&picture, image.pixels.data(), stride);
    if (!imported) {
        WebPPictureFree(&picture);
        error = "Out of memory importing pixels";
        return output;
    }

    WebPMemoryWriter writer;
    WebPMemoryWriterInit(&writer);
    picture.writer = WebPMemoryWrite;
    picture.custom_ptr = &writer;

    if (WebPEncode(&config, &picture) && writer.size > 0) {
        output.assign(writer.mem, writer.mem + writer.size);
    } else {
        error = "WebP encoding failed (error code " + std::to_string(static_cast<int>(picture.error_code)) + ")";
    }

    WebPMemoryWriterClear(&writer);
    WebPPictureFree(&picture);
    return output;
}

TranscodeResult WebPTranscoder::transcode(const ImageFile& image, const TranscodeOptions& options) {
    TranscodeResult result;
    result.source = image;
    result.output_path = output_path_for(image.path);

    if (options.backup && !ensure_backup(image.path, result.error_message)) {
        return result;
    }

    std::vector<uint8_t> encoded;
    try {
        auto decoded = load_image(image.path, result.error_message);
        if (!decoded) {
            return result;
        }
        encoded = encode_webp(*decoded, options.quality, options.method, result.error_message);
    } catch (const std::bad_alloc&) {
        result.error_message = "Out of memory while converting";
        return result;
    }
    if (encoded.empty()) {
        return result;
    }

    // ATOMIC WRITE: erst .tmp schreiben, dann rename
    auto temp_path = result.output_path;
    temp_path += ".tmp";
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(encoded.data()), static_cast<std::streamsize>(encoded.size()));
        out.close();
        if (!out) {
            std::error_code rm_ec;
            fs::remove(temp_path, rm_ec);
            result.error_message = "Failed to write " + temp_path.string();
            return result;
        }
    }

    std::error_code ec;
    fs::rename(temp_path, result.output_path, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(temp_path, rm_ec);
        result.error_message = "Failed to finalize output: " + ec.message();
        return result;
    }

    result.output_size = encoded.size();
    result.success = true;
    return result;
}

} // namespace webpify
