// exif_orient.hpp - exif orientation fuer jpeg quellen
// webp output hat kein exif mehr, also muessen die pixel vorher richtig rum sein
// sonst liegen handyfotos nach der konvertierung auf der seite
#pragma once

#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <utility>
#include <vector>

namespace exif {

enum class Orientation : uint8_t {
    Normal = 1,
    FlipH = 2,
    Rotate180 = 3,
    FlipV = 4,
    Transpose = 5,   // FlipH + Rotate270
    Rotate90 = 6,
    Transverse = 7,  // FlipH + Rotate90
    Rotate270 = 8
};

namespace detail {

// TIFF block aus dem APP1 segment lesen, tag 0x0112 suchen
inline Orientation parse_tiff(const uint8_t* tiff, size_t len) {
    if (len < 8) return Orientation::Normal;
    const bool big_endian = (tiff[0] == 'M');

    auto read16 = [&](size_t off) -> uint32_t {
        if (off + 2 > len) return 0;
        return big_endian ? (tiff[off] << 8) | tiff[off + 1]
                          : tiff[off] | (tiff[off + 1] << 8);
    };
    auto read32 = [&](size_t off) -> uint32_t {
        if (off + 4 > len) return 0;
        return big_endian
            ? (uint32_t(tiff[off]) << 24) | (tiff[off + 1] << 16) | (tiff[off + 2] << 8) | tiff[off + 3]
            : tiff[off] | (tiff[off + 1] << 8) | (tiff[off + 2] << 16) | (uint32_t(tiff[off + 3]) << 24);
    };

    const uint32_t ifd = read32(4);
    if (ifd == 0 || size_t(ifd) + 2 > len) return Orientation::Normal;

    const uint32_t entries = read16(ifd);
    for (uint32_t i = 0; i < entries; ++i) {
        size_t entry = size_t(ifd) + 2 + size_t(i) * 12;
        if (entry + 12 > len) break;
        if (read16(entry) == 0x0112) {
            uint32_t value = read16(entry + 8);
            if (value >= 1 && value <= 8) return static_cast<Orientation>(value);
            break;
        }
    }
    return Orientation::Normal;
}

} // namespace detail

// Normal wenn kein jpeg, kein exif oder kaputtes exif
inline Orientation read_jpeg_orientation(const uint8_t* buf, size_t len) {
    if (len < 12 || buf[0] != 0xFF || buf[1] != 0xD8) return Orientation::Normal;

    // exif steht immer vorne, mehr als 64kb anschauen bringt nix
    if (len > 65536) len = 65536;

    size_t pos = 2;
    while (pos + 4 < len) {
        if (buf[pos] != 0xFF) { ++pos; continue; }

        const uint8_t marker = buf[pos + 1];
        if (marker == 0xFF) { ++pos; continue; }         // fill bytes
        if (marker == 0xDA || marker == 0xD9) break;      // SOS / EOI
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
            pos += 2;
            continue;
        }

        const size_t seg_len = (size_t(buf[pos + 2]) << 8) | buf[pos + 3];
        if (marker == 0xE1 && pos + 10 < len && std::memcmp(buf + pos + 4, "Exif\0\0", 6) == 0) {
            const size_t tiff_start = pos + 10;
            const size_t seg_end = std::min(len, pos + 2 + seg_len);
            if (seg_end <= tiff_start) return Orientation::Normal;
            return detail::parse_tiff(buf + tiff_start, seg_end - tiff_start);
        }
        pos += 2 + seg_len;
    }
    return Orientation::Normal;
}

// pixel umsortieren, width/height werden bei 90/270 getauscht
// geht fuer beliebig viele channels, wir haben hier 1-4
inline void apply_orientation(std::vector<uint8_t>& pixels, int& width, int& height,
                              int channels, Orientation orientation) {
    if (orientation == Orientation::Normal) return;

    const size_t px = static_cast<size_t>(channels);
    const size_t w = static_cast<size_t>(width);
    const size_t h = static_cast<size_t>(height);
    const bool swaps = orientation >= Orientation::Transpose;
    const size_t out_w = swaps ? h : w;

    std::vector<uint8_t> out(pixels.size());
    for (size_t y = 0; y < h; ++y) {
        for (size_t x = 0; x < w; ++x) {
            size_t nx = x, ny = y;
            switch (orientation) {
                case Orientation::FlipH:      nx = w - 1 - x; break;
                case Orientation::Rotate180:  nx = w - 1 - x; ny = h - 1 - y; break;
                case Orientation::FlipV:      ny = h - 1 - y; break;
                case Orientation::Transpose:  nx = y;         ny = x; break;
                case Orientation::Rotate90:   nx = h - 1 - y; ny = x; break;
                case Orientation::Transverse: nx = h - 1 - y; ny = w - 1 - x; break;
                case Orientation::Rotate270:  nx = y;         ny = w - 1 - x; break;
                default: break;
            }
            std::memcpy(out.data() + (ny * out_w + nx) * px,
                        pixels.data() + (y * w + x) * px, px);
        }
    }
    pixels = std::move(out);
    if (swaps) std::swap(width, height);
}

} // namespace exif
