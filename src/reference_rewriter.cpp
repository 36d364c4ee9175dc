#include "reference_rewriter.hpp"
#include "mmap_file.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace webpify {

namespace fs = std::filesystem;

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// strict: keine overlongs, keine surrogates, max U+10FFFF
bool is_valid_utf8(const std::string& bytes) {
    const auto* s = reinterpret_cast<const unsigned char*>(bytes.data());
    const size_t n = bytes.size();
    size_t i = 0;
    while (i < n) {
        unsigned char c = s[i];
        size_t len;
        uint32_t cp;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > n) return false;
        for (size_t k = 1; k < len; ++k) {
            if ((s[i + k] & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (s[i + k] & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

// 0x80..0x9F, 0 = undefined in cp1252
constexpr uint16_t CP1252_HIGH[32] = {
    0x20AC, 0,      0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0,      0x017D, 0,
    0,      0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0,      0x017E, 0x0178,
};

} // namespace

const char* encoding_name(TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::UTF8: return "utf-8";
        case TextEncoding::Latin1: return "latin-1";
        case TextEncoding::Windows1252: return "cp1252";
    }
    return "unknown";
}

std::optional<std::string> decode_to_utf8(const std::string& bytes, TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::UTF8:
            if (!is_valid_utf8(bytes)) return std::nullopt;
            return bytes;

        case TextEncoding::Latin1: {
            std::string out;
            out.reserve(bytes.size() + bytes.size() / 8);
            for (unsigned char c : bytes) append_utf8(out, c);
            return out;
        }

        case TextEncoding::Windows1252: {
            std::string out;
            out.reserve(bytes.size() + bytes.size() / 8);
            for (unsigned char c : bytes) {
                if (c >= 0x80 && c <= 0x9F) {
                    uint16_t cp = CP1252_HIGH[c - 0x80];
                    if (cp == 0) return std::nullopt;
                    append_utf8(out, cp);
                } else {
                    append_utf8(out, c);
                }
            }
            return out;
        }
    }
    return std::nullopt;
}

namespace {

bool is_quote(char c) { return c == '"' || c == '\''; }

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

// "url" + whitespace directly before the paren at open
bool url_before(const std::string& lowered, size_t open, size_t floor) {
    size_t k = open;
    while (k > floor && is_space(lowered[k - 1])) --k;
    return k >= floor + 3 && lowered.compare(k - 3, 3, "url") == 0;
}

// "![alt]" + whitespace directly before the paren at open, alt has no ']'
bool image_label_before(const std::string& lowered, size_t open, size_t floor) {
    size_t k = open;
    while (k > floor && is_space(lowered[k - 1])) --k;
    if (k == floor || lowered[k - 1] != ']') return false;
    for (size_t j = k - 1; j > floor; --j) {
        const char c = lowered[j - 1];
        if (c == ']') return false;
        if (c == '[' && j - 1 > floor && lowered[j - 2] == '!') return true;
    }
    return false;
}

// Walks back from the filename to the opening delimiter of its context.
// Nothing before floor may be used, it belongs to an earlier match.
bool opens_context(ReferenceContext context, const std::string& lowered, size_t name_pos, size_t floor) {
    for (size_t j = name_pos; j > floor; --j) {
        const char c = lowered[j - 1];
        switch (context) {
            case ReferenceContext::Quoted:
                if (is_quote(c)) return true;
                break;
            case ReferenceContext::CssUrl:
            case ReferenceContext::Markdown:
                if (c == ')') return false;
                if (c == '(') {
                    const bool opens = context == ReferenceContext::CssUrl ? url_before(lowered, j - 1, floor)
                                                                           : image_label_before(lowered, j - 1, floor);
                    if (opens) return true;
                }
                break;
        }
    }
    return false;
}

// Position just past the closing delimiter, npos if the filename is not
// followed by one.
size_t closes_context(ReferenceContext context, const std::string& text, size_t name_end) {
    const size_t n = text.size();
    size_t i = name_end;
    switch (context) {
        case ReferenceContext::Quoted:
            if (i < n && is_quote(text[i])) return i + 1;
            break;
        case ReferenceContext::CssUrl:
            if (i < n && is_quote(text[i])) ++i;
            while (i < n && is_space(text[i])) ++i;
            if (i < n && text[i] == ')') return i + 1;
            break;
        case ReferenceContext::Markdown:
            if (i < n && text[i] == ')') return i + 1;
            break;
    }
    return std::string::npos;
}

} // namespace

size_t apply_rule(std::string& text, ReferenceContext context, const std::string& filename,
                  const std::string& replacement) {
    if (filename.empty()) return 0;

    const std::string lowered = to_lower(text);
    const std::string needle = to_lower(filename);

    size_t count = 0;
    std::string out;
    size_t last = 0;
    size_t pos = 0;
    while ((pos = lowered.find(needle, pos)) != std::string::npos) {
        const size_t name_end = pos + needle.size();
        const size_t match_end = closes_context(context, lowered, name_end);
        if (match_end == std::string::npos || !opens_context(context, lowered, pos, last)) {
            ++pos;
            continue;
        }

        out.append(text, last, pos - last);
        out += replacement;
        out.append(text, name_end, match_end - name_end);
        last = match_end;
        pos = match_end;
        ++count;
    }

    if (count > 0) {
        out.append(text, last, std::string::npos);
        text = std::move(out);
    }
    return count;
}

const std::vector<TextEncoding>& ReferenceRewriter::default_encodings() {
    static const std::vector<TextEncoding> encodings = {
        TextEncoding::UTF8, TextEncoding::Latin1, TextEncoding::Windows1252};
    return encodings;
}

ReferenceRewriter::ReferenceRewriter(const ReferenceMapping& mapping, std::vector<TextEncoding> encodings)
    : encodings_(std::move(encodings)) {
    entries_.reserve(mapping.size());
    for (const auto& entry : mapping.entries()) {
        entries_.push_back({entry.first, to_lower(entry.first), entry.second});
    }
}

size_t ReferenceRewriter::rewrite_text(std::string& text) const {
    size_t replacements = 0;
    std::string lowered = to_lower(text);

    for (const auto& entry : entries_) {
        // billiger vorfilter, kontexte nur pruefen wenn der name ueberhaupt vorkommt
        if (lowered.find(entry.old_lower) == std::string::npos) continue;

        size_t before = replacements;
        for (auto context : CONTEXT_ORDER) {
            replacements += apply_rule(text, context, entry.old_name, entry.new_name);
        }
        if (replacements != before) lowered = to_lower(text);
    }
    return replacements;
}

RewriteResult ReferenceRewriter::rewrite(const CodeFile& file, bool dry_run) const {
    RewriteResult result;

    std::string bytes;
    if (!mmapfile::read_all(file.path.string(), bytes)) {
        result.success = false;
        result.error_message = "Cannot read " + file.path.string();
        return result;
    }

    std::optional<std::string> text;
    for (auto encoding : encodings_) {
        text = decode_to_utf8(bytes, encoding);
        if (text) {
            result.encoding = encoding;
            break;
        }
    }
    if (!text) {
        return result;  // kein encoding passt, einfach skippen
    }
    result.decoded = true;

    const std::string original = *text;
    result.replacements = rewrite_text(*text);
    result.changed = (*text != original);

    if (!result.changed || dry_run) {
        return result;
    }

    // output immer utf-8, egal wie gelesen wurde
    auto temp_path = file.path;
    temp_path += ".tmp";
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        out.write(text->data(), static_cast<std::streamsize>(text->size()));
        out.close();
        if (!out) {
            std::error_code rm_ec;
            fs::remove(temp_path, rm_ec);
            result.success = false;
            result.error_message = "Cannot write " + file.path.string();
            return result;
        }
    }

    std::error_code ec;
    auto perms = fs::status(file.path, ec).permissions();
    if (!ec) fs::permissions(temp_path, perms, ec);

    fs::rename(temp_path, file.path, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(temp_path, rm_ec);
        result.success = false;
        result.error_message = "Cannot replace " + file.path.string() + ": " + ec.message();
    }
    return result;
}

} // namespace webpify
