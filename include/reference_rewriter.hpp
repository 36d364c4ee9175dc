#pragma once
// referenzen in html/css/md/js files auf die neuen dateinamen umbiegen

#include "mapping_builder.hpp"
#include "scanner.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace webpify {

enum class TextEncoding {
    UTF8,
    Latin1,
    Windows1252
};

const char* encoding_name(TextEncoding encoding);

// Decodes raw bytes to UTF-8, nullopt if bytes are invalid in that encoding.
std::optional<std::string> decode_to_utf8(const std::string& bytes, TextEncoding encoding);

// Where a filename counts as a reference:
//   Quoted    "images/photo.jpg", 'photo.jpg'
//   CssUrl    url(photo.jpg), url( "../img/photo.jpg" )
//   Markdown  ![alt](images/photo.jpg)
// The path in front of the filename is kept, only the filename is replaced.
enum class ReferenceContext {
    Quoted,
    CssUrl,
    Markdown
};

// Application order, each pass sees the output of the previous one.
constexpr std::array<ReferenceContext, 3> CONTEXT_ORDER = {
    ReferenceContext::Quoted, ReferenceContext::CssUrl, ReferenceContext::Markdown};

// Replaces every case-insensitive occurrence of filename that sits in
// context with replacement (taken literally). Matches do not overlap.
// Returns the number of replacements.
size_t apply_rule(std::string& text, ReferenceContext context, const std::string& filename,
                  const std::string& replacement);

struct RewriteResult {
    size_t replacements = 0;
    bool changed = false;
    bool success = true;     // false: read or write failed
    bool decoded = false;    // false: no encoding accepted the bytes, file skipped
    TextEncoding encoding = TextEncoding::UTF8;
    std::string error_message;
};

class ReferenceRewriter {
public:
    static const std::vector<TextEncoding>& default_encodings();

    // Copies the mapping entries, the mapping must be complete at this point.
    explicit ReferenceRewriter(const ReferenceMapping& mapping,
                               std::vector<TextEncoding> encodings = default_encodings());

    // in-memory variante, gibt anzahl ersetzungen zurueck
    size_t rewrite_text(std::string& text) const;

    // Read, substitute, write back if changed and not a dry run.
    // Never throws for per-file problems.
    RewriteResult rewrite(const CodeFile& file, bool dry_run) const;

private:
    struct Entry {
        std::string old_name;
        std::string old_lower;
        std::string new_name;
    };

    std::vector<Entry> entries_;
    std::vector<TextEncoding> encodings_;
};

} // namespace webpify
