#include "engine/source_unit.h"

#include <cstring>
#include <utility>

#include "common/string_utils.h"

namespace Shield {

using Common::endsWith;
using Common::equalsNoCase;
using Common::startsWith;
using Common::trimView;

namespace {

constexpr const char* HASH_EXTENSIONS[] = {
    ".py", ".pyi", ".sh", ".bash", ".rb", ".pl", ".yaml", ".yml", ".toml", ".cfg", ".ini", ".conf", ".r"
};

constexpr const char* SLASH_EXTENSIONS[] = {
    ".c", ".cc", ".cpp", ".cxx", ".h", ".hh", ".hpp", ".java", ".js", ".jsx", ".ts", ".tsx",
    ".go", ".rs", ".cs", ".kt", ".swift", ".scala", ".php"
};

constexpr const char* DASH_EXTENSIONS[] = {".sql", ".lua", ".hs"};

auto fileName(std::string_view path) noexcept -> std::string_view {
    const size_t slash = path.find_last_of("/\\");
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

auto extensionOf(std::string_view path) noexcept -> std::string_view {
    const std::string_view name = fileName(path);
    const size_t dot = name.rfind('.');
    return (dot == std::string_view::npos || dot == 0) ? std::string_view() : name.substr(dot);
}

constexpr const char* TRIPLE_DOUBLE = "\"\"\"";
constexpr const char* TRIPLE_SINGLE = "'''";

struct BlockState {
    const char* docstring = nullptr;  // open docstring delimiter, lines are comments
    const char* string = nullptr;     // open multi-line string literal, lines are code
    bool block_comment = false;
};

auto usesHash(CommentStyle style) noexcept -> bool {
    return style == CommentStyle::HASH || style == CommentStyle::ANY;
}

auto usesSlash(CommentStyle style) noexcept -> bool {
    return style == CommentStyle::SLASH || style == CommentStyle::ANY;
}

// Follows triple-quoted strings through one line given the delimiter open at
// its start; returns the delimiter still open at its end
auto openTripleQuote(std::string_view line, const char* open) noexcept -> const char* {
    char quote = 0;
    size_t i = 0;
    while (i < line.size()) {
        if (open) {
            const size_t close = line.find(open, i);
            if (close == std::string_view::npos) {
                return open;
            }
            i = close + 3;
            open = nullptr;
            continue;
        }
        const char c = line[i];
        if (quote) {
            if (c == '\\') {
                i += 2;
                continue;
            }
            if (c == quote) {
                quote = 0;
            }
            ++i;
            continue;
        }
        if (c == '#') {
            break;
        }
        if (c == '"' || c == '\'') {
            const char* triple = c == '"' ? TRIPLE_DOUBLE : TRIPLE_SINGLE;
            if (line.compare(i, 3, triple) == 0) {
                open = triple;
                i += 3;
                continue;
            }
            quote = c;
        }
        ++i;
    }
    return open;
}

// Whole-line comment test; updates the multi-line string/docstring/block state
auto classifyCommentLine(std::string_view line, CommentStyle style, BlockState* state) noexcept -> bool {
    const std::string_view t = trimView(line);
    const bool hash = usesHash(style);
    const bool slash = usesSlash(style);

    if (state->block_comment) {
        if (t.find("*/") != std::string_view::npos) {
            state->block_comment = false;
        }
        return true;
    }
    if (state->docstring) {
        const size_t close = t.find(state->docstring);
        if (close != std::string_view::npos) {
            state->docstring = nullptr;
            state->string = openTripleQuote(t.substr(close + 3), nullptr);
        }
        return true;
    }
    if (state->string) {
        // Body and closing line of an assigned string are code
        state->string = openTripleQuote(line, state->string);
        return false;
    }
    if (t.empty()) {
        return false;
    }

    if (hash) {
        // Only a string that starts the statement is a docstring
        if (startsWith(t, TRIPLE_DOUBLE) || startsWith(t, TRIPLE_SINGLE)) {
            state->docstring = openTripleQuote(t, nullptr);
            return true;
        }
        if (t[0] == '#') {
            return true;
        }
    }
    if (slash) {
        if (startsWith(t, "/*")) {
            if (t.find("*/", 2) == std::string_view::npos) {
                state->block_comment = true;
            }
            return true;
        }
        if (startsWith(t, "//") || t[0] == '*') {
            return true;
        }
    }
    if (style == CommentStyle::DASH && startsWith(t, "--")) {
        return true;
    }
    if (hash) {
        state->string = openTripleQuote(line, nullptr);
    }
    return false;
}

} // namespace

auto commentStyleFor(std::string_view path) noexcept -> CommentStyle {
    const std::string_view ext = extensionOf(path);
    if (ext.empty()) {
        return CommentStyle::ANY;
    }
    for (const char* e : HASH_EXTENSIONS) {
        if (equalsNoCase(ext, e)) return CommentStyle::HASH;
    }
    for (const char* e : SLASH_EXTENSIONS) {
        if (equalsNoCase(ext, e)) return CommentStyle::SLASH;
    }
    for (const char* e : DASH_EXTENSIONS) {
        if (equalsNoCase(ext, e)) return CommentStyle::DASH;
    }
    return CommentStyle::ANY;
}

auto findCommentColumn(std::string_view line, CommentStyle style) noexcept -> size_t {
    const bool hash = usesHash(style);
    const bool slash = usesSlash(style);
    const bool dash = style == CommentStyle::DASH;
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quote) {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '"' || c == '\'') {
            quote = c;
        } else if (hash && c == '#') {
            return i;
        } else if (slash && c == '/' && i + 1 < line.size() && line[i + 1] == '/') {
            return i;
        } else if (dash && c == '-' && i + 1 < line.size() && line[i + 1] == '-') {
            return i;
        }
    }
    return NO_COLUMN;
}

SourceUnit::SourceUnit(std::string id, std::string text)
    : id_(std::move(id)), text_(std::move(text)), lines_(),
      style_(commentStyleFor(id_)), binary_(false), read_error_() {
    binary_ = std::memchr(text_.data(), '\0', text_.size()) != nullptr;
    if (!binary_) {
        segment();
    }
}

auto SourceUnit::unreadable(std::string id, std::string reason) -> SourceUnit {
    SourceUnit unit(std::move(id), std::string());
    unit.read_error_ = reason.empty() ? std::string("read failed") : std::move(reason);
    return unit;
}

void SourceUnit::segment() {
    BlockState state;
    size_t start = 0;
    const size_t n = text_.size();
    while (start < n) {
        size_t end = text_.find('\n', start);
        const size_t next = end == std::string::npos ? n : end + 1;
        if (end == std::string::npos) {
            end = n;
        }
        size_t length = end - start;
        if (length > 0 && text_[start + length - 1] == '\r') {
            --length;
        }

        const std::string_view view(text_.data() + start, length);
        LineInfo info;
        info.offset = start;
        info.length = length;
        info.comment_line = classifyCommentLine(view, style_, &state);
        info.comment_column = findCommentColumn(view, style_);
        lines_.push_back(info);

        start = next;
    }
}

auto SourceUnit::line(uint32_t line_no) const noexcept -> std::string_view {
    if (line_no == 0 || line_no > lines_.size()) {
        return {};
    }
    const LineInfo& info = lines_[line_no - 1];
    return std::string_view(text_.data() + info.offset, info.length);
}

auto clampRange(const SourceUnit& unit, int64_t first, int64_t last) noexcept -> LineRange {
    const int64_t count = unit.lineCount();
    if (first < 1) first = 1;
    if (last > count) last = count;
    if (count == 0 || first > last) {
        return {1, 0};
    }
    return {static_cast<uint32_t>(first), static_cast<uint32_t>(last)};
}

auto hasDirectorySegment(std::string_view path, const NameList& names) noexcept -> bool {
    size_t start = 0;
    while (start < path.size()) {
        const size_t sep = path.find_first_of("/\\", start);
        if (sep == std::string_view::npos) {
            break;  // remaining text is the file name
        }
        const std::string_view segment = path.substr(start, sep - start);
        if (!segment.empty() && names.containsNoCase(segment)) {
            return true;
        }
        start = sep + 1;
    }
    return false;
}

auto isTestPath(std::string_view path, const NameList& test_segments) noexcept -> bool {
    if (hasDirectorySegment(path, test_segments)) {
        return true;
    }
    std::string_view stem = fileName(path);
    const size_t dot = stem.rfind('.');
    if (dot != std::string_view::npos && dot > 0) {
        stem = stem.substr(0, dot);
    }
    return startsWith(stem, "test_") || endsWith(stem, "_test") || endsWith(stem, "_tests");
}

} // namespace Shield
