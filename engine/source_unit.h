#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.h"

namespace Shield {

constexpr size_t NO_COLUMN = static_cast<size_t>(-1);

/// Comment syntax assumed for a unit, chosen from its file extension
enum class CommentStyle : uint8_t {
    HASH,   // '#' line comments and triple-quoted docstrings
    SLASH,  // '//' and '/* */'
    DASH,   // '--' line comments (SQL, Lua, Haskell)
    ANY     // unknown extension: hash and slash
};

[[nodiscard]] auto commentStyleFor(std::string_view path) noexcept -> CommentStyle;

/// Per-line lexical facts computed once when a unit is segmented
struct LineInfo {
    size_t offset;          // into SourceUnit::text()
    size_t length;          // without the line terminator
    size_t comment_column;  // trailing comment start outside string literals, NO_COLUMN if none
    bool comment_line;      // whole line is a comment or docstring body
};

/// One scannable text artifact: an opaque identifier plus its content.
/// Lines are 1-based in every public accessor.
class SourceUnit {
public:
    SourceUnit(std::string id, std::string text);

    /// Stand-in for an input that could not be read. It has no lines and the
    /// scan records it as skipped.
    [[nodiscard]] static auto unreadable(std::string id, std::string reason) -> SourceUnit;

    SourceUnit(SourceUnit&&) noexcept = default;
    SourceUnit& operator=(SourceUnit&&) noexcept = default;
    SourceUnit(const SourceUnit&) = default;
    SourceUnit& operator=(const SourceUnit&) = default;

    [[nodiscard]] auto id() const noexcept -> const std::string& { return id_; }
    [[nodiscard]] auto text() const noexcept -> std::string_view { return text_; }
    [[nodiscard]] auto size() const noexcept -> size_t { return text_.size(); }
    [[nodiscard]] auto lineCount() const noexcept -> uint32_t { return static_cast<uint32_t>(lines_.size()); }

    [[nodiscard]] auto line(uint32_t line_no) const noexcept -> std::string_view;
    [[nodiscard]] auto lineInfo(uint32_t line_no) const noexcept -> const LineInfo& {
        return lines_[line_no - 1];
    }

    /// Text contains a NUL byte, so it is not treated as source
    [[nodiscard]] auto isBinary() const noexcept -> bool { return binary_; }

    [[nodiscard]] auto isReadable() const noexcept -> bool { return read_error_.empty(); }
    [[nodiscard]] auto readError() const noexcept -> const std::string& { return read_error_; }

    [[nodiscard]] auto commentStyle() const noexcept -> CommentStyle { return style_; }

private:
    void segment();

    std::string id_;
    std::string text_;
    std::vector<LineInfo> lines_;
    CommentStyle style_;
    bool binary_;
    std::string read_error_;
};

/// Scan input lines [first, last] clamped to the unit
struct LineRange {
    uint32_t first;
    uint32_t last;
};

[[nodiscard]] auto clampRange(const SourceUnit& unit, int64_t first, int64_t last) noexcept -> LineRange;

// Path classification over the unit identifier ('/' or '\\' separated)

/// A directory segment of the path matches one of the names
[[nodiscard]] auto hasDirectorySegment(std::string_view path, const NameList& names) noexcept -> bool;

/// Test path: a test directory segment, or a file named test_* or *_test
[[nodiscard]] auto isTestPath(std::string_view path, const NameList& test_segments) noexcept -> bool;

/// Position of the first comment marker that is not inside a quoted string
[[nodiscard]] auto findCommentColumn(std::string_view line, CommentStyle style) noexcept -> size_t;

} // namespace Shield
