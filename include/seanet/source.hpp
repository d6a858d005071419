#pragma once

#include <seanet/result.hpp>
#include <string>
#include <string_view>

namespace seanet {

// One compilation unit's text. Tokens and AST nodes hold views into `text`,
// so a SourceFile must outlive everything scanned or parsed from it.
struct SourceFile {
    std::string name;  // used only in diagnostics
    std::string text;

    SourceFile() = default;
    SourceFile(std::string n, std::string t)
        : name(std::move(n)), text(std::move(t)) {}

    SourceFile(const SourceFile&) = delete;
    SourceFile& operator=(const SourceFile&) = delete;
    SourceFile(SourceFile&&) = default;
    SourceFile& operator=(SourceFile&&) = default;

    std::string_view view() const { return text; }

    // Read a file from disk. The file name becomes the diagnostic name.
    static Result<SourceFile> load(const std::string& path);
};

} // namespace seanet
