#pragma once

#include <string>
#include <vector>

namespace seanet {

struct Diagnostic {
    std::string file;
    int line = 0;
    int col = 0;
    std::string message;

    // "Parse error at {file}:{line},{col} - {message}"
    std::string format() const;
};

// Collects scan and parse errors for one compilation unit, in report order.
// Not safe for concurrent writers: give each worker its own instance.
class Diagnostics {
public:
    void report(const std::string& file, int line, int col, std::string message);

    bool has_errors() const { return !entries_.empty(); }
    std::size_t size() const { return entries_.size(); }
    const std::vector<Diagnostic>& entries() const { return entries_; }

    std::vector<std::string> formatted() const;

    void clear() { entries_.clear(); }

private:
    std::vector<Diagnostic> entries_;
};

} // namespace seanet
