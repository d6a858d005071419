#include <seanet/lang/diagnostics.hpp>

namespace seanet {

std::string Diagnostic::format() const {
    std::string result = "Parse error at ";
    result += file;
    result += ":";
    result += std::to_string(line);
    result += ",";
    result += std::to_string(col);
    result += " - ";
    result += message;
    return result;
}

void Diagnostics::report(const std::string& file, int line, int col,
                         std::string message) {
    entries_.push_back({file, line, col, std::move(message)});
}

std::vector<std::string> Diagnostics::formatted() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& d : entries_) {
        out.push_back(d.format());
    }
    return out;
}

} // namespace seanet
