#pragma once

#include <seanet/lang/diagnostics.hpp>
#include <seanet/lang/token.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace seanet {

// Scan Seanet source into tokens. Never fails: lexical errors are reported
// to diags and the offending lexeme is dropped from the stream. The result
// always ends with exactly one Eof token. Tokens borrow `source`.
std::vector<Token> scan(const std::string& filename,
                        std::string_view source,
                        Diagnostics& diags);

// Exact-match keyword table
const std::unordered_map<std::string_view, TokenKind>& keywords();

} // namespace seanet
