#pragma once

#include <seanet/lang/ast.hpp>
#include <seanet/lang/diagnostics.hpp>
#include <seanet/lang/token.hpp>
#include <string>
#include <vector>

namespace seanet {

// Parse a scanned token stream into a Program. Comment tokens are skipped.
// Parsing stops at the first syntax error: exactly one diagnostic is added
// to diags and an empty Program is returned. The AST borrows the source
// buffer the tokens point into.
Program parse(const std::string& filename,
              const std::vector<Token>& tokens,
              Diagnostics& diags);

// Parse a single expression that must span the whole token stream.
// Returns nullptr after reporting a syntax error.
ExprPtr parse_expression(const std::string& filename,
                         const std::vector<Token>& tokens,
                         Diagnostics& diags);

// Parse a single type expression (int[][], ref Foo, fun<int, bool>) that
// must span the whole token stream. Returns nullptr after reporting.
TypeInfoPtr parse_type(const std::string& filename,
                       const std::vector<Token>& tokens,
                       Diagnostics& diags);

} // namespace seanet
