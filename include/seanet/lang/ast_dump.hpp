#pragma once

#include <seanet/lang/ast.hpp>
#include <seanet/lang/type_info.hpp>
#include <string>

namespace seanet {

// Render AST nodes as S-expressions, e.g. (+ 1 (* 2 3)) or
// (function int main (params) (block (return 0))).
// A Program prints one top-level declaration per line.
std::string dump(const Program& program);
std::string dump(const Stmt& stmt);
std::string dump(const Expr& expr);

// Types print in source form: int[][], ref Foo, fun<int, bool, void>
std::string dump(const TypeInfo& type);

} // namespace seanet
