#pragma once

#include <seanet/lang/token.hpp>
#include <memory>
#include <variant>
#include <vector>

namespace seanet {

struct TypeInfo;
using TypeInfoPtr = std::unique_ptr<TypeInfo>;

// A single type name: builtin keyword, struct identifier, void or var
struct NamedType {
    Token name;
    bool is_ref = false;
};

// Element type plus one array dimension; nest for int[][]
struct ArrayType {
    TypeInfoPtr element;
    bool is_ref = false;
};

// fun<P1, ..., Pn, R>; a bare `fun` has no params and returns void
struct FunctionType {
    std::vector<TypeInfoPtr> params;
    TypeInfoPtr return_type;
};

using TypeInfoVariant = std::variant<NamedType, ArrayType, FunctionType>;

struct TypeInfo {
    TypeInfoVariant value;

    explicit TypeInfo(TypeInfoVariant v) : value(std::move(v)) {}

    bool is_ref() const {
        if (auto* n = std::get_if<NamedType>(&value)) return n->is_ref;
        if (auto* a = std::get_if<ArrayType>(&value)) return a->is_ref;
        return false;
    }
};

inline TypeInfoPtr make_named_type(Token name, bool is_ref = false) {
    return std::make_unique<TypeInfo>(NamedType{name, is_ref});
}

inline TypeInfoPtr make_array_type(TypeInfoPtr element, bool is_ref = false) {
    return std::make_unique<TypeInfo>(ArrayType{std::move(element), is_ref});
}

inline TypeInfoPtr make_function_type(std::vector<TypeInfoPtr> params,
                                      TypeInfoPtr return_type) {
    return std::make_unique<TypeInfo>(
        FunctionType{std::move(params), std::move(return_type)});
}

} // namespace seanet
