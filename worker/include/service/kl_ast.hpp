//! # Module Language AST

#pragma once

#include "common.hpp"
#include "kernel/graph.hpp"

#include <string>
#include <vector>

namespace kiln::service {

struct Position {
    uint32_t line = 0;
    uint32_t column = 0;
};

struct TypeRef {
    std::string name;
    Position pos;
};

enum class ExprKind : uint8_t {
    IntLiteral,
    StringLiteral,
    BoolLiteral,
    Name,
    Add,  ///< operands[0] + operands[1]
    Call, ///< text(operands...)
};

struct Expr {
    ExprKind kind = ExprKind::IntLiteral;
    Position pos;
    /// Name, callee or string contents.
    std::string text;
    int64_t int_value = 0;
    bool bool_value = false;
    std::vector<Box<Expr>> operands;
};

struct ImportDecl {
    std::string uri;
    Position pos;
};

struct Param {
    std::string name;
    TypeRef type;
    Position pos;
};

struct MemberDecl {
    kernel::MemberKind kind = kernel::MemberKind::Let;
    std::string name;
    Position pos;
    std::vector<Param> params; ///< `fn` only
    TypeRef type;              ///< Declared type, or return type for `fn`
    Box<Expr> init;
};

struct ModuleAst {
    std::vector<ImportDecl> imports;
    std::vector<MemberDecl> members;
};

} // namespace kiln::service
