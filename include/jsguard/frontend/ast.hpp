#ifndef JSGUARD_FRONTEND_AST_HPP
#define JSGUARD_FRONTEND_AST_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace jsguard::frontend {

enum class NodeKind {
    Program,
    VariableDeclaration,
    VariableDeclarator,
    FunctionDeclaration,
    BlockStatement,
    ExpressionStatement,
    ReturnStatement,
    IfStatement,
    WhileStatement,
    ForStatement,
    BinaryExpression,
    UnaryExpression,
    AssignmentExpression,
    CallExpression,
    MemberExpression,
    Identifier,
    Literal,
    ArrayExpression,
    ObjectExpression,
    Property,
};

const char* ToString(NodeKind kind);

struct Node {
    Node(NodeKind in_kind, std::size_t in_line, std::size_t in_column)
        : kind(in_kind), line(in_line), column(in_column) {}
    virtual ~Node() = default;

    // Ordered child nodes visited by tree walkers. Null optional children
    // are omitted; position and kind are never children.
    virtual std::vector<const Node*> Children() const = 0;

    NodeKind kind;
    std::size_t line = 1;
    std::size_t column = 1;
};

struct Expr : Node {
    using Node::Node;
};

struct Statement : Node {
    using Node::Node;
};

struct Identifier final : Expr {
    Identifier(std::string in_name, std::size_t in_line, std::size_t in_column)
        : Expr(NodeKind::Identifier, in_line, in_column), name(std::move(in_name)) {}

    std::vector<const Node*> Children() const override;

    std::string name;
};

using LiteralValue = std::variant<std::nullptr_t, double, bool, std::string>;

struct Literal final : Expr {
    Literal(LiteralValue in_value, std::string in_raw, std::size_t in_line, std::size_t in_column)
        : Expr(NodeKind::Literal, in_line, in_column), value(std::move(in_value)), raw(std::move(in_raw)) {}

    std::vector<const Node*> Children() const override;

    bool IsString() const {
        return std::holds_alternative<std::string>(value);
    }

    LiteralValue value;
    std::string raw;
};

struct BinaryExpression final : Expr {
    BinaryExpression(
        std::string in_op,
        std::unique_ptr<Expr> in_left,
        std::unique_ptr<Expr> in_right,
        std::size_t in_line,
        std::size_t in_column)
        : Expr(NodeKind::BinaryExpression, in_line, in_column),
          op(std::move(in_op)),
          left(std::move(in_left)),
          right(std::move(in_right)) {}

    std::vector<const Node*> Children() const override;

    std::string op;
    std::unique_ptr<Expr> left;
    std::unique_ptr<Expr> right;
};

struct UnaryExpression final : Expr {
    UnaryExpression(std::string in_op, std::unique_ptr<Expr> in_argument, std::size_t in_line, std::size_t in_column)
        : Expr(NodeKind::UnaryExpression, in_line, in_column),
          op(std::move(in_op)),
          argument(std::move(in_argument)) {}

    std::vector<const Node*> Children() const override;

    std::string op;
    std::unique_ptr<Expr> argument;
    bool prefix = true;
};

struct AssignmentExpression final : Expr {
    AssignmentExpression(
        std::string in_op,
        std::unique_ptr<Expr> in_left,
        std::unique_ptr<Expr> in_right,
        std::size_t in_line,
        std::size_t in_column)
        : Expr(NodeKind::AssignmentExpression, in_line, in_column),
          op(std::move(in_op)),
          left(std::move(in_left)),
          right(std::move(in_right)) {}

    std::vector<const Node*> Children() const override;

    std::string op;
    std::unique_ptr<Expr> left;
    std::unique_ptr<Expr> right;
};

struct CallExpression final : Expr {
    CallExpression(
        std::unique_ptr<Expr> in_callee,
        std::vector<std::unique_ptr<Expr>> in_arguments,
        std::size_t in_line,
        std::size_t in_column)
        : Expr(NodeKind::CallExpression, in_line, in_column),
          callee(std::move(in_callee)),
          arguments(std::move(in_arguments)) {}

    std::vector<const Node*> Children() const override;

    std::unique_ptr<Expr> callee;
    std::vector<std::unique_ptr<Expr>> arguments;
};

struct MemberExpression final : Expr {
    MemberExpression(
        std::unique_ptr<Expr> in_object,
        std::unique_ptr<Expr> in_property,
        bool in_computed,
        std::size_t in_line,
        std::size_t in_column)
        : Expr(NodeKind::MemberExpression, in_line, in_column),
          object(std::move(in_object)),
          property(std::move(in_property)),
          computed(in_computed) {}

    std::vector<const Node*> Children() const override;

    std::unique_ptr<Expr> object;
    std::unique_ptr<Expr> property;
    bool computed = false;
};

struct ArrayExpression final : Expr {
    ArrayExpression(std::vector<std::unique_ptr<Expr>> in_elements, std::size_t in_line, std::size_t in_column)
        : Expr(NodeKind::ArrayExpression, in_line, in_column), elements(std::move(in_elements)) {}

    std::vector<const Node*> Children() const override;

    std::vector<std::unique_ptr<Expr>> elements;
};

// Key is an Identifier or a string Literal.
struct Property final : Node {
    Property(std::unique_ptr<Expr> in_key, std::unique_ptr<Expr> in_value, std::size_t in_line, std::size_t in_column)
        : Node(NodeKind::Property, in_line, in_column), key(std::move(in_key)), value(std::move(in_value)) {}

    std::vector<const Node*> Children() const override;

    std::unique_ptr<Expr> key;
    std::unique_ptr<Expr> value;
};

struct ObjectExpression final : Expr {
    ObjectExpression(std::vector<std::unique_ptr<Property>> in_properties, std::size_t in_line, std::size_t in_column)
        : Expr(NodeKind::ObjectExpression, in_line, in_column), properties(std::move(in_properties)) {}

    std::vector<const Node*> Children() const override;

    std::vector<std::unique_ptr<Property>> properties;
};

struct VariableDeclarator final : Node {
    VariableDeclarator(
        std::unique_ptr<Identifier> in_id,
        std::unique_ptr<Expr> in_init,
        std::size_t in_line,
        std::size_t in_column)
        : Node(NodeKind::VariableDeclarator, in_line, in_column), id(std::move(in_id)), init(std::move(in_init)) {}

    std::vector<const Node*> Children() const override;

    std::unique_ptr<Identifier> id;
    std::unique_ptr<Expr> init;
};

struct VariableDeclaration final : Statement {
    VariableDeclaration(
        std::string in_declaration_kind,
        std::vector<std::unique_ptr<VariableDeclarator>> in_declarations,
        std::size_t in_line,
        std::size_t in_column)
        : Statement(NodeKind::VariableDeclaration, in_line, in_column),
          declaration_kind(std::move(in_declaration_kind)),
          declarations(std::move(in_declarations)) {}

    std::vector<const Node*> Children() const override;

    // "var", "let" or "const".
    std::string declaration_kind;
    std::vector<std::unique_ptr<VariableDeclarator>> declarations;
};

struct BlockStatement final : Statement {
    BlockStatement(std::vector<std::unique_ptr<Statement>> in_body, std::size_t in_line, std::size_t in_column)
        : Statement(NodeKind::BlockStatement, in_line, in_column), body(std::move(in_body)) {}

    std::vector<const Node*> Children() const override;

    std::vector<std::unique_ptr<Statement>> body;
};

struct FunctionDeclaration final : Statement {
    FunctionDeclaration(
        std::unique_ptr<Identifier> in_id,
        std::vector<std::unique_ptr<Identifier>> in_params,
        std::unique_ptr<BlockStatement> in_body,
        std::size_t in_line,
        std::size_t in_column)
        : Statement(NodeKind::FunctionDeclaration, in_line, in_column),
          id(std::move(in_id)),
          params(std::move(in_params)),
          body(std::move(in_body)) {}

    std::vector<const Node*> Children() const override;

    std::unique_ptr<Identifier> id;
    std::vector<std::unique_ptr<Identifier>> params;
    std::unique_ptr<BlockStatement> body;
};

struct ExpressionStatement final : Statement {
    ExpressionStatement(std::unique_ptr<Expr> in_expression, std::size_t in_line, std::size_t in_column)
        : Statement(NodeKind::ExpressionStatement, in_line, in_column), expression(std::move(in_expression)) {}

    std::vector<const Node*> Children() const override;

    std::unique_ptr<Expr> expression;
};

struct ReturnStatement final : Statement {
    ReturnStatement(std::unique_ptr<Expr> in_argument, std::size_t in_line, std::size_t in_column)
        : Statement(NodeKind::ReturnStatement, in_line, in_column), argument(std::move(in_argument)) {}

    std::vector<const Node*> Children() const override;

    std::unique_ptr<Expr> argument;
};

struct IfStatement final : Statement {
    IfStatement(
        std::unique_ptr<Expr> in_test,
        std::unique_ptr<Statement> in_consequent,
        std::unique_ptr<Statement> in_alternate,
        std::size_t in_line,
        std::size_t in_column)
        : Statement(NodeKind::IfStatement, in_line, in_column),
          test(std::move(in_test)),
          consequent(std::move(in_consequent)),
          alternate(std::move(in_alternate)) {}

    std::vector<const Node*> Children() const override;

    std::unique_ptr<Expr> test;
    std::unique_ptr<Statement> consequent;
    std::unique_ptr<Statement> alternate;
};

// Loop headers are skipped by the parser; only the body is kept.
struct WhileStatement final : Statement {
    WhileStatement(std::unique_ptr<Statement> in_body, std::size_t in_line, std::size_t in_column)
        : Statement(NodeKind::WhileStatement, in_line, in_column), body(std::move(in_body)) {}

    std::vector<const Node*> Children() const override;

    std::unique_ptr<Statement> body;
};

struct ForStatement final : Statement {
    ForStatement(std::unique_ptr<Statement> in_body, std::size_t in_line, std::size_t in_column)
        : Statement(NodeKind::ForStatement, in_line, in_column), body(std::move(in_body)) {}

    std::vector<const Node*> Children() const override;

    std::unique_ptr<Statement> body;
};

struct Program final : Node {
    Program() : Node(NodeKind::Program, 1, 1) {}

    std::vector<const Node*> Children() const override;

    std::vector<std::unique_ptr<Statement>> body;
};

}  // namespace jsguard::frontend

#endif  // JSGUARD_FRONTEND_AST_HPP
