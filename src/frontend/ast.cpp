#include "jsguard/frontend/ast.hpp"

namespace jsguard::frontend {

namespace {

template <typename T>
void AppendChild(const std::unique_ptr<T>& child, std::vector<const Node*>* out_children) {
    if (child != nullptr) {
        out_children->push_back(child.get());
    }
}

template <typename T>
void AppendChildren(const std::vector<std::unique_ptr<T>>& children, std::vector<const Node*>* out_children) {
    for (const auto& child : children) {
        AppendChild(child, out_children);
    }
}

}  // namespace

const char* ToString(NodeKind kind) {
    switch (kind) {
    case NodeKind::Program:
        return "Program";
    case NodeKind::VariableDeclaration:
        return "VariableDeclaration";
    case NodeKind::VariableDeclarator:
        return "VariableDeclarator";
    case NodeKind::FunctionDeclaration:
        return "FunctionDeclaration";
    case NodeKind::BlockStatement:
        return "BlockStatement";
    case NodeKind::ExpressionStatement:
        return "ExpressionStatement";
    case NodeKind::ReturnStatement:
        return "ReturnStatement";
    case NodeKind::IfStatement:
        return "IfStatement";
    case NodeKind::WhileStatement:
        return "WhileStatement";
    case NodeKind::ForStatement:
        return "ForStatement";
    case NodeKind::BinaryExpression:
        return "BinaryExpression";
    case NodeKind::UnaryExpression:
        return "UnaryExpression";
    case NodeKind::AssignmentExpression:
        return "AssignmentExpression";
    case NodeKind::CallExpression:
        return "CallExpression";
    case NodeKind::MemberExpression:
        return "MemberExpression";
    case NodeKind::Identifier:
        return "Identifier";
    case NodeKind::Literal:
        return "Literal";
    case NodeKind::ArrayExpression:
        return "ArrayExpression";
    case NodeKind::ObjectExpression:
        return "ObjectExpression";
    case NodeKind::Property:
        return "Property";
    }
    return "Unknown";
}

std::vector<const Node*> Identifier::Children() const {
    return {};
}

std::vector<const Node*> Literal::Children() const {
    return {};
}

std::vector<const Node*> BinaryExpression::Children() const {
    std::vector<const Node*> children;
    AppendChild(left, &children);
    AppendChild(right, &children);
    return children;
}

std::vector<const Node*> UnaryExpression::Children() const {
    std::vector<const Node*> children;
    AppendChild(argument, &children);
    return children;
}

std::vector<const Node*> AssignmentExpression::Children() const {
    std::vector<const Node*> children;
    AppendChild(left, &children);
    AppendChild(right, &children);
    return children;
}

std::vector<const Node*> CallExpression::Children() const {
    std::vector<const Node*> children;
    AppendChild(callee, &children);
    AppendChildren(arguments, &children);
    return children;
}

std::vector<const Node*> MemberExpression::Children() const {
    std::vector<const Node*> children;
    AppendChild(object, &children);
    AppendChild(property, &children);
    return children;
}

std::vector<const Node*> ArrayExpression::Children() const {
    std::vector<const Node*> children;
    AppendChildren(elements, &children);
    return children;
}

std::vector<const Node*> Property::Children() const {
    std::vector<const Node*> children;
    AppendChild(key, &children);
    AppendChild(value, &children);
    return children;
}

std::vector<const Node*> ObjectExpression::Children() const {
    std::vector<const Node*> children;
    AppendChildren(properties, &children);
    return children;
}

std::vector<const Node*> VariableDeclarator::Children() const {
    std::vector<const Node*> children;
    AppendChild(id, &children);
    AppendChild(init, &children);
    return children;
}

std::vector<const Node*> VariableDeclaration::Children() const {
    std::vector<const Node*> children;
    AppendChildren(declarations, &children);
    return children;
}

std::vector<const Node*> BlockStatement::Children() const {
    std::vector<const Node*> children;
    AppendChildren(body, &children);
    return children;
}

std::vector<const Node*> FunctionDeclaration::Children() const {
    std::vector<const Node*> children;
    AppendChild(id, &children);
    AppendChildren(params, &children);
    AppendChild(body, &children);
    return children;
}

std::vector<const Node*> ExpressionStatement::Children() const {
    std::vector<const Node*> children;
    AppendChild(expression, &children);
    return children;
}

std::vector<const Node*> ReturnStatement::Children() const {
    std::vector<const Node*> children;
    AppendChild(argument, &children);
    return children;
}

std::vector<const Node*> IfStatement::Children() const {
    std::vector<const Node*> children;
    AppendChild(test, &children);
    AppendChild(consequent, &children);
    AppendChild(alternate, &children);
    return children;
}

std::vector<const Node*> WhileStatement::Children() const {
    std::vector<const Node*> children;
    AppendChild(body, &children);
    return children;
}

std::vector<const Node*> ForStatement::Children() const {
    std::vector<const Node*> children;
    AppendChild(body, &children);
    return children;
}

std::vector<const Node*> Program::Children() const {
    std::vector<const Node*> children;
    AppendChildren(body, &children);
    return children;
}

}  // namespace jsguard::frontend
