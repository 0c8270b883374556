// ouro/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Produces the `<stem>.ast.json` build artifact and the `dump-ast`
// output. Every node becomes an object with a "type" (the node class
// name) and a "range" of byte offsets; checked expressions also carry
// "resolvedType".
//
#pragma once

#include <nlohmann/json.hpp>

#include "ouro/ast/ast.hpp"

namespace ouro
{

/**
 * Serialize any AST node to JSON.
 *
 * @param node The node to serialize (nullptr gives a "null" node)
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/// Serialize a whole compilation unit: declarations and top-level statements.
[[nodiscard]] nlohmann::json to_json(const Program * program);

}  // namespace ouro
