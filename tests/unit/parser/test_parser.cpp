// tests/unit/parser/test_parser.cpp - Unit tests for the recursive-descent parser
//
#include <gtest/gtest.h>

#include <string>

#include "ouro/ast/ast.hpp"
#include "ouro/ast/ast_context.hpp"
#include "ouro/syntax/lexer.hpp"
#include "ouro/syntax/parser.hpp"
#include "ouro/test_support/parse_helpers.hpp"

using namespace ouro;
using ouro::syntax::ParserErrorKind;

namespace
{

Program * parse_ok(test_support::TestParseUnit & unit)
{
  EXPECT_FALSE(unit.lex_error.has_value());
  EXPECT_TRUE(unit.parse_errors.empty())
    << "first parser error: " << (unit.parse_errors.empty() ? "" : unit.parse_errors[0].message);
  return unit.program;
}

}  // namespace

// ============================================================================
// Declarations
// ============================================================================

TEST(ParserDecls, FunctionWithWhileBody)
{
  auto unit = test_support::parse("func foo() { while (x < 10) x = x + 1; }");
  Program * program = parse_ok(*unit);
  ASSERT_NE(program, nullptr);
  ASSERT_EQ(program->decls.size(), 1u);

  const auto * fn = dyn_cast<FunctionDecl>(program->decls[0]);
  ASSERT_NE(fn, nullptr);
  EXPECT_EQ(fn->name, "foo");
  EXPECT_TRUE(fn->params.empty());
  EXPECT_EQ(fn->returnType, nullptr);
  ASSERT_NE(fn->body, nullptr);
  ASSERT_EQ(fn->body->statements.size(), 1u);

  const auto * loop = dyn_cast<WhileStmt>(fn->body->statements[0]);
  ASSERT_NE(loop, nullptr);
  const auto * cond = dyn_cast<BinaryExpr>(loop->condition);
  ASSERT_NE(cond, nullptr);
  EXPECT_EQ(cond->op, BinaryOp::Lt);
  ASSERT_NE(dyn_cast<ExpressionStmt>(loop->body), nullptr);
  EXPECT_TRUE(isa<AssignExpr>(cast<ExpressionStmt>(loop->body)->expr));
}

TEST(ParserDecls, ClassHeaderFirstNameIsSuperclass)
{
  auto unit = test_support::parse("class A: B, C { var x: Int; func f() {} }");
  Program * program = parse_ok(*unit);
  ASSERT_NE(program, nullptr);
  ASSERT_EQ(program->decls.size(), 1u);

  const auto * cls = dyn_cast<ClassDecl>(program->decls[0]);
  ASSERT_NE(cls, nullptr);
  EXPECT_EQ(cls->name, "A");
  ASSERT_NE(cls->superclass, nullptr);
  EXPECT_EQ(cls->superclass->name, "B");
  ASSERT_EQ(cls->interfaces.size(), 1u);
  EXPECT_EQ(cls->interfaces[0]->name, "C");
  ASSERT_EQ(cls->properties.size(), 1u);
  EXPECT_EQ(cls->properties[0]->name, "x");
  ASSERT_NE(cls->properties[0]->type, nullptr);
  ASSERT_EQ(cls->methods.size(), 1u);
  EXPECT_EQ(cls->methods[0]->name, "f");
}

TEST(ParserDecls, ClassModifiersAndPermits)
{
  auto unit = test_support::parse(
    "sealed abstract class Shape permits Circle, Square { abstract func area() -> Double; }");
  Program * program = parse_ok(*unit);
  ASSERT_NE(program, nullptr);

  const auto * cls = dyn_cast<ClassDecl>(program->decls[0]);
  ASSERT_NE(cls, nullptr);
  EXPECT_TRUE(cls->modifiers.has(Modifier::Sealed));
  EXPECT_TRUE(cls->modifiers.has(Modifier::Abstract));
  EXPECT_FALSE(cls->modifiers.has(Modifier::Final));
  EXPECT_EQ(cls->superclass, nullptr);
  ASSERT_EQ(cls->permits.size(), 2u);
  EXPECT_EQ(cls->permits[0]->name, "Circle");
  EXPECT_EQ(cls->permits[1]->name, "Square");
  ASSERT_EQ(cls->methods.size(), 1u);
  EXPECT_FALSE(cls->methods[0]->has_body());
  EXPECT_TRUE(cls->methods[0]->modifiers.has(Modifier::Abstract));
}

TEST(ParserDecls, StructInterfacesOnly)
{
  auto unit = test_support::parse("struct S: I1, I2 { var a: Int = 1; }");
  Program * program = parse_ok(*unit);
  ASSERT_NE(program, nullptr);

  const auto * s = dyn_cast<StructDecl>(program->decls[0]);
  ASSERT_NE(s, nullptr);
  ASSERT_EQ(s->interfaces.size(), 2u);
  EXPECT_EQ(s->interfaces[0]->name, "I1");
  EXPECT_EQ(s->interfaces[1]->name, "I2");
  ASSERT_EQ(s->properties.size(), 1u);
  EXPECT_NE(s->properties[0]->initializer, nullptr);
}

TEST(ParserDecls, EnumCasesWithRawValuesAndMethods)
{
  auto unit = test_support::parse(
    "enum Color: Int { Red = 1; Green = 2, Blue; func describe() -> String { return \"c\"; } }");
  Program * program = parse_ok(*unit);
  ASSERT_NE(program, nullptr);

  const auto * e = dyn_cast<EnumDecl>(program->decls[0]);
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->name, "Color");
  ASSERT_NE(e->rawType, nullptr);
  ASSERT_EQ(e->cases.size(), 3u);
  EXPECT_EQ(e->cases[0]->name, "Red");
  ASSERT_NE(e->cases[0]->rawValue, nullptr);
  EXPECT_EQ(cast<LiteralExpr>(e->cases[0]->rawValue)->intValue, 1);
  EXPECT_EQ(e->cases[2]->name, "Blue");
  EXPECT_EQ(e->cases[2]->rawValue, nullptr);
  ASSERT_EQ(e->methods.size(), 1u);
  EXPECT_EQ(e->methods[0]->name, "describe");
}

TEST(ParserDecls, InterfaceSignaturesAndDefaultBodies)
{
  auto unit = test_support::parse(
    "interface Named: Base { func name() -> String; func greet() -> String { return \"hi\"; } }");
  Program * program = parse_ok(*unit);
  ASSERT_NE(program, nullptr);

  const auto * iface = dyn_cast<InterfaceDecl>(program->decls[0]);
  ASSERT_NE(iface, nullptr);
  ASSERT_EQ(iface->parents.size(), 1u);
  EXPECT_EQ(iface->parents[0]->name, "Base");
  ASSERT_EQ(iface->methods.size(), 2u);
  EXPECT_FALSE(iface->methods[0]->has_body());
  EXPECT_TRUE(iface->methods[1]->has_body());
}

TEST(ParserDecls, FunctionParamsDefaultsAndReturnType)
{
  auto unit = test_support::parse("func scale(v: Double, by: Double = 2.0) -> Double { return v * by; }");
  Program * program = parse_ok(*unit);
  ASSERT_NE(program, nullptr);

  const auto * fn = dyn_cast<FunctionDecl>(program->decls[0]);
  ASSERT_NE(fn, nullptr);
  ASSERT_EQ(fn->params.size(), 2u);
  EXPECT_EQ(fn->params[0]->name, "v");
  EXPECT_EQ(fn->params[0]->defaultValue, nullptr);
  EXPECT_NE(fn->params[1]->defaultValue, nullptr);
  EXPECT_EQ(fn->required_param_count(), 1u);
  const auto * ret = dyn_cast<NamedType>(fn->returnType);
  ASSERT_NE(ret, nullptr);
  EXPECT_EQ(ret->name, "Double");
}

TEST(ParserDecls, TypeAnnotations)
{
  auto unit = test_support::parse("var a: Int[] = [1, 2]; const b: Box<String> = null;");
  Program * program = parse_ok(*unit);
  ASSERT_NE(program, nullptr);
  ASSERT_EQ(program->decls.size(), 2u);

  const auto * a = dyn_cast<VarDecl>(program->decls[0]);
  ASSERT_NE(a, nullptr);
  EXPECT_FALSE(a->isConst);
  const auto * arr = dyn_cast<ArrayType>(a->type);
  ASSERT_NE(arr, nullptr);
  EXPECT_EQ(cast<NamedType>(arr->elementType)->name, "Int");
  ASSERT_NE(dyn_cast<ArrayLiteralExpr>(a->initializer), nullptr);
  EXPECT_EQ(cast<ArrayLiteralExpr>(a->initializer)->elements.size(), 2u);

  const auto * b = dyn_cast<VarDecl>(program->decls[1]);
  ASSERT_NE(b, nullptr);
  EXPECT_TRUE(b->isConst);
  const auto * gen = dyn_cast<GenericType>(b->type);
  ASSERT_NE(gen, nullptr);
  EXPECT_EQ(gen->name, "Box");
  ASSERT_EQ(gen->typeArgs.size(), 1u);
}

// ============================================================================
// Statements
// ============================================================================

TEST(ParserStmts, ForWithAllClausesAndEmptyClauses)
{
  auto unit = test_support::parse(
    "for (var i = 0; i < 10; i += 1) { continue; }\n"
    "for (;;) break;");
  Program * program = parse_ok(*unit);
  ASSERT_NE(program, nullptr);
  ASSERT_EQ(program->statements.size(), 2u);

  const auto * full = dyn_cast<ForStmt>(program->statements[0]);
  ASSERT_NE(full, nullptr);
  EXPECT_TRUE(isa<VarDeclStmt>(full->init));
  EXPECT_NE(full->condition, nullptr);
  ASSERT_NE(full->increment, nullptr);
  // i += 1 is desugared to i = i + 1
  const auto * incr = dyn_cast<AssignExpr>(full->increment);
  ASSERT_NE(incr, nullptr);
  EXPECT_EQ(incr->name, "i");
  ASSERT_NE(dyn_cast<BinaryExpr>(incr->value), nullptr);
  EXPECT_EQ(cast<BinaryExpr>(incr->value)->op, BinaryOp::Add);
  EXPECT_TRUE(isa<BlockStmt>(full->body));

  const auto * empty = dyn_cast<ForStmt>(program->statements[1]);
  ASSERT_NE(empty, nullptr);
  EXPECT_EQ(empty->init, nullptr);
  EXPECT_EQ(empty->condition, nullptr);
  EXPECT_EQ(empty->increment, nullptr);
  EXPECT_TRUE(isa<BreakStmt>(empty->body));
}

TEST(ParserStmts, IfElseChain)
{
  auto unit = test_support::parse("if (a) { } else if (b) return; else { x = 1; }");
  Program * program = parse_ok(*unit);
  ASSERT_NE(program, nullptr);
  ASSERT_EQ(program->statements.size(), 1u);

  const auto * outer = dyn_cast<IfStmt>(program->statements[0]);
  ASSERT_NE(outer, nullptr);
  const auto * inner = dyn_cast<IfStmt>(outer->elseBranch);
  ASSERT_NE(inner, nullptr);
  EXPECT_TRUE(isa<ReturnStmt>(inner->thenBranch));
  EXPECT_TRUE(isa<BlockStmt>(inner->elseBranch));
}

TEST(ParserStmts, MemberAndIndexAssignment)
{
  auto unit = test_support::parse("p.x = 3; xs[0] += 1; p.items[1] = 2;");
  Program * program = parse_ok(*unit);
  ASSERT_NE(program, nullptr);
  ASSERT_EQ(program->statements.size(), 3u);

  const auto * set = dyn_cast<SetExpr>(cast<ExpressionStmt>(program->statements[0])->expr);
  ASSERT_NE(set, nullptr);
  EXPECT_EQ(set->name, "x");
  EXPECT_EQ(set->op, AssignOp::Assign);

  const auto * iset = dyn_cast<IndexSetExpr>(cast<ExpressionStmt>(program->statements[1])->expr);
  ASSERT_NE(iset, nullptr);
  EXPECT_EQ(iset->op, AssignOp::Add);

  const auto * nested = dyn_cast<IndexSetExpr>(cast<ExpressionStmt>(program->statements[2])->expr);
  ASSERT_NE(nested, nullptr);
  EXPECT_TRUE(isa<GetExpr>(nested->base));
}

// ============================================================================
// Expressions
// ============================================================================

TEST(ParserExprs, MultiplicationBindsTighterThanAddition)
{
  auto unit = test_support::parse("1 + 2 * 3;");
  Program * program = parse_ok(*unit);
  ASSERT_NE(program, nullptr);

  const auto * add = dyn_cast<BinaryExpr>(cast<ExpressionStmt>(program->statements[0])->expr);
  ASSERT_NE(add, nullptr);
  EXPECT_EQ(add->op, BinaryOp::Add);
  EXPECT_TRUE(isa<LiteralExpr>(add->lhs));
  const auto * mul = dyn_cast<BinaryExpr>(add->rhs);
  ASSERT_NE(mul, nullptr);
  EXPECT_EQ(mul->op, BinaryOp::Mul);
}

TEST(ParserExprs, ExponentIsRightAssociative)
{
  auto unit = test_support::parse("2 ** 3 ** 2;");
  Program * program = parse_ok(*unit);
  ASSERT_NE(program, nullptr);

  const auto * outer = dyn_cast<BinaryExpr>(cast<ExpressionStmt>(program->statements[0])->expr);
  ASSERT_NE(outer, nullptr);
  EXPECT_EQ(outer->op, BinaryOp::Pow);
  EXPECT_TRUE(isa<LiteralExpr>(outer->lhs));
  EXPECT_TRUE(isa<BinaryExpr>(outer->rhs));
}

TEST(ParserExprs, SubtractionIsLeftAssociative)
{
  auto unit = test_support::parse("10 - 4 - 3;");
  Program * program = parse_ok(*unit);
  ASSERT_NE(program, nullptr);

  const auto * outer = dyn_cast<BinaryExpr>(cast<ExpressionStmt>(program->statements[0])->expr);
  ASSERT_NE(outer, nullptr);
  EXPECT_TRUE(isa<BinaryExpr>(outer->lhs));
  EXPECT_TRUE(isa<LiteralExpr>(outer->rhs));
}

TEST(ParserExprs, AssignmentIsRightAssociative)
{
  auto unit = test_support::parse("a = b = 1;");
  Program * program = parse_ok(*unit);
  ASSERT_NE(program, nullptr);

  const auto * outer = dyn_cast<AssignExpr>(cast<ExpressionStmt>(program->statements[0])->expr);
  ASSERT_NE(outer, nullptr);
  EXPECT_EQ(outer->name, "a");
  const auto * inner = dyn_cast<AssignExpr>(outer->value);
  ASSERT_NE(inner, nullptr);
  EXPECT_EQ(inner->name, "b");
}

TEST(ParserExprs, ConditionalAndCoalesce)
{
  auto unit = test_support::parse("x = a ?? b ? 1 : 2;");
  Program * program = parse_ok(*unit);
  ASSERT_NE(program, nullptr);

  const auto * assign = dyn_cast<AssignExpr>(cast<ExpressionStmt>(program->statements[0])->expr);
  ASSERT_NE(assign, nullptr);
  const auto * cond = dyn_cast<ConditionalExpr>(assign->value);
  ASSERT_NE(cond, nullptr);
  const auto * coalesce = dyn_cast<BinaryExpr>(cond->condition);
  ASSERT_NE(coalesce, nullptr);
  EXPECT_EQ(coalesce->op, BinaryOp::Coalesce);
}

TEST(ParserExprs, PostfixChain)
{
  auto unit = test_support::parse("obj.items[2].name(1, \"a\");");
  Program * program = parse_ok(*unit);
  ASSERT_NE(program, nullptr);

  const auto * call = dyn_cast<CallExpr>(cast<ExpressionStmt>(program->statements[0])->expr);
  ASSERT_NE(call, nullptr);
  EXPECT_EQ(call->args.size(), 2u);
  const auto * get = dyn_cast<GetExpr>(call->callee);
  ASSERT_NE(get, nullptr);
  EXPECT_EQ(get->name, "name");
  EXPECT_TRUE(isa<IndexExpr>(get->object));
}

TEST(ParserExprs, UnaryAndGrouping)
{
  auto unit = test_support::parse("-(a + b); !done; ~mask;");
  Program * program = parse_ok(*unit);
  ASSERT_NE(program, nullptr);
  ASSERT_EQ(program->statements.size(), 3u);

  const auto * neg = dyn_cast<UnaryExpr>(cast<ExpressionStmt>(program->statements[0])->expr);
  ASSERT_NE(neg, nullptr);
  EXPECT_EQ(neg->op, UnaryOp::Neg);
  EXPECT_TRUE(isa<GroupingExpr>(neg->operand));
  EXPECT_EQ(
    cast<UnaryExpr>(cast<ExpressionStmt>(program->statements[1])->expr)->op, UnaryOp::Not);
  EXPECT_EQ(
    cast<UnaryExpr>(cast<ExpressionStmt>(program->statements[2])->expr)->op, UnaryOp::BitNot);
}

TEST(ParserExprs, NodePositions)
{
  auto unit = test_support::parse("var a = 1;\n  func f() {}");
  Program * program = parse_ok(*unit);
  ASSERT_NE(program, nullptr);
  ASSERT_EQ(program->decls.size(), 2u);
  EXPECT_EQ(program->decls[0]->line(), 1u);
  EXPECT_EQ(program->decls[0]->column(), 1u);
  EXPECT_EQ(program->decls[1]->line(), 2u);
  EXPECT_EQ(program->decls[1]->column(), 3u);
}

// ============================================================================
// Errors and Recovery
// ============================================================================

TEST(ParserErrors, ParseReturnsFirstError)
{
  auto tokens = syntax::scan_tokens("var = 1;\nfunc (");
  ASSERT_TRUE(tokens.has_value());

  AstContext ast;
  auto result = syntax::parse(ast, std::move(tokens).value());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().line, 1u);
  EXPECT_FALSE(result.error().message.empty());
}

TEST(ParserErrors, RecoveryCollectsSeveralErrors)
{
  auto unit = test_support::parse(
    "var a = ;\n"
    "var b = 2;\n"
    "func f() { var c = 1 +; }\n"
    "var d = 4;");
  EXPECT_GE(unit->parse_errors.size(), 2u);
  EXPECT_EQ(unit->parse_errors.size(), unit->diags.size());
  EXPECT_TRUE(unit->diags.has_errors());
}

TEST(ParserErrors, InvalidAssignmentTarget)
{
  auto unit = test_support::parse("1 = 2;");
  ASSERT_FALSE(unit->parse_errors.empty());
  EXPECT_EQ(unit->parse_errors[0].kind, ParserErrorKind::InvalidAssignmentTarget);
}

TEST(ParserErrors, MissingSemicolonIsExpectedToken)
{
  auto unit = test_support::parse("var a = 1\nvar b = 2;");
  ASSERT_FALSE(unit->parse_errors.empty());
  EXPECT_EQ(unit->parse_errors[0].kind, ParserErrorKind::ExpectedToken);
  EXPECT_FALSE(unit->parse_errors[0].expected.empty());
}

TEST(ParserErrors, DeepNestingIsBounded)
{
  std::string src = "x = ";
  src.append(400, '(');
  src += "1";
  src.append(400, ')');
  src += ";";

  auto unit = test_support::parse(src);
  ASSERT_FALSE(unit->parse_errors.empty());
  bool saw_depth = false;
  for (const auto & err : unit->parse_errors) {
    if (err.kind == ParserErrorKind::NestingTooDeep) saw_depth = true;
  }
  EXPECT_TRUE(saw_depth);
}

TEST(ParserErrors, DeepTypeArgumentNestingIsBounded)
{
  constexpr int depth = 100000;
  std::string src = "var x: ";
  for (int i = 0; i < depth; ++i) src += "A<";
  src += "Int";
  src.append(depth, '>');
  src += ";";

  auto unit = test_support::parse(src);
  ASSERT_EQ(unit->parse_errors.size(), 1u);
  EXPECT_EQ(unit->parse_errors[0].kind, ParserErrorKind::NestingTooDeep);
  EXPECT_EQ(unit->diags.size(), 1u);
}

TEST(ParserErrors, TypeArgumentNestingWithinLimitParses)
{
  auto unit = test_support::parse("var x: Box<Box<Box<Int>>>;");
  ASSERT_TRUE(unit->parsed());
  const auto * var = dyn_cast<VarDecl>(unit->program->decls[0]);
  ASSERT_NE(var, nullptr);
  const auto * outer = dyn_cast<GenericType>(var->type);
  ASSERT_NE(outer, nullptr);
  ASSERT_EQ(outer->typeArgs.size(), 1u);
  EXPECT_TRUE(isa<GenericType>(outer->typeArgs[0]));
}
