// tests/unit/sema/test_type_checker.cpp - Unit tests for type checker
//
// Tests inference, compatibility rules and multi-error reporting.
//

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "ouro/ast/ast.hpp"
#include "ouro/sema/sema.hpp"
#include "ouro/sema/types/type_definition.hpp"
#include "ouro/test_support/parse_helpers.hpp"

using namespace ouro;

namespace
{

std::unique_ptr<test_support::TestParseUnit> check_ok(const std::string & src)
{
  auto unit = test_support::check(src);
  EXPECT_TRUE(unit->parsed()) << "source failed to parse: " << src;
  return unit;
}

std::vector<SymbolErrorKind> kinds(const test_support::TestParseUnit & unit)
{
  std::vector<SymbolErrorKind> out;
  for (const auto & e : unit.sema_errors) {
    out.push_back(e.kind);
  }
  return out;
}

bool has_error_containing(const test_support::TestParseUnit & unit, const std::string & needle)
{
  return std::any_of(unit.sema_errors.begin(), unit.sema_errors.end(), [&](const SymbolError & e) {
    return e.message.find(needle) != std::string::npos;
  });
}

/// Resolved type name of the top-level variable `name`.
std::string var_type(const test_support::TestParseUnit & unit, std::string_view name)
{
  for (const Decl * d : unit.program->decls) {
    if (const auto * v = dyn_cast<VarDecl>(d); v && v->name == name) {
      return v->resolvedType ? v->resolvedType->name : "<null>";
    }
  }
  return "<missing>";
}

}  // namespace

// ============================================================================
// Variables
// ============================================================================

TEST(TypeCheckerTest, AnnotationMismatch)
{
  auto unit = check_ok("var x: String = 42;");
  ASSERT_EQ(unit->sema_errors.size(), 1u);
  const SymbolError & err = unit->sema_errors[0];
  EXPECT_EQ(err.kind, SymbolErrorKind::TypeMismatch);
  EXPECT_EQ(err.expected, "String");
  EXPECT_EQ(err.got, "Int");
  EXPECT_EQ(err.line, 1u);
}

TEST(TypeCheckerTest, CleanFunction)
{
  auto unit = check_ok("func add(a: Int, b: Int) -> Int { return a + b; }");
  EXPECT_TRUE(unit->sema_errors.empty());
}

TEST(TypeCheckerTest, ReportsEveryIndependentMismatch)
{
  auto unit = check_ok(
    "var a: String = 1;\n"
    "var b: Int = \"two\";\n"
    "var c: Bool = 3.5;\n"
    "var d: Int = 4;\n");
  ASSERT_EQ(unit->sema_errors.size(), 3u);
  for (const auto & err : unit->sema_errors) {
    EXPECT_EQ(err.kind, SymbolErrorKind::TypeMismatch);
  }
  EXPECT_EQ(unit->sema_errors[0].line, 1u);
  EXPECT_EQ(unit->sema_errors[1].line, 2u);
  EXPECT_EQ(unit->sema_errors[2].line, 3u);
}

TEST(TypeCheckerTest, LiteralInference)
{
  auto unit = check_ok(
    "var i = 1;\n"
    "var big = 5000000000;\n"
    "var f = 1.5;\n"
    "var s = \"s\";\n"
    "var c = 'c';\n"
    "var b = true;\n"
    "var n = null;\n"
    "var xs = [1, 2, 3];\n");
  ASSERT_TRUE(unit->sema_errors.empty());
  EXPECT_EQ(var_type(*unit, "i"), "Int");
  EXPECT_EQ(var_type(*unit, "big"), "Int64");
  EXPECT_EQ(var_type(*unit, "f"), "Double");
  EXPECT_EQ(var_type(*unit, "s"), "String");
  EXPECT_EQ(var_type(*unit, "c"), "Char");
  EXPECT_EQ(var_type(*unit, "b"), "Bool");
  EXPECT_EQ(var_type(*unit, "n"), "Any");
  EXPECT_EQ(var_type(*unit, "xs"), "Int[]");
}

TEST(TypeCheckerTest, NumericWidening)
{
  auto unit = check_ok(
    "var a: Int64 = 1;\n"
    "var b: Double = 2;\n"
    "var c = 1 + 2.5;\n"
    "var d: Int = 2.5;\n");
  EXPECT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::TypeMismatch});
  EXPECT_EQ(var_type(*unit, "c"), "Double");
}

TEST(TypeCheckerTest, LiteralOutOfRangeForAnnotation)
{
  auto unit = check_ok("var a: Int8 = 100;\nvar b: Int8 = 300;\n");
  ASSERT_EQ(unit->sema_errors.size(), 1u);
  EXPECT_EQ(unit->sema_errors[0].line, 2u);
}

TEST(TypeCheckerTest, NullNeedsReferenceType)
{
  auto unit = check_ok("var s: String = null;\nvar i: Int = null;\n");
  ASSERT_EQ(unit->sema_errors.size(), 1u);
  EXPECT_EQ(unit->sema_errors[0].kind, SymbolErrorKind::TypeMismatch);
  EXPECT_EQ(unit->sema_errors[0].line, 2u);
}

TEST(TypeCheckerTest, InferredLocalTypeIsEnforced)
{
  auto unit = check_ok("func f() { var n = 1; n = \"text\"; }");
  EXPECT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::TypeMismatch});
}

// ============================================================================
// Returns
// ============================================================================

TEST(TypeCheckerTest, ReturnTypeMismatch)
{
  auto unit = check_ok("func f() -> Int { return \"no\"; }");
  ASSERT_EQ(unit->sema_errors.size(), 1u);
  EXPECT_EQ(unit->sema_errors[0].kind, SymbolErrorKind::TypeMismatch);
  EXPECT_EQ(unit->sema_errors[0].expected, "Int");
  EXPECT_EQ(unit->sema_errors[0].got, "String");
}

TEST(TypeCheckerTest, ValueReturnedFromVoidFunction)
{
  auto unit = check_ok("func f() { return 1; }");
  ASSERT_EQ(unit->sema_errors.size(), 1u);
  EXPECT_EQ(unit->sema_errors[0].kind, SymbolErrorKind::TypeMismatch);
  EXPECT_EQ(unit->sema_errors[0].expected, "Void");
}

TEST(TypeCheckerTest, BareReturnInValueFunction)
{
  auto unit = check_ok("func f() -> Int { return; }\nfunc g() { return; }\n");
  EXPECT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::MissingReturnValue});
}

TEST(TypeCheckerTest, ReturnWidensToDeclaredType)
{
  auto unit = check_ok("func f(x: Int) -> Double { return x; }");
  EXPECT_TRUE(unit->sema_errors.empty());
}

// ============================================================================
// Operators
// ============================================================================

TEST(TypeCheckerTest, StringConcatenationWithoutCoercion)
{
  auto unit = check_ok(
    "var ok = \"a\" + \"b\";\n"
    "var bad = \"a\" + 1;\n");
  EXPECT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::InvalidOperation});
  EXPECT_EQ(var_type(*unit, "ok"), "String");
}

TEST(TypeCheckerTest, ComparisonAndLogicalOperators)
{
  auto unit = check_ok(
    "var lt = 1 < 2.0;\n"
    "var both = lt && true;\n"
    "var cmp = 1 <=> 2;\n"
    "var bad = 1 && true;\n");
  EXPECT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::InvalidOperation});
  EXPECT_EQ(var_type(*unit, "lt"), "Bool");
  EXPECT_EQ(var_type(*unit, "both"), "Bool");
  EXPECT_EQ(var_type(*unit, "cmp"), "Int");
}

TEST(TypeCheckerTest, BitwiseNeedsIntegers)
{
  auto unit = check_ok("var ok = 6 & 3 | 1 << 2;\nvar bad = 1.5 & 2;\n");
  EXPECT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::InvalidOperation});
}

TEST(TypeCheckerTest, UnaryOperators)
{
  auto unit = check_ok(
    "var a = -1;\n"
    "var b = !true;\n"
    "var c = ~7;\n"
    "var d = !1;\n"
    "var e = -\"s\";\n");
  EXPECT_EQ(unit->sema_errors.size(), 2u);
  EXPECT_EQ(var_type(*unit, "a"), "Int");
  EXPECT_EQ(var_type(*unit, "b"), "Bool");
}

TEST(TypeCheckerTest, ErrorOperandsDoNotCascade)
{
  auto unit = check_ok("var a = missing + 1;\nvar b: Int = missing * 2;\n");
  ASSERT_EQ(unit->sema_errors.size(), 2u);
  for (const auto & err : unit->sema_errors) {
    EXPECT_EQ(err.kind, SymbolErrorKind::UndefinedSymbol);
  }
}

TEST(TypeCheckerTest, ConditionsMustBeBool)
{
  auto unit = check_ok(
    "func f(n: Int) {\n"
    "  if (n) { }\n"
    "  while (n > 0) { n = n - 1; }\n"
    "  for (var i = 0; i; i += 1) { }\n"
    "}\n");
  ASSERT_EQ(unit->sema_errors.size(), 2u);
  EXPECT_EQ(unit->sema_errors[0].kind, SymbolErrorKind::TypeMismatch);
  EXPECT_EQ(unit->sema_errors[0].expected, "Bool");
  EXPECT_EQ(unit->sema_errors[0].line, 2u);
  EXPECT_EQ(unit->sema_errors[1].line, 4u);
}

TEST(TypeCheckerTest, ConditionalExpressionUnifiesBranches)
{
  auto unit = check_ok("var a = true ? 1 : 2.5;\nvar b = 1 ? 1 : 2;\n");
  EXPECT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::TypeMismatch});
  EXPECT_EQ(var_type(*unit, "a"), "Double");
}

// ============================================================================
// Calls
// ============================================================================

TEST(TypeCheckerTest, ArgumentCountAndTypes)
{
  auto unit = check_ok(
    "func greet(name: String, times: Int = 1) { }\n"
    "greet(\"a\");\n"
    "greet(\"a\", 2);\n"
    "greet();\n"
    "greet(\"a\", 2, 3);\n"
    "greet(5);\n");
  EXPECT_EQ(
    kinds(*unit), (std::vector<SymbolErrorKind>{
                    SymbolErrorKind::ArgumentCountMismatch, SymbolErrorKind::ArgumentCountMismatch,
                    SymbolErrorKind::TypeMismatch}));
}

TEST(TypeCheckerTest, CallingANonFunction)
{
  auto unit = check_ok("var n = 3;\nn();\n");
  EXPECT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::NotCallable});
}

TEST(TypeCheckerTest, CallResultType)
{
  auto unit = check_ok(
    "func half(x: Double) -> Double { return x / 2; }\n"
    "var h = half(3);\n"
    "var bad: String = half(1);\n");
  EXPECT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::TypeMismatch});
  EXPECT_EQ(var_type(*unit, "h"), "Double");
}

TEST(TypeCheckerTest, ConstructionThroughInitializer)
{
  auto unit = check_ok(
    "class Point {\n"
    "  var x: Int = 0;\n"
    "  var y: Int = 0;\n"
    "  init(x: Int, y: Int) { this.x = x; this.y = y; }\n"
    "}\n"
    "var p = Point(1, 2);\n"
    "var q = Point(1);\n");
  EXPECT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::ArgumentCountMismatch});
  EXPECT_EQ(var_type(*unit, "p"), "Point");
}

TEST(TypeCheckerTest, StructMemberwiseConstruction)
{
  auto unit = check_ok(
    "struct Size { var w: Int; var h: Int; }\n"
    "var ok = Size(1, 2);\n"
    "var partial = Size(1);\n"
    "var wrong = Size(1, \"2\");\n");
  EXPECT_EQ(
    kinds(*unit), (std::vector<SymbolErrorKind>{
                    SymbolErrorKind::ArgumentCountMismatch, SymbolErrorKind::TypeMismatch}));
}

TEST(TypeCheckerTest, AbstractTypeCannotBeInstantiated)
{
  auto unit = check_ok("abstract class Shape { }\nvar s = Shape();\n");
  EXPECT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::InvalidOperation});
}

// ============================================================================
// Members
// ============================================================================

TEST(TypeCheckerTest, MemberLookupAlongSuperclassChain)
{
  auto unit = check_ok(
    "class Animal { var legs: Int = 4; func speak() -> String { return \"...\"; } }\n"
    "class Dog: Animal { }\n"
    "var d = Dog();\n"
    "var legs = d.legs;\n"
    "var sound = d.speak();\n"
    "var wings = d.wings;\n");
  EXPECT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::UnknownMember});
  EXPECT_EQ(var_type(*unit, "legs"), "Int");
  EXPECT_EQ(var_type(*unit, "sound"), "String");
}

TEST(TypeCheckerTest, MemberAssignmentTypes)
{
  auto unit = check_ok(
    "class Box { var value: Int = 0; }\n"
    "var b = Box();\n"
    "b.value = 3;\n"
    "b.value = \"three\";\n");
  EXPECT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::TypeMismatch});
}

TEST(TypeCheckerTest, PrivateMemberIsInaccessibleOutside)
{
  auto unit = check_ok(
    "class Vault { private var secret: Int = 1; func peek() -> Int { return secret; } }\n"
    "var v = Vault();\n"
    "var s = v.secret;\n"
    "var ok = v.peek();\n");
  EXPECT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::InaccessibleMember});
}

TEST(TypeCheckerTest, ConstantPropertyAssignableOnlyInInit)
{
  auto unit = check_ok(
    "class Id {\n"
    "  const value: Int = 0;\n"
    "  init(v: Int) { this.value = v; }\n"
    "  func reset() { this.value = 0; }\n"
    "}\n");
  ASSERT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::AssignToConstant});
  EXPECT_EQ(unit->sema_errors[0].line, 4u);
}

TEST(TypeCheckerTest, InterfaceTypedValues)
{
  auto unit = check_ok(
    "interface Shape { func area() -> Double; }\n"
    "struct Square: Shape { var side: Double = 2.0; func area() -> Double { return side * side; } }\n"
    "var s: Shape = Square();\n"
    "var a = s.area();\n"
    "var n: Square = s;\n");
  EXPECT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::TypeMismatch});
  EXPECT_EQ(var_type(*unit, "a"), "Double");
}

TEST(TypeCheckerTest, AbstractMethodThroughSuper)
{
  auto unit = check_ok(
    "abstract class Base { abstract func run() -> Int; func walk() -> Int { return 1; } }\n"
    "class Impl: Base {\n"
    "  override func run() -> Int { return super.walk() + super.run(); }\n"
    "}\n");
  EXPECT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::AbstractMethodCall});
}

TEST(TypeCheckerTest, EnumCasesAndRawValues)
{
  auto unit = check_ok(
    "enum Level: Int { Low = 1; High = \"x\"; }\n"
    "var l = Level.Low;\n");
  EXPECT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::TypeMismatch});
  EXPECT_EQ(var_type(*unit, "l"), "Level");
}

// ============================================================================
// Arrays and Indexing
// ============================================================================

TEST(TypeCheckerTest, IndexingArraysAndStrings)
{
  auto unit = check_ok(
    "var xs = [1, 2, 3];\n"
    "var first = xs[0];\n"
    "var ch = \"abc\"[1];\n"
    "var bad = xs[\"0\"];\n"
    "var n = 5;\n"
    "var worse = n[0];\n");
  EXPECT_EQ(unit->sema_errors.size(), 2u);
  EXPECT_EQ(var_type(*unit, "first"), "Int");
  EXPECT_EQ(var_type(*unit, "ch"), "Char");
}

TEST(TypeCheckerTest, ArrayLiteralUnification)
{
  auto unit = check_ok(
    "var mixed = [1, 2.5];\n"
    "var empty: String[] = [];\n"
    "var bad = [1, \"two\"];\n");
  EXPECT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::IncompatibleTypes});
  EXPECT_EQ(var_type(*unit, "mixed"), "Double[]");
  EXPECT_EQ(var_type(*unit, "empty"), "String[]");
}

TEST(TypeCheckerTest, ArrayBuiltins)
{
  auto unit = check_ok(
    "var xs: Int[] = [];\n"
    "xs.append(1);\n"
    "xs.append(\"s\");\n"
    "var n = xs.count;\n"
    "xs[0] = 2;\n"
    "\"abc\"[0] = 'x';\n");
  EXPECT_EQ(
    kinds(*unit), (std::vector<SymbolErrorKind>{
                    SymbolErrorKind::TypeMismatch, SymbolErrorKind::InvalidOperation}));
  EXPECT_EQ(var_type(*unit, "n"), "Int");
  EXPECT_TRUE(has_error_containing(*unit, "immutable"));
}

// ============================================================================
// Annotations
// ============================================================================

TEST(TypeCheckerTest, ExpressionsCarryResolvedTypes)
{
  auto unit = check_ok("var r = 1 + 2 * 3;");
  ASSERT_TRUE(unit->sema_errors.empty());
  const auto * var = cast<VarDecl>(unit->program->decls[0]);
  const auto * add = cast<BinaryExpr>(var->initializer);
  ASSERT_NE(add->resolvedType, nullptr);
  EXPECT_EQ(add->resolvedType->name, "Int");
  ASSERT_NE(add->rhs->resolvedType, nullptr);
  EXPECT_EQ(add->rhs->resolvedType->name, "Int");
}

TEST(TypeCheckerTest, GenericTypeParametersAreLenient)
{
  auto unit = check_ok(
    "class Box<T> { var item: T; init(item: T) { this.item = item; } func get() -> T { return item; } }\n"
    "var b: Box<String> = Box(\"s\");\n");
  EXPECT_TRUE(unit->sema_errors.empty());
}

// ============================================================================
// Negative Literals
// ============================================================================

TEST(TypeCheckerTest, NegativeLiteralsUseSignedRange)
{
  auto unit = check_ok(
    "var a: Int8 = -128;\n"
    "var b: Int = -2147483648;\n"
    "var c = -2147483648;\n"
    "var d = -2147483649;\n"
    "var e: Int16 = -(32768);\n");
  EXPECT_TRUE(unit->sema_errors.empty());
  EXPECT_EQ(var_type(*unit, "c"), "Int");
  EXPECT_EQ(var_type(*unit, "d"), "Int64");

  const auto * a = cast<VarDecl>(unit->program->decls[0]);
  ASSERT_NE(a->initializer->resolvedType, nullptr);
  EXPECT_EQ(a->initializer->resolvedType->name, "Int8");
}

TEST(TypeCheckerTest, NegativeLiteralsInFunctionBodies)
{
  auto unit = check_ok("func f() { var w: Int = -2147483648; var n: Int8 = -128; }");
  EXPECT_TRUE(unit->sema_errors.empty());
}

TEST(TypeCheckerTest, NegativeLiteralOutOfRange)
{
  auto unit = check_ok(
    "var y: UInt8 = -1;\n"
    "var z: UInt = -5;\n"
    "var b: Int8 = -129;\n");
  EXPECT_EQ(
    kinds(*unit), (std::vector<SymbolErrorKind>{
                    SymbolErrorKind::TypeMismatch, SymbolErrorKind::TypeMismatch,
                    SymbolErrorKind::TypeMismatch}));
}

TEST(TypeCheckerTest, NegatingUnsignedIsInvalid)
{
  auto unit = check_ok("var u: UInt8 = 1;\nvar v = -u;\n");
  EXPECT_EQ(kinds(*unit), std::vector<SymbolErrorKind>{SymbolErrorKind::InvalidOperation});
  EXPECT_TRUE(has_error_containing(*unit, "'UInt8'"));
}

TEST(TypeCheckerTest, NegatedLiteralMismatchReportedOnce)
{
  auto global = check_ok("var s: String = -5;");
  ASSERT_EQ(global->sema_errors.size(), 1u);
  EXPECT_EQ(global->sema_errors[0].kind, SymbolErrorKind::TypeMismatch);
  EXPECT_EQ(global->sema_errors[0].got, "Int");

  auto local = check_ok("func f() { var s: String = -5; }");
  ASSERT_EQ(local->sema_errors.size(), 1u);
  EXPECT_EQ(local->sema_errors[0].kind, SymbolErrorKind::TypeMismatch);
}
