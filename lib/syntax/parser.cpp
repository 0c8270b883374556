// ouro/syntax/parser.cpp - Recursive-descent parser implementation
#include "ouro/syntax/parser.hpp"

#include <optional>
#include <string>
#include <utility>

namespace ouro::syntax
{
namespace
{

[[nodiscard]] LineColumn loc(const Token & t) noexcept { return {t.line, t.column}; }

[[nodiscard]] std::string describe(const Token & t)
{
  if (t.is(TokenKind::Eof)) {
    return "end of input";
  }
  return "'" + std::string(t.lexeme) + "'";
}

[[nodiscard]] std::optional<Modifier> modifier_for(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::KwPublic:
      return Modifier::Public;
    case TokenKind::KwPrivate:
      return Modifier::Private;
    case TokenKind::KwProtected:
      return Modifier::Protected;
    case TokenKind::KwInternal:
      return Modifier::Internal;
    case TokenKind::KwStatic:
      return Modifier::Static;
    case TokenKind::KwFinal:
      return Modifier::Final;
    case TokenKind::KwAbstract:
      return Modifier::Abstract;
    case TokenKind::KwSealed:
      return Modifier::Sealed;
    case TokenKind::KwOverride:
      return Modifier::Override;
    default:
      return std::nullopt;
  }
}

[[nodiscard]] std::optional<AssignOp> assign_op_for(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eq:
      return AssignOp::Assign;
    case TokenKind::PlusEq:
      return AssignOp::Add;
    case TokenKind::MinusEq:
      return AssignOp::Sub;
    case TokenKind::StarEq:
      return AssignOp::Mul;
    case TokenKind::SlashEq:
      return AssignOp::Div;
    case TokenKind::PercentEq:
      return AssignOp::Mod;
    case TokenKind::StarStarEq:
      return AssignOp::Pow;
    case TokenKind::AmpEq:
      return AssignOp::BitAnd;
    case TokenKind::PipeEq:
      return AssignOp::BitOr;
    case TokenKind::CaretEq:
      return AssignOp::BitXor;
    case TokenKind::LtLtEq:
      return AssignOp::Shl;
    case TokenKind::GtGtEq:
      return AssignOp::Shr;
    case TokenKind::GtGtGtEq:
      return AssignOp::UShr;
    case TokenKind::QuestionQuestionEq:
      return AssignOp::Coalesce;
    default:
      return std::nullopt;
  }
}

[[nodiscard]] bool is_type_decl_keyword(TokenKind k) noexcept
{
  return k == TokenKind::KwClass || k == TokenKind::KwStruct || k == TokenKind::KwEnum ||
         k == TokenKind::KwInterface;
}

}  // namespace

// ============================================================================
// ParserError
// ============================================================================

std::string_view to_string(ParserErrorKind k) noexcept
{
  switch (k) {
    case ParserErrorKind::UnexpectedToken:
      return "unexpected token";
    case ParserErrorKind::ExpectedToken:
      return "expected token";
    case ParserErrorKind::InvalidAssignmentTarget:
      return "invalid assignment target";
    case ParserErrorKind::NestingTooDeep:
      return "nesting too deep";
  }
  return "parse error";
}

Diagnostic ParserError::to_diagnostic() const
{
  Diagnostic d;
  d.severity = Severity::Error;
  d.code = "P000" + std::to_string(static_cast<int>(kind) + 1);
  d.message = message;
  const std::string label =
    expected.empty() ? std::string(to_string(kind)) : "expected " + expected;
  d.labels.push_back(Label{range, label, LabelStyle::Primary});
  return d;
}

// ============================================================================
// Depth accounting
// ============================================================================

class Parser::DepthGuard
{
public:
  explicit DepthGuard(Parser & parser) : parser_(parser), ok_(parser.enter_nested()) {}
  ~DepthGuard() { parser_.leave_nested(); }

  DepthGuard(const DepthGuard &) = delete;
  DepthGuard & operator=(const DepthGuard &) = delete;

  explicit operator bool() const noexcept { return ok_; }

private:
  Parser & parser_;
  bool ok_;
};

bool Parser::enter_nested()
{
  ++depth_;
  if (too_deep_) {
    return false;
  }
  if (depth_ > k_max_nesting_depth) {
    error_at(
      cur(), ParserErrorKind::NestingTooDeep,
      "nesting exceeds the maximum depth of " + std::to_string(k_max_nesting_depth));
    too_deep_ = true;
    // Abandon the rest of the input; everything after this point would cascade.
    idx_ = tokens_.size() - 1;
    return false;
  }
  return true;
}

void Parser::leave_nested() noexcept { --depth_; }

// ============================================================================
// Token helpers
// ============================================================================

Parser::Parser(AstContext & ast, DiagnosticBag & diags, std::vector<Token> tokens)
: ast_(ast), diags_(diags), tokens_(std::move(tokens))
{
  if (tokens_.empty() || !tokens_.back().is(TokenKind::Eof)) {
    Token eof;
    eof.kind = TokenKind::Eof;
    if (!tokens_.empty()) {
      const Token & last = tokens_.back();
      eof.range = SourceRange(last.end(), last.end());
      eof.line = last.line;
      eof.column = last.column + static_cast<uint32_t>(last.lexeme.size());
    } else {
      eof.range = SourceRange(0, 0);
    }
    tokens_.push_back(eof);
  }
}

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

const Token & Parser::prev() const { return tokens_[idx_ > 0 ? idx_ - 1 : 0]; }

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what, RecoverySet recovery)
{
  if (match(k)) {
    return true;
  }

  const std::string message = "expected " + std::string(what) + ", found " + describe(cur());

  // A missing ';' at the end of a line is reported after the previous token.
  if (k == TokenKind::Semicolon && idx_ > 0 && cur().line > prev().line) {
    const Token & p = prev();
    report(
      ParserErrorKind::ExpectedToken, message, std::string(what),
      SourceRange(p.end(), p.end()), {p.line, p.column + static_cast<uint32_t>(p.lexeme.size())});
  } else {
    error_at(cur(), ParserErrorKind::ExpectedToken, message, std::string(what));
  }

  if (recovery == RecoverySet::None) {
    return false;
  }

  while (!at_eof()) {
    if (at(k)) {
      advance();
      return true;
    }

    const TokenKind kind = cur().kind;
    if (
      kind == TokenKind::Semicolon &&
      (recovery & RecoverySet::Statement || recovery & RecoverySet::Block ||
       recovery & RecoverySet::Argument)) {
      return false;
    }
    if (kind == TokenKind::RBrace) {
      return false;
    }
    if (kind == TokenKind::RParen && (recovery & RecoverySet::Argument)) {
      return false;
    }
    if (kind == TokenKind::LBrace && (recovery & RecoverySet::Argument)) {
      // Probably a missing ')' before a body.
      return false;
    }
    if ((recovery & RecoverySet::Statement || recovery & RecoverySet::Block) && at_decl_start()) {
      return false;
    }

    advance();
  }
  return false;
}

bool Parser::expect_name(std::string_view what)
{
  if (at_name()) {
    advance();
    return true;
  }
  error_at(
    cur(), ParserErrorKind::ExpectedToken,
    "expected " + std::string(what) + ", found " + describe(cur()), std::string(what));
  return false;
}

bool Parser::expect_closing_angle(std::string_view what)
{
  // `>>` and friends close several type argument lists at once; split off
  // one '>' and leave the remainder as the current token.
  Token & t = tokens_[idx_];
  const auto split = [&t](TokenKind rest) {
    t.kind = rest;
    t.lexeme.remove_prefix(1);
    t.range = SourceRange(t.begin() + 1, t.end());
    ++t.column;
  };

  switch (t.kind) {
    case TokenKind::Gt:
      advance();
      return true;
    case TokenKind::GtGt:
      split(TokenKind::Gt);
      return true;
    case TokenKind::GtGtGt:
      split(TokenKind::GtGt);
      return true;
    case TokenKind::Ge:
      split(TokenKind::Eq);
      return true;
    case TokenKind::GtGtEq:
      split(TokenKind::Ge);
      return true;
    case TokenKind::GtGtGtEq:
      split(TokenKind::GtGtEq);
      return true;
    default:
      return expect(TokenKind::Gt, what);
  }
}

void Parser::error_at(
  const Token & t, ParserErrorKind kind, std::string msg, std::string expected)
{
  report(kind, std::move(msg), std::move(expected), t.range, loc(t));
}

void Parser::report(
  ParserErrorKind kind, std::string msg, std::string expected, SourceRange range, LineColumn lc)
{
  if (too_deep_) {
    return;
  }
  // One error per position; recovery tends to trip over the same token twice.
  if (!errors_.empty() && errors_.back().range == range) {
    return;
  }

  ParserError err;
  err.kind = kind;
  err.message = std::move(msg);
  err.expected = std::move(expected);
  err.line = lc.line;
  err.column = lc.column;
  err.range = range;
  diags_.add(err.to_diagnostic());
  errors_.push_back(std::move(err));
}

void Parser::synchronize_to_stmt()
{
  while (!at_eof()) {
    if (match(TokenKind::Semicolon)) {
      return;
    }
    if (at(TokenKind::RBrace)) {
      return;
    }
    switch (cur().kind) {
      case TokenKind::KwIf:
      case TokenKind::KwWhile:
      case TokenKind::KwFor:
      case TokenKind::KwReturn:
      case TokenKind::KwBreak:
      case TokenKind::KwContinue:
        return;
      default:
        break;
    }
    if (at_decl_start()) {
      return;
    }
    advance();
  }
}

void Parser::synchronize_to_member()
{
  while (!at_eof()) {
    if (match(TokenKind::Semicolon)) {
      return;
    }
    if (at(TokenKind::RBrace)) {
      return;
    }
    if (at(TokenKind::LBrace)) {
      synchronize_skip_block();
      return;
    }
    if (at(TokenKind::KwInit) || at_decl_start()) {
      return;
    }
    advance();
  }
}

void Parser::synchronize_skip_block()
{
  int brace_depth = 0;

  while (!at_eof()) {
    if (at(TokenKind::LBrace)) {
      ++brace_depth;
      advance();
      continue;
    }

    if (at(TokenKind::RBrace)) {
      if (brace_depth > 0) {
        --brace_depth;
        advance();
        if (brace_depth == 0) {
          return;
        }
        continue;
      }
      // Unmatched '}' belongs to the enclosing construct.
      return;
    }

    if (brace_depth == 0 && match(TokenKind::Semicolon)) {
      return;
    }

    advance();
  }
}

bool Parser::at_modifier() const { return modifier_for(cur().kind).has_value(); }

bool Parser::at_decl_start() const
{
  switch (cur().kind) {
    case TokenKind::KwClass:
    case TokenKind::KwStruct:
    case TokenKind::KwEnum:
    case TokenKind::KwInterface:
    case TokenKind::KwFunc:
    case TokenKind::KwVar:
    case TokenKind::KwConst:
      return true;
    default:
      return at_modifier();
  }
}

bool Parser::at_contextual(std::string_view word) const
{
  return at(TokenKind::Identifier) && cur().lexeme == word;
}

bool Parser::at_name() const
{
  // `get` and `set` are only reserved inside property accessors.
  return at(TokenKind::Identifier) || at(TokenKind::KwGet) || at(TokenKind::KwSet);
}

bool Parser::at_member_name() const { return at(TokenKind::Identifier) || is_keyword(cur().kind); }

Modifiers Parser::parse_modifiers()
{
  Modifiers mods;
  while (const auto m = modifier_for(cur().kind)) {
    if (mods.has(*m)) {
      error_at(
        cur(), ParserErrorKind::UnexpectedToken,
        "duplicate modifier '" + std::string(cur().lexeme) + "'");
    }
    mods.add(*m);
    advance();
  }
  return mods;
}

template <typename T, typename... Args>
T * Parser::make(LineColumn lc, SourceRange range, Args &&... args)
{
  T * node = ast_.create<T>(std::forward<Args>(args)..., range);
  node->loc_ = lc;
  return node;
}

SourceRange Parser::span_from(const Token & first) const
{
  return join_ranges(first.range, prev().range);
}

// ============================================================================
// Program
// ============================================================================

Program * Parser::parse_program()
{
  std::vector<Decl *> decls;
  std::vector<Stmt *> statements;

  while (!at_eof()) {
    const size_t start = idx_;

    if (at_decl_start()) {
      if (Decl * d = parse_decl()) {
        decls.push_back(d);
      }
    } else if (at(TokenKind::RBrace)) {
      error_at(cur(), ParserErrorKind::UnexpectedToken, "unmatched '}' at top level");
      advance();
    } else if (Stmt * s = parse_stmt()) {
      statements.push_back(s);
    }

    if (idx_ == start) {
      advance();
    }
  }

  auto * prog = make<Program>(
    LineColumn{1, 1}, join_ranges(tokens_.front().range, tokens_.back().range));
  prog->decls = ast_.copy_to_arena(decls);
  prog->statements = ast_.copy_to_arena(statements);
  return prog;
}

// ============================================================================
// Declarations
// ============================================================================

Decl * Parser::parse_decl()
{
  const Token & first = cur();
  const Modifiers mods = parse_modifiers();

  switch (cur().kind) {
    case TokenKind::KwClass:
      return parse_class_decl(first, mods);
    case TokenKind::KwStruct:
      return parse_struct_decl(first, mods);
    case TokenKind::KwEnum:
      return parse_enum_decl(first, mods);
    case TokenKind::KwInterface:
      return parse_interface_decl(first, mods);
    case TokenKind::KwFunc:
      return parse_function_decl(first, mods, mods.has(Modifier::Abstract));
    case TokenKind::KwVar:
    case TokenKind::KwConst:
      return parse_var_decl(first, mods);
    default:
      error_at(
        cur(), ParserErrorKind::UnexpectedToken,
        "expected a declaration after modifiers, found " + describe(cur()));
      synchronize_to_stmt();
      return nullptr;
  }
}

VarDecl * Parser::parse_var_decl(const Token & first, Modifiers mods)
{
  const bool is_const = advance().is(TokenKind::KwConst);

  std::string_view name;
  if (expect_name(is_const ? "constant name" : "variable name")) {
    name = ast_.intern(prev().lexeme);
  }

  TypeNode * type = nullptr;
  Expr * init = nullptr;
  if (match(TokenKind::Colon)) {
    type = parse_type();
  }
  if (match(TokenKind::Eq)) {
    init = parse_expr();
  }

  if (!expect(TokenKind::Semicolon, "';' after variable declaration", RecoverySet::Statement)) {
    match(TokenKind::Semicolon);
  }

  auto * decl = make<VarDecl>(loc(first), span_from(first), name, type, init, is_const);
  decl->modifiers = mods;
  return decl;
}

FunctionDecl * Parser::parse_function_decl(
  const Token & first, Modifiers mods, bool signature_allowed)
{
  advance();  // func

  std::string_view name;
  if (expect_name("function name")) {
    name = ast_.intern(prev().lexeme);
  }

  const auto type_params = parse_type_params_opt();
  const auto params = parse_params();

  TypeNode * ret = nullptr;
  if (match(TokenKind::Arrow)) {
    ret = parse_type();
  }

  BlockStmt * body = nullptr;
  if (at(TokenKind::LBrace)) {
    body = parse_block();
  } else if (signature_allowed) {
    expect(TokenKind::Semicolon, "';' or a body after function signature", RecoverySet::Block);
  } else {
    error_at(
      cur(), ParserErrorKind::ExpectedToken,
      "expected '{' to begin the body of '" + std::string(name) + "', found " + describe(cur()),
      "'{'");
    synchronize_to_member();
  }

  auto * fn = make<FunctionDecl>(loc(first), span_from(first), name);
  fn->modifiers = mods;
  fn->typeParams = ast_.copy_to_arena(type_params);
  fn->params = params;
  fn->returnType = ret;
  fn->body = body;
  return fn;
}

FunctionDecl * Parser::parse_initializer(const Token & first, Modifiers mods)
{
  advance();  // init

  const auto params = parse_params();
  BlockStmt * body = nullptr;
  if (at(TokenKind::LBrace)) {
    body = parse_block();
  } else {
    error_at(
      cur(), ParserErrorKind::ExpectedToken,
      "expected '{' to begin initializer body, found " + describe(cur()), "'{'");
    synchronize_to_member();
  }

  auto * fn = make<FunctionDecl>(loc(first), span_from(first), ast_.intern("init"));
  fn->modifiers = mods;
  fn->params = params;
  fn->body = body;
  fn->isInitializer = true;
  return fn;
}

std::vector<std::string_view> Parser::parse_type_params_opt()
{
  std::vector<std::string_view> names;
  if (!match(TokenKind::Lt)) {
    return names;
  }
  do {
    if (expect_name("type parameter name")) {
      names.push_back(ast_.intern(prev().lexeme));
    }
  } while (match(TokenKind::Comma));
  expect_closing_angle("'>' after type parameters");
  return names;
}

std::vector<NamedType *> Parser::parse_inherited_names()
{
  std::vector<NamedType *> names;
  do {
    names.push_back(parse_named_type());
  } while (match(TokenKind::Comma));
  return names;
}

gsl::span<ParamDecl *> Parser::parse_params()
{
  std::vector<ParamDecl *> params;
  if (!expect(TokenKind::LParen, "'(' before parameter list")) {
    return {};
  }
  while (!at(TokenKind::RParen) && !at_eof()) {
    params.push_back(parse_param());
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  expect(TokenKind::RParen, "')' after parameters", RecoverySet::Argument);
  return ast_.copy_to_arena(params);
}

ParamDecl * Parser::parse_param()
{
  const Token & first = cur();
  std::string_view name;
  if (expect_name("parameter name")) {
    name = ast_.intern(prev().lexeme);
  }

  TypeNode * type = nullptr;
  if (expect(TokenKind::Colon, "':' after parameter name")) {
    type = parse_type();
  }

  Expr * def = nullptr;
  if (match(TokenKind::Eq)) {
    def = parse_expr();
  }
  return make<ParamDecl>(loc(first), span_from(first), name, type, def);
}

void Parser::parse_member(MemberLists & out, bool in_interface)
{
  const size_t start = idx_;
  const Token & first = cur();
  const Modifiers mods = parse_modifiers();

  switch (cur().kind) {
    case TokenKind::KwVar:
    case TokenKind::KwConst:
      out.properties.push_back(parse_var_decl(first, mods));
      break;
    case TokenKind::KwFunc:
      out.methods.push_back(
        parse_function_decl(first, mods, in_interface || mods.has(Modifier::Abstract)));
      break;
    case TokenKind::KwInit:
      out.methods.push_back(parse_initializer(first, mods));
      break;
    default:
      if (is_type_decl_keyword(cur().kind)) {
        error_at(
          cur(), ParserErrorKind::UnexpectedToken, "nested type declarations are not supported");
      } else {
        error_at(
          cur(), ParserErrorKind::UnexpectedToken,
          "expected a property, method or initializer, found " + describe(cur()));
      }
      synchronize_to_member();
      break;
  }

  if (idx_ == start && !at(TokenKind::RBrace)) {
    advance();
  }
}

void Parser::finish_type_body(TypeDecl * decl, MemberLists & members)
{
  decl->properties = ast_.copy_to_arena(members.properties);
  decl->methods = ast_.copy_to_arena(members.methods);
}

ClassDecl * Parser::parse_class_decl(const Token & first, Modifiers mods)
{
  advance();  // class

  std::string_view name;
  if (expect_name("class name")) {
    name = ast_.intern(prev().lexeme);
  }
  const auto type_params = parse_type_params_opt();

  std::vector<NamedType *> inherited;
  if (match(TokenKind::Colon)) {
    inherited = parse_inherited_names();
  }

  std::vector<NamedType *> permits;
  if (mods.has(Modifier::Sealed) && at_contextual("permits")) {
    advance();
    permits = parse_inherited_names();
  }

  MemberLists members;
  if (expect(TokenKind::LBrace, "'{' to begin class body")) {
    while (!at(TokenKind::RBrace) && !at_eof()) {
      parse_member(members, /*in_interface=*/false);
    }
    expect(TokenKind::RBrace, "'}' to close class body");
  } else {
    synchronize_skip_block();
  }

  auto * decl = make<ClassDecl>(loc(first), span_from(first), name);
  decl->modifiers = mods;
  decl->typeParams = ast_.copy_to_arena(type_params);
  if (!inherited.empty()) {
    decl->superclass = inherited.front();
    inherited.erase(inherited.begin());
  }
  decl->interfaces = ast_.copy_to_arena(inherited);
  decl->permits = ast_.copy_to_arena(permits);
  finish_type_body(decl, members);
  return decl;
}

StructDecl * Parser::parse_struct_decl(const Token & first, Modifiers mods)
{
  advance();  // struct

  std::string_view name;
  if (expect_name("struct name")) {
    name = ast_.intern(prev().lexeme);
  }
  const auto type_params = parse_type_params_opt();

  std::vector<NamedType *> interfaces;
  if (match(TokenKind::Colon)) {
    interfaces = parse_inherited_names();
  }

  MemberLists members;
  if (expect(TokenKind::LBrace, "'{' to begin struct body")) {
    while (!at(TokenKind::RBrace) && !at_eof()) {
      parse_member(members, /*in_interface=*/false);
    }
    expect(TokenKind::RBrace, "'}' to close struct body");
  } else {
    synchronize_skip_block();
  }

  auto * decl = make<StructDecl>(loc(first), span_from(first), name);
  decl->modifiers = mods;
  decl->typeParams = ast_.copy_to_arena(type_params);
  decl->interfaces = ast_.copy_to_arena(interfaces);
  finish_type_body(decl, members);
  return decl;
}

EnumDecl * Parser::parse_enum_decl(const Token & first, Modifiers mods)
{
  advance();  // enum

  std::string_view name;
  if (expect_name("enum name")) {
    name = ast_.intern(prev().lexeme);
  }

  TypeNode * raw_type = nullptr;
  if (match(TokenKind::Colon)) {
    raw_type = parse_type();
  }

  std::vector<EnumCaseDecl *> cases;
  MemberLists members;
  if (expect(TokenKind::LBrace, "'{' to begin enum body")) {
    while (!at(TokenKind::RBrace) && !at_eof()) {
      match(TokenKind::KwCase);
      if (!at(TokenKind::Identifier)) {
        parse_member(members, /*in_interface=*/false);
        continue;
      }

      const Token & case_tok = advance();
      Expr * raw_value = nullptr;
      if (match(TokenKind::Eq)) {
        raw_value = parse_expr();
      }
      cases.push_back(make<EnumCaseDecl>(
        loc(case_tok), span_from(case_tok), ast_.intern(case_tok.lexeme), raw_value));

      if (!match(TokenKind::Semicolon) && !match(TokenKind::Comma) && !at(TokenKind::RBrace)) {
        error_at(
          cur(), ParserErrorKind::ExpectedToken,
          "expected ';' or ',' after enum case, found " + describe(cur()), "';' or ','");
        synchronize_to_member();
      }
    }
    expect(TokenKind::RBrace, "'}' to close enum body");
  } else {
    synchronize_skip_block();
  }

  auto * decl = make<EnumDecl>(loc(first), span_from(first), name);
  decl->modifiers = mods;
  decl->rawType = raw_type;
  decl->cases = ast_.copy_to_arena(cases);
  finish_type_body(decl, members);
  return decl;
}

InterfaceDecl * Parser::parse_interface_decl(const Token & first, Modifiers mods)
{
  advance();  // interface

  std::string_view name;
  if (expect_name("interface name")) {
    name = ast_.intern(prev().lexeme);
  }
  const auto type_params = parse_type_params_opt();

  std::vector<NamedType *> parents;
  if (match(TokenKind::Colon)) {
    parents = parse_inherited_names();
  }

  MemberLists members;
  if (expect(TokenKind::LBrace, "'{' to begin interface body")) {
    while (!at(TokenKind::RBrace) && !at_eof()) {
      parse_member(members, /*in_interface=*/true);
    }
    expect(TokenKind::RBrace, "'}' to close interface body");
  } else {
    synchronize_skip_block();
  }

  auto * decl = make<InterfaceDecl>(loc(first), span_from(first), name);
  decl->modifiers = mods;
  decl->typeParams = ast_.copy_to_arena(type_params);
  decl->parents = ast_.copy_to_arena(parents);
  finish_type_body(decl, members);
  return decl;
}

// ============================================================================
// Statements
// ============================================================================

Stmt * Parser::parse_stmt()
{
  DepthGuard guard(*this);
  if (!guard) {
    return nullptr;
  }

  const Token & first = cur();
  switch (first.kind) {
    case TokenKind::LBrace:
      return parse_block();
    case TokenKind::KwIf:
      return parse_if_stmt();
    case TokenKind::KwWhile:
      return parse_while_stmt();
    case TokenKind::KwFor:
      return parse_for_stmt();
    case TokenKind::KwReturn:
      return parse_return_stmt();
    case TokenKind::KwBreak:
      advance();
      expect(TokenKind::Semicolon, "';' after 'break'", RecoverySet::Statement);
      return make<BreakStmt>(loc(first), span_from(first));
    case TokenKind::KwContinue:
      advance();
      expect(TokenKind::Semicolon, "';' after 'continue'", RecoverySet::Statement);
      return make<ContinueStmt>(loc(first), span_from(first));
    case TokenKind::KwVar:
    case TokenKind::KwConst:
      return parse_local_var();
    case TokenKind::Semicolon:
      // Empty statement.
      advance();
      return make<BlockStmt>(loc(first), first.range, gsl::span<Stmt *>{});
    default:
      break;
  }

  if (at_decl_start() || is_type_decl_keyword(first.kind)) {
    error_at(
      first, ParserErrorKind::UnexpectedToken,
      "declarations of this kind are only allowed at top level, found " + describe(first));
    synchronize_skip_block();
    return nullptr;
  }

  return parse_expression_stmt();
}

BlockStmt * Parser::parse_block()
{
  const Token & lb = cur();
  std::vector<Stmt *> statements;

  if (expect(TokenKind::LBrace, "'{' to begin block")) {
    while (!at(TokenKind::RBrace) && !at_eof()) {
      const size_t start = idx_;
      if (Stmt * s = parse_stmt()) {
        statements.push_back(s);
      }
      if (idx_ == start) {
        advance();
      }
    }
    expect(TokenKind::RBrace, "'}' to close block");
  }

  return make<BlockStmt>(loc(lb), span_from(lb), ast_.copy_to_arena(statements));
}

Stmt * Parser::parse_body_stmt()
{
  if (Stmt * s = parse_stmt()) {
    return s;
  }
  return make<BlockStmt>(loc(cur()), cur().range, gsl::span<Stmt *>{});
}

Stmt * Parser::parse_if_stmt()
{
  const Token & kw = advance();
  expect(TokenKind::LParen, "'(' after 'if'");
  Expr * cond = parse_expr();
  expect(TokenKind::RParen, "')' after if condition", RecoverySet::Argument);

  Stmt * then_branch = parse_body_stmt();
  Stmt * else_branch = nullptr;
  if (match(TokenKind::KwElse)) {
    else_branch = parse_body_stmt();
  }
  return make<IfStmt>(loc(kw), span_from(kw), cond, then_branch, else_branch);
}

Stmt * Parser::parse_while_stmt()
{
  const Token & kw = advance();
  expect(TokenKind::LParen, "'(' after 'while'");
  Expr * cond = parse_expr();
  expect(TokenKind::RParen, "')' after while condition", RecoverySet::Argument);

  Stmt * body = parse_body_stmt();
  return make<WhileStmt>(loc(kw), span_from(kw), cond, body);
}

Stmt * Parser::parse_for_stmt()
{
  const Token & kw = advance();
  expect(TokenKind::LParen, "'(' after 'for'");

  Stmt * init = nullptr;
  if (match(TokenKind::Semicolon)) {
    // no initializer
  } else if (at(TokenKind::KwVar) || at(TokenKind::KwConst)) {
    init = parse_local_var();
  } else {
    const Token & init_tok = cur();
    Expr * e = parse_expr();
    expect(TokenKind::Semicolon, "';' after for initializer");
    init = make<ExpressionStmt>(loc(init_tok), span_from(init_tok), e);
  }

  Expr * cond = nullptr;
  if (!at(TokenKind::Semicolon)) {
    cond = parse_expr();
  }
  expect(TokenKind::Semicolon, "';' after for condition");

  Expr * incr = nullptr;
  if (!at(TokenKind::RParen)) {
    incr = parse_expr();
  }
  expect(TokenKind::RParen, "')' after for clauses", RecoverySet::Argument);

  Stmt * body = parse_body_stmt();

  auto * stmt = make<ForStmt>(loc(kw), span_from(kw));
  stmt->init = init;
  stmt->condition = cond;
  stmt->increment = incr;
  stmt->body = body;
  return stmt;
}

Stmt * Parser::parse_return_stmt()
{
  const Token & kw = advance();
  Expr * value = nullptr;
  if (!at(TokenKind::Semicolon) && !at(TokenKind::RBrace) && !at_eof()) {
    value = parse_expr();
  }
  expect(TokenKind::Semicolon, "';' after return", RecoverySet::Statement);
  return make<ReturnStmt>(loc(kw), span_from(kw), value);
}

Stmt * Parser::parse_expression_stmt()
{
  const Token & first = cur();
  const size_t error_mark = errors_.size();
  Expr * e = parse_expr();

  if (errors_.size() != error_mark) {
    synchronize_to_stmt();
    return nullptr;
  }
  if (!expect(TokenKind::Semicolon, "';' after expression", RecoverySet::Statement)) {
    match(TokenKind::Semicolon);
  }
  return make<ExpressionStmt>(loc(first), span_from(first), e);
}

VarDeclStmt * Parser::parse_local_var()
{
  const Token & first = cur();
  VarDecl * decl = parse_var_decl(first, Modifiers{});
  return make<VarDeclStmt>(loc(first), span_from(first), decl);
}

// ============================================================================
// Types
// ============================================================================

TypeNode * Parser::parse_type()
{
  const Token & first = cur();
  DepthGuard guard(*this);
  if (!guard) {
    return make<NamedType>(loc(first), first.range, std::string_view{});
  }

  TypeNode * type = nullptr;

  if (match(TokenKind::KwVoid)) {
    type = make<NamedType>(loc(first), first.range, ast_.intern(first.lexeme));
  } else {
    NamedType * named = parse_named_type();
    type = named;
    if (match(TokenKind::Lt)) {
      std::vector<TypeNode *> args;
      do {
        args.push_back(parse_type());
      } while (match(TokenKind::Comma));
      expect_closing_angle("'>' after type arguments");
      type = make<GenericType>(loc(first), span_from(first), named->name, ast_.copy_to_arena(args));
    }
  }

  while (at(TokenKind::LBracket) && cur(1).is(TokenKind::RBracket)) {
    advance();
    advance();
    type = make<ArrayType>(loc(first), span_from(first), type);
  }
  return type;
}

NamedType * Parser::parse_named_type()
{
  const Token & t = cur();
  if (expect_name("type name")) {
    return make<NamedType>(loc(t), t.range, ast_.intern(t.lexeme));
  }
  return make<NamedType>(loc(t), t.range, std::string_view{});
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Parser::parse_expr() { return parse_nested(&Parser::parse_assignment); }

Expr * Parser::parse_nested(Expr * (Parser::*level)())
{
  DepthGuard guard(*this);
  if (!guard) {
    return make_missing_expr_at(cur());
  }
  return (this->*level)();
}

Expr * Parser::parse_assignment()
{
  Expr * target = parse_conditional();

  const auto op = assign_op_for(cur().kind);
  if (!op) {
    return target;
  }
  const Token & op_tok = advance();
  Expr * value = parse_nested(&Parser::parse_assignment);
  const SourceRange range = join_ranges(target->get_range(), value->get_range());
  const LineColumn lc = target->loc_;

  if (auto * var = dyn_cast<VariableExpr>(target)) {
    Expr * rhs = value;
    if (*op != AssignOp::Assign) {
      // a op= b  ->  a = a op b
      rhs = make<BinaryExpr>(lc, range, var, compound_binary_op(*op), value);
    }
    return make<AssignExpr>(lc, range, var->name, rhs);
  }
  if (auto * get = dyn_cast<GetExpr>(target)) {
    return make<SetExpr>(lc, range, get->object, get->name, *op, value);
  }
  if (auto * index = dyn_cast<IndexExpr>(target)) {
    return make<IndexSetExpr>(lc, range, index->base, index->index, *op, value);
  }

  if (!isa<MissingExpr>(target)) {
    report(
      ParserErrorKind::InvalidAssignmentTarget,
      "invalid assignment target before '" + std::string(op_tok.lexeme) + "'", "",
      target->get_range(), lc);
  }
  return value;
}

Expr * Parser::parse_conditional()
{
  Expr * cond = parse_coalesce();
  if (!match(TokenKind::Question)) {
    return cond;
  }
  Expr * then_expr = parse_nested(&Parser::parse_assignment);
  expect(TokenKind::Colon, "':' in conditional expression");
  Expr * else_expr = parse_nested(&Parser::parse_conditional);
  return make<ConditionalExpr>(
    cond->loc_, join_ranges(cond->get_range(), else_expr->get_range()), cond, then_expr,
    else_expr);
}

Expr * Parser::parse_coalesce()
{
  Expr * lhs = parse_or();
  if (match(TokenKind::QuestionQuestion)) {
    Expr * rhs = parse_nested(&Parser::parse_coalesce);
    return make_binary(lhs, BinaryOp::Coalesce, rhs);
  }
  return lhs;
}

Expr * Parser::parse_or()
{
  Expr * lhs = parse_and();
  while (match(TokenKind::OrOr)) {
    lhs = make_binary(lhs, BinaryOp::Or, parse_and());
  }
  return lhs;
}

Expr * Parser::parse_and()
{
  Expr * lhs = parse_bitor();
  while (match(TokenKind::AndAnd)) {
    lhs = make_binary(lhs, BinaryOp::And, parse_bitor());
  }
  return lhs;
}

Expr * Parser::parse_bitor()
{
  Expr * lhs = parse_bitxor();
  while (match(TokenKind::Pipe)) {
    lhs = make_binary(lhs, BinaryOp::BitOr, parse_bitxor());
  }
  return lhs;
}

Expr * Parser::parse_bitxor()
{
  Expr * lhs = parse_bitand();
  while (match(TokenKind::Caret)) {
    lhs = make_binary(lhs, BinaryOp::BitXor, parse_bitand());
  }
  return lhs;
}

Expr * Parser::parse_bitand()
{
  Expr * lhs = parse_equality();
  while (match(TokenKind::Amp)) {
    lhs = make_binary(lhs, BinaryOp::BitAnd, parse_equality());
  }
  return lhs;
}

Expr * Parser::parse_equality()
{
  Expr * lhs = parse_comparison();
  while (true) {
    BinaryOp op = BinaryOp::Eq;
    if (match(TokenKind::EqEq)) {
      op = BinaryOp::Eq;
    } else if (match(TokenKind::Ne)) {
      op = BinaryOp::Ne;
    } else if (match(TokenKind::Spaceship)) {
      op = BinaryOp::Cmp;
    } else {
      break;
    }
    lhs = make_binary(lhs, op, parse_comparison());
  }
  return lhs;
}

Expr * Parser::parse_comparison()
{
  Expr * lhs = parse_shift();
  while (true) {
    BinaryOp op = BinaryOp::Lt;
    switch (cur().kind) {
      case TokenKind::Lt:
        op = BinaryOp::Lt;
        break;
      case TokenKind::Le:
        op = BinaryOp::Le;
        break;
      case TokenKind::Gt:
        op = BinaryOp::Gt;
        break;
      case TokenKind::Ge:
        op = BinaryOp::Ge;
        break;
      default:
        return lhs;
    }
    advance();
    lhs = make_binary(lhs, op, parse_shift());
  }
}

Expr * Parser::parse_shift()
{
  Expr * lhs = parse_add();
  while (true) {
    BinaryOp op = BinaryOp::Shl;
    if (match(TokenKind::LtLt)) {
      op = BinaryOp::Shl;
    } else if (match(TokenKind::GtGt)) {
      op = BinaryOp::Shr;
    } else if (match(TokenKind::GtGtGt)) {
      op = BinaryOp::UShr;
    } else {
      break;
    }
    lhs = make_binary(lhs, op, parse_add());
  }
  return lhs;
}

Expr * Parser::parse_add()
{
  Expr * lhs = parse_mul();
  while (at(TokenKind::Plus) || at(TokenKind::Minus)) {
    const BinaryOp op = advance().is(TokenKind::Plus) ? BinaryOp::Add : BinaryOp::Sub;
    lhs = make_binary(lhs, op, parse_mul());
  }
  return lhs;
}

Expr * Parser::parse_mul()
{
  Expr * lhs = parse_power();
  while (true) {
    BinaryOp op = BinaryOp::Mul;
    if (match(TokenKind::Star)) {
      op = BinaryOp::Mul;
    } else if (match(TokenKind::Slash)) {
      op = BinaryOp::Div;
    } else if (match(TokenKind::Percent)) {
      op = BinaryOp::Mod;
    } else {
      break;
    }
    lhs = make_binary(lhs, op, parse_power());
  }
  return lhs;
}

Expr * Parser::parse_power()
{
  Expr * base = parse_unary();
  if (match(TokenKind::StarStar)) {
    // Right-associative: 2 ** 3 ** 2 == 2 ** (3 ** 2)
    Expr * exponent = parse_nested(&Parser::parse_power);
    return make_binary(base, BinaryOp::Pow, exponent);
  }
  return base;
}

Expr * Parser::parse_unary()
{
  UnaryOp op = UnaryOp::Not;
  switch (cur().kind) {
    case TokenKind::Bang:
      op = UnaryOp::Not;
      break;
    case TokenKind::Minus:
      op = UnaryOp::Neg;
      break;
    case TokenKind::Plus:
      op = UnaryOp::Plus;
      break;
    case TokenKind::Tilde:
      op = UnaryOp::BitNot;
      break;
    default:
      return parse_postfix();
  }

  const Token & op_tok = advance();
  Expr * operand = parse_nested(&Parser::parse_unary);
  return make<UnaryExpr>(
    loc(op_tok), join_ranges(op_tok.range, operand->get_range()), op, operand);
}

Expr * Parser::parse_postfix()
{
  Expr * e = parse_primary();

  while (true) {
    if (at(TokenKind::LParen)) {
      const auto args = parse_call_args();
      e = make<CallExpr>(e->loc_, join_ranges(e->get_range(), prev().range), e, args);
    } else if (match(TokenKind::Dot)) {
      if (!at_member_name()) {
        error_at(
          cur(), ParserErrorKind::ExpectedToken,
          "expected member name after '.', found " + describe(cur()), "member name");
        return e;
      }
      const Token & name_tok = advance();
      e = make<GetExpr>(
        e->loc_, join_ranges(e->get_range(), name_tok.range), e, ast_.intern(name_tok.lexeme));
    } else if (match(TokenKind::LBracket)) {
      Expr * index = parse_expr();
      expect(TokenKind::RBracket, "']' after index expression");
      e = make<IndexExpr>(e->loc_, join_ranges(e->get_range(), prev().range), e, index);
    } else {
      return e;
    }
  }
}

gsl::span<Expr *> Parser::parse_call_args()
{
  advance();  // (
  std::vector<Expr *> args;
  while (!at(TokenKind::RParen) && !at_eof()) {
    args.push_back(parse_expr());
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  expect(TokenKind::RParen, "')' after arguments", RecoverySet::Argument);
  return ast_.copy_to_arena(args);
}

Expr * Parser::parse_primary()
{
  const Token & t = cur();

  switch (t.kind) {
    case TokenKind::IntLiteral: {
      advance();
      auto * lit = make<LiteralExpr>(loc(t), t.range);
      lit->literalKind = LiteralKind::Int;
      lit->intValue = t.int_value();
      return lit;
    }
    case TokenKind::FloatLiteral: {
      advance();
      auto * lit = make<LiteralExpr>(loc(t), t.range);
      lit->literalKind = LiteralKind::Float;
      lit->floatValue = t.float_value();
      return lit;
    }
    case TokenKind::StringLiteral: {
      advance();
      auto * lit = make<LiteralExpr>(loc(t), t.range);
      lit->literalKind = LiteralKind::String;
      lit->stringValue = ast_.intern(t.string_value());
      return lit;
    }
    case TokenKind::CharLiteral: {
      advance();
      auto * lit = make<LiteralExpr>(loc(t), t.range);
      lit->literalKind = LiteralKind::Char;
      lit->charValue = t.char_value();
      return lit;
    }
    case TokenKind::KwTrue:
    case TokenKind::KwFalse: {
      advance();
      auto * lit = make<LiteralExpr>(loc(t), t.range);
      lit->literalKind = LiteralKind::Bool;
      lit->boolValue = t.is(TokenKind::KwTrue);
      return lit;
    }
    case TokenKind::KwNull: {
      advance();
      auto * lit = make<LiteralExpr>(loc(t), t.range);
      lit->literalKind = LiteralKind::Null;
      return lit;
    }
    case TokenKind::KwThis:
      advance();
      return make<ThisExpr>(loc(t), t.range);
    case TokenKind::KwSuper: {
      advance();
      std::string_view method;
      if (expect(TokenKind::Dot, "'.' after 'super'")) {
        if (at_member_name()) {
          method = ast_.intern(advance().lexeme);
        } else {
          error_at(
            cur(), ParserErrorKind::ExpectedToken,
            "expected superclass member name, found " + describe(cur()), "member name");
        }
      }
      return make<SuperExpr>(loc(t), span_from(t), method);
    }
    case TokenKind::LParen: {
      advance();
      Expr * inner = parse_expr();
      expect(TokenKind::RParen, "')' after expression");
      return make<GroupingExpr>(loc(t), span_from(t), inner);
    }
    case TokenKind::LBracket: {
      advance();
      std::vector<Expr *> elems;
      while (!at(TokenKind::RBracket) && !at_eof()) {
        elems.push_back(parse_expr());
        if (!match(TokenKind::Comma)) {
          break;
        }
      }
      expect(TokenKind::RBracket, "']' after array elements");
      return make<ArrayLiteralExpr>(loc(t), span_from(t), ast_.copy_to_arena(elems));
    }
    default:
      break;
  }

  if (at_name()) {
    advance();
    return make<VariableExpr>(loc(t), t.range, ast_.intern(t.lexeme));
  }

  error_at(t, ParserErrorKind::UnexpectedToken, "expected expression, found " + describe(t));
  return make_missing_expr_at(t);
}

Expr * Parser::make_binary(Expr * lhs, BinaryOp op, Expr * rhs)
{
  return make<BinaryExpr>(
    lhs->loc_, join_ranges(lhs->get_range(), rhs->get_range()), lhs, op, rhs);
}

Expr * Parser::make_missing_expr_at(const Token & t) { return make<MissingExpr>(loc(t), t.range); }

// ============================================================================
// Entry point
// ============================================================================

Result<Program *, ParserError> parse(AstContext & ast, std::vector<Token> tokens)
{
  DiagnosticBag diags;
  Parser parser(ast, diags, std::move(tokens));
  Program * program = parser.parse_program();
  if (parser.has_errors()) {
    return parser.errors().front();
  }
  return program;
}

}  // namespace ouro::syntax
