// ouro/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "ouro/basic/diagnostic.hpp"
#include "ouro/basic/source_manager.hpp"

namespace ouro
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[S0004]: type mismatch: expected 'String', got 'Int'
 *     --> src/main.ouro:1:17
 *      |
 *    1 | var x: String = 42;
 *      |                 ^^ expected 'String'
 *      |
 *      = help: convert the value or change the annotation
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// Print one diagnostic; labels are resolved against `source`.
  void print(const Diagnostic & diag, const SourceFile & source);

  /// Print every diagnostic of a bag in source order.
  void print_all(const DiagnosticBag & diags, const SourceFile & source);

  /// One-line summary such as "2 errors generated".
  void print_summary(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label(const Label & label, const SourceFile & source);
  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view message);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace ouro
