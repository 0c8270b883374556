// ouro/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "ouro/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace ouro
{

namespace
{

std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += "    ";
    } else if (c != '\r' && c != '\n') {
      out += c;
    }
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceFile & source)
{
  print_severity_header(diag);

  const FullSourceRange fr = source.get_full_range(diag.primary_range());
  if (fr.is_valid()) {
    fmt::print(
      os_, "{} {}:{}:{}\n", gutter_arrow(), source.display_name(), fr.start_line,
      fr.start_column);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), source.display_name());
  }
  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label(label, source);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceFile & source)
{
  std::vector<const Diagnostic *> sorted;
  sorted.reserve(diags.size());
  for (const auto & d : diags) {
    sorted.push_back(&d);
  }
  std::stable_sort(sorted.begin(), sorted.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->primary_range().get_begin() < b->primary_range().get_begin();
  });

  for (const auto * d : sorted) {
    print(*d, source);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  const size_t errors = diags.error_count();
  if (errors == 0) {
    return;
  }
  if (use_color_) {
    os_ << rang::style::bold << rang::fg::red;
  }
  fmt::print(os_, "{} error{} generated\n", errors, errors == 1 ? "" : "s");
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string head =
    diag.code.empty() ? std::string(to_string(diag.severity))
                      : fmt::format("{}[{}]", to_string(diag.severity), diag.code);

  if (!use_color_) {
    fmt::print(os_, "{}: {}\n", head, diag.message);
    return;
  }

  os_ << rang::style::bold;
  switch (diag.severity) {
    case Severity::Error:
      os_ << rang::fg::red;
      break;
    case Severity::Warning:
      os_ << rang::fg::yellow;
      break;
    case Severity::Note:
      os_ << rang::fg::cyan;
      break;
  }
  os_ << head << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_label(const Label & label, const SourceFile & source)
{
  const FullSourceRange fr = source.get_full_range(label.range);
  if (!fr.is_valid()) {
    if (!label.message.empty()) {
      print_note(label.message);
    }
    return;
  }

  // Multi-line ranges are marked on their first line only.
  const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                             ? fr.end_column
                             : fr.start_column + 1;

  print_source_line(source, fr.start_line - 1, fr.start_column, end_col, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view message)
{
  const std::string_view line = source.get_line(line_index);

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_index + 1);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_index + 1);
  }
  fmt::print(os_, "{}\n", expand_tabs(line));

  // Marker offset honours tab expansion of the printed line.
  std::string prefix;
  for (size_t i = 0; i + 1 < start_col && i < line.size(); ++i) {
    prefix += (line[i] == '\t') ? "    " : " ";
  }
  const std::string markers(std::max<uint32_t>(end_col - start_col, 1U),
                            style == LabelStyle::Primary ? '^' : '-');

  fmt::print(os_, "      | {}", prefix);
  if (use_color_) {
    os_ << (style == LabelStyle::Primary ? rang::fg::red : rang::fg::cyan) << rang::style::bold;
  }
  fmt::print(os_, "{}", markers);
  if (!message.empty()) {
    fmt::print(os_, " {}", message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());
  fmt::print(os_, "      = help: {}\n", message);
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());
  fmt::print(os_, "      = note: {}\n", message);
}

std::string DiagnosticPrinter::gutter_arrow() const
{
  return use_color_ ? "\033[1;36m   -->\033[0m" : "   -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  return use_color_ ? "\033[1;36m      |\033[0m" : "      |";
}

}  // namespace ouro
