// spawn_dsl/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "spawn_dsl/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace spawn_dsl
{

namespace
{

std::string_view severity_name(Severity s)
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

rang::fg severity_color(Severity s)
{
  switch (s) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
    case Severity::Info:
      return rang::fg::cyan;
    case Severity::Hint:
      return rang::fg::green;
  }
  return rang::fg::red;
}

/// Expands tabs to 4 spaces and strips line terminators.
std::string clean_line(std::string_view line)
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
  const FullSourceRange primary = source.get_full_range(diag.primary_range());

  print_severity_header(diag);

  if (primary.is_valid()) {
    fmt::print(
      os_, "{} {}:{}:{}\n", gutter_arrow(), source.display_name(), primary.start_line,
      primary.start_column);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), source.display_name());
  }
  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label_context(label, source);
  }

  if (diag.help_message) {
    print_trailer("help", *diag.help_message);
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

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view sev = severity_name(diag.severity);
  const std::string code = diag.code.empty() ? std::string() : fmt::format("[{}]", diag.code);

  if (use_color_) {
    os_ << rang::style::bold << severity_color(diag.severity) << sev << code << rang::fg::reset
        << ": " << diag.message << rang::style::reset << "\n";
    return;
  }
  fmt::print(os_, "{}{}: {}\n", sev, code, diag.message);
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceFile & source)
{
  const FullSourceRange fr = source.get_full_range(label.range);
  if (!fr.is_valid()) {
    if (!label.message.empty()) {
      print_trailer("note", label.message);
    }
    return;
  }

  // Multi-line ranges are underlined on their first line only.
  const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                             ? fr.end_column
                             : fr.start_column + 1;

  print_source_line(source, fr.start_line - 1, fr.start_column, end_col, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  const std::string_view line = source.get_line(line_index);
  if (line.empty()) {
    return;
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_index + 1);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_index + 1);
  }
  fmt::print(os_, "{}\n", clean_line(line));

  // Marker padding follows the same tab expansion as the printed line.
  std::string padding;
  for (uint32_t col = 1; col < start_col && col <= line.size(); ++col) {
    padding += (line[col - 1] == '\t') ? "    " : " ";
  }

  const size_t marker_len = end_col > start_col ? end_col - start_col : 1;
  const char marker_char = style == LabelStyle::Primary ? '^' : '-';
  std::string marker(marker_len, marker_char);
  if (!label_message.empty()) {
    marker += ' ';
    marker += label_message;
  }

  fmt::print(os_, "{} {}", gutter_pipe(), padding);
  if (use_color_) {
    os_ << (style == LabelStyle::Primary ? rang::fg::red : rang::fg::cyan) << rang::style::bold
        << marker << rang::style::reset << rang::fg::reset << "\n";
  } else {
    fmt::print(os_, "{}\n", marker);
  }
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "{}: {}\n", kind, message);
  } else {
    fmt::print(os_, "      = {}: {}\n", kind, message);
  }
}

std::string DiagnosticPrinter::gutter_arrow() const
{
  return use_color_ ? "\033[1;36m   -->\033[0m" : "   -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  return use_color_ ? "\033[1;36m      |\033[0m" : "      |";
}

}  // namespace spawn_dsl
