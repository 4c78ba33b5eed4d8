// spawn_dsl/basic/diagnostic_printer.hpp
//
// Renders diagnostics with source context in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "spawn_dsl/basic/diagnostic.hpp"
#include "spawn_dsl/basic/source_manager.hpp"

namespace spawn_dsl
{

/**
 * Prints diagnostics in Rust-style format:
 *
 *   error[E0101]: cannot insert into 'panel': no entity with this name is visible here
 *     --> ui.spawn:4:3
 *      |
 *    4 |   panel + (Visible);
 *      |   ^^^^^ not bound locally
 *      |
 *      = help: insertion needs an entity created earlier in this scope or an enclosing one
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceFile & source);

  /// Prints every diagnostic, ordered by primary location.
  void print_all(const DiagnosticBag & diags, const SourceFile & source);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label_context(const Label & label, const SourceFile & source);
  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);
  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace spawn_dsl
