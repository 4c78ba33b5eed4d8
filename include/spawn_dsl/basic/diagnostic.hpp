// spawn_dsl/basic/diagnostic.hpp - Diagnostic types shared by all passes
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "spawn_dsl/basic/source_manager.hpp"

namespace spawn_dsl
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

/**
 * Error taxonomy of the compiler. Each category has a stable code.
 */
enum class DiagCategory : uint8_t {
  SyntaxError,              ///< E0001
  DuplicateBinding,         ///< E0100
  InsertionTargetNotLocal,  ///< E0101
  ReservedName,             ///< E0102
  LiteralError,             ///< E0200
  UnboundReference,         ///< W0100 (soft)
};

[[nodiscard]] constexpr std::string_view diag_code(DiagCategory c) noexcept
{
  switch (c) {
    case DiagCategory::SyntaxError:
      return "E0001";
    case DiagCategory::DuplicateBinding:
      return "E0100";
    case DiagCategory::InsertionTargetNotLocal:
      return "E0101";
    case DiagCategory::ReservedName:
      return "E0102";
    case DiagCategory::LiteralError:
      return "E0200";
    case DiagCategory::UnboundReference:
      return "W0100";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(DiagCategory c) noexcept
{
  switch (c) {
    case DiagCategory::SyntaxError:
      return "SyntaxError";
    case DiagCategory::DuplicateBinding:
      return "DuplicateBinding";
    case DiagCategory::InsertionTargetNotLocal:
      return "InsertionTargetNotLocal";
    case DiagCategory::ReservedName:
      return "ReservedName";
    case DiagCategory::LiteralError:
      return "LiteralError";
    case DiagCategory::UnboundReference:
      return "UnboundReference";
  }
  return "";
}

enum class LabelStyle {
  Primary,    // direct cause
  Secondary,  // related location
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g. "E0100"
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder returned by DiagnosticBag::report and report_error.
 *
 * The diagnostic is added to the bag when the builder is destroyed, so the
 * usual form is a single expression statement:
 * @code
 *   diags.report(DiagCategory::DuplicateBinding, range, "duplicate binding 'a'")
 *     .with_secondary_label(first, "first bound here");
 * @endcode
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");

  /// Error tagged with its category code.
  DiagnosticBuilder report(
    DiagCategory category, SourceRange range, std::string message,
    std::string label_message = "");

  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] size_t error_count() const;

  /// Number of diagnostics carrying the code of `category`.
  [[nodiscard]] size_t count(DiagCategory category) const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace spawn_dsl
