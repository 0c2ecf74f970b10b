// declref/basic/diagnostic.hpp - Diagnostics reported while checking references
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace declref
{

/**
 * How an unresolved reference is reported.
 *
 * Error fails a check, Warning is printed but tolerated and Info is used when
 * failures are only listed (the `resolve` command).
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
};

/**
 * Where a diagnostic came from.
 *
 * References are not read from source text, so an origin is the input file
 * plus the index of the entry inside it.
 */
struct Origin
{
  std::string file;
  std::optional<size_t> entry;

  [[nodiscard]] bool is_valid() const noexcept { return !file.empty(); }

  /// "refs/docs.json[3]", "refs/docs.json" or "" for an invalid origin
  [[nodiscard]] std::string to_string() const;
};

enum class LabelStyle {
  Primary,    // the failing reference entry
  Secondary,  // a candidate declaration or related input
};

struct Label
{
  Origin origin;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

/// Suggested rewrite of a reference, in display form
struct FixIt
{
  std::string original_text;
  std::string replacement_text;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     // "R0001".."R0013", "R0100" for load errors
  std::string message;  // resolver reason or load error

  std::vector<Label> labels;
  std::vector<FixIt> fixits;
  std::vector<std::string> notes;
  std::optional<std::string> help_message;

  /// First primary label, else the first label, else nullptr
  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] Origin primary_origin() const;
};

class DiagnosticBag;

/**
 * Fluent builder returned by DiagnosticBag::report.
 *
 * The diagnostic is committed to the bag when the builder is destroyed, so a
 * chain of `with_*` calls on a temporary reports exactly one diagnostic.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_label(
    Origin origin, std::string msg, LabelStyle style = LabelStyle::Primary);
  DiagnosticBuilder & with_secondary_label(Origin origin, std::string msg);
  DiagnosticBuilder & with_fixit(std::string original, std::string replacement);
  DiagnosticBuilder & with_note(std::string note);
  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool committed_ = false;
};

/**
 * Diagnostics of one check run, in reporting order.
 */
class DiagnosticBag
{
public:
  DiagnosticBuilder report(
    Severity severity, Origin origin, std::string message, std::string label_message = "");
  DiagnosticBuilder report_error(
    Origin origin, std::string message, std::string label_message = "");

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] bool has_errors() const { return count(Severity::Error) != 0; }
  [[nodiscard]] bool has_warnings() const { return count(Severity::Warning) != 0; }

  /// Append the diagnostics of another run, leaving it empty
  void merge(DiagnosticBag && other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  friend class DiagnosticBuilder;

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace declref
