// declref/basic/diagnostic_printer.hpp
//
// Prints diagnostics with their origin, notes and suggested fixes
// in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "declref/basic/diagnostic.hpp"

namespace declref
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[R0009]: The reference is ambiguous because "Shape" has more than one declaration
 *     --> refs/docs.json[3]
 *         |
 *         ^ in 'widgets#Shape'
 *      = note: candidates: interface, class
 *         |
 *   help: replace 'widgets#Shape' with 'widgets#Shape:interface'
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /**
   * Print a single diagnostic.
   */
  void print(const Diagnostic & diag);

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by origin.
   */
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label(const Label & label);

  void print_fixit(const FixIt & fixit);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace declref
