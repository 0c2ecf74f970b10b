// declref/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "declref/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace declref
{

namespace
{

std::string_view severity_name(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
  }
  return "error";
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> file[entry] ===
  const Origin origin = diag.primary_origin();
  fmt::print(
    os_, "{} {}\n", gutter_arrow(), origin.is_valid() ? origin.to_string() : "<unknown>");

  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label(label);
  }

  for (const auto & note : diag.notes) {
    print_note(note);
  }

  for (const auto & f : diag.fixits) {
    print_fixit(f);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  // Sort by origin file, then entry index (stable)
  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      const Origin oa = a.primary_origin();
      const Origin ob = b.primary_origin();
      if (oa.file != ob.file) {
        return oa.file < ob.file;
      }
      return oa.entry.value_or(0) < ob.entry.value_or(0);
    });

  for (const auto & d : sorted_diags) {
    print(d);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view name = severity_name(diag.severity);

  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
    }
    os_ << name;
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
  } else {
    if (!diag.code.empty()) {
      fmt::print(os_, "{}[{}]: {}\n", name, diag.code, diag.message);
    } else {
      fmt::print(os_, "{}: {}\n", name, diag.message);
    }
  }
}

void DiagnosticPrinter::print_label(const Label & label)
{
  if (label.message.empty()) {
    return;
  }

  const char marker = (label.style == LabelStyle::Primary) ? '^' : '-';
  const std::string where = label.origin.is_valid() ? label.origin.to_string() : "";

  if (use_color_) {
    if (label.style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
    fmt::print(os_, "      {} {}", marker, label.message);
    os_ << rang::style::reset << rang::fg::reset;
  } else {
    fmt::print(os_, "      {} {}", marker, label.message);
  }
  if (label.style == LabelStyle::Secondary && !where.empty()) {
    fmt::print(os_, " ({})", where);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_fixit(const FixIt & fixit)
{
  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "help" << rang::style::reset << rang::fg::reset;
    fmt::print(
      os_, ": replace '{}' with '{}'\n", fixit.original_text, fixit.replacement_text);
  } else {
    fmt::print(
      os_, "help: replace '{}' with '{}'\n", fixit.original_text, fixit.replacement_text);
  }
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "   = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace declref
