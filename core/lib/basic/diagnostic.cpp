// declref/basic/diagnostic.cpp - Diagnostic bag and builder
#include "declref/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace declref
{

std::string Origin::to_string() const
{
  if (!is_valid()) {
    return {};
  }
  return entry ? file + "[" + std::to_string(*entry) + "]" : file;
}

const Label * Diagnostic::primary_label() const noexcept
{
  const auto it = std::find_if(labels.begin(), labels.end(), [](const Label & label) {
    return label.style == LabelStyle::Primary;
  });
  if (it != labels.end()) {
    return &*it;
  }
  return labels.empty() ? nullptr : &labels.front();
}

Origin Diagnostic::primary_origin() const
{
  const Label * label = primary_label();
  return label != nullptr ? label->origin : Origin{};
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), committed_(other.committed_)
{
  other.committed_ = true;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (!committed_) {
    bag_.diagnostics_.push_back(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_label(
  Origin origin, std::string msg, LabelStyle style)
{
  diagnostic_.labels.push_back(Label{std::move(origin), std::move(msg), style});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(Origin origin, std::string msg)
{
  return with_label(std::move(origin), std::move(msg), LabelStyle::Secondary);
}

DiagnosticBuilder & DiagnosticBuilder::with_fixit(std::string original, std::string replacement)
{
  diagnostic_.fixits.push_back(FixIt{std::move(original), std::move(replacement)});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_note(std::string note)
{
  diagnostic_.notes.push_back(std::move(note));
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report(
  Severity severity, Origin origin, std::string message, std::string label_message)
{
  Diagnostic diag;
  diag.severity = severity;
  diag.message = std::move(message);
  diag.labels.push_back(Label{std::move(origin), std::move(label_message), LabelStyle::Primary});
  return {*this, std::move(diag)};
}

DiagnosticBuilder DiagnosticBag::report_error(
  Origin origin, std::string message, std::string label_message)
{
  return report(Severity::Error, std::move(origin), std::move(message), std::move(label_message));
}

size_t DiagnosticBag::count(Severity severity) const
{
  return static_cast<size_t>(std::count_if(
    diagnostics_.begin(), diagnostics_.end(),
    [severity](const Diagnostic & d) { return d.severity == severity; }));
}

void DiagnosticBag::merge(DiagnosticBag && other)
{
  diagnostics_.insert(
    diagnostics_.end(), std::make_move_iterator(other.diagnostics_.begin()),
    std::make_move_iterator(other.diagnostics_.end()));
  other.diagnostics_.clear();
}

}  // namespace declref
