// declref/reference/declaration_reference.cpp - Reference display
//
#include "declref/reference/declaration_reference.hpp"

namespace declref
{

std::string to_string(const MemberReference & member)
{
  std::string out;
  if (member.symbol) {
    out += "[" + member.symbol->symbol_reference + "]";
  } else if (member.identifier) {
    out += member.identifier->identifier;
  }
  if (member.selector) {
    out += ":" + member.selector->text;
  }
  return out;
}

std::string to_string(const DeclarationReference & ref)
{
  std::string out;
  if (ref.package_name) {
    out += *ref.package_name;
  }
  if (ref.import_path && !ref.import_path->empty()) {
    out += "/" + *ref.import_path;
  }
  if (ref.package_name || (ref.import_path && !ref.import_path->empty())) {
    out += "#";
  }

  bool first = true;
  for (const auto & member : ref.member_references) {
    if (!first) {
      out += ".";
    }
    out += to_string(member);
    first = false;
  }
  return out;
}

}  // namespace declref
