#include "archwith/Frontend/ASTPrinter.h"

#include "archwith/Frontend/AST.h"

#include <sstream>

namespace archwith {
namespace {

void printAttributes(std::ostringstream &out,
                     const std::vector<AttributeAST> &attributes,
                     const char *indent) {
  for (const auto &attr : attributes) {
    out << indent << "[[" << attr.name;
    if (attr.hasArguments) {
      out << '(' << spellTokens(attr.arguments) << ')';
    }
    out << "]]\n";
  }
}

} // namespace

std::string MirrorDeclAST::qualifiedName() const {
  std::string out;
  for (const auto &component : namespaceComponents) {
    out += component + "::";
  }
  return out + name;
}

std::string printAST(const ASTModule &module) {
  std::ostringstream out;
  out << "module {\n";
  for (const auto &file : module.files) {
    out << "  file \"" << file.filePath << "\" {\n";
    for (const auto &inc : file.includes) {
      out << "    include " << inc.target << "\n";
    }
    for (const auto &mirror : file.mirrors) {
      printAttributes(out, mirror.attributes, "    ");
      out << "    " << (mirror.isClass ? "class " : "struct ")
          << mirror.qualifiedName();
      if (!mirror.templateParams.empty()) {
        out << '<';
        for (std::size_t i = 0; i < mirror.templateParams.size(); ++i) {
          out << (i == 0 ? "" : ", ") << mirror.templateParams[i].declaration;
        }
        out << '>';
      }
      out << " {\n";
      for (const auto &field : mirror.fields) {
        printAttributes(out, field.attributes, "      ");
        out << "      field " << field.type.spelling << ' ' << field.name
            << "\n";
      }
      out << "    }\n";
    }
    out << "  }\n";
  }
  out << "}\n";
  return out.str();
}

} // namespace archwith
