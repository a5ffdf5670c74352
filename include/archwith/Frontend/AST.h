#ifndef ARCHWITH_FRONTEND_AST_H
#define ARCHWITH_FRONTEND_AST_H

#include "archwith/Frontend/Lexer.h"
#include "archwith/Frontend/SourceLocation.h"

#include <string>
#include <vector>

namespace archwith {

struct AttributeAST {
  SourceLocation location;
  std::string name;
  // Tokens between the outer parentheses; empty when the attribute has none.
  std::vector<Token> arguments;
  bool hasArguments{false};
};

struct TemplateParamAST {
  SourceLocation location;
  // Full parameter declaration, e.g. `typename T` or `std::size_t N`.
  std::string declaration;
  std::string name;
};

struct TypeRefAST {
  SourceLocation location;
  std::string spelling;
};

struct FieldDeclAST {
  SourceLocation location;
  TypeRefAST type;
  std::string name;
  std::vector<AttributeAST> attributes;
};

struct MirrorDeclAST {
  SourceLocation location;
  std::string name;
  std::vector<std::string> namespaceComponents;
  std::vector<TemplateParamAST> templateParams;
  std::vector<AttributeAST> attributes;
  std::vector<FieldDeclAST> fields;
  bool isClass{false};

  [[nodiscard]] std::string qualifiedName() const;
};

struct IncludeAST {
  SourceLocation location;
  // Include target with its delimiters, e.g. `"geo.hpp"` or `<string>`.
  std::string target;
};

struct MirrorFileAST {
  std::string filePath;
  std::vector<IncludeAST> includes;
  std::vector<MirrorDeclAST> mirrors;
};

struct ASTModule {
  std::vector<MirrorFileAST> files;
};

} // namespace archwith

#endif // ARCHWITH_FRONTEND_AST_H
