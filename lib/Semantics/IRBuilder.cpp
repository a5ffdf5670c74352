//===----------------------------------------------------------------------===//
///
/// @file
/// Implements the directive-to-IR lowering and its default-inference rules.
///
//===----------------------------------------------------------------------===//

#include "archwith/Semantics/IRBuilder.h"

#include "archwith/Support/Diagnostics.h"

#include "llvm/ADT/StringMap.h"

#include <utility>

namespace archwith
{

Converter inferConverter(const TypePath& mirrorType, const FieldDirectives& directives)
{
    if (directives.via)
    {
        return Converter{ConverterKind::Explicit, directives.via->spelling, directives.via->location};
    }
    if (directives.fromType)
    {
        return Converter{ConverterKind::MirrorSelf, mirrorType.spelling, mirrorType.location};
    }
    return Converter{ConverterKind::Identity, "", mirrorType.location};
}

llvm::Expected<TypeSpec> buildTypeSpec(const MirrorFileAST&  file,
                                       const MirrorDeclAST&  decl,
                                       const DirectiveModel& directives,
                                       DiagnosticEngine&     diagnostics)
{
    TypeSpec spec;
    spec.header.name                = decl.name;
    spec.header.location            = decl.location;
    spec.header.sourceFile          = file.filePath;
    spec.header.namespaceComponents = decl.namespaceComponents;
    spec.header.remoteTypes         = directives.type.remoteTypes;
    for (const auto& param : decl.templateParams)
    {
        spec.header.templateParams.push_back(TemplateParam{param.declaration, param.name});
    }
    for (const auto& inc : file.includes)
    {
        spec.header.includes.push_back(inc.target);
    }

    if (directives.fields.size() != decl.fields.size())
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "directive model of %s does not match its field list",
                                       decl.qualifiedName().c_str());
    }

    bool                                 ok = true;
    llvm::StringMap<const FieldDeclAST*> seen;
    for (std::size_t i = 0; i < decl.fields.size(); ++i)
    {
        const FieldDeclAST&    field = decl.fields[i];
        const FieldDirectives& fd    = directives.fields[i];

        const auto inserted = seen.try_emplace(field.name, &field);
        if (!inserted.second)
        {
            diagnostics.error(field.location,
                              "mirror '" + decl.qualifiedName() + "' field '" + field.name +
                                  "': duplicate field name (first declared at " +
                                  inserted.first->second->location.str() + ")",
                              DiagnosticKind::DuplicateField);
            ok = false;
            continue;
        }

        FieldSpec out;
        out.name                = field.name;
        out.location            = field.location;
        out.mirrorType          = TypePath{field.type.spelling, field.type.location};
        out.fromType            = fd.fromType;
        out.via                 = fd.via;
        out.getter              = fd.getter;
        out.getterOwned         = fd.getterOwned;
        out.getterOwnedLocation = fd.getterOwnedLocation;
        out.converter           = inferConverter(out.mirrorType, fd);
        spec.fields.push_back(std::move(out));
    }

    if (!ok)
    {
        return llvm::createStringError(llvm::inconvertibleErrorCode(),
                                       "failed to build field mapping of %s",
                                       decl.qualifiedName().c_str());
    }
    return spec;
}

}  // namespace archwith
