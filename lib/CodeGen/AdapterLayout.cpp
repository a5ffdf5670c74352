//===----------------------------------------------------------------------===//
///
/// @file
/// Implements output layout and shared spelling helpers for generated adapter units.
///
//===----------------------------------------------------------------------===//

#include "archwith/CodeGen/AdapterLayout.h"

#include "archwith/CodeGen/NamingPolicy.h"

#include "llvm/ADT/StringSet.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/Path.h"

#include <sstream>

namespace archwith
{

std::string unitDirectory(const std::vector<std::string>& namespaceComponents)
{
    std::string out;
    for (const auto& component : namespaceComponents)
    {
        out += component + "/";
    }
    return out;
}

std::string unitPath(const std::vector<std::string>& namespaceComponents,
                     const std::string&              mirrorName,
                     const std::string&              suffix)
{
    return unitDirectory(namespaceComponents) + mirrorName + "." + suffix;
}

std::string umbrellaUnitPath(const std::vector<std::string>& namespaceComponents, const std::string& mirrorName)
{
    return unitPath(namespaceComponents, mirrorName, "hpp");
}

std::vector<RemoteUnitName> remoteUnitNames(const MirrorHeader& header)
{
    std::vector<RemoteUnitName> out;
    llvm::StringSet<>           taken;
    for (const auto& remote : header.remoteTypes)
    {
        const std::string base = codegenTypeSlug(remote.spelling);
        std::string       slug = base;
        for (unsigned n = 2; !taken.insert(slug).second; ++n)
        {
            slug = llvm::formatv("{0}_{1}", base, n).str();
        }
        out.push_back(RemoteUnitName{remote.spelling, slug});
    }
    return out;
}

std::string archivedTypeName(const MirrorHeader& header)
{
    return "Archived" + header.name;
}

std::string resolverTypeName(const MirrorHeader& header)
{
    return header.name + "Resolver";
}

namespace
{

std::string qualify(const MirrorHeader& header, const std::string& name)
{
    std::string out = "::";
    for (const auto& component : header.namespaceComponents)
    {
        out += component + "::";
    }
    out += name;
    if (!header.templateParams.empty())
    {
        out += '<';
        for (std::size_t i = 0; i < header.templateParams.size(); ++i)
        {
            out += (i == 0 ? "" : ", ") + header.templateParams[i].name;
        }
        out += '>';
    }
    return out;
}

}  // namespace

std::string archivedTypeReference(const MirrorHeader& header)
{
    return qualify(header, archivedTypeName(header));
}

std::string resolverTypeReference(const MirrorHeader& header)
{
    return qualify(header, resolverTypeName(header));
}

std::string templateHead(const MirrorHeader& header)
{
    if (header.templateParams.empty())
    {
        return "";
    }
    std::string out = "template <";
    for (std::size_t i = 0; i < header.templateParams.size(); ++i)
    {
        out += (i == 0 ? "" : ", ") + header.templateParams[i].declaration;
    }
    return out + ">";
}

std::string specializationHead(const MirrorHeader& header)
{
    return header.templateParams.empty() ? std::string("template <>") : templateHead(header);
}

std::string valueTypeExpr(const MirrorHeader& header, const FieldSpec& field)
{
    if (field.fromType)
    {
        return field.fromType->spelling;
    }
    return "decltype(" + header.typeReference() + "::" + field.name + ")";
}

std::string converterExpr(const MirrorHeader& header, const FieldSpec& field)
{
    switch (field.converter.kind)
    {
    case ConverterKind::Identity:
        return "::archwith::rt::Identity";
    case ConverterKind::MirrorSelf:
        return "decltype(" + header.typeReference() + "::" + field.name + ")";
    case ConverterKind::Explicit:
        return field.converter.spelling;
    }
    return "::archwith::rt::Identity";
}

std::string renderUnitPrologue(const MirrorHeader& header, const std::string& guard)
{
    std::ostringstream out;
    // File name only, so the same input generates the same bytes in any checkout.
    out << "// Generated by archwithc from " << llvm::sys::path::filename(header.sourceFile).str()
        << ". Do not edit.\n";
    out << "// Mirror type: " << header.qualifiedName() << "\n\n";
    out << "#ifndef " << guard << "\n";
    out << "#define " << guard << "\n\n";
    return out.str();
}

std::string renderUnitEpilogue(const std::string& guard)
{
    return "\n#endif  // " + guard + "\n";
}

}  // namespace archwith
