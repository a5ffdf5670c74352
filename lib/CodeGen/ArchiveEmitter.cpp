//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Implements archived-representation, build, and serialize emission.
///
/// Fields are always processed in declaration order. A field value is bound to
/// a `field_<name>` local first: a direct member read, a getter call on the
/// remote instance, or a getter call on a fresh copy for owned getters.
///
//===----------------------------------------------------------------------===//

#include "archwith/CodeGen/ArchiveEmitter.h"

#include "archwith/CodeGen/NamingPolicy.h"

#include <set>
#include <sstream>
#include <string>

namespace archwith
{
namespace
{

void emitLine(std::ostringstream& out, const int indent, const std::string& line)
{
    if (line.empty())
    {
        out << '\n';
        return;
    }
    out << std::string(static_cast<std::size_t>(indent) * 4U, ' ') << line << '\n';
}

std::string namespacePath(const MirrorHeader& header)
{
    std::string out;
    for (const auto& component : header.namespaceComponents)
    {
        if (!out.empty())
        {
            out += "::";
        }
        out += component;
    }
    return out;
}

void emitNamespaceOpen(std::ostringstream& out, const MirrorHeader& header)
{
    if (header.namespaceComponents.empty())
    {
        return;
    }
    out << "namespace " << namespacePath(header) << "\n{\n\n";
}

void emitNamespaceClose(std::ostringstream& out, const MirrorHeader& header)
{
    if (header.namespaceComponents.empty())
    {
        return;
    }
    out << "\n}  // namespace " << namespacePath(header) << "\n";
}

/// Binds `field_<name>` to the value read from `remote`.
std::string fieldBinding(const FieldMapping& field, const std::string& valueType, const std::string& remoteType)
{
    const std::string local = "field_" + field.spec.name;
    switch (field.access)
    {
    case FieldAccessKind::DirectField:
        return "const " + valueType + "& " + local + " = remote." + field.spec.name + ";";
    case FieldAccessKind::GetterByReference:
        return "const " + valueType + "& " + local + " = std::invoke(&" + field.spec.getter->spelling + ", remote);";
    case FieldAccessKind::GetterOwned:
        return "const " + valueType + " " + local + " = std::invoke(&" + field.spec.getter->spelling + ", " +
               remoteType + "(remote));";
    }
    return "";
}

void collectConverterIncludes(const FieldMappingTable& table, const MirrorIndex& index, std::set<std::string>& out)
{
    const std::string self   = umbrellaUnitPath(table.header.namespaceComponents, table.header.name);
    auto              insert = [&](const std::string& spelling) {
        const MirrorIndexEntry* entry = index.lookup(spelling, table.header.namespaceComponents);
        if (entry != nullptr && entry->umbrellaHeader != self)
        {
            out.insert(entry->umbrellaHeader);
        }
    };
    for (const auto& field : table.fields)
    {
        insert(field.spec.mirrorType.spelling);
        if (field.spec.converter.kind == ConverterKind::Explicit)
        {
            insert(field.spec.converter.spelling);
        }
    }
}

std::string renderArchiveUnit(const FieldMappingTable& table, const RemoteUnitName& remote)
{
    const MirrorHeader& header   = table.header;
    const std::string   mirror   = header.typeReference();
    const std::string   archived = archivedTypeReference(header);
    const std::string   resolver = resolverTypeReference(header);

    std::vector<std::string> guardParts = header.namespaceComponents;
    guardParts.push_back(header.name);
    guardParts.push_back("archive");
    guardParts.push_back(remote.slug);
    const std::string guard = codegenHeaderGuard(guardParts);

    std::ostringstream out;
    out << renderUnitPrologue(header, guard);
    out << "#include <cstddef>\n";
    out << "#include <functional>\n";
    out << "#include <utility>\n\n";
    out << "#include \"" << unitPath(header.namespaceComponents, header.name, "repr.hpp") << "\"\n\n";

    out << "namespace archwith\n{\nnamespace rt\n{\n\n";

    // Build.
    emitLine(out, 0, "/// Builds the archived form of " + remote.remoteType + " with " + mirror + " as converter.");
    emitLine(out, 0, specializationHead(header));
    emitLine(out, 0, "struct ArchiveWith<" + mirror + ", " + remote.remoteType + ">");
    emitLine(out, 0, "{");
    emitLine(out, 1, "using Archived = " + archived + ";");
    emitLine(out, 1, "using Resolver = " + resolver + ";");
    emitLine(out, 0, "");
    emitLine(out, 1,
             "static void resolveWith(const " + remote.remoteType +
                 "& remote, std::size_t pos, Resolver resolver, Archived* out)");
    emitLine(out, 1, "{");
    if (table.fields.empty())
    {
        emitLine(out, 2, "(void) remote;");
        emitLine(out, 2, "(void) pos;");
        emitLine(out, 2, "(void) resolver;");
        emitLine(out, 2, "(void) out;");
    }
    for (const auto& field : table.fields)
    {
        const std::string value     = valueTypeExpr(header, field.spec);
        const std::string converter = converterExpr(header, field.spec);
        const std::string& name     = field.spec.name;
        emitLine(out, 2, fieldBinding(field, value, remote.remoteType));
        emitLine(out, 2,
                 "ArchiveWith<" + converter + ", " + value + ">::resolveWith(field_" + name +
                     ", pos + memberOffset(out, &out->" + name + "), std::move(resolver." + name + "), &out->" +
                     name + ");");
    }
    emitLine(out, 1, "}");
    emitLine(out, 0, "};");
    emitLine(out, 0, "");

    // Serialize.
    emitLine(out, 0, "/// Serializes " + remote.remoteType + " with " + mirror + " as converter.");
    emitLine(out, 0, specializationHead(header));
    emitLine(out, 0, "struct SerializeWith<" + mirror + ", " + remote.remoteType + ">");
    emitLine(out, 0, "{");
    emitLine(out, 1, "template <typename Serializer>");
    emitLine(out, 1,
             "static " + resolver + " serializeWith(const " + remote.remoteType +
                 "& remote, Serializer& serializer)");
    emitLine(out, 1, "{");
    if (table.fields.empty())
    {
        emitLine(out, 2, "(void) remote;");
        emitLine(out, 2, "(void) serializer;");
        emitLine(out, 2, "return " + resolver + "{};");
    }
    else
    {
        for (const auto& field : table.fields)
        {
            const std::string value     = valueTypeExpr(header, field.spec);
            const std::string converter = converterExpr(header, field.spec);
            const std::string& name     = field.spec.name;
            emitLine(out, 2, fieldBinding(field, value, remote.remoteType));
            emitLine(out, 2,
                     "auto resolver_" + name + " = SerializeWith<" + converter + ", " + value +
                         ">::serializeWith(field_" + name + ", serializer);");
        }
        std::string init = "return " + resolver + "{";
        for (std::size_t i = 0; i < table.fields.size(); ++i)
        {
            init += (i == 0 ? "" : ", ") + std::string("std::move(resolver_") + table.fields[i].spec.name + ")";
        }
        emitLine(out, 2, init + "};");
    }
    emitLine(out, 1, "}");
    emitLine(out, 0, "};");

    out << "\n}  // namespace rt\n}  // namespace archwith\n";
    out << renderUnitEpilogue(guard);
    return out.str();
}

}  // namespace

GeneratedUnit renderReprUnit(const FieldMappingTable& table, const MirrorIndex& index)
{
    const MirrorHeader& header = table.header;

    std::vector<std::string> guardParts = header.namespaceComponents;
    guardParts.push_back(header.name);
    guardParts.push_back("repr");
    const std::string guard = codegenHeaderGuard(guardParts);

    std::set<std::string> converterIncludes;
    collectConverterIncludes(table, index, converterIncludes);

    std::ostringstream out;
    out << renderUnitPrologue(header, guard);
    out << "#include \"" << kRuntimeHeaderName << "\"\n";
    for (const auto& include : header.includes)
    {
        out << "#include " << include << "\n";
    }
    for (const auto& include : converterIncludes)
    {
        out << "#include \"" << include << "\"\n";
    }
    out << "\n";

    emitNamespaceOpen(out, header);

    const std::string head = templateHead(header);

    // Mirror type.
    if (!head.empty())
    {
        emitLine(out, 0, head);
    }
    emitLine(out, 0, "struct " + header.name);
    emitLine(out, 0, "{");
    for (const auto& field : table.fields)
    {
        emitLine(out, 1, field.spec.mirrorType.spelling + " " + field.spec.name + ";");
    }
    emitLine(out, 0, "};");
    emitLine(out, 0, "");

    // Archived representation.
    emitLine(out, 0, "/// Archived form of " + header.name + ".");
    if (!head.empty())
    {
        emitLine(out, 0, head);
    }
    emitLine(out, 0, "struct " + archivedTypeName(header));
    emitLine(out, 0, "{");
    for (const auto& field : table.fields)
    {
        emitLine(out,
                 1,
                 "::archwith::rt::ArchivedWith<" + converterExpr(header, field.spec) + ", " +
                     valueTypeExpr(header, field.spec) + "> " + field.spec.name + ";");
    }
    emitLine(out, 0, "};");
    emitLine(out, 0, "");

    // Resolver.
    emitLine(out, 0, "/// Resolver state produced by serializing " + header.name + ".");
    if (!head.empty())
    {
        emitLine(out, 0, head);
    }
    emitLine(out, 0, "struct " + resolverTypeName(header));
    emitLine(out, 0, "{");
    for (const auto& field : table.fields)
    {
        emitLine(out,
                 1,
                 "::archwith::rt::ResolverWith<" + converterExpr(header, field.spec) + ", " +
                     valueTypeExpr(header, field.spec) + "> " + field.spec.name + ";");
    }
    emitLine(out, 0, "};");

    emitNamespaceClose(out, header);
    out << renderUnitEpilogue(guard);

    return GeneratedUnit{unitPath(header.namespaceComponents, header.name, "repr.hpp"), out.str()};
}

std::vector<GeneratedUnit> renderArchiveUnits(const FieldMappingTable& table)
{
    std::vector<GeneratedUnit> units;
    for (const auto& remote : remoteUnitNames(table.header))
    {
        units.push_back(GeneratedUnit{unitPath(table.header.namespaceComponents,
                                               table.header.name,
                                               "archive." + remote.slug + ".hpp"),
                                      renderArchiveUnit(table, remote)});
    }
    return units;
}

}  // namespace archwith
