//===----------------------------------------------------------------------===//
///
/// @file
/// Implements deserialize emission.
///
//===----------------------------------------------------------------------===//

#include "archwith/CodeGen/DeserializeEmitter.h"

#include "archwith/CodeGen/NamingPolicy.h"
#include "archwith/Support/Diagnostics.h"

#include <sstream>
#include <string>

namespace archwith
{
namespace
{

std::string indent(const int level)
{
    return std::string(static_cast<std::size_t>(level) * 4U, ' ');
}

void renderDeserializeWith(std::ostringstream& out, const FieldMappingTable& table, const std::string& remoteType)
{
    const MirrorHeader& header   = table.header;
    const std::string   mirror   = header.typeReference();
    const std::string   archived = archivedTypeReference(header);

    out << "/// Rebuilds " << remoteType << " from the archived form of " << mirror << ".\n";
    out << specializationHead(header) << "\n";
    out << "struct DeserializeWith<" << mirror << ", " << remoteType << ">\n";
    out << "{\n";
    out << indent(1) << "template <typename Deserializer>\n";
    out << indent(1) << "static " << remoteType << " deserializeWith(const " << archived
        << "& archived, Deserializer& deserializer)\n";
    out << indent(1) << "{\n";
    if (table.fields.empty())
    {
        out << indent(2) << "(void) archived;\n";
        out << indent(2) << "(void) deserializer;\n";
        out << indent(2) << "return " << remoteType << "{};\n";
    }
    else
    {
        // Members are assigned by name, so the remote type's own declaration order does not matter.
        for (const auto& field : table.fields)
        {
            const std::string& name = field.spec.name;
            out << indent(2) << valueTypeExpr(header, field.spec) << " field_" << name << " = DeserializeWith<"
                << converterExpr(header, field.spec) << ", " << valueTypeExpr(header, field.spec)
                << ">::deserializeWith(archived." << name << ", deserializer);\n";
        }
        out << indent(2) << remoteType << " remote{};\n";
        for (const auto& field : table.fields)
        {
            const std::string& name = field.spec.name;
            out << indent(2) << "remote." << name << " = std::move(field_" << name << ");\n";
        }
        out << indent(2) << "return remote;\n";
    }
    out << indent(1) << "}\n";
    out << "};\n";
}

}  // namespace

std::optional<GeneratedUnit> renderDeserializeUnit(const FieldMappingTable& table, DiagnosticEngine& diagnostics)
{
    const MirrorHeader& header = table.header;
    if (!table.fullyReconstructable)
    {
        std::string fields;
        for (const auto& field : table.fields)
        {
            if (!field.reconstructable)
            {
                fields += (fields.empty() ? "'" : ", '") + field.spec.name + "'";
            }
        }
        diagnostics.note(header.location,
                         "mirror '" + header.qualifiedName() + "': deserialization is not derived because field(s) " +
                             fields + " use a getter; provide DeserializeWith<" + header.typeReference() +
                             ", Remote> by hand",
                         DiagnosticKind::NotReconstructable);
        return std::nullopt;
    }

    std::vector<std::string> guardParts = header.namespaceComponents;
    guardParts.push_back(header.name);
    guardParts.push_back("deserialize");
    const std::string guard = codegenHeaderGuard(guardParts);

    std::ostringstream out;
    out << renderUnitPrologue(header, guard);
    out << "#include \"" << unitPath(header.namespaceComponents, header.name, "repr.hpp") << "\"\n\n";
    out << "#include <utility>\n\n";
    out << "namespace archwith\n{\nnamespace rt\n{\n";
    for (const auto& remote : header.remoteTypes)
    {
        out << "\n";
        renderDeserializeWith(out, table, remote.spelling);
    }
    out << "\n}  // namespace rt\n}  // namespace archwith\n";
    out << renderUnitEpilogue(guard);

    return GeneratedUnit{unitPath(header.namespaceComponents, header.name, "deserialize.hpp"), out.str()};
}

}  // namespace archwith
