//===----------------------------------------------------------------------===//
///
/// @file
/// Implements JSON rendering of field mapping tables.
///
//===----------------------------------------------------------------------===//

#include "archwith/Semantics/MappingTableJson.h"

#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>
#include <utility>

namespace archwith
{
namespace
{

llvm::json::Object locationToJson(const SourceLocation& location)
{
    return llvm::json::Object{
        {"file", location.file},
        {"line", static_cast<std::int64_t>(location.line)},
        {"column", static_cast<std::int64_t>(location.column)},
    };
}

llvm::json::Value fieldToJson(const FieldMapping& mapping)
{
    const FieldSpec&   spec = mapping.spec;
    llvm::json::Object field{
        {"name", spec.name},
        {"location", locationToJson(spec.location)},
        {"mirror_type", spec.mirrorType.spelling},
        {"value_type", fieldValueType(spec)},
        {"converter",
         llvm::json::Object{
             {"kind", converterKindName(spec.converter.kind)},
             {"spelling", spec.converter.spelling},
         }},
        {"access", fieldAccessKindName(mapping.access)},
        {"reconstructable", mapping.reconstructable},
    };
    if (spec.fromType)
    {
        field["from"] = spec.fromType->spelling;
    }
    if (spec.via)
    {
        field["via"] = spec.via->spelling;
    }
    if (spec.getter)
    {
        field["getter"] = spec.getter->spelling;
        field["getter_owned"] = spec.getterOwned;
    }
    return field;
}

}  // namespace

llvm::json::Value mappingTableToJson(const FieldMappingTable& table)
{
    const MirrorHeader& header = table.header;

    llvm::json::Array templateParams;
    for (const auto& param : header.templateParams)
    {
        templateParams.push_back(param.declaration);
    }

    llvm::json::Array remoteTypes;
    for (const auto& remote : header.remoteTypes)
    {
        remoteTypes.push_back(remote.spelling);
    }

    llvm::json::Array fields;
    for (const auto& mapping : table.fields)
    {
        fields.push_back(fieldToJson(mapping));
    }

    return llvm::json::Object{
        {"name", header.qualifiedName()},
        {"source_file", header.sourceFile},
        {"location", locationToJson(header.location)},
        {"template_params", std::move(templateParams)},
        {"remote_types", std::move(remoteTypes)},
        {"fully_reconstructable", table.fullyReconstructable},
        {"fields", std::move(fields)},
    };
}

std::string renderMappingTablesJson(const std::vector<FieldMappingTable>& tables)
{
    llvm::json::Array mirrors;
    for (const auto& table : tables)
    {
        mirrors.push_back(mappingTableToJson(table));
    }

    llvm::json::Object root;
    root["schema_version"] = MappingTableSchemaVersion;
    root["mirrors"]        = std::move(mirrors);

    std::string              rendered;
    llvm::raw_string_ostream stream(rendered);
    stream << llvm::formatv("{0:2}", llvm::json::Value(std::move(root)));
    stream << '\n';
    stream.flush();
    return rendered;
}

}  // namespace archwith
