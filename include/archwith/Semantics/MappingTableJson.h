//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// JSON rendering of validated field mapping tables.
///
//===----------------------------------------------------------------------===//
#ifndef ARCHWITH_SEMANTICS_MAPPING_TABLE_JSON_H
#define ARCHWITH_SEMANTICS_MAPPING_TABLE_JSON_H

#include "archwith/Semantics/MappingTable.h"

#include "llvm/Support/JSON.h"

#include <cstdint>
#include <string>
#include <vector>

namespace archwith
{

/// @brief Schema version written at the root of table dumps.
inline constexpr std::int64_t MappingTableSchemaVersion = 1;

/// @brief Converts one validated table to a JSON object.
/// @param[in] table Validated mapping table.
/// @return JSON object describing the mirror, its remote types and its fields.
llvm::json::Value mappingTableToJson(const FieldMappingTable& table);

/// @brief Renders a list of tables as a pretty-printed JSON document.
/// @param[in] tables Tables in declaration order.
/// @return Document text terminated by a newline.
std::string renderMappingTablesJson(const std::vector<FieldMappingTable>& tables);

}  // namespace archwith

#endif  // ARCHWITH_SEMANTICS_MAPPING_TABLE_JSON_H
