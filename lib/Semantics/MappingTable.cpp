//===----------------------------------------------------------------------===//
///
/// @file
/// Implements small helpers on the field mapping IR.
///
//===----------------------------------------------------------------------===//

#include "archwith/Semantics/MappingTable.h"

#include <cstddef>

namespace archwith
{

std::string MirrorHeader::qualifiedName() const
{
    std::string out;
    for (const auto& component : namespaceComponents)
    {
        out += component + "::";
    }
    return out + name;
}

std::string MirrorHeader::typeReference() const
{
    std::string out = "::" + qualifiedName();
    if (!templateParams.empty())
    {
        out += '<';
        for (std::size_t i = 0; i < templateParams.size(); ++i)
        {
            if (i > 0)
            {
                out += ", ";
            }
            out += templateParams[i].name;
        }
        out += '>';
    }
    return out;
}

const char* converterKindName(const ConverterKind kind)
{
    switch (kind)
    {
    case ConverterKind::Identity:
        return "identity";
    case ConverterKind::MirrorSelf:
        return "mirror-self";
    case ConverterKind::Explicit:
        return "explicit";
    }
    return "identity";
}

const char* fieldAccessKindName(const FieldAccessKind kind)
{
    switch (kind)
    {
    case FieldAccessKind::DirectField:
        return "direct";
    case FieldAccessKind::GetterByReference:
        return "getter";
    case FieldAccessKind::GetterOwned:
        return "getter-owned";
    }
    return "direct";
}

std::string fieldValueType(const FieldSpec& field)
{
    return field.fromType ? field.fromType->spelling : field.mirrorType.spelling;
}

}  // namespace archwith
