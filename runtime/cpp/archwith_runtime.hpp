//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Archiving contract targeted by adapters that archwithc generates.
///
/// An archiving library provides `Archive<T>` specializations for the types it
/// can lay out. Generated adapters provide `ArchiveWith`, `SerializeWith` and
/// `DeserializeWith` specializations that let a mirror type stand in for a
/// remote type. Archiving is two-phase: `serialize` writes dependent data and
/// returns a resolver, then `resolve` writes the fixed-size archived value at
/// its final position using that resolver.
///
//===----------------------------------------------------------------------===//

#ifndef ARCHWITH_RUNTIME_HPP
#define ARCHWITH_RUNTIME_HPP

#include <cstddef>
#include <utility>

namespace archwith
{
namespace rt
{

/// @brief Archiving capability of one type, specialized by the archiving library.
///
/// @details A specialization provides:
/// - `using Archived = ...;` the archived representation;
/// - `using Resolver = ...;` the state passed from serialize to resolve;
/// - `static void resolve(const T& value, std::size_t pos, Resolver resolver, Archived* out);`
/// - `template <typename Serializer> static Resolver serialize(const T& value, Serializer& serializer);`
/// - `template <typename Deserializer> static T deserialize(const Archived& archived, Deserializer& deserializer);`
template <typename T, typename Enable = void>
struct Archive;

/// @brief Builds the archived form of a `Field` through the converter `With`.
///
/// @details A specialization provides `Archived`, `Resolver`, and
/// `static void resolveWith(const Field& field, std::size_t pos, Resolver resolver, Archived* out);`
template <typename With, typename Field, typename Enable = void>
struct ArchiveWith;

/// @brief Serializes the dependent data of a `Field` through the converter `With`.
///
/// @details A specialization provides
/// `template <typename Serializer> static ResolverWith<With, Field> serializeWith(const Field&, Serializer&);`
template <typename With, typename Field, typename Enable = void>
struct SerializeWith;

/// @brief Rebuilds a `Field` from its archived form through the converter `With`.
///
/// @details A specialization provides
/// `template <typename Deserializer> static Field deserializeWith(const ArchivedWith<With, Field>&, Deserializer&);`
template <typename With, typename Field, typename Enable = void>
struct DeserializeWith;

/// @brief Archived representation of `Field` through `With`.
template <typename With, typename Field>
using ArchivedWith = typename ArchiveWith<With, Field>::Archived;

/// @brief Resolver of `Field` through `With`.
template <typename With, typename Field>
using ResolverWith = typename ArchiveWith<With, Field>::Resolver;

/// @brief Converter that archives a field unchanged using `Archive<Field>`.
struct Identity
{
};

template <typename Field>
struct ArchiveWith<Identity, Field>
{
    using Archived = typename Archive<Field>::Archived;
    using Resolver = typename Archive<Field>::Resolver;

    static void resolveWith(const Field& field, std::size_t pos, Resolver resolver, Archived* out)
    {
        Archive<Field>::resolve(field, pos, std::move(resolver), out);
    }
};

template <typename Field>
struct SerializeWith<Identity, Field>
{
    template <typename Serializer>
    static typename Archive<Field>::Resolver serializeWith(const Field& field, Serializer& serializer)
    {
        return Archive<Field>::serialize(field, serializer);
    }
};

template <typename Field>
struct DeserializeWith<Identity, Field>
{
    template <typename Deserializer>
    static Field deserializeWith(const typename Archive<Field>::Archived& archived, Deserializer& deserializer)
    {
        return Archive<Field>::deserialize(archived, deserializer);
    }
};

/// @brief Returns the byte offset of `member` inside `outer`.
/// @param[in] outer Enclosing object.
/// @param[in] member Member subobject of `*outer`.
/// @return Offset in bytes.
template <typename Outer, typename Member>
inline std::size_t memberOffset(const Outer* outer, const Member* member) noexcept
{
    return static_cast<std::size_t>(reinterpret_cast<const unsigned char*>(member) -
                                    reinterpret_cast<const unsigned char*>(outer));
}

}  // namespace rt
}  // namespace archwith

#endif  // ARCHWITH_RUNTIME_HPP
