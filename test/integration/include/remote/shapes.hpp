//===----------------------------------------------------------------------===//
//
// Part of the archwith project, under the MIT licence
// SPDX-License-Identifier: MIT
//
//===----------------------------------------------------------------------===//

//===----------------------------------------------------------------------===//
///
/// @file
/// Remote types mirrored by the adapter round-trip test.
///
/// These stand in for types owned by another library: they carry no archiving
/// support of their own.
///
//===----------------------------------------------------------------------===//

#ifndef ARCHWITH_TEST_REMOTE_SHAPES_HPP
#define ARCHWITH_TEST_REMOTE_SHAPES_HPP

#include <cstdint>
#include <string>
#include <utility>

namespace remote
{

struct Point
{
    std::int32_t x;
    std::int32_t y;
};

/// Same layout as Point under a different name.
struct PointV2
{
    std::int32_t x;
    std::int32_t y;
};

struct Segment
{
    Point        start;
    Point        end;
    std::int32_t id;
};

struct Span
{
    std::int32_t begin;
    std::string  tag;
    std::int32_t end;
};

class Label
{
public:
    Label(std::string text, const std::uint8_t weight)
        : text_(std::move(text))
        , weight_(weight)
    {
    }

    const std::string& text() const
    {
        return text_;
    }

    std::uint8_t weight() const
    {
        return weight_;
    }

private:
    std::string  text_;
    std::uint8_t weight_;
};

/// Consumes a label and returns its weight.
inline std::uint8_t labelWeight(Label label)
{
    return label.weight();
}

template <typename T>
struct Boxed
{
    T value;
};

struct Nothing
{
};

}  // namespace remote

#endif  // ARCHWITH_TEST_REMOTE_SHAPES_HPP
