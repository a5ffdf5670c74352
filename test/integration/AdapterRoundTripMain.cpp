#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <type_traits>

#include "geo/Boxed.hpp"
#include "geo/Label.hpp"
#include "geo/Nothing.hpp"
#include "geo/Point.hpp"
#include "geo/Segment.hpp"
#include "geo/Span.hpp"

namespace
{

std::uint64_t gRngState = UINT64_C(0x9E3779B97F4A7C15);

std::uint32_t nextRandomU32()
{
    gRngState ^= gRngState << 13U;
    gRngState ^= gRngState >> 7U;
    gRngState ^= gRngState << 17U;
    return static_cast<std::uint32_t>(gRngState & UINT64_C(0xFFFFFFFF));
}

std::int32_t nextRandomI32()
{
    return static_cast<std::int32_t>(nextRandomU32());
}

template <typename Mirror, typename Remote>
constexpr bool kArchivable =
    std::is_class_v<typename ::archwith::rt::ArchiveWith<Mirror, Remote>::Archived> &&
    std::is_class_v<typename ::archwith::rt::ArchiveWith<Mirror, Remote>::Resolver>;

static_assert(kArchivable<geo::Point, remote::Point>, "Point adapter missing");
static_assert(kArchivable<geo::Point, remote::PointV2>, "PointV2 adapter missing");
static_assert(kArchivable<geo::Segment, remote::Segment>, "Segment adapter missing");
static_assert(kArchivable<geo::Label, remote::Label>, "Label adapter missing");
static_assert(kArchivable<geo::Span, remote::Span>, "Span adapter missing");
static_assert(kArchivable<geo::Boxed<std::uint8_t>, remote::Boxed<std::uint8_t>>, "Boxed adapter missing");
static_assert(kArchivable<geo::Nothing, remote::Nothing>, "Nothing adapter missing");

int runPointCases(const std::size_t iterations)
{
    for (std::size_t i = 0; i < iterations; ++i)
    {
        const remote::Point in{nextRandomI32(), nextRandomI32()};
        const auto          archive  = conv::archiveRoot<geo::Point>(in);
        const auto&         archived = conv::accessRoot<geo::Point, remote::Point>(archive);
        if ((archived.x != in.x) || (archived.y != in.y))
        {
            std::fprintf(stderr, "Point archived value mismatch at iteration %zu\n", i);
            return 1;
        }
        const remote::Point out = conv::deserializeRoot<geo::Point, remote::Point>(archive);
        if ((out.x != in.x) || (out.y != in.y))
        {
            std::fprintf(stderr, "Point round-trip mismatch at iteration %zu\n", i);
            return 1;
        }

        // Both remote types share one mapping table, so equal values archive to equal bytes.
        const remote::PointV2 inV2{in.x, in.y};
        const auto            archiveV2 = conv::archiveRoot<geo::Point>(inV2);
        if (archiveV2.bytes != archive.bytes)
        {
            std::fprintf(stderr, "Point and PointV2 archives differ at iteration %zu\n", i);
            return 1;
        }
        const remote::PointV2 outV2 = conv::deserializeRoot<geo::Point, remote::PointV2>(archiveV2);
        if ((outV2.x != inV2.x) || (outV2.y != inV2.y))
        {
            std::fprintf(stderr, "PointV2 round-trip mismatch at iteration %zu\n", i);
            return 1;
        }
    }
    std::printf("PASS Point random (%zu)\n", iterations);
    return 0;
}

int runSegmentCases(const std::size_t iterations)
{
    for (std::size_t i = 0; i < iterations; ++i)
    {
        const remote::Segment in{{nextRandomI32(), nextRandomI32()},
                                 {nextRandomI32(), nextRandomI32()},
                                 nextRandomI32()};
        const auto  archive  = conv::archiveRoot<geo::Segment>(in);
        const auto& archived = conv::accessRoot<geo::Segment, remote::Segment>(archive);

        // The id goes through AsString, so its bytes are the decimal text.
        const std::string idText = std::to_string(in.id);
        if ((archived.start.x != in.start.x) || (archived.end.y != in.end.y) ||
            (archived.id.length != idText.size()) ||
            (std::memcmp(archive.bytes.data() + archived.id.pos, idText.data(), idText.size()) != 0))
        {
            std::fprintf(stderr, "Segment archived value mismatch at iteration %zu\n", i);
            return 1;
        }

        const remote::Segment out = conv::deserializeRoot<geo::Segment, remote::Segment>(archive);
        if ((out.start.x != in.start.x) || (out.start.y != in.start.y) || (out.end.x != in.end.x) ||
            (out.end.y != in.end.y) || (out.id != in.id))
        {
            std::fprintf(stderr, "Segment round-trip mismatch at iteration %zu\n", i);
            return 1;
        }
    }
    std::printf("PASS Segment random (%zu)\n", iterations);
    return 0;
}

int runSpanCases(const std::size_t iterations)
{
    for (std::size_t i = 0; i < iterations; ++i)
    {
        const remote::Span in{nextRandomI32(), "span-" + std::to_string(i), nextRandomI32()};
        const auto         archive  = conv::archiveRoot<geo::Span>(in);
        const auto&        archived = conv::accessRoot<geo::Span, remote::Span>(archive);
        if ((archived.begin != in.begin) || (archived.end != in.end) || (archived.tag.length != in.tag.size()))
        {
            std::fprintf(stderr, "Span archived value mismatch at iteration %zu\n", i);
            return 1;
        }
        const remote::Span out = conv::deserializeRoot<geo::Span, remote::Span>(archive);
        if ((out.begin != in.begin) || (out.end != in.end) || (out.tag != in.tag))
        {
            std::fprintf(stderr, "Span round-trip mismatch at iteration %zu\n", i);
            return 1;
        }
    }
    std::printf("PASS Span random (%zu)\n", iterations);
    return 0;
}

int runDirectedCases()
{
    {
        const remote::Label in("mirror-label", static_cast<std::uint8_t>(0xA5U));
        const auto          archive  = conv::archiveRoot<geo::Label>(in);
        const auto&         archived = conv::accessRoot<geo::Label, remote::Label>(archive);
        const std::string   text(reinterpret_cast<const char*>(archive.bytes.data() + archived.text.pos),
                                 archived.text.length);
        if ((text != in.text()) || (archived.weight != in.weight()))
        {
            std::fprintf(stderr, "Label getter archiving mismatch\n");
            return 1;
        }
    }

    {
        const remote::Boxed<std::uint8_t> in{static_cast<std::uint8_t>(0x5AU)};
        const auto                        archive = conv::archiveRoot<geo::Boxed<std::uint8_t>>(in);
        const auto out = conv::deserializeRoot<geo::Boxed<std::uint8_t>, remote::Boxed<std::uint8_t>>(archive);
        if (out.value != in.value)
        {
            std::fprintf(stderr, "Boxed<uint8_t> round-trip mismatch\n");
            return 1;
        }

        const remote::Boxed<std::string> inText{"boxed text"};
        const auto archiveText = conv::archiveRoot<geo::Boxed<std::string>>(inText);
        const auto outText = conv::deserializeRoot<geo::Boxed<std::string>, remote::Boxed<std::string>>(archiveText);
        if (outText.value != inText.value)
        {
            std::fprintf(stderr, "Boxed<std::string> round-trip mismatch\n");
            return 1;
        }
    }

    {
        const remote::Nothing in{};
        const auto            archive = conv::archiveRoot<geo::Nothing>(in);
        (void) conv::deserializeRoot<geo::Nothing, remote::Nothing>(archive);
    }

    std::printf("PASS directed (3)\n");
    return 0;
}

}  // namespace

int main(int argc, char** argv)
{
    std::size_t iterations = 128U;
    if (argc > 1)
    {
        char*               endptr = nullptr;
        const unsigned long parsed = std::strtoul(argv[1], &endptr, 10);
        if ((endptr == nullptr) || (*endptr != '\0') || (parsed == 0UL))
        {
            std::fprintf(stderr, "Invalid iteration count: %s\n", argv[1]);
            return 2;
        }
        iterations = static_cast<std::size_t>(parsed);
    }

    if (runPointCases(iterations) != 0)
    {
        return 1;
    }
    if (runSegmentCases(iterations) != 0)
    {
        return 1;
    }
    if (runSpanCases(iterations) != 0)
    {
        return 1;
    }
    if (runDirectedCases() != 0)
    {
        return 1;
    }
    std::printf("PASS adapter round-trip\n");
    return 0;
}
