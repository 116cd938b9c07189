#include "ferry/LinearMemory.hpp"

#include "doctest/doctest.h"

namespace ferry {

TEST_CASE("LinearMemory") {
    LinearMemory memory(4 * LinearMemory::kGrowthUnit);
    CHECK(memory.startAddress() == nullptr);
    CHECK(!memory.grow(1));

    REQUIRE(memory.map());
    REQUIRE(memory.startAddress() != nullptr);
    CHECK_EQ(memory.reservedSize(), 4 * LinearMemory::kGrowthUnit);
    CHECK_EQ(memory.committedSize(), 0);

    SUBCASE("grow rounds up to growth units") {
        REQUIRE(memory.grow(1));
        CHECK_EQ(memory.committedSize(), LinearMemory::kGrowthUnit);
        memory.startAddress()[LinearMemory::kGrowthUnit - 1] = 0xaa;

        REQUIRE(memory.grow(LinearMemory::kGrowthUnit + 1));
        CHECK_EQ(memory.committedSize(), 2 * LinearMemory::kGrowthUnit);
        CHECK_EQ(memory.startAddress()[LinearMemory::kGrowthUnit - 1], 0xaa);

        // Shrinking is a no-op.
        REQUIRE(memory.grow(16));
        CHECK_EQ(memory.committedSize(), 2 * LinearMemory::kGrowthUnit);
    }

    SUBCASE("grow past the reservation fails") {
        CHECK(memory.grow(4 * LinearMemory::kGrowthUnit));
        CHECK(!memory.grow(4 * LinearMemory::kGrowthUnit + 1));
        CHECK_EQ(memory.committedSize(), 4 * LinearMemory::kGrowthUnit);
    }

    SUBCASE("unmap") {
        CHECK(memory.unmap());
        CHECK(memory.startAddress() == nullptr);
        CHECK(memory.unmap());
    }
}

} // namespace ferry
