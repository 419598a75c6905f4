#include <catch2/catch_test_macros.hpp>

#include <nitro/hw/video/color.hpp>

using namespace nitro::video;

namespace video_color {

TEST_CASE("Rgb15 converts 24-bit color codes to the 15-bit palette format", "[video][color]") {
    STATIC_REQUIRE(Rgb15(0xFFFFFF) == 0x7FFF);
    STATIC_REQUIRE(Rgb15(0x000000) == 0x0000);

    SECTION("Channels are packed red first") {
        CHECK(Rgb15(0xF80000) == 0x001F);
        CHECK(Rgb15(0x00F800) == 0x03E0);
        CHECK(Rgb15(0x0000F8) == 0x7C00);
    }

    SECTION("Only the top 5 bits of each channel are kept") {
        CHECK(Rgb15(0x070707) == 0x0000);
        CHECK(Rgb15(0x080808) == 0x0421);
        CHECK(Rgb15(0x7F7F7F) == 0x3DEF);
    }

    SECTION("The most significant byte is ignored") {
        CHECK(Rgb15(0xFF000000) == 0x0000);
        CHECK(Rgb15(0xABFFFFFF) == Rgb15(0xFFFFFF));
    }
}

} // namespace video_color
