#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <nitro/hw/video/video.hpp>

#include "mock_register_space.hpp"

#include <vector>

using namespace nitro;
using namespace nitro::video;

using video_test::MockRegisterSpace;
using Access = MockRegisterSpace::Access;

namespace video_ops {

struct TestSubject {
    MockRegisterSpace space;

    const std::vector<Access> &Accesses() const {
        return space.accesses;
    }
};

TEST_CASE("Register math computes the next register value", "[video][calc]") {
    SECTION("Power flags are added and removed") {
        CHECK(CalcPowerOn(0x00000000, GfxPwr::Main2D) == 0x00000002);
        CHECK(CalcPowerOn(0x00008001, GfxPwr::All) == 0x0000820F);
        CHECK(CalcPowerOff(0xFFFFFFFF, GfxPwr::All2D) == 0xFFFFFDFD);
        CHECK(CalcPowerOff(0x0000820F, GfxPwr::Render3D | GfxPwr::Geometry3D) == 0x00008203);
    }

    SECTION("Main engine position only touches bit 15") {
        CHECK(CalcEngineLCD(0x00000000, MainEnginePos::Top) == 0x00008000);
        CHECK(CalcEngineLCD(0xFFFFFFFF, MainEnginePos::Bottom) == 0xFFFF7FFF);
        CHECK(CalcEngineLCD(0x0000820F, MainEnginePos::Top) == 0x0000820F);
    }

    SECTION("Brightness levels are encoded with a mode and a clamped factor") {
        CHECK(CalcBrightness(0) == 0x4000);
        CHECK(CalcBrightness(8) == 0x4008);
        CHECK(CalcBrightness(16) == 0x4010);
        CHECK(CalcBrightness(-1) == 0x8001);
        CHECK(CalcBrightness(-16) == 0x8010);
        CHECK(CalcBrightness(20) == CalcBrightness(16));
        CHECK(CalcBrightness(-20) == CalcBrightness(-16));
        CHECK(CalcBrightness(INT32_MAX) == 0x4010);
        CHECK(CalcBrightness(INT32_MIN) == 0x8010);
    }

    SECTION("V-Count trigger splits the line number across bits 7-15") {
        CHECK(CalcVCountTrigger(0x0000, 0) == 0x0000);
        CHECK(CalcVCountTrigger(0x0000, 191) == 0xBF00);
        CHECK(CalcVCountTrigger(0x0000, 262) == 0x0680);
        CHECK(CalcVCountTrigger(0xFFFF, 200) == 0xC87F);
        CHECK(CalcVCountTrigger(0x0038, 256) == 0x00B8);
        CHECK(CalcVCountTrigger(0x0000, kVisibleLines - 1) == 0xBF00);
        CHECK(CalcVCountTrigger(0x0000, kVisibleLines) == 0xC000);
    }

    SECTION("Lines past the last scan line are still encoded") {
        CHECK(CalcVCountTrigger(0x0000, kVCountLines) == 0x0780);
        CHECK(CalcVCountTrigger(0x0000, 300) == 0x2C80);
        CHECK(CalcVCountTrigger(0x0041, 300) == 0x2CC1);
        CHECK(CalcVCountTrigger(0x007F, 511) == 0xFFFF);
        CHECK(CalcVCountTrigger(0x0000, 512) == 0x0000);
    }

    SECTION("Master brightness registers are selected by engine offset") {
        CHECK(MasterBrightAddress(GfxEngine::Main) == 0x0400006C);
        CHECK(MasterBrightAddress(GfxEngine::Sub) == 0x0400106C);
    }
}

TEST_CASE("GfxPwr supports set operations", "[video][power]") {
    CHECK((GfxPwr::Main2D | GfxPwr::Sub2D) == GfxPwr::All2D);
    CHECK((GfxPwr::All & ~GfxPwr::All2D) == (GfxPwr::Render3D | GfxPwr::Geometry3D));
    CHECK(BitmaskEnum(GfxPwr::All).AllOf(GfxPwr::All2D));
    CHECK(BitmaskEnum(GfxPwr::All2D).AnyOf(GfxPwr::Sub2D | GfxPwr::Render3D));
    CHECK_FALSE(BitmaskEnum(GfxPwr::All2D).AllOf(GfxPwr::Sub2D | GfxPwr::Render3D));
    CHECK(BitmaskEnum(GfxPwr::Main2D).NoneOf(GfxPwr::Sub2D));
    CHECK(static_cast<uint32>(GfxPwr::All) == 0x020E);
}

#if Nitro_ARM9

TEST_CASE_METHOD(TestSubject, "Display control accessors perform a single 32-bit access", "[video][dispcnt]") {
    SECTION("Main engine") {
        const DisplayControlMain ctl{.bgMode = 1, .displayBG0 = true, .displayMode = 1, .objExtPalette = true};
        SetMainDisplayControl(space, ctl);
        CHECK(Accesses() == std::vector{MockRegisterSpace::Store(0x04000000, 4, 0x80010101)});

        space.ClearCaptures();
        CHECK(GetMainDisplayControl(space) == ctl);
        CHECK(Accesses() == std::vector{MockRegisterSpace::Load(0x04000000, 4, 0x80010101)});
    }

    SECTION("Sub engine") {
        const DisplayControlSub ctl{.bgMode = 3, .displayOBJ = true, .displayMode = 1};
        SetSubDisplayControl(space, ctl);
        CHECK(Accesses() == std::vector{MockRegisterSpace::Store(0x04001000, 4, 0x00011003)});

        space.ClearCaptures();
        CHECK(GetSubDisplayControl(space) == ctl);
        CHECK(Accesses() == std::vector{MockRegisterSpace::Load(0x04001000, 4, 0x00011003)});
    }

    SECTION("Getters accept any raw bit pattern") {
        space.Poke<uint32>(0x04000000, 0xFFFFFFFF);
        CHECK(GetMainDisplayControl(space).ToU32() == 0xFFFFFFFF);

        space.Poke<uint32>(0x04001000, 0xFFFFFFFF);
        CHECK(GetSubDisplayControl(space).ToU32() == 0xFFFFFFFF);
    }

    SECTION("Writing back an unmodified value leaves the register unchanged") {
        const uint32 raw = GENERATE(0xFFFFFFFFu, 0x3F4C0008u, 0xA5A5A5A5u);
        space.Poke<uint32>(0x04000000, raw);
        space.Poke<uint32>(0x04001000, raw);

        SetMainDisplayControl(space, GetMainDisplayControl(space));
        SetSubDisplayControl(space, GetSubDisplayControl(space));
        CHECK(space.Peek<uint32>(0x04000000) == raw);
        CHECK(space.Peek<uint32>(0x04001000) == raw);
    }

    SECTION("Sub engine field edits keep the reserved bits read from the register") {
        space.Poke<uint32>(0x04001000, 0x3F4C0008);
        auto ctl = GetSubDisplayControl(space);
        ctl.displayMode = 1;
        ctl.displayBG0 = true;
        SetSubDisplayControl(space, ctl);
        CHECK(space.Peek<uint32>(0x04001000) == 0x3F4D0108);
    }
}

TEST_CASE_METHOD(TestSubject, "Background control accessors address one register per layer", "[video][bgcnt]") {
    const uint32 index = GENERATE(0u, 1u, 2u, 3u);
    const BackgroundControl ctl{.priority = 2, .tileMapBase = 4, .screenSize = 1};

    SetMainBGControl(space, index, ctl);
    SetSubBGControl(space, index, ctl);
    CHECK(Accesses() == std::vector{
                            MockRegisterSpace::Store(0x04000008 + index * 2, 2, 0x4402),
                            MockRegisterSpace::Store(0x04001008 + index * 2, 2, 0x4402),
                        });

    space.ClearCaptures();
    CHECK(GetMainBGControl(space, index) == ctl);
    CHECK(GetSubBGControl(space, index) == ctl);
    CHECK(Accesses() == std::vector{
                            MockRegisterSpace::Load(0x04000008 + index * 2, 2, 0x4402),
                            MockRegisterSpace::Load(0x04001008 + index * 2, 2, 0x4402),
                        });
}

// Out-of-range layer indices are not rejected. They wrap around and silently alias layers 0-3, which callers must
// avoid.
TEST_CASE_METHOD(TestSubject, "Background layer indices past 3 alias lower layers", "[video][bgcnt][hazard]") {
    const uint32 index = GENERATE(4u, 5u, 6u, 7u, 8u, 0xFFFFFFFFu);
    const uint32 aliased = index & 3;

    CHECK(BGControlAddress(mmio::kBG0CNT_MAIN, index) == BGControlAddress(mmio::kBG0CNT_MAIN, aliased));

    SetMainBGControl(space, index, BackgroundControl{.mosaic = true});
    CHECK(space.Peek<uint16>(0x04000008 + aliased * 2) == 0x0040);
    CHECK(GetMainBGControl(space, aliased).mosaic);

    SetSubBGControl(space, aliased, BackgroundControl{.priority = 1});
    CHECK(GetSubBGControl(space, index).priority == 1);
}

TEST_CASE_METHOD(TestSubject, "PowerOn and PowerOff read-modify-write POWCNT1", "[video][power]") {
    space.Poke<uint32>(0x04000304, 0x0000820C);

    PowerOn(space, GfxPwr::Main2D);
    CHECK(Accesses() == std::vector{
                            MockRegisterSpace::Load(0x04000304, 4, 0x0000820C),
                            MockRegisterSpace::Store(0x04000304, 4, 0x0000820E),
                        });

    space.ClearCaptures();
    PowerOff(space, GfxPwr::Main2D);
    CHECK(Accesses() == std::vector{
                            MockRegisterSpace::Load(0x04000304, 4, 0x0000820E),
                            MockRegisterSpace::Store(0x04000304, 4, 0x0000820C),
                        });
    CHECK(space.Peek<uint32>(0x04000304) == 0x0000820C);

    PowerOff(space, GfxPwr::All);
    CHECK(space.Peek<uint32>(0x04000304) == 0x00008000);

    PowerOn(space, GfxPwr::All2D);
    CHECK(space.Peek<uint32>(0x04000304) == 0x00008202);
}

TEST_CASE_METHOD(TestSubject, "SetEngineLCD assigns the main engine to a screen", "[video][power]") {
    space.Poke<uint32>(0x04000304, 0x0000020F);

    SetEngineLCD(space, MainEnginePos::Top);
    CHECK(Accesses() == std::vector{
                            MockRegisterSpace::Load(0x04000304, 4, 0x0000020F),
                            MockRegisterSpace::Store(0x04000304, 4, 0x0000820F),
                        });

    SetEngineLCD(space, MainEnginePos::Bottom);
    CHECK(space.Peek<uint32>(0x04000304) == 0x0000020F);
}

TEST_CASE_METHOD(TestSubject, "SetBrightness writes the master brightness register once", "[video][brightness]") {
    SECTION("Main engine") {
        SetBrightness(space, GfxEngine::Main, -8);
        CHECK(Accesses() == std::vector{MockRegisterSpace::Store(0x0400006C, 4, 0x8008)});
    }

    SECTION("Sub engine") {
        SetBrightness(space, GfxEngine::Sub, 0);
        CHECK(Accesses() == std::vector{MockRegisterSpace::Store(0x0400106C, 4, 0x4000)});
    }

    SECTION("Out-of-range levels are clamped") {
        SetBrightness(space, GfxEngine::Main, 20);
        SetBrightness(space, GfxEngine::Main, 16);
        SetBrightness(space, GfxEngine::Main, -20);
        SetBrightness(space, GfxEngine::Main, -16);
        CHECK(Accesses() == std::vector{
                                MockRegisterSpace::Store(0x0400006C, 4, 0x4010),
                                MockRegisterSpace::Store(0x0400006C, 4, 0x4010),
                                MockRegisterSpace::Store(0x0400006C, 4, 0x8010),
                                MockRegisterSpace::Store(0x0400006C, 4, 0x8010),
                            });
    }
}

#endif // Nitro_ARM9

TEST_CASE_METHOD(TestSubject, "SetVCountTrigger updates only the V-Count setting of DISPSTAT", "[video][vcount]") {
    SECTION("Status and IRQ enable bits are preserved") {
        space.Poke<uint16>(0x04000004, 0x003F);
        SetVCountTrigger(space, 200);
        CHECK(Accesses() == std::vector{
                                MockRegisterSpace::Load(0x04000004, 2, 0x003F),
                                MockRegisterSpace::Store(0x04000004, 2, 0xC83F),
                            });
    }

    SECTION("Bits 8-14 hold the low line bits") {
        space.Poke<uint16>(0x04000004, 0x0000);
        SetVCountTrigger(space, 200);
        CHECK(((space.Peek<uint16>(0x04000004) >> 8) & 0x7F) == 72);
    }

    SECTION("Line bit 8 goes into register bit 7") {
        space.Poke<uint16>(0x04000004, 0x0018);
        SetVCountTrigger(space, 262);
        CHECK(space.Peek<uint16>(0x04000004) == 0x0698);

        SetVCountTrigger(space, 191);
        CHECK(space.Peek<uint16>(0x04000004) == 0xBF18);
    }

    SECTION("A previous trigger line is fully replaced") {
        space.Poke<uint16>(0x04000004, 0xFFFF);
        SetVCountTrigger(space, 0);
        CHECK(space.Peek<uint16>(0x04000004) == 0x007F);
    }
}

} // namespace video_ops
