/**
@file
@brief Main page documentation.
*/

/**
@mainpage Nitro

Nitro is a register-level layer for the dual 2D graphics engines of a dual-screen handheld, written in C++20.



@section usage Usage

Include nitro.hpp to bring in everything, or pick the individual headers under `nitro/hw/video`.

Registers are modeled as plain structs with named fields: `nitro::video::DisplayControlMain`,
`nitro::video::DisplayControlSub` and `nitro::video::BackgroundControl`. Read a register with one of the getters, change
the fields you need and hand it back to the matching setter:

```cpp
using namespace nitro::video;

PowerOn(GfxPwr::All2D);
SetEngineLCD(MainEnginePos::Top);

auto dispcnt = GetMainDisplayControl();
dispcnt.SetBGMode(BGMode::Text4);
dispcnt.SetDisplayMode(DisplayMode::Normal);
dispcnt.displayBG0 = true;
SetMainDisplayControl(dispcnt);

SetMainBGControl(0, BackgroundControl{.priority = 0, .tileMapBase = 31});
SetBrightness(GfxEngine::Sub, -16);
SetVCountTrigger(160);
```

The structs never touch the hardware by themselves. Every hardware access is a single volatile load or store issued by
the accessors through `nitro::mmio`.



@subsection spaces Register spaces

Every operation also exists as a template taking a `nitro::mmio::RegisterSpace` as its first argument. The overloads
without that argument use `nitro::mmio::IOSpace{}`, which maps the real I/O block. Pass an `IOSpace` constructed over a
buffer, or any other type satisfying the concept, to run the same code against memory on a host machine.



@subsection role Processor role

The register accessors, power control and brightness operations are only declared when `Nitro_ARM9` is truthy.
`nitro::video::SetVCountTrigger` and `nitro::video::Rgb15` are always available.



@subsection hazards Hazards

- `PowerOn`, `PowerOff`, `SetEngineLCD` and `SetVCountTrigger` read and then write their register. An interrupt handler
  that modifies the same register between the two accesses loses its change. Disable interrupts around these calls if
  that can happen.
- Background layer indices wrap around: layer 4 is layer 0, layer 5 is layer 1, and so on.
- Brightness levels are clamped to -16..16. V-Count trigger lines above 262 are only caught by an assertion in debug
  builds.
*/
