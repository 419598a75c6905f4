#include <nitro/hw/video/video.hpp>

namespace nitro::video {

#if Nitro_ARM9

void SetMainDisplayControl(DisplayControlMain ctl) {
    SetMainDisplayControl(mmio::IOSpace{}, ctl);
}

DisplayControlMain GetMainDisplayControl() {
    return GetMainDisplayControl(mmio::IOSpace{});
}

void SetSubDisplayControl(DisplayControlSub ctl) {
    SetSubDisplayControl(mmio::IOSpace{}, ctl);
}

DisplayControlSub GetSubDisplayControl() {
    return GetSubDisplayControl(mmio::IOSpace{});
}

void SetMainBGControl(uint32 index, BackgroundControl ctl) {
    SetMainBGControl(mmio::IOSpace{}, index, ctl);
}

BackgroundControl GetMainBGControl(uint32 index) {
    return GetMainBGControl(mmio::IOSpace{}, index);
}

void SetSubBGControl(uint32 index, BackgroundControl ctl) {
    SetSubBGControl(mmio::IOSpace{}, index, ctl);
}

BackgroundControl GetSubBGControl(uint32 index) {
    return GetSubBGControl(mmio::IOSpace{}, index);
}

void PowerOn(GfxPwr flags) {
    PowerOn(mmio::IOSpace{}, flags);
}

void PowerOff(GfxPwr flags) {
    PowerOff(mmio::IOSpace{}, flags);
}

void SetEngineLCD(MainEnginePos pos) {
    SetEngineLCD(mmio::IOSpace{}, pos);
}

void SetBrightness(GfxEngine engine, sint32 level) {
    SetBrightness(mmio::IOSpace{}, engine, level);
}

#endif // Nitro_ARM9

void SetVCountTrigger(uint16 line) {
    SetVCountTrigger(mmio::IOSpace{}, line);
}

} // namespace nitro::video
