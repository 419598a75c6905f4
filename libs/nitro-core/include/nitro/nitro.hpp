#pragma once

/**
@file
@brief The entrypoint of the Nitro core library. Includes the graphics register layer and its definitions.
*/

#include <nitro/version.hpp>

#include <nitro/hw/mmio/mmio.hpp>
#include <nitro/hw/video/video.hpp>
