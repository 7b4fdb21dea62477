#pragma once

// Tessera - Main header
// Progressive flat-color decomposition of images

#include <tessera/errors.h>
#include <tessera/pixel_buffer.h>
#include <tessera/region.h>
#include <tessera/region_stats.h>
#include <tessera/fragment.h>
#include <tessera/refinement_engine.h>
#include <tessera/image_source.h>
#include <tessera/progressive_driver.h>
#include <tessera/fragment_layout.h>

namespace tessera {

constexpr const char* VERSION = "1.0.0";

} // namespace tessera
