#ifndef CHIPVIEW_PIXEL_SOURCE_HH
#define CHIPVIEW_PIXEL_SOURCE_HH
#include "math.hh"

// Read-only view of an emulator's monochrome screen. The size must not change
// during the lifetime of the source.
class pixel_source
{
public:
    virtual ~pixel_source() = default;

    virtual uvec2 get_screen_size() const = 0;
    virtual bool get_pixel(unsigned x, unsigned y) const = 0;
};

#endif
