#ifndef CHIPVIEW_FRAME_CONVERTER_HH
#define CHIPVIEW_FRAME_CONVERTER_HH
#include "pixel_source.hh"
#include <vector>

// Tightly packed, row-major RGBA8 pixels.
struct rgba_image
{
    uvec2 size = uvec2(0);
    std::vector<uint8_t> data;
};

// Expands a monochrome screen into opaque white-on-black RGBA. The output
// buffer is reused from frame to frame.
class frame_converter
{
public:
    frame_converter(uvec2 size);

    // Throws configuration_mismatch if the source has a different size.
    const rgba_image& convert(const pixel_source& src);

    const rgba_image& get_image() const;
    uvec2 get_size() const;

private:
    rgba_image image;
};

#endif
