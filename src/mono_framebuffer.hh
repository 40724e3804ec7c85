#ifndef CHIPVIEW_MONO_FRAMEBUFFER_HH
#define CHIPVIEW_MONO_FRAMEBUFFER_HH
#include "pixel_source.hh"
#include <vector>

// One bit per pixel screen in the style of the CHIP-8 display. Sprites are
// 8 pixels wide and XORed into the screen.
class mono_framebuffer: public pixel_source
{
public:
    static constexpr unsigned DEFAULT_WIDTH = 64;
    static constexpr unsigned DEFAULT_HEIGHT = 32;

    mono_framebuffer(uvec2 size = uvec2(DEFAULT_WIDTH, DEFAULT_HEIGHT));

    uvec2 get_screen_size() const override;
    bool get_pixel(unsigned x, unsigned y) const override;

    void set_pixel(unsigned x, unsigned y, bool on);
    void clear();

    // Returns true if any lit pixel was turned off. Coordinates wrap around
    // the screen edges.
    bool draw_sprite(unsigned x, unsigned y, const std::vector<uint8_t>& rows);

private:
    size_t index(unsigned x, unsigned y) const;

    uvec2 size;
    std::vector<bool> pixels;
};

#endif
