#include "mono_framebuffer.hh"
#include "error.hh"
#include <algorithm>

mono_framebuffer::mono_framebuffer(uvec2 size)
: size(size)
{
    if(size.x == 0 || size.y == 0)
        throw std::invalid_argument(format_error(
            "Invalid framebuffer size %ux%u", size.x, size.y
        ));
    pixels.resize(size_t(size.x) * size.y, false);
}

uvec2 mono_framebuffer::get_screen_size() const
{
    return size;
}

bool mono_framebuffer::get_pixel(unsigned x, unsigned y) const
{
    return pixels[index(x, y)];
}

void mono_framebuffer::set_pixel(unsigned x, unsigned y, bool on)
{
    pixels[index(x, y)] = on;
}

void mono_framebuffer::clear()
{
    std::fill(pixels.begin(), pixels.end(), false);
}

bool mono_framebuffer::draw_sprite(
    unsigned x,
    unsigned y,
    const std::vector<uint8_t>& rows
){
    bool collision = false;
    for(size_t row = 0; row < rows.size(); ++row)
    {
        unsigned py = (y + row) % size.y;
        for(unsigned bit = 0; bit < 8; ++bit)
        {
            if(!(rows[row] & (0x80 >> bit)))
                continue;

            size_t i = index((x + bit) % size.x, py);
            if(pixels[i]) collision = true;
            pixels[i] = !pixels[i];
        }
    }
    return collision;
}

size_t mono_framebuffer::index(unsigned x, unsigned y) const
{
    if(x >= size.x || y >= size.y)
        throw std::out_of_range(format_error(
            "Pixel (%u, %u) outside of %ux%u screen", x, y, size.x, size.y
        ));
    return ravel_tex_coord(uvec2(x, y), size);
}
