#include "math.hh"

size_t align_up(size_t value, size_t alignment)
{
    if(alignment <= 1) return value;
    return (value + alignment - 1) / alignment * alignment;
}

unsigned ravel_tex_coord(uvec2 p, uvec2 size)
{
    return p.y * size.x + p.x;
}

vec4 normalize_color(ivec4 color)
{
    return vec4(color) / 255.0f;
}
