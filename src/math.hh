#ifndef CHIPVIEW_MATH_HH
#define CHIPVIEW_MATH_HH
#define GLM_FORCE_RADIANS
#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>
using namespace glm;

// Rounds value up to the next multiple of alignment. Alignment of 0 or 1
// leaves the value as-is.
size_t align_up(size_t value, size_t alignment);

unsigned ravel_tex_coord(uvec2 p, uvec2 size);

// Converts 0-255 integer channels into normalized floats.
vec4 normalize_color(ivec4 color);

#endif
