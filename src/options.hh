#ifndef CHIPVIEW_OPTIONS_HH
#define CHIPVIEW_OPTIONS_HH
#include "math.hh"
#include <nlohmann/json.hpp>
using json = nlohmann::json;

struct options
{
    // Larger screens are treated as a broken options file.
    static constexpr int MAX_SCREEN_DIMENSION = 4096;

    ivec2 window_size = ivec2(1280, 720);
    bool fullscreen = false;
    bool vsync = true;
    uvec2 screen_size = uvec2(64, 32);
    float display_scale = 9.0f;
    vec4 tint = vec4(0.19f, 0.66f, 0.38f, 1.0f);

    json serialize() const;
    // Returns false and resets to defaults if j is not a valid options object.
    bool deserialize(const json& j);
};

#endif
