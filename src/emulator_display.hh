#ifndef CHIPVIEW_EMULATOR_DISPLAY_HH
#define CHIPVIEW_EMULATOR_DISPLAY_HH
#include "upload_pipeline.hh"
#include <string>

// Owns the texture that shows one pixel_source, along with how it's drawn.
// The texture is created once and overwritten by every update().
class emulator_display
{
public:
    static constexpr float DEFAULT_SCALE = 9.0f;
    static const vec4 DEFAULT_TINT;

    // Throws configuration_mismatch if the source isn't screen_size pixels.
    emulator_display(
        const pixel_source& src,
        texture_backend& backend,
        uvec2 screen_size
    );
    emulator_display(const pixel_source& src, texture_backend& backend);
    emulator_display(const emulator_display& other) = delete;
    ~emulator_display();

    // Converts the current screen and uploads it. Once an update has failed,
    // the display stays failed and every later update throws. Running out of
    // host memory is reported as resource_allocation_failure.
    void update();

    texture_handle get_texture() const;
    uvec2 get_size() const;

    void set_tint(vec4 tint);
    vec4 get_tint() const;

    // Throws std::invalid_argument for non-positive scales.
    void set_scale(float scale);
    float get_scale() const;
    vec2 get_draw_size() const;

    bool has_failed() const;
    const std::string& get_failure() const;

    uint64_t get_frame_count() const;

private:
    const pixel_source* src;
    texture_backend* backend;
    frame_converter converter;
    upload_pipeline pipeline;
    texture_handle texture;
    vec4 tint;
    float scale;
    std::string failure;
};

#endif
