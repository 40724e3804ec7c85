#include "emulator_display.hh"
#include "error.hh"
#include <iostream>
#include <new>

namespace
{

uvec2 checked_size(const pixel_source& src, uvec2 screen_size)
{
    uvec2 src_size = src.get_screen_size();
    if(src_size != screen_size)
        throw configuration_mismatch(format_error(
            "Emulator screen is %ux%u, display is configured for %ux%u",
            src_size.x, src_size.y, screen_size.x, screen_size.y
        ));
    return screen_size;
}

}

const vec4 emulator_display::DEFAULT_TINT = vec4(0.19f, 0.66f, 0.38f, 1.0f);

emulator_display::emulator_display(
    const pixel_source& src,
    texture_backend& backend,
    uvec2 screen_size
):  src(&src), backend(&backend),
    converter(checked_size(src, screen_size)),
    pipeline(backend),
    tint(DEFAULT_TINT), scale(DEFAULT_SCALE)
{
    texture = backend.create_texture(texture_config::display_texture(screen_size));
}

emulator_display::emulator_display(
    const pixel_source& src,
    texture_backend& backend
): emulator_display(src, backend, src.get_screen_size())
{
}

emulator_display::~emulator_display()
{
    if(backend->is_valid(texture))
        backend->destroy_texture(texture);
}

void emulator_display::update()
{
    if(has_failed())
        throw display_error("Display is disabled after an earlier failure: " + failure);

    try
    {
        pipeline.upload(texture, converter.convert(*src));
    }
    catch(const display_error& e)
    {
        failure = e.what();
        std::cerr << "Emulator display failed: " << failure << std::endl;
        throw;
    }
    catch(const std::bad_alloc& e)
    {
        failure = format_error("Out of host memory during upload (%s)", e.what());
        std::cerr << "Emulator display failed: " << failure << std::endl;
        throw resource_allocation_failure(failure);
    }
}

texture_handle emulator_display::get_texture() const
{
    return texture;
}

uvec2 emulator_display::get_size() const
{
    return converter.get_size();
}

void emulator_display::set_tint(vec4 tint)
{
    this->tint = tint;
}

vec4 emulator_display::get_tint() const
{
    return tint;
}

void emulator_display::set_scale(float scale)
{
    if(!(scale > 0.0f))
        throw std::invalid_argument(format_error("Invalid display scale %f", scale));
    this->scale = scale;
}

float emulator_display::get_scale() const
{
    return scale;
}

vec2 emulator_display::get_draw_size() const
{
    return vec2(get_size()) * scale;
}

bool emulator_display::has_failed() const
{
    return !failure.empty();
}

const std::string& emulator_display::get_failure() const
{
    return failure;
}

uint64_t emulator_display::get_frame_count() const
{
    return pipeline.get_upload_count();
}
