#include "app.hh"
#include "error.hh"
#include "imgui.h"

namespace
{

// Steps of the demo per second, CHIP-8 programs usually redraw at 60 Hz.
constexpr int DEMO_STEP_RATE = 30;

const std::vector<uint8_t> demo_sprite = {
    0x3C, 0x42, 0xA5, 0x81, 0xA5, 0x99, 0x42, 0x3C
};

const vec4 background_color = vec4(0.05f, 0.05f, 0.06f, 1.0f);

}

app::app()
:   need_swapchain_reset(false), screen(uvec2(64, 32))
{
    load_options(opt);
    screen = mono_framebuffer(opt.screen_size);
    gfx_ctx.reset(new context(opt.window_size, opt.fullscreen, opt.vsync));
    ui.reset(new gui(*gfx_ctx, opt));
    ui_stage.reset(new gui_render_stage(*gfx_ctx));
    backend.reset(new vulkan_texture_backend(*gfx_ctx));
    create_display();
    last_step = std::chrono::steady_clock::now();
}

app::~app()
{
    if(display)
    {
        opt.tint = display->get_tint();
        opt.display_scale = display->get_scale();
    }
    ui->set_display_panel(nullptr);
    gfx_ctx->sync_flush();
    write_options(opt);
}

void app::create_display()
{
    if(display)
    {
        opt.tint = display->get_tint();
        opt.display_scale = display->get_scale();
    }
    ui->set_display_panel(nullptr);
    panel.reset();
    display.reset();

    display.reset(new emulator_display(screen, *backend, opt.screen_size));
    display->set_tint(opt.tint);
    display->set_scale(opt.display_scale);
    panel.reset(new display_panel(*gfx_ctx, *ui_stage, *backend, *display));
    ui->set_display_panel(panel.get());
}

bool app::handle_input()
{
    SDL_Event event;
    while(SDL_PollEvent(&event))
    {
        ui->handle_event(event);
        switch(event.type)
        {
        case SDL_QUIT:
            return false;

        case SDL_KEYDOWN:
            if(ImGui::GetIO().WantCaptureKeyboard) break;
            if(event.key.keysym.sym == SDLK_ESCAPE)
                return false;
            if(event.key.keysym.sym == SDLK_F11)
            {
                opt.fullscreen = !opt.fullscreen;
                gfx_ctx->set_fullscreen(opt.fullscreen);
                need_swapchain_reset = true;
            }
            break;

        case SDL_WINDOWEVENT:
            if(
                event.window.event == SDL_WINDOWEVENT_RESIZED ||
                event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED
            ){
                if(!opt.fullscreen)
                    opt.window_size = ivec2(event.window.data1, event.window.data2);
                need_swapchain_reset = true;
            }
            break;

        case SDL_USEREVENT:
            switch(event.user.code)
            {
            case gui::FULLSCREEN_TOGGLE:
                gfx_ctx->set_fullscreen(opt.fullscreen);
                need_swapchain_reset = true;
                break;
            case gui::VSYNC_TOGGLE:
                gfx_ctx->set_vsync(opt.vsync);
                need_swapchain_reset = true;
                break;
            case gui::RESET_DISPLAY:
                create_display();
                break;
            }
            break;
        }
    }
    return true;
}

void app::update()
{
    auto now = std::chrono::steady_clock::now();
    auto step = std::chrono::microseconds(1000000/DEMO_STEP_RATE);
    while(now - last_step >= step)
    {
        step_demo();
        last_step += step;
    }
}

void app::step_demo()
{
    ivec2 size = ivec2(screen.get_screen_size());
    ivec2 limit = max(size - ivec2(8, (int)demo_sprite.size()), ivec2(0));

    demo.pos += demo.velocity;
    for(int i = 0; i < 2; ++i)
    {
        if(demo.pos[i] <= 0 || demo.pos[i] >= limit[i])
        {
            demo.pos[i] = clamp(demo.pos[i], 0, limit[i]);
            demo.velocity[i] = -demo.velocity[i];
        }
    }

    screen.clear();
    screen.draw_sprite(demo.pos.x, demo.pos.y, demo_sprite);
}

void app::render()
{
    if(need_swapchain_reset)
    {
        need_swapchain_reset = false;
        gfx_ctx->reset_swapchain();
        ui_stage->reset_framebuffers();
    }

    if(gfx_ctx->start_frame())
    {
        need_swapchain_reset = true;
        return;
    }

    // The upload belongs to this frame, so its staging memory is released
    // together with the rest of the frame.
    if(!display->has_failed())
    {
        try
        {
            display->update();
        }
        catch(const display_error&)
        {
            // Already logged and recorded by the display; the panel shows
            // the message from now on and the screen state is untouched.
        }
    }

    ui->update();
    vkres<VkCommandBuffer> cmd = ui_stage->record(
        gfx_ctx->get_image_index(), background_color
    );
    if(gfx_ctx->finish_frame(cmd))
        need_swapchain_reset = true;
}
