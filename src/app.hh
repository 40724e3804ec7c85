#ifndef CHIPVIEW_APP_HH
#define CHIPVIEW_APP_HH

#include "context.hh"
#include "gui.hh"
#include "gui_render_stage.hh"
#include "mono_framebuffer.hh"
#include "vulkan_texture_backend.hh"
#include "emulator_display.hh"
#include "display_panel.hh"
#include "io.hh"
#include <chrono>
#include <memory>

class app
{
public:
    app();
    ~app();

    bool handle_input();
    void update();
    void render();

private:
    void create_display();
    void step_demo();

    options opt;
    bool need_swapchain_reset;
    std::unique_ptr<context> gfx_ctx;
    std::unique_ptr<gui> ui;
    std::unique_ptr<gui_render_stage> ui_stage;
    std::unique_ptr<vulkan_texture_backend> backend;
    mono_framebuffer screen;

    // The panel samples the display's texture, so it must go first.
    std::unique_ptr<emulator_display> display;
    std::unique_ptr<display_panel> panel;

    // Stand-in for the emulator: a sprite bouncing around the screen.
    struct
    {
        ivec2 pos = ivec2(0);
        ivec2 velocity = ivec2(1, 1);
    } demo;
    std::chrono::steady_clock::time_point last_step;
};

#endif
