#ifndef CHIPVIEW_DISPLAY_PANEL_HH
#define CHIPVIEW_DISPLAY_PANEL_HH
#include "emulator_display.hh"
#include "vulkan_texture_backend.hh"
#include "sampler.hh"
#include "gui_render_stage.hh"

// ImGui window showing the emulator texture with its tint & scale controls.
// The stage must outlive the panel.
class display_panel
{
public:
    display_panel(
        context& ctx,
        gui_render_stage& stage,
        vulkan_texture_backend& backend,
        emulator_display& display
    );
    display_panel(const display_panel& other) = delete;
    ~display_panel();

    // Call between ImGui::NewFrame() and ImGui::Render().
    void render();

private:
    gui_render_stage* stage;
    emulator_display* display;
    sampler nearest;
    VkDescriptorSet texture_id;
};

#endif
