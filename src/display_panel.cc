#include "display_panel.hh"
#include "imgui.h"
#include "backends/imgui_impl_vulkan.h"

display_panel::display_panel(
    context& ctx,
    gui_render_stage& stage,
    vulkan_texture_backend& backend,
    emulator_display& display
): stage(&stage), display(&display), nearest(ctx)
{
    texture_id = ImGui_ImplVulkan_AddTexture(
        nearest.get(),
        backend.get_image_view(display.get_texture()),
        VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL
    );
}

display_panel::~display_panel()
{
    stage->release_texture(texture_id);
}

void display_panel::render()
{
    ImGui::SetNextWindowPos(ImVec2(5.0f, 5.0f), ImGuiCond_Once);
    if(ImGui::Begin("Emulator Window", nullptr, ImGuiWindowFlags_AlwaysAutoResize))
    {
        if(display->has_failed())
        {
            // Showing the last uploaded frame would just be stale content.
            vec2 size = display->get_draw_size();
            ImGui::PushTextWrapPos(size.x);
            ImGui::TextColored(
                ImVec4(1.0f, 0.3f, 0.3f, 1.0f),
                "Rendering stopped: %s", display->get_failure().c_str()
            );
            ImGui::PopTextWrapPos();
        }
        else
        {
            vec2 size = display->get_draw_size();
            vec4 tint = display->get_tint();
            ImGui::Image(
                (ImTextureID)texture_id,
                ImVec2(size.x, size.y),
                ImVec2(0, 0), ImVec2(1, 1),
                ImVec4(tint.r, tint.g, tint.b, tint.a)
            );
        }

        float scale = display->get_scale();
        if(ImGui::InputFloat("Scale", &scale, 1.0f, 1.0f, "%.1f") && scale > 0.0f)
            display->set_scale(scale);

        vec4 tint = display->get_tint();
        if(ImGui::ColorEdit4("Main Color", &tint.x))
            display->set_tint(tint);
    }
    ImGui::End();
}
