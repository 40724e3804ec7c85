#include "gui.hh"
#include "display_panel.hh"
#include "backends/imgui_impl_sdl.h"
#include "backends/imgui_impl_vulkan.h"
#include "io.hh"

namespace
{

PFN_vkVoidFunction loader_func(const char* name, void* userdata)
{
    context* ctx = (context*)userdata;
    return vkGetInstanceProcAddr(ctx->get_instance(), name);
}

void push_option_event(gui::option_events code)
{
    SDL_Event e;
    SDL_zero(e);
    e.type = SDL_USEREVENT;
    e.user.code = code;
    SDL_PushEvent(&e);
}

}

gui::gui(context& ctx, options& opts)
:   show_menubar(true), show_about(false), ctx(&ctx), opts(&opts),
    panel(nullptr)
{
    ImGui::CreateContext();
    static std::string ini_path = (get_writable_path()/"imgui.ini").string();
    ImGui::GetIO().IniFilename = ini_path.c_str();
    ImGui::StyleColorsDark();
    ImGui_ImplSDL2_InitForVulkan(ctx.get_window());
    ImGui_ImplVulkan_LoadFunctions(loader_func, &ctx);
}

gui::~gui()
{
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();
}

void gui::set_display_panel(display_panel* panel)
{
    this->panel = panel;
}

void gui::handle_event(const SDL_Event& event)
{
    if(!ImGui::GetIO().WantCaptureKeyboard && event.type == SDL_KEYDOWN)
    {
        if(event.key.keysym.sym == SDLK_LALT)
            show_menubar = !show_menubar;
    }
    ImGui_ImplSDL2_ProcessEvent(&event);
}

void gui::update()
{
    ImGui_ImplVulkan_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();

    if(show_menubar && ImGui::BeginMainMenuBar())
    {
        if(ImGui::BeginMenu("File"))
        {
            menu_file();
            ImGui::EndMenu();
        }

        if(ImGui::BeginMenu("Window"))
        {
            menu_window();
            ImGui::EndMenu();
        }

        if(ImGui::BeginMenu("Help"))
        {
            menu_help();
            ImGui::EndMenu();
        }
        ImGui::TextColored(
            ImVec4(0.4, 0.4, 0.4, 1.0),
            "  Press left alt to toggle this bar on and off"
        );
        ImGui::EndMainMenuBar();
    }

    if(panel) panel->render();
    if(show_about) help_about();

    ImGui::Render();
}

void gui::menu_file()
{
    if(ImGui::MenuItem("Reset display"))
        push_option_event(RESET_DISPLAY);

    if(ImGui::MenuItem("Quit"))
    {
        SDL_Event e;
        SDL_zero(e);
        e.type = SDL_QUIT;
        SDL_PushEvent(&e);
    }
}

void gui::menu_window()
{
    if(ImGui::MenuItem("Fullscreen", NULL, opts->fullscreen))
    {
        opts->fullscreen = !opts->fullscreen;
        push_option_event(FULLSCREEN_TOGGLE);
    }

    if(ImGui::MenuItem("Vertical sync", NULL, opts->vsync))
    {
        opts->vsync = !opts->vsync;
        push_option_event(VSYNC_TOGGLE);
    }
}

void gui::menu_help()
{
    if(ImGui::MenuItem("About"))
        show_about = true;
}

void gui::help_about()
{
    if(ImGui::Begin("About chipview", &show_about, ImGuiWindowFlags_AlwaysAutoResize))
    {
        ImGui::Text(R"(
chipview shows the monochrome screen of an emulated machine.
        )");
        ImGui::Separator();
        ivec2 size = ctx->get_size();
        ImGui::Text("Swapchain: %dx%d, %u images", size.x, size.y, ctx->get_image_count());
        ImGui::Text("Frames: %llu", (unsigned long long)ctx->get_frame_counter());
    }
    ImGui::End();
}
