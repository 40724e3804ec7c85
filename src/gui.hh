#ifndef CHIPVIEW_GUI_HH
#define CHIPVIEW_GUI_HH

#include "context.hh"
#include "options.hh"

class display_panel;
class gui
{
public:
    gui(context& ctx, options& opts);
    ~gui();

    // Sent as SDL_USEREVENT codes when a menu changes an option.
    enum option_events
    {
        FULLSCREEN_TOGGLE = 0,
        VSYNC_TOGGLE,
        RESET_DISPLAY
    };

    void set_display_panel(display_panel* panel);

    void handle_event(const SDL_Event& event);
    void update();

private:
    void menu_file();
    void menu_window();
    void menu_help();
    void help_about();

    bool show_menubar;
    bool show_about;
    context* ctx;
    options* opts;
    display_panel* panel;
};

#endif
