#include "options.hh"
#include <iostream>

json options::serialize() const
{
    json j;
    j["window_width"] = window_size.x;
    j["window_height"] = window_size.y;
    j["fullscreen"] = fullscreen;
    j["vsync"] = vsync;
    j["screen_width"] = screen_size.x;
    j["screen_height"] = screen_size.y;
    j["display_scale"] = display_scale;
    j["tint"] = {tint.r, tint.g, tint.b, tint.a};
    return j;
}

bool options::deserialize(const json& j)
{
    *this = options();

    try
    {
        window_size.x = j.value("window_width", 1280);
        window_size.y = j.value("window_height", 720);
        fullscreen = j.value("fullscreen", false);
        vsync = j.value("vsync", true);
        // Signed, so that negative sizes don't wrap into huge ones.
        int64_t screen_width = j.value("screen_width", int64_t(64));
        int64_t screen_height = j.value("screen_height", int64_t(32));
        if(
            screen_width < 1 || screen_width > MAX_SCREEN_DIMENSION ||
            screen_height < 1 || screen_height > MAX_SCREEN_DIMENSION
        ) screen_size = options().screen_size;
        else screen_size = uvec2(screen_width, screen_height);
        display_scale = j.value("display_scale", 9.0f);

        if(j.contains("tint"))
        {
            const json& t = j.at("tint");
            for(int i = 0; i < 4; ++i)
                tint[i] = t.at(i).get<float>();
        }
    }
    catch(const json::exception& e)
    {
        std::cerr << "Invalid options: " << e.what() << std::endl;
        *this = options();
        return false;
    }

    // Keep whatever is sane, the rest falls back to defaults.
    if(!(display_scale > 0.0f))
        display_scale = options().display_scale;
    if(window_size.x <= 0 || window_size.y <= 0)
        window_size = options().window_size;

    return true;
}
