#include "io.hh"
#include <SDL2/SDL.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

fs::path get_writable_path()
{
    static bool has_path = false;
    static fs::path path;
    if(!has_path)
    {
        char* path_str = SDL_GetPrefPath("chipview", "chipview");
        if(!path_str)
            throw std::runtime_error(SDL_GetError());
        path = path_str;
        SDL_free(path_str);
        path = path.make_preferred();
        has_path = true;
    }

    return path;
}

void write_json_file(const fs::path& path, const json& j)
{
    std::ofstream f(path, std::ios::binary);
    if(!f) throw std::runtime_error("Unable to open " + path.string());

    f << j.dump(2);
    if(!f) throw std::runtime_error("Unable to write " + path.string());
}

json read_json_file(const fs::path& path)
{
    std::ifstream f(path, std::ios::binary);
    if(!f) throw std::runtime_error("Unable to open " + path.string());

    std::stringstream ss;
    ss << f.rdbuf();
    return json::parse(ss.str());
}

void write_options(const options& opts)
{
    fs::path path = get_writable_path()/"options.json";
    try
    {
        write_json_file(path, opts.serialize());
    }
    catch(const std::runtime_error& e)
    {
        std::cerr << "Failed to save options: " << e.what() << std::endl;
    }
}

void load_options(options& opts)
{
    fs::path path = get_writable_path()/"options.json";
    if(!fs::exists(path))
    {
        opts = options();
        return;
    }

    try
    {
        opts.deserialize(read_json_file(path));
    }
    // A broken file is fine, just reset options.
    catch(const std::exception& e)
    {
        std::cerr << "Ignoring " << path.string() << ": " << e.what() << std::endl;
        opts = options();
    }
}
