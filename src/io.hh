#ifndef CHIPVIEW_IO_HH
#define CHIPVIEW_IO_HH
#include "options.hh"
#include <filesystem>

namespace fs = std::filesystem;

// Per-user directory for settings, created on first use.
fs::path get_writable_path();

void write_json_file(const fs::path& path, const json& j);
json read_json_file(const fs::path& path);

void write_options(const options& opts);
void load_options(options& opts);

#endif
