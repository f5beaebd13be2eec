#ifndef SETTINGS_H
#define SETTINGS_H

#include <string>

// Display preferences only. Credentials never go in here.
struct Settings {
    int poll_interval = 30;
    bool autostart = false;
    std::string theme = "auto";   // "auto", "dark" or "light"
};

// $XDG_CONFIG_HOME/pinch/settings.json
std::string default_settings_path();

// Clamp to the supported 15-120 s range
int clamp_poll_interval(int seconds);

// Load settings; missing file, bad JSON or bad values fall back to defaults.
// Unknown keys are ignored.
Settings load_settings(const std::string& path);

// Write settings with owner-only permissions. Returns false on I/O failure.
bool save_settings(const std::string& path, const Settings& settings);

bool settings_exist(const std::string& path);

#endif // SETTINGS_H
