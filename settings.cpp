#include "settings.h"

#include "usage_common.h"

#include <algorithm>
#include <cstdint>

std::string default_settings_path() {
    std::string dir = get_config_dir();
    if (dir.empty()) {
        return std::string();
    }
    return dir + "/pinch/settings.json";
}

int clamp_poll_interval(int seconds) {
    if (seconds < kPollIntervalMin) return kPollIntervalMin;
    if (seconds > kPollIntervalMax) return kPollIntervalMax;
    return seconds;
}

static bool is_known_theme(const std::string& theme) {
    return theme == "auto" || theme == "dark" || theme == "light";
}

Settings load_settings(const std::string& path) {
    Settings s;

    std::ifstream file(path);
    if (path.empty() || !file.is_open()) {
        return s;
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        app_log(LogLevel::Warn, "Failed to load settings: %s", e.what());
        return s;
    }
    if (!j.is_object()) {
        app_log(LogLevel::Warn, "Failed to load settings: not a JSON object");
        return s;
    }

    auto it = j.find("poll_interval");
    if (it != j.end()) {
        if (it->is_number_integer()) {
            // Clamp in 64 bits before narrowing to int.
            int64_t raw = kPollIntervalMax;
            if (!it->is_number_unsigned() || it->get<uint64_t>() <= static_cast<uint64_t>(kPollIntervalMax)) {
                raw = it->get<int64_t>();
            }
            raw = std::max<int64_t>(kPollIntervalMin, std::min<int64_t>(raw, kPollIntervalMax));
            s.poll_interval = static_cast<int>(raw);
        } else {
            app_log(LogLevel::Warn, "Ignoring non-integer poll_interval in settings");
        }
    }

    it = j.find("autostart");
    if (it != j.end()) {
        if (it->is_boolean()) {
            s.autostart = it->get<bool>();
        } else {
            app_log(LogLevel::Warn, "Ignoring non-boolean autostart in settings");
        }
    }

    it = j.find("theme");
    if (it != j.end()) {
        if (it->is_string() && is_known_theme(it->get<std::string>())) {
            s.theme = it->get<std::string>();
        } else {
            app_log(LogLevel::Warn, "Ignoring unknown theme in settings");
        }
    }

    return s;
}

bool save_settings(const std::string& path, const Settings& settings) {
    if (path.empty()) {
        return false;
    }

    const size_t slash = path.find_last_of('/');
    if (slash != std::string::npos && slash > 0 && !ensure_dir_exists(path.substr(0, slash), 0700)) {
        app_log(LogLevel::Error, "Failed to create settings directory for %s", path.c_str());
        return false;
    }

    json j;
    j["poll_interval"] = clamp_poll_interval(settings.poll_interval);
    j["autostart"] = settings.autostart;
    j["theme"] = is_known_theme(settings.theme) ? settings.theme : std::string("auto");

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        app_log(LogLevel::Error, "Failed to save settings: cannot open %s", path.c_str());
        return false;
    }
    file << j.dump(2) << "\n";
    file.close();
    if (file.fail()) {
        app_log(LogLevel::Error, "Failed to save settings: write error on %s", path.c_str());
        return false;
    }

    if (chmod(path.c_str(), S_IRUSR | S_IWUSR) != 0) {
        app_log(LogLevel::Warn, "Could not restrict permissions on %s", path.c_str());
    }

    app_log(LogLevel::Info, "Settings saved to %s", path.c_str());
    return true;
}

bool settings_exist(const std::string& path) {
    struct stat buffer;
    return !path.empty() && stat(path.c_str(), &buffer) == 0;
}
