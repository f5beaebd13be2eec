// =============================================================================
// show_usage_gui.cpp - Tray version of the Pinch usage monitor
// =============================================================================
// Requires GTK3, ayatana-appindicator3 and libnotify.
// The indicator label is the at-a-glance pill ("5h 42% · 2h14m"); the
// details window shows one colour-coded bar per bucket.
// =============================================================================

#include "usage_common.h"
#include "credentials.h"
#include "settings.h"
#include "usage_evaluator.h"
#include "usage_monitor.h"

#include <algorithm>
#include <atomic>
#include <libgen.h>
#include <linux/limits.h>
#include <memory>

extern "C" {
#include <gtk/gtk.h>
#include <libayatana-appindicator/app-indicator.h>
#include <libnotify/notify.h>
}
#include <pthread.h>

// ============================================================================
// GUI Types and Structures
// ============================================================================

struct GUIState;

// user_data for a bucket's bar draw callback
struct BarBinding {
    GUIState* state;
    BucketKind kind;
};

struct BucketRow {
    GtkWidget* bar;
    GtkWidget* pct_label;
    GtkWidget* detail_label;
};

struct GUIState {
    // GTK Widgets
    GtkWidget* window = nullptr;
    GtkWidget* root_container = nullptr;
    GtkWidget* status_label = nullptr;
    GtkWidget* updated_label = nullptr;
    BucketRow rows[kBucketKindCount] = {};
    BarBinding bindings[kBucketKindCount] = {};

    GtkCssProvider* theme_provider = nullptr;

    // System Tray
    AppIndicator* indicator = nullptr;
    GtkWidget* tray_menu = nullptr;
    GtkWidget* refresh_items[4] = {};
    GtkWidget* theme_items[3] = {};
    GtkWidget* autostart_item = nullptr;

    // Application State
    std::string settings_path;
    Settings settings;
    std::shared_ptr<DisplayChannel> channel;
    std::shared_ptr<UsageMonitor> monitor;
    std::atomic<bool> fetching{false};

    // Current Data (only touched on the GTK thread)
    DisplayStatePtr display;
    Severity last_notified_severity = Severity::Ok;
    DisplayStatus last_status = DisplayStatus::Live;

    guint refresh_timer_id = 0;
    guint ui_tick_id = 0;

    bool window_visible = false;
};

static constexpr int kRefreshChoices[4] = {15, 30, 60, 120};
static constexpr const char* kThemeChoices[3] = {"auto", "dark", "light"};

// ============================================================================
// Forward Declarations
// ============================================================================

static void apply_display_state(GUIState* state, const DisplayStatePtr& display);
static void start_fetch(GUIState* state);
static gboolean on_refresh_timer(gpointer user_data);

static std::string get_executable_path();
static std::string get_autostart_desktop_path();
static bool is_autostart_enabled();
static bool set_autostart_enabled(bool enabled);

static void apply_window_theme(GUIState* state);

// ============================================================================
// Colors
// ============================================================================

static void color_for_severity(Severity severity, double* r, double* g, double* b) {
    switch (severity) {
        case Severity::Ok:
            // #a6e3a1
            *r = 0xa6 / 255.0;
            *g = 0xe3 / 255.0;
            *b = 0xa1 / 255.0;
            return;
        case Severity::Warn:
            // #f9e2af
            *r = 0xf9 / 255.0;
            *g = 0xe2 / 255.0;
            *b = 0xaf / 255.0;
            return;
        case Severity::Critical:
            break;
    }
    // #f38ba8
    *r = 0xf3 / 255.0;
    *g = 0x8b / 255.0;
    *b = 0xa8 / 255.0;
}

static bool theme_is_dark(const GUIState* state) {
    if (state->settings.theme == "dark") return true;
    if (state->settings.theme == "light") return false;

    gboolean prefer_dark = FALSE;
    gchar* theme_name = nullptr;
    GtkSettings* gs = gtk_settings_get_default();
    if (!gs) return true;
    g_object_get(gs,
                 "gtk-application-prefer-dark-theme", &prefer_dark,
                 "gtk-theme-name", &theme_name,
                 nullptr);
    bool dark = prefer_dark;
    if (theme_name) {
        std::string name(theme_name);
        std::transform(name.begin(), name.end(), name.begin(), ::tolower);
        dark = dark || name.find("dark") != std::string::npos;
        g_free(theme_name);
    }
    return dark;
}

// ============================================================================
// Bucket bar drawing
// ============================================================================

static gboolean on_bucket_bar_draw(GtkWidget* widget, cairo_t* cr, gpointer user_data) {
    BarBinding* binding = (BarBinding*)user_data;
    if (!binding || !binding->state) return FALSE;
    GUIState* state = binding->state;

    GtkAllocation a;
    gtk_widget_get_allocation(widget, &a);
    const int w = a.width;
    const int h = a.height;
    if (w <= 0 || h <= 0) return FALSE;

    int pct = 0;
    Severity severity = Severity::Ok;
    bool dimmed = true;
    if (state->display && state->display->has_data) {
        const BucketView& v = state->display->bucket(binding->kind);
        pct = v.participates ? v.percent : 0;
        severity = v.severity;
        dimmed = state->display->status != DisplayStatus::Live;
    }

    double fill_r = 0.0, fill_g = 0.0, fill_b = 0.0;
    color_for_severity(severity, &fill_r, &fill_g, &fill_b);

    double trough_r, trough_g, trough_b;
    if (theme_is_dark(state)) {
        // #313244
        trough_r = 0x31 / 255.0;
        trough_g = 0x32 / 255.0;
        trough_b = 0x44 / 255.0;
    } else {
        // #e5e7eb
        trough_r = 0xe5 / 255.0;
        trough_g = 0xe7 / 255.0;
        trough_b = 0xeb / 255.0;
    }

    const double radius = std::min(4.0, h / 2.0);
    const double degrees = G_PI / 180.0;

    auto rounded_rect = [&](double x, double y, double rw, double rh) {
        cairo_new_sub_path(cr);
        cairo_arc(cr, x + rw - radius, y + radius, radius, -90 * degrees, 0 * degrees);
        cairo_arc(cr, x + rw - radius, y + rh - radius, radius, 0 * degrees, 90 * degrees);
        cairo_arc(cr, x + radius, y + rh - radius, radius, 90 * degrees, 180 * degrees);
        cairo_arc(cr, x + radius, y + radius, radius, 180 * degrees, 270 * degrees);
        cairo_close_path(cr);
    };

    // Trough
    cairo_set_source_rgb(cr, trough_r, trough_g, trough_b);
    rounded_rect(0, 0, w, h);
    cairo_fill(cr);

    // Fill, at least as wide as the corner radii once non-zero
    if (pct > 0) {
        const double fill_w = std::max(radius * 2.0, w * (pct / 100.0));
        cairo_set_source_rgba(cr, fill_r, fill_g, fill_b, dimmed ? 0.45 : 1.0);
        rounded_rect(0, 0, fill_w, h);
        cairo_fill(cr);
    }

    return FALSE;
}

// ============================================================================
// CSS Styling
// ============================================================================

static void apply_window_theme(GUIState* state) {
    if (!state || !state->window) return;

    if (!state->theme_provider) {
        state->theme_provider = gtk_css_provider_new();
    }

    GtkStyleContext* wctx = gtk_widget_get_style_context(state->window);
    gtk_style_context_add_provider(
        wctx,
        GTK_STYLE_PROVIDER(state->theme_provider),
        GTK_STYLE_PROVIDER_PRIORITY_APPLICATION
    );

    gtk_style_context_remove_class(wctx, "pinch-dark");
    gtk_style_context_remove_class(wctx, "pinch-light");
    gtk_style_context_add_class(wctx, theme_is_dark(state) ? "pinch-dark" : "pinch-light");

    // Labels need the provider too; class selection on the window does the rest.
    const char* css =
        "window.pinch-light { background-color: #ffffff; color: #111111; } "
        "window.pinch-light label { color: #111111; } "
        "window.pinch-light label.dim { color: #6b7280; } "
        "window.pinch-dark { background-color: #1a1b2e; color: #cdd6f4; } "
        "window.pinch-dark label { color: #cdd6f4; } "
        "window.pinch-dark label.dim { color: #6c7086; } "
        "label.title { font-weight: bold; } ";

    gtk_css_provider_load_from_data(state->theme_provider, css, -1, nullptr);
    gtk_style_context_add_provider_for_screen(
        gdk_screen_get_default(),
        GTK_STYLE_PROVIDER(state->theme_provider),
        GTK_STYLE_PROVIDER_PRIORITY_APPLICATION
    );

    gtk_widget_queue_draw(state->window);
}

// ============================================================================
// Window
// ============================================================================

static gboolean on_window_delete(GtkWidget* widget, GdkEvent* event, gpointer user_data) {
    (void)event;
    GUIState* state = (GUIState*)user_data;
    gtk_widget_hide(widget);
    state->window_visible = false;
    return TRUE;  // Prevent default destroy
}

static GtkWidget* add_dim_label(GtkWidget* box, const char* text) {
    GtkWidget* label = gtk_label_new(text);
    gtk_label_set_xalign(GTK_LABEL(label), 0.0);
    gtk_style_context_add_class(gtk_widget_get_style_context(label), "dim");
    gtk_box_pack_start(GTK_BOX(box), label, FALSE, FALSE, 0);
    return label;
}

static GtkWidget* create_main_window(GUIState* state) {
    GtkWidget* window = gtk_window_new(GTK_WINDOW_TOPLEVEL);

    const int width = 300;
    const int border = 12;
    const int spacing = 4;
    const int bar_height = 8;

    gtk_window_set_title(GTK_WINDOW(window), "Pinch");
    gtk_window_set_default_size(GTK_WINDOW(window), width, -1);
    gtk_window_set_resizable(GTK_WINDOW(window), FALSE);
    gtk_window_set_skip_taskbar_hint(GTK_WINDOW(window), TRUE);
    gtk_window_set_keep_above(GTK_WINDOW(window), TRUE);
    gtk_container_set_border_width(GTK_CONTAINER(window), border);

    GtkWidget* vbox = gtk_box_new(GTK_ORIENTATION_VERTICAL, spacing);
    state->root_container = vbox;
    gtk_container_add(GTK_CONTAINER(window), vbox);

    GtkWidget* title = gtk_label_new("Pinch");
    gtk_label_set_xalign(GTK_LABEL(title), 0.0);
    gtk_style_context_add_class(gtk_widget_get_style_context(title), "title");
    gtk_box_pack_start(GTK_BOX(vbox), title, FALSE, FALSE, 0);

    state->status_label = add_dim_label(vbox, "Loading...");

    for (BucketKind kind : kAllBucketKinds) {
        const size_t idx = static_cast<size_t>(kind);
        BucketRow& row = state->rows[idx];

        GtkWidget* header = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 0);
        GtkWidget* name = gtk_label_new(bucket_label(kind));
        gtk_label_set_xalign(GTK_LABEL(name), 0.0);
        gtk_box_pack_start(GTK_BOX(header), name, TRUE, TRUE, 0);
        row.pct_label = gtk_label_new("--%");
        gtk_box_pack_end(GTK_BOX(header), row.pct_label, FALSE, FALSE, 0);
        gtk_widget_set_margin_top(header, 8);
        gtk_box_pack_start(GTK_BOX(vbox), header, FALSE, FALSE, 0);

        row.detail_label = add_dim_label(vbox, "");

        state->bindings[idx].state = state;
        state->bindings[idx].kind = kind;
        row.bar = gtk_drawing_area_new();
        gtk_widget_set_size_request(row.bar, -1, bar_height);
        gtk_widget_set_hexpand(row.bar, TRUE);
        g_signal_connect(row.bar, "draw", G_CALLBACK(on_bucket_bar_draw), &state->bindings[idx]);
        gtk_box_pack_start(GTK_BOX(vbox), row.bar, FALSE, FALSE, 0);
    }

    state->updated_label = add_dim_label(vbox, "");
    gtk_widget_set_margin_top(state->updated_label, 8);

    g_signal_connect(window, "delete-event", G_CALLBACK(on_window_delete), state);

    return window;
}

// ============================================================================
// Tray Menu Callbacks
// ============================================================================

static void on_tray_show(GtkMenuItem* item, gpointer user_data) {
    (void)item;
    GUIState* state = (GUIState*)user_data;
    if (state->window_visible) {
        gtk_widget_hide(state->window);
        state->window_visible = false;
        return;
    }
    gtk_widget_show_all(state->window);
    gtk_window_present(GTK_WINDOW(state->window));
    state->window_visible = true;
}

static void on_tray_refresh_now(GtkMenuItem* item, gpointer user_data) {
    (void)item;
    GUIState* state = (GUIState*)user_data;
    app_log(LogLevel::Info, "Refresh requested, forcing immediate poll");
    start_fetch(state);
}

static void on_tray_quit(GtkMenuItem* item, gpointer user_data) {
    (void)item;
    (void)user_data;
    gtk_main_quit();
}

static void persist_settings(GUIState* state) {
    if (!save_settings(state->settings_path, state->settings)) {
        app_log(LogLevel::Warn, "Settings not saved; changes last until exit");
    }
}

// ============================================================================
// Autostart (XDG autostart entry)
// ============================================================================

static std::string get_executable_path() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return "pinch-tray";
    }
    buf[len] = '\0';
    return std::string(buf);
}

static std::string get_executable_dir() {
    std::string path = get_executable_path();
    std::vector<char> buf(path.begin(), path.end());
    buf.push_back('\0');
    char* dir = dirname(buf.data());
    return dir ? std::string(dir) : ".";
}

static std::string get_autostart_desktop_path() {
    std::string dir = get_config_dir();
    if (dir.empty()) return std::string();
    return dir + "/autostart/pinch.desktop";
}

static bool is_autostart_enabled() {
    std::string path = get_autostart_desktop_path();
    if (path.empty()) return false;

    std::ifstream f(path);
    if (!f.is_open()) return false;

    std::string line;
    while (std::getline(f, line)) {
        if (line.rfind("X-GNOME-Autostart-enabled=", 0) == 0) {
            std::string v = line.substr(std::strlen("X-GNOME-Autostart-enabled="));
            return (v == "true" || v == "True" || v == "1");
        }
    }

    // If the file exists but the key is missing, treat as enabled.
    return true;
}

static bool set_autostart_enabled(bool enabled) {
    std::string path = get_autostart_desktop_path();
    if (path.empty()) return false;
    if (!ensure_dir_exists(path.substr(0, path.find_last_of('/')), 0755)) return false;

    std::ofstream f(path);
    if (!f.is_open()) return false;

    f << "[Desktop Entry]\n";
    f << "Type=Application\n";
    f << "Name=Pinch\n";
    f << "Comment=Usage quota monitor\n";
    f << "Exec=" << get_executable_path() << "\n";
    f << "Terminal=false\n";
    f << "X-GNOME-Autostart-enabled=" << (enabled ? "true" : "false") << "\n";
    f.close();
    return !f.fail();
}

static void on_toggle_autostart(GtkCheckMenuItem* item, gpointer user_data) {
    GUIState* state = (GUIState*)user_data;
    if (!state) return;
    const bool enabled = gtk_check_menu_item_get_active(item);

    if (!set_autostart_enabled(enabled)) {
        app_log(LogLevel::Error, "Failed to write autostart entry %s", get_autostart_desktop_path().c_str());
        g_signal_handlers_block_by_func(item, (void*)on_toggle_autostart, state);
        gtk_check_menu_item_set_active(item, !enabled);
        g_signal_handlers_unblock_by_func(item, (void*)on_toggle_autostart, state);
        return;
    }

    app_log(LogLevel::Info, "Auto-start toggled to: %s", enabled ? "on" : "off");
    state->settings.autostart = enabled;
    persist_settings(state);
}

// ============================================================================
// Refresh Rate and Theme
// ============================================================================

static void change_refresh_rate(GUIState* state, int new_interval) {
    new_interval = clamp_poll_interval(new_interval);
    if (new_interval == state->settings.poll_interval && state->refresh_timer_id > 0) {
        return;
    }
    state->settings.poll_interval = new_interval;

    if (state->refresh_timer_id > 0) {
        g_source_remove(state->refresh_timer_id);
    }
    state->refresh_timer_id = g_timeout_add_seconds(new_interval, on_refresh_timer, state);

    app_log(LogLevel::Info, "Poll interval updated to %ds", new_interval);
    persist_settings(state);
}

static void on_refresh_choice(GtkCheckMenuItem* item, gpointer user_data) {
    GUIState* state = (GUIState*)user_data;
    if (!gtk_check_menu_item_get_active(item)) return;
    for (int i = 0; i < 4; ++i) {
        if (GTK_WIDGET(item) == state->refresh_items[i]) {
            change_refresh_rate(state, kRefreshChoices[i]);
            return;
        }
    }
}

static void on_theme_choice(GtkCheckMenuItem* item, gpointer user_data) {
    GUIState* state = (GUIState*)user_data;
    if (!gtk_check_menu_item_get_active(item)) return;
    for (int i = 0; i < 3; ++i) {
        if (GTK_WIDGET(item) == state->theme_items[i]) {
            state->settings.theme = kThemeChoices[i];
            apply_window_theme(state);
            persist_settings(state);
            return;
        }
    }
}

// ============================================================================
// System Tray
// ============================================================================

static AppIndicator* create_system_tray(GUIState* state) {
    std::string icon_theme_path = get_executable_dir();

    // AppIndicator looks for pinch-icon.{svg,png} in the theme path.
    AppIndicator* indicator = app_indicator_new(
        "pinch-indicator",
        "pinch-icon",
        APP_INDICATOR_CATEGORY_APPLICATION_STATUS
    );
    app_indicator_set_icon_theme_path(indicator, icon_theme_path.c_str());

    std::string icon_full_path = icon_theme_path + "/pinch-icon";
    struct stat buffer;
    if (stat((icon_full_path + ".png").c_str(), &buffer) == 0) {
        app_indicator_set_icon_full(indicator, (icon_full_path + ".png").c_str(), "Pinch");
    } else if (stat((icon_full_path + ".svg").c_str(), &buffer) == 0) {
        app_indicator_set_icon_full(indicator, (icon_full_path + ".svg").c_str(), "Pinch");
    }

    app_indicator_set_status(indicator, APP_INDICATOR_STATUS_ACTIVE);
    app_indicator_set_title(indicator, "Pinch: Loading...");
    app_indicator_set_label(indicator, "5h --%", "5h 100% · 00h00m");

    GtkWidget* menu = gtk_menu_new();

    GtkWidget* show_item = gtk_menu_item_new_with_label("Show Details");
    g_signal_connect(show_item, "activate", G_CALLBACK(on_tray_show), state);
    gtk_menu_shell_append(GTK_MENU_SHELL(menu), show_item);
    app_indicator_set_secondary_activate_target(indicator, show_item);

    GtkWidget* refresh_now_item = gtk_menu_item_new_with_label("Refresh Now");
    g_signal_connect(refresh_now_item, "activate", G_CALLBACK(on_tray_refresh_now), state);
    gtk_menu_shell_append(GTK_MENU_SHELL(menu), refresh_now_item);

    gtk_menu_shell_append(GTK_MENU_SHELL(menu), gtk_separator_menu_item_new());

    // Poll interval submenu
    GtkWidget* refresh_item = gtk_menu_item_new_with_label("Poll Interval");
    GtkWidget* refresh_submenu = gtk_menu_new();
    gtk_menu_item_set_submenu(GTK_MENU_ITEM(refresh_item), refresh_submenu);

    GSList* refresh_group = nullptr;
    for (int i = 0; i < 4; ++i) {
        const std::string label = std::to_string(kRefreshChoices[i]) + " seconds";
        state->refresh_items[i] = gtk_radio_menu_item_new_with_label(refresh_group, label.c_str());
        refresh_group = gtk_radio_menu_item_get_group(GTK_RADIO_MENU_ITEM(state->refresh_items[i]));
        gtk_check_menu_item_set_active(GTK_CHECK_MENU_ITEM(state->refresh_items[i]),
                                       state->settings.poll_interval == kRefreshChoices[i]);
        g_signal_connect(state->refresh_items[i], "toggled", G_CALLBACK(on_refresh_choice), state);
        gtk_menu_shell_append(GTK_MENU_SHELL(refresh_submenu), state->refresh_items[i]);
    }
    gtk_menu_shell_append(GTK_MENU_SHELL(menu), refresh_item);

    // Theme submenu
    GtkWidget* theme_item = gtk_menu_item_new_with_label("Theme");
    GtkWidget* theme_submenu = gtk_menu_new();
    gtk_menu_item_set_submenu(GTK_MENU_ITEM(theme_item), theme_submenu);

    const char* theme_labels[3] = {"Follow System", "Dark", "Light"};
    GSList* theme_group = nullptr;
    for (int i = 0; i < 3; ++i) {
        state->theme_items[i] = gtk_radio_menu_item_new_with_label(theme_group, theme_labels[i]);
        theme_group = gtk_radio_menu_item_get_group(GTK_RADIO_MENU_ITEM(state->theme_items[i]));
        gtk_check_menu_item_set_active(GTK_CHECK_MENU_ITEM(state->theme_items[i]),
                                       state->settings.theme == kThemeChoices[i]);
        g_signal_connect(state->theme_items[i], "toggled", G_CALLBACK(on_theme_choice), state);
        gtk_menu_shell_append(GTK_MENU_SHELL(theme_submenu), state->theme_items[i]);
    }
    gtk_menu_shell_append(GTK_MENU_SHELL(menu), theme_item);

    state->autostart_item = gtk_check_menu_item_new_with_label("Start at Login");
    gtk_check_menu_item_set_active(GTK_CHECK_MENU_ITEM(state->autostart_item), is_autostart_enabled());
    g_signal_connect(state->autostart_item, "toggled", G_CALLBACK(on_toggle_autostart), state);
    gtk_menu_shell_append(GTK_MENU_SHELL(menu), state->autostart_item);

    gtk_menu_shell_append(GTK_MENU_SHELL(menu), gtk_separator_menu_item_new());

    GtkWidget* quit_item = gtk_menu_item_new_with_label("Quit");
    g_signal_connect(quit_item, "activate", G_CALLBACK(on_tray_quit), state);
    gtk_menu_shell_append(GTK_MENU_SHELL(menu), quit_item);

    gtk_widget_show_all(menu);
    app_indicator_set_menu(indicator, GTK_MENU(menu));

    state->tray_menu = menu;

    return indicator;
}

// ============================================================================
// Notifications
// ============================================================================

static void show_desktop_notification(const char* title, const std::string& body, NotifyUrgency urgency,
                                      const char* icon) {
    NotifyNotification* notification = notify_notification_new(title, body.c_str(), icon);
    notify_notification_set_urgency(notification, urgency);
    notify_notification_set_timeout(notification, 10000);  // 10 seconds

    GError* error = nullptr;
    if (!notify_notification_show(notification, &error)) {
        app_log(LogLevel::Warn, "Notification failed: %s", error ? error->message : "unknown error");
        if (error) g_error_free(error);
    }
    g_object_unref(notification);
}

static void notify_transitions(GUIState* state, const DisplayState& s) {
    if (s.status == DisplayStatus::Unauthenticated && state->last_status != DisplayStatus::Unauthenticated) {
        show_desktop_notification("Pinch: Sign-in Needed", s.message, NOTIFY_URGENCY_NORMAL, "dialog-warning");
    }
    state->last_status = s.status;

    if (s.status != DisplayStatus::Live) {
        return;
    }
    if (s.severity == Severity::Critical && state->last_notified_severity != Severity::Critical) {
        char body[256];
        snprintf(body, sizeof(body), "5h window at %d%%. A bucket is at or above its critical threshold.",
                 s.percent);
        show_desktop_notification("Usage Almost Exhausted", body, NOTIFY_URGENCY_CRITICAL, "dialog-warning");
    }
    state->last_notified_severity = s.severity;
}

// ============================================================================
// GUI Update Functions
// ============================================================================

static std::string reset_text(const BucketView& v) {
    if (!v.has_reset) {
        return "No active window";
    }
    if (v.countdown_seconds <= 0) {
        return "Resets now";
    }
    return "Resets in " + format_duration_compact(v.countdown_seconds);
}

static void update_gui_widgets(GUIState* state, const DisplayState& s) {
    if (s.status == DisplayStatus::Live) {
        gtk_label_set_text(GTK_LABEL(state->status_label), severity_name(s.severity));
    } else {
        const std::string text = std::string(display_status_name(s.status)) + ": " + s.message;
        gtk_label_set_text(GTK_LABEL(state->status_label), text.c_str());
    }

    for (BucketKind kind : kAllBucketKinds) {
        const BucketView& v = s.bucket(kind);
        BucketRow& row = state->rows[static_cast<size_t>(kind)];

        if (!s.has_data) {
            gtk_label_set_text(GTK_LABEL(row.pct_label), "--%");
            gtk_label_set_text(GTK_LABEL(row.detail_label), "");
        } else if (kind == BucketKind::ExtraCredit) {
            if (!v.participates) {
                gtk_label_set_text(GTK_LABEL(row.pct_label), "Disabled");
                gtk_label_set_text(GTK_LABEL(row.detail_label), "");
            } else {
                char pct_text[64];
                snprintf(pct_text, sizeof(pct_text), "$%.2f / $%.2f", v.used, v.limit);
                gtk_label_set_text(GTK_LABEL(row.pct_label), pct_text);
                const std::string detail = std::to_string(v.percent) + "% of monthly limit";
                gtk_label_set_text(GTK_LABEL(row.detail_label), detail.c_str());
            }
        } else {
            const std::string pct_text = std::to_string(v.percent) + "%";
            gtk_label_set_text(GTK_LABEL(row.pct_label), pct_text.c_str());
            gtk_label_set_text(GTK_LABEL(row.detail_label), reset_text(v).c_str());
        }

        gtk_widget_queue_draw(row.bar);
    }

    if (s.has_data) {
        const std::string updated = "Updated " + format_local_time(s.fetched_at);
        gtk_label_set_text(GTK_LABEL(state->updated_label), updated.c_str());
    }
}

static void update_tray_display(GUIState* state, const DisplayState& s) {
    char label[128];
    char tooltip[512];

    const char* primary = bucket_short_label(kPrimaryBucket);
    const char* weekly = bucket_short_label(BucketKind::Opus7d);

    if (!s.has_data) {
        snprintf(label, sizeof(label), "%s --%%", primary);
    } else if (s.countdown_known) {
        snprintf(label, sizeof(label), "%s %d%% · %s", primary, s.percent,
                 format_duration_tight(s.countdown_seconds).c_str());
    } else {
        snprintf(label, sizeof(label), "%s %d%%", primary, s.percent);
    }

    if (s.status == DisplayStatus::Live) {
        snprintf(tooltip, sizeof(tooltip), "Pinch\n%s: %d%% | %s: %d%%\nPoll: %ds",
                 primary, s.percent, weekly, s.bucket(BucketKind::Opus7d).percent, state->settings.poll_interval);
    } else {
        snprintf(tooltip, sizeof(tooltip), "Pinch: %s - %s", display_status_name(s.status), s.message.c_str());
        if (s.status != DisplayStatus::Stale || !s.has_data) {
            snprintf(label, sizeof(label), "%s ??", primary);
        }
    }

    app_indicator_set_label(state->indicator, label, "5h 100% · 00h00m");
    app_indicator_set_title(state->indicator, tooltip);
    app_indicator_set_status(state->indicator,
                             s.status == DisplayStatus::Live && s.severity == Severity::Critical
                                 ? APP_INDICATOR_STATUS_ATTENTION
                                 : APP_INDICATOR_STATUS_ACTIVE);
}

static void apply_display_state(GUIState* state, const DisplayStatePtr& display) {
    if (!display) return;
    state->display = display;
    update_gui_widgets(state, *display);
    update_tray_display(state, *display);
}

// ============================================================================
// Background Fetch Thread
// ============================================================================

// The worker only touches the monitor; GUIState is used on the GTK thread.
struct FetchThreadData {
    GUIState* state;
    std::shared_ptr<UsageMonitor> monitor;
};

static gboolean on_fetch_complete(gpointer user_data) {
    FetchThreadData* data = (FetchThreadData*)user_data;
    GUIState* state = data->state;

    state->fetching.store(false);

    DisplayStatePtr latest = state->channel->drain_latest();
    if (latest) {
        apply_display_state(state, latest);
        notify_transitions(state, *latest);
    }

    delete data;
    return G_SOURCE_REMOVE;
}

static void* fetch_usage_thread(void* arg) {
    FetchThreadData* data = (FetchThreadData*)arg;

    // Publishes into the channel; on_fetch_complete drains it.
    data->monitor->poll_once(time(nullptr));

    g_idle_add(on_fetch_complete, data);
    return nullptr;
}

static void start_fetch(GUIState* state) {
    bool expected = false;
    if (!state->fetching.compare_exchange_strong(expected, true)) {
        app_log(LogLevel::Debug, "Fetch already in flight, skipping");
        return;
    }

    FetchThreadData* data = new FetchThreadData();
    data->state = state;
    data->monitor = state->monitor;

    pthread_t thread;
    if (pthread_create(&thread, nullptr, fetch_usage_thread, data) == 0) {
        pthread_detach(thread);
        return;
    }

    app_log(LogLevel::Error, "Could not start fetch thread");
    state->fetching.store(false);
    delete data;
}

static gboolean on_refresh_timer(gpointer user_data) {
    GUIState* state = (GUIState*)user_data;
    start_fetch(state);
    return G_SOURCE_CONTINUE;
}

// Recompute countdowns every second; poll early once a reset time passes.
static gboolean on_ui_tick(gpointer user_data) {
    GUIState* state = (GUIState*)user_data;

    bool refetch = false;
    DisplayStatePtr display = state->monitor->tick(time(nullptr), &refetch);
    if (display && state->channel->pending() == 0) {
        apply_display_state(state, display);
    }
    if (refetch) {
        app_log(LogLevel::Info, "Reset time passed, polling early");
        start_fetch(state);
    }
    return G_SOURCE_CONTINUE;
}

// ============================================================================
// Print Usage
// ============================================================================

static void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS]" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Tray version - requires GTK3, ayatana-appindicator3 and libnotify." << std::endl;
    std::cerr << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  --refresh <seconds>  Poll interval for this session (15-120)" << std::endl;
    std::cerr << "  --credentials <file> Credentials file (default: ~/.claude/.credentials.json)" << std::endl;
    std::cerr << "  --show               Open the details window on start" << std::endl;
    std::cerr << "  --verbose            Log to stderr, including debug messages" << std::endl;
    std::cerr << "  --help               Show this help message" << std::endl;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    std::string credentials_path;
    int refresh_override = -1;
    bool show_window = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--refresh" || arg == "-r") {
            if (i + 1 < argc) {
                refresh_override = clamp_poll_interval(std::atoi(argv[++i]));
            } else {
                std::cerr << "Error: --refresh requires a number of seconds" << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        } else if (arg == "--credentials" || arg == "-c") {
            if (i + 1 < argc) {
                credentials_path = argv[++i];
            } else {
                std::cerr << "Error: --credentials requires a file path" << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        } else if (arg == "--show") {
            show_window = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    app_log_init("pinch-tray", verbose);
    app_log(LogLevel::Info, "Starting Pinch");

    if (credentials_path.empty()) {
        credentials_path = default_credentials_path();
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    if (!gtk_init_check(&argc, &argv)) {
        std::cerr << "Failed to initialize GTK. Is a display available?" << std::endl;
        curl_global_cleanup();
        return 1;
    }

    notify_init("Pinch");

    GUIState* state = new GUIState();
    state->settings_path = default_settings_path();
    const bool first_run = !settings_exist(state->settings_path);
    state->settings = load_settings(state->settings_path);
    if (first_run) {
        persist_settings(state);
        show_window = true;
    }
    if (refresh_override > 0) {
        state->settings.poll_interval = refresh_override;
    }

    // The preference is the source of truth for the autostart entry.
    if (state->settings.autostart != is_autostart_enabled()) {
        if (!set_autostart_enabled(state->settings.autostart)) {
            app_log(LogLevel::Warn, "Could not sync autostart entry with settings");
        }
    }

    state->channel = std::make_shared<DisplayChannel>();
    state->monitor = std::make_shared<UsageMonitor>(file_credential_source(credentials_path), fetch_usage,
                                                    state->channel);

    state->window = create_main_window(state);
    apply_window_theme(state);
    state->indicator = create_system_tray(state);

    if (show_window) {
        gtk_widget_show_all(state->window);
        state->window_visible = true;
    }

    // Initial fetch
    start_fetch(state);

    state->refresh_timer_id = g_timeout_add_seconds(state->settings.poll_interval, on_refresh_timer, state);
    state->ui_tick_id = g_timeout_add_seconds(1, on_ui_tick, state);

    app_log(LogLevel::Info, "All components started (poll every %ds)", state->settings.poll_interval);

    gtk_main();

    app_log(LogLevel::Info, "Shutting down");
    if (state->refresh_timer_id > 0) {
        g_source_remove(state->refresh_timer_id);
    }
    if (state->ui_tick_id > 0) {
        g_source_remove(state->ui_tick_id);
    }
    state->channel->close();
    notify_uninit();

    // A detached worker still inside poll_once owns the monitor and its
    // channel; libcurl has to stay initialised until it returns.
    const bool worker_in_flight = state->fetching.load();
    delete state;

    if (worker_in_flight) {
        app_log(LogLevel::Info, "Fetch still in flight, leaving libcurl initialised");
    } else {
        curl_global_cleanup();
    }

    return 0;
}
