#ifndef LAUNCHERWINDOWCONFIG_H
#define LAUNCHERWINDOWCONFIG_H

/**
 * LauncherWindow Configuration
 *
 * Look and feel of the launcher window. Runtime behaviour (poll interval,
 * timeouts, tool paths) lives in ScrcpyLauncher.ini instead.
 */

namespace LauncherWindowConfig {

// ============================================================================
// WINDOW
// ============================================================================

constexpr int MIN_WINDOW_WIDTH = 480;
constexpr int MIN_WINDOW_HEIGHT = 400;
constexpr int DEFAULT_WINDOW_WIDTH = 580;
constexpr int DEFAULT_WINDOW_HEIGHT = 650;

constexpr int CONTENT_MARGIN = 24;
constexpr int CARD_SPACING = 8;

// ============================================================================
// COLORS (dark theme)
// ============================================================================

constexpr const char* BG_DARK = "#0D0F12";
constexpr const char* BG_CARD = "#161A1F";
constexpr const char* BG_CARD_HOVER = "#1E2329";
constexpr const char* BG_CARD_ACTIVE = "#252B33";
constexpr const char* ACCENT = "#00D68F";
constexpr const char* ACCENT_DIM = "#00A86E";
constexpr const char* TEXT_PRIMARY = "#E8ECF1";
constexpr const char* TEXT_SECONDARY = "#7A8494";
constexpr const char* TEXT_MUTED = "#4A5568";
constexpr const char* BORDER = "#2A3040";
constexpr const char* RED = "#FF6B6B";
constexpr const char* YELLOW = "#FFD93D";
constexpr const char* BLUE = "#4D9DE0";

// ============================================================================
// DEVICE CARD
// ============================================================================

constexpr int CARD_ICON_SIZE = 48;
constexpr int CARD_RADIUS = 12;

// Battery color tiers: above HIGH accent, above LOW yellow, else red
constexpr int BATTERY_HIGH_THRESHOLD = 30;
constexpr int BATTERY_LOW_THRESHOLD = 15;

// ============================================================================
// TOASTS
// ============================================================================

constexpr int TOAST_DURATION_MS = 3000;
constexpr int TOAST_BOTTOM_OFFSET = 32;

} // namespace LauncherWindowConfig

#endif // LAUNCHERWINDOWCONFIG_H
