#pragma once

#include "blitz/core/types.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace blitz {

/// Fatal configuration problem; key() names the offending dotted key.
class ConfigError : public std::runtime_error
{
public:
    ConfigError(std::string key, std::string const& what)
        : std::runtime_error(what)
        , key_(std::move(key))
    { }

    std::string const& key() const { return key_; }

private:
    std::string key_;
};

struct BrowserConfig
{
    std::string command;
    std::vector<std::string> flags_head;
    std::vector<std::string> flags_middle;
    std::vector<std::string> flags_tail; // last token is glued to the URL
};

struct TargetsConfig
{
    std::string url;    // URL list, or path of a file with one URL per line
    std::string prompt; // prompt text, or path of a file with one prompt per line
    std::filesystem::path ledger_dir;
};

struct StageConfig
{
    int count = 1;
    std::string window_pattern;
    int32_t window_width = 0;
    int32_t window_height = 0;
    int32_t margin = 10;
    int32_t max_overlap_percent = 25;
    int32_t max_columns = 0; // 0 = no cap
    int32_t vertical_gap = 10;
    double launch_delay = 0.5;
    double poll_interval = 0.1;
    double stable_seconds = 3.0;
    int max_attempts = 300;
    int recent_windows = 4;
    int recent_max_attempts = 120;
    bool wipe = false;
    std::filesystem::path ledger;
};

enum class LostWindowPolicy
{
    Retry, ///< keep the handle, try it again next round
    Drop   ///< remove it from the working plan for the rest of the session
};

struct FireConfig
{
    Anchor x_from_left;
    Anchor y_from_bottom;
    int burst_count = 1;
    double shot_delay = 0.5;
    double round_delay = 5.0;
    int rounds = 0; // Auto cap, <= 0 unbounded
    int scroll_ticks = 3;
    LostWindowPolicy lost_window_policy = LostWindowPolicy::Retry;
};

struct ClipboardConfig
{
    std::vector<std::string> command = { "xclip", "-selection", "clipboard" };
    std::vector<std::string> fallback = { "wl-copy" };
};

struct PanelConfig
{
    std::string title;
};

struct PathsConfig
{
    std::filesystem::path config_dir; ///< relative paths in any layer resolve against it
    std::filesystem::path state_file;
    std::filesystem::path lock_file;
    std::filesystem::path log_file = "/tmp/blitz.log";
};

struct Config
{
    BrowserConfig browser;
    TargetsConfig targets;
    StageConfig stage;
    FireConfig fire;
    ClipboardConfig clipboard;
    PanelConfig panel;
    PathsConfig paths;
};

/// The three layers, applied in this order (later wins).
struct ConfigLayers
{
    std::filesystem::path system;  ///< base defaults, must exist
    std::filesystem::path session; ///< runtime state written by blitz
    std::filesystem::path user;    ///< operator overrides

    static ConfigLayers in(std::filesystem::path const& dir);
};

/**
 * @brief Load, merge and validate the layered configuration.
 *
 * Built once per command and passed explicitly to every component.
 * @throws ConfigError naming the key when a mandatory key is missing or
 *         has the wrong type, or when a layer fails to parse.
 */
Config load_config(ConfigLayers const& layers);

/// Same validation over already-read TOML text (system, session, user).
Config parse_config(
    std::string const& system_text,
    std::string const& session_text,
    std::string const& user_text,
    std::filesystem::path const& base_dir
);

/// Persist KEY=VALUE ("table.key") into the user override layer.
bool set_user_override(std::filesystem::path const& user_file, std::string const& key, std::string const& value);

std::optional<Anchor> parse_anchor(std::string const& text);

// Value list helpers
std::vector<std::string> split_list(std::string const& text);
std::vector<std::string> split_args(std::string const& text);

/// A value naming an existing file (relative to @p base_dir) is read one entry per line.
std::vector<std::string> resolve_urls(std::string const& value, std::filesystem::path const& base_dir = {});
std::vector<std::string> resolve_prompts(std::string const& value, std::filesystem::path const& base_dir = {});

} // namespace blitz
