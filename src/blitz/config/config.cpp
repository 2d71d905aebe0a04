#include "config.hpp"
#include "blitz/core/atomic_file.hpp"
#include "blitz/core/log.hpp"
#include "blitz/core/window_pattern.hpp"
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <toml++/toml.hpp>

namespace fs = std::filesystem;

namespace blitz {

namespace {

using NodeView = toml::node_view<toml::node const>;

NodeView lookup(toml::table const& tbl, std::string_view dotted)
{
    auto dot = dotted.find('.');
    if (dot == std::string_view::npos)
        return tbl[dotted];
    return tbl[dotted.substr(0, dot)][dotted.substr(dot + 1)];
}

std::string trim(std::string const& s)
{
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::optional<int64_t> parse_int(std::string const& text)
{
    std::string t = trim(text);
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), value);
    if (ec != std::errc() || ptr != t.data() + t.size() || t.empty())
        return std::nullopt;
    return value;
}

std::optional<double> parse_double(std::string const& text)
{
    std::string t = trim(text);
    if (t.empty())
        return std::nullopt;
    char* end = nullptr;
    double value = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size())
        return std::nullopt;
    return value;
}

[[noreturn]] void invalid(std::string_view key, char const* expected)
{
    throw ConfigError(std::string(key), "Invalid value for " + std::string(key) + ": expected " + expected);
}

[[noreturn]] void missing(std::string_view key)
{
    throw ConfigError(std::string(key), "Missing required configuration key: " + std::string(key));
}

std::optional<int64_t> get_int(toml::table const& tbl, std::string_view key)
{
    auto node = lookup(tbl, key);
    if (!node)
        return std::nullopt;
    if (node.is_integer())
        return node.value<int64_t>();
    if (auto s = node.value<std::string>())
    {
        if (auto v = parse_int(*s))
            return v;
    }
    invalid(key, "integer");
}

std::optional<double> get_double(toml::table const& tbl, std::string_view key)
{
    auto node = lookup(tbl, key);
    if (!node)
        return std::nullopt;
    if (node.is_number())
        return node.value<double>();
    if (auto s = node.value<std::string>())
    {
        if (auto v = parse_double(*s))
            return v;
    }
    invalid(key, "number");
}

std::optional<bool> get_bool(toml::table const& tbl, std::string_view key)
{
    auto node = lookup(tbl, key);
    if (!node)
        return std::nullopt;
    if (node.is_boolean())
        return node.value<bool>();
    if (node.is_integer())
        return *node.value<int64_t>() != 0;
    if (auto s = node.value<std::string>())
    {
        std::string v = trim(*s);
        if (v == "true" || v == "yes" || v == "Yes" || v == "Y" || v == "1")
            return true;
        if (v == "false" || v == "no" || v == "No" || v == "N" || v == "0")
            return false;
    }
    invalid(key, "boolean");
}

std::optional<std::string> get_string(toml::table const& tbl, std::string_view key)
{
    auto node = lookup(tbl, key);
    if (!node)
        return std::nullopt;
    if (auto s = node.value<std::string>())
        return s;
    if (node.is_integer())
        return std::to_string(*node.value<int64_t>());
    invalid(key, "string");
}

int64_t require_int(toml::table const& tbl, std::string_view key)
{
    if (auto v = get_int(tbl, key))
        return *v;
    missing(key);
}

double require_double(toml::table const& tbl, std::string_view key)
{
    if (auto v = get_double(tbl, key))
        return *v;
    missing(key);
}

std::string require_string(toml::table const& tbl, std::string_view key)
{
    auto v = get_string(tbl, key);
    if (!v || trim(*v).empty())
        missing(key);
    return *v;
}

Anchor require_anchor(toml::table const& tbl, std::string_view key)
{
    auto text = require_string(tbl, key);
    auto anchor = parse_anchor(text);
    if (!anchor)
        invalid(key, "pixels or percentage (e.g. 40 or 50%)");
    return *anchor;
}

fs::path resolve_path(fs::path const& base_dir, std::string const& value)
{
    fs::path p(value);
    if (!value.empty() && value.front() == '~')
    {
        if (char const* home = std::getenv("HOME"))
            p = fs::path(home) / value.substr(value.size() > 1 && value[1] == '/' ? 2 : 1);
    }
    if (p.is_relative())
        p = base_dir / p;
    return p;
}

void merge_into(toml::table& base, toml::table const& overlay)
{
    for (auto&& [key, node] : overlay)
    {
        std::string name(key.str());
        if (auto const* sub = node.as_table())
        {
            if (auto* existing = base[name].as_table())
            {
                merge_into(*existing, *sub);
                continue;
            }
        }
        node.visit([&](auto const& concrete) { base.insert_or_assign(name, concrete); });
    }
}

toml::table parse_layer(std::string const& text, std::string_view source)
{
    try
    {
        return toml::parse(text, source);
    }
    catch (toml::parse_error const& err)
    {
        std::ostringstream msg;
        msg << "Config parse error in " << source << ": " << err.description() << " (" << err.source().begin << ")";
        throw ConfigError("", msg.str());
    }
}

Config build_config(toml::table const& tbl, fs::path const& base_dir)
{
    Config cfg;

    // Browser
    cfg.browser.command = require_string(tbl, "browser.command");
    if (auto v = get_string(tbl, "browser.flags_head"))
        cfg.browser.flags_head = split_args(*v);
    if (auto v = get_string(tbl, "browser.flags_middle"))
        cfg.browser.flags_middle = split_args(*v);
    if (auto v = get_string(tbl, "browser.flags_tail"))
        cfg.browser.flags_tail = split_args(*v);

    // Targets
    cfg.targets.url = require_string(tbl, "targets.url");
    cfg.targets.prompt = require_string(tbl, "targets.prompt");
    cfg.targets.ledger_dir = resolve_path(base_dir, require_string(tbl, "targets.ledger_dir"));

    // Stage
    cfg.stage.window_pattern = require_string(tbl, "stage.window_pattern");
    try
    {
        WindowPattern pattern(cfg.stage.window_pattern);
    }
    catch (std::regex_error const&)
    {
        invalid("stage.window_pattern", "comma separated regular expressions");
    }
    cfg.stage.window_width = static_cast<int32_t>(require_int(tbl, "stage.window_width"));
    cfg.stage.window_height = static_cast<int32_t>(require_int(tbl, "stage.window_height"));
    cfg.stage.max_overlap_percent = static_cast<int32_t>(require_int(tbl, "stage.max_overlap_percent"));
    if (auto v = get_int(tbl, "stage.count"))
        cfg.stage.count = static_cast<int>(*v);
    if (auto v = get_int(tbl, "stage.margin"))
        cfg.stage.margin = static_cast<int32_t>(*v);
    if (auto v = get_int(tbl, "stage.max_columns"))
        cfg.stage.max_columns = static_cast<int32_t>(*v);
    if (auto v = get_int(tbl, "stage.vertical_gap"))
        cfg.stage.vertical_gap = static_cast<int32_t>(*v);
    if (auto v = get_double(tbl, "stage.launch_delay"))
        cfg.stage.launch_delay = *v;
    if (auto v = get_double(tbl, "stage.poll_interval"))
        cfg.stage.poll_interval = *v;
    if (auto v = get_double(tbl, "stage.stable_seconds"))
        cfg.stage.stable_seconds = *v;
    if (auto v = get_int(tbl, "stage.max_attempts"))
        cfg.stage.max_attempts = static_cast<int>(*v);
    if (auto v = get_int(tbl, "stage.recent_windows"))
        cfg.stage.recent_windows = static_cast<int>(*v);
    if (auto v = get_int(tbl, "stage.recent_max_attempts"))
        cfg.stage.recent_max_attempts = static_cast<int>(*v);
    if (auto v = get_bool(tbl, "stage.wipe"))
        cfg.stage.wipe = *v;
    cfg.stage.ledger = resolve_path(base_dir, get_string(tbl, "stage.ledger").value_or("live_windows.txt"));

    if (cfg.stage.window_width <= 0)
        invalid("stage.window_width", "positive integer");
    if (cfg.stage.window_height <= 0)
        invalid("stage.window_height", "positive integer");
    if (cfg.stage.max_overlap_percent < 0 || cfg.stage.max_overlap_percent > 100)
        invalid("stage.max_overlap_percent", "integer between 0 and 100");
    if (cfg.stage.count < 0)
        invalid("stage.count", "non-negative integer");

    // Fire
    cfg.fire.x_from_left = require_anchor(tbl, "fire.x_from_left");
    cfg.fire.y_from_bottom = require_anchor(tbl, "fire.y_from_bottom");
    cfg.fire.burst_count = static_cast<int>(require_int(tbl, "fire.burst_count"));
    cfg.fire.shot_delay = require_double(tbl, "fire.shot_delay");
    cfg.fire.round_delay = require_double(tbl, "fire.round_delay");
    if (auto v = get_int(tbl, "fire.rounds"))
        cfg.fire.rounds = static_cast<int>(*v);
    if (auto v = get_int(tbl, "fire.scroll_ticks"))
        cfg.fire.scroll_ticks = static_cast<int>(*v);
    if (auto v = get_string(tbl, "fire.lost_window_policy"))
    {
        if (*v == "retry")
            cfg.fire.lost_window_policy = LostWindowPolicy::Retry;
        else if (*v == "drop")
            cfg.fire.lost_window_policy = LostWindowPolicy::Drop;
        else
            invalid("fire.lost_window_policy", "\"retry\" or \"drop\"");
    }

    if (cfg.fire.burst_count < 1)
        invalid("fire.burst_count", "integer >= 1");
    if (cfg.fire.shot_delay < 0)
        invalid("fire.shot_delay", "non-negative number");
    if (cfg.fire.round_delay < 0)
        invalid("fire.round_delay", "non-negative number");

    // Clipboard
    if (auto v = get_string(tbl, "clipboard.command"))
        cfg.clipboard.command = split_args(*v);
    if (auto v = get_string(tbl, "clipboard.fallback"))
        cfg.clipboard.fallback = split_args(*v);

    // Panel
    if (auto v = get_string(tbl, "panel.title"))
        cfg.panel.title = *v;

    // Paths
    cfg.paths.config_dir = base_dir;
    cfg.paths.state_file = resolve_path(base_dir, get_string(tbl, "paths.state_file").value_or("state.toml"));
    cfg.paths.lock_file = resolve_path(base_dir, get_string(tbl, "paths.lock_file").value_or("blitz.lock"));
    if (auto v = get_string(tbl, "paths.log_file"))
        cfg.paths.log_file = resolve_path(base_dir, *v);

    return cfg;
}

} // namespace

ConfigLayers ConfigLayers::in(fs::path const& dir)
{
    return ConfigLayers{ dir / "system.toml", dir / "state.toml", dir / "user.toml" };
}

Config parse_config(
    std::string const& system_text,
    std::string const& session_text,
    std::string const& user_text,
    fs::path const& base_dir
)
{
    toml::table merged = parse_layer(system_text, "system");
    merge_into(merged, parse_layer(session_text, "session"));
    merge_into(merged, parse_layer(user_text, "user"));
    return build_config(merged, base_dir);
}

Config load_config(ConfigLayers const& layers)
{
    auto system = atomic_file::read(layers.system);
    if (!system)
    {
        throw ConfigError("", "Missing base configuration file " + layers.system.string());
    }

    LOG_DEBUG("Config layers: {} -> {} -> {}", layers.system.string(), layers.session.string(), layers.user.string());
    return parse_config(
        *system,
        atomic_file::read(layers.session).value_or(""),
        atomic_file::read(layers.user).value_or(""),
        layers.system.parent_path()
    );
}

bool set_user_override(fs::path const& user_file, std::string const& key, std::string const& value)
{
    auto dot = key.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == key.size())
    {
        LOG_ERROR("Override key must look like table.key, got '{}'", key);
        return false;
    }
    std::string section = key.substr(0, dot);
    std::string name = key.substr(dot + 1);

    toml::table tbl;
    try
    {
        tbl = toml::parse(atomic_file::read(user_file).value_or(""), user_file.string());
    }
    catch (toml::parse_error const& err)
    {
        LOG_ERROR("Cannot update {}: {}", user_file.string(), err.description());
        return false;
    }

    if (!tbl[section].is_table())
        tbl.insert_or_assign(section, toml::table{});
    auto* sub = tbl[section].as_table();

    if (value == "true" || value == "false")
        sub->insert_or_assign(name, value == "true");
    else if (auto i = parse_int(value))
        sub->insert_or_assign(name, *i);
    else if (auto d = parse_double(value))
        sub->insert_or_assign(name, *d);
    else
        sub->insert_or_assign(name, value);

    std::ostringstream out;
    out << tbl << '\n';
    return atomic_file::write(user_file, out.str());
}

std::optional<Anchor> parse_anchor(std::string const& text)
{
    std::string t = trim(text);
    Anchor anchor;
    if (!t.empty() && t.back() == '%')
    {
        anchor.percent = true;
        t.pop_back();
    }
    auto value = parse_int(t);
    if (!value || *value < 0)
        return std::nullopt;
    anchor.value = static_cast<int32_t>(*value);
    return anchor;
}

std::vector<std::string> split_list(std::string const& text)
{
    std::vector<std::string> items;
    std::string current;
    for (char c : text)
    {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c)))
        {
            if (!current.empty())
                items.push_back(std::move(current));
            current.clear();
        }
        else
        {
            current += c;
        }
    }
    if (!current.empty())
        items.push_back(std::move(current));
    return items;
}

std::vector<std::string> split_args(std::string const& text)
{
    std::vector<std::string> args;
    std::string current;
    bool in_token = false;
    char quote = 0;

    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (quote)
        {
            if (c == quote)
                quote = 0;
            else
                current += c;
            continue;
        }
        if (c == '\\' && i + 1 < text.size())
        {
            char next = text[++i];
            // backslash-newline is a line continuation
            if (next != '\n')
            {
                current += next;
                in_token = true;
            }
            continue;
        }
        if (c == '"' || c == '\'')
        {
            quote = c;
            in_token = true;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c)))
        {
            if (in_token)
                args.push_back(std::move(current));
            current.clear();
            in_token = false;
            continue;
        }
        current += c;
        in_token = true;
    }
    if (in_token)
        args.push_back(std::move(current));
    return args;
}

namespace {

std::optional<std::vector<std::string>>
read_list_file(std::string const& value, fs::path const& base_dir, bool strip_comments)
{
    std::string text = trim(value);
    if (text.empty())
        return std::nullopt;

    fs::path path = resolve_path(base_dir, text);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return std::nullopt;

    std::ifstream in(path);
    if (!in.is_open())
        return std::nullopt;

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line))
    {
        line = trim(strip_comments ? line.substr(0, line.find('#')) : line);
        if (!line.empty())
            lines.push_back(line);
    }
    return lines;
}

} // namespace

std::vector<std::string> resolve_urls(std::string const& value, fs::path const& base_dir)
{
    if (auto lines = read_list_file(value, base_dir, true))
        return *lines;
    return split_list(value);
}

std::vector<std::string> resolve_prompts(std::string const& value, fs::path const& base_dir)
{
    if (auto lines = read_list_file(value, base_dir, false))
    {
        if (!lines->empty())
            return *lines;
    }
    return { trim(value) };
}

} // namespace blitz
