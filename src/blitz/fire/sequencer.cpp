#include "sequencer.hpp"
#include "blitz/core/log.hpp"
#include <algorithm>

namespace blitz {

namespace {

constexpr auto StopCheckSlice = std::chrono::milliseconds(100);

std::string const SelectPasteSubmit = "ctrl+a ctrl+v Return";
std::string const SelectClearSubmit = "ctrl+a Delete Return";

// Puts the pointer back where the operator left it, however the window ends.
class PointerGuard
{
public:
    explicit PointerGuard(InputInjector& input)
        : input_(input)
        , saved_(input.pointer())
    { }

    ~PointerGuard()
    {
        if (saved_)
            input_.warp(*saved_);
        else
            LOG_DEBUG("Pointer position was unknown, leaving it where the injection put it");
    }

    PointerGuard(PointerGuard const&) = delete;
    PointerGuard& operator=(PointerGuard const&) = delete;

private:
    InputInjector& input_;
    std::optional<Point> saved_;
};

} // namespace

FireParams FireParams::from(Config const& config)
{
    FireParams params;
    params.x_from_left = config.fire.x_from_left;
    params.y_from_bottom = config.fire.y_from_bottom;
    params.burst_count = config.fire.burst_count;
    params.shot_delay = to_millis(config.fire.shot_delay);
    params.round_delay = to_millis(config.fire.round_delay);
    params.scroll_ticks = config.fire.scroll_ticks;
    params.lost_window_policy = config.fire.lost_window_policy;
    params.prompts = resolve_prompts(config.targets.prompt, config.paths.config_dir);
    params.urls = resolve_urls(config.targets.url, config.paths.config_dir);
    return params;
}

namespace fire_policy {

Point injection_point(Geometry const& geometry, Anchor const& x_from_left, Anchor const& y_from_bottom)
{
    return Point{ x_from_left.resolve(geometry.width), geometry.height - y_from_bottom.resolve(geometry.height) };
}

bool is_clear_prompt(std::string const& prompt)
{
    return prompt == "_" || prompt.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string ledger_line(std::vector<std::string> const& prompts)
{
    std::string line;
    for (size_t i = 0; i < prompts.size(); ++i)
    {
        if (i > 0)
            line += " | ";
        // A record holds one line per round, so line breaks are escaped
        for (char c : prompts[i])
        {
            if (c == '\n')
                line += "\\n";
            else if (c == '\r')
                line += "\\r";
            else
                line += c;
        }
    }
    return line;
}

std::string status_text(FireProgress const& progress)
{
    return std::string(to_string(progress.mode)) + " round " + std::to_string(progress.round) + " shots "
        + std::to_string(progress.shots) + (progress.status.empty() ? "" : " - " + progress.status);
}

} // namespace fire_policy

FireSequencer::FireSequencer(
    WindowEnumerator& windows,
    InputInjector& input,
    ClipboardSink& clipboard,
    StatusSurface& status,
    TargetLedger& ledger,
    PollTiming timing
)
    : windows_(windows)
    , input_(input)
    , clipboard_(clipboard)
    , status_(status)
    , ledger_(ledger)
    , timing_(std::move(timing))
{ }

void FireSequencer::set_progress_callback(ProgressCallback callback) { progress_ = std::move(callback); }

void FireSequencer::set_stop_predicate(StopPredicate predicate) { stop_predicate_ = std::move(predicate); }

bool FireSequencer::should_stop()
{
    if (!stop_requested_ && stop_predicate_ && stop_predicate_())
        stop_requested_ = true;
    return stop_requested_;
}

void FireSequencer::report(std::string status)
{
    FireProgress progress{ mode_, round_, shots_, std::move(status) };
    status_.set_status(fire_policy::status_text(progress));
    if (progress_)
        progress_(progress);
}

int FireSequencer::run(FireMode mode, int round_cap, std::vector<xcb_window_t> plan, FireParams const& params)
{
    if (mode_ != FireMode::Safe)
    {
        LOG_ERROR("Fire requested while a session is already {}", to_string(mode_));
        return 0;
    }
    if (mode != FireMode::Semi && mode != FireMode::Auto)
    {
        LOG_ERROR("Fire needs semi or auto mode, got {}", to_string(mode));
        return 0;
    }

    mode_ = mode;
    round_ = 0;
    shots_ = 0;
    stop_requested_ = false;

    if (mode == FireMode::Semi)
        round_cap = 1;

    LOG_INFO(
        "Firing {} over {} windows (cap {}, burst {})", to_string(mode), plan.size(), round_cap, params.burst_count
    );
    report("firing");

    while (!should_stop())
    {
        if (plan.empty())
        {
            LOG_WARN("No windows left to fire at");
            break;
        }

        if (!run_round(plan, params))
            break;

        ++round_;
        std::string line = fire_policy::ledger_line(params.prompts);
        for (auto const& url : params.urls)
            ledger_.append_round(url, line);

        LOG_INFO("Round {} complete, {} shots total", round_, shots_);
        report("round complete");

        if (round_cap > 0 && round_ >= round_cap)
            break;
        if (!wait_between_rounds(params.round_delay))
            break;
    }

    if (stop_requested_)
    {
        mode_ = FireMode::Stopping;
        LOG_INFO("Stop observed after {} rounds", round_);
        report("stopping");
    }

    mode_ = FireMode::Safe;
    report("idle");
    return round_;
}

bool FireSequencer::run_round(std::vector<xcb_window_t>& plan, FireParams const& params)
{
    std::vector<xcb_window_t> lost;

    for (xcb_window_t window : plan)
    {
        if (should_stop())
            return false;

        if (!fire_window(window, params))
            lost.push_back(window);
    }

    if (params.lost_window_policy == LostWindowPolicy::Drop && !lost.empty())
    {
        std::erase_if(plan, [&](xcb_window_t w) { return std::ranges::find(lost, w) != lost.end(); });
        LOG_INFO("Dropped {} lost windows, {} remain", lost.size(), plan.size());
    }
    return true;
}

bool FireSequencer::fire_window(xcb_window_t window, FireParams const& params)
{
    auto geometry = windows_.geometry(window);
    if (!geometry)
    {
        LOG_WARN("Window {:#x} is gone, skipping it this round", window);
        return false;
    }

    Point target = fire_policy::injection_point(*geometry, params.x_from_left, params.y_from_bottom);
    LOG_DEBUG("Window {:#x}: injecting at {},{}", window, target.x, target.y);

    input_.activate(window);
    PointerGuard guard(input_);

    input_.move(window, target.x, target.y);
    if (params.scroll_ticks > 0)
        input_.scroll(params.scroll_ticks);

    auto prompt_for = [&](int shot) -> std::string const&
    {
        static std::string const empty;
        if (params.prompts.empty())
            return empty;
        return params.prompts[static_cast<size_t>(shot) % params.prompts.size()];
    };

    std::string const* on_clipboard = nullptr;
    auto load_clipboard = [&](std::string const& prompt)
    {
        if (fire_policy::is_clear_prompt(prompt) || (on_clipboard && *on_clipboard == prompt))
            return;
        if (!clipboard_.set_text(prompt))
            LOG_WARN("Clipboard unavailable, window {:#x} may receive stale text", window);
        on_clipboard = &prompt;
    };

    load_clipboard(prompt_for(0));
    input_.move(window, target.x, target.y);
    input_.click(1);

    for (int shot = 0; shot < params.burst_count; ++shot)
    {
        std::string const& prompt = prompt_for(shot);
        if (fire_policy::is_clear_prompt(prompt))
        {
            input_.send_keys(window, SelectClearSubmit);
        }
        else
        {
            load_clipboard(prompt);
            input_.send_keys(window, SelectPasteSubmit);
        }
        timing_.sleep(params.shot_delay);
    }

    shots_ += params.burst_count;
    report("window done");
    return true;
}

bool FireSequencer::wait_between_rounds(std::chrono::milliseconds delay)
{
    auto deadline = timing_.now() + delay;
    while (timing_.now() < deadline)
    {
        if (should_stop())
            return false;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - timing_.now());
        timing_.sleep(std::clamp(remaining, std::chrono::milliseconds(1), StopCheckSlice));
    }
    return !should_stop();
}

} // namespace blitz
