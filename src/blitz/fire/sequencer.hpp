#pragma once

#include "blitz/config/config.hpp"
#include "blitz/core/clock.hpp"
#include "blitz/core/desktop.hpp"
#include "blitz/fire/ledger.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace blitz {

struct FireParams
{
    Anchor x_from_left;
    Anchor y_from_bottom;
    int burst_count = 1;
    std::chrono::milliseconds shot_delay{ 500 };
    std::chrono::milliseconds round_delay{ 5000 };
    int scroll_ticks = 3;
    LostWindowPolicy lost_window_policy = LostWindowPolicy::Retry;
    std::vector<std::string> prompts; ///< burst shot j uses prompts[j % size]
    std::vector<std::string> urls;    ///< records that gain one line per round

    static FireParams from(Config const& config);
};

struct FireProgress
{
    FireMode mode = FireMode::Safe;
    int round = 0;     ///< completed rounds
    int64_t shots = 0; ///< cumulative over the session
    std::string status;
};

namespace fire_policy {

/// Injection point in window-relative coordinates.
Point injection_point(Geometry const& geometry, Anchor const& x_from_left, Anchor const& y_from_bottom);

/// "_" or a blank prompt clears the input field instead of pasting.
bool is_clear_prompt(std::string const& prompt);

/// Text recorded in the target ledger for one round, always a single line.
std::string ledger_line(std::vector<std::string> const& prompts);

std::string status_text(FireProgress const& progress);

} // namespace fire_policy

/**
 * @brief Round driver: Safe -> Semi/Auto -> (Stopping) -> Safe.
 *
 * Each round visits every planned window in order, re-resolving its geometry
 * and skipping windows that are gone. Stop is honoured at the top of the
 * per-window loop and during the inter-round delay; the pointer position is
 * restored after every window, including the last one before a stop.
 * A completed round adds exactly one line to each target record.
 */
class FireSequencer
{
public:
    using ProgressCallback = std::function<void(FireProgress const&)>;
    using StopPredicate = std::function<bool()>;

    FireSequencer(
        WindowEnumerator& windows,
        InputInjector& input,
        ClipboardSink& clipboard,
        StatusSurface& status,
        TargetLedger& ledger,
        PollTiming timing = PollTiming::system()
    );

    void set_progress_callback(ProgressCallback callback);
    void set_stop_predicate(StopPredicate predicate);

    /**
     * Runs Semi (one round) or Auto (until round_cap rounds, or forever when
     * round_cap <= 0) from Safe. Returns the number of completed rounds.
     * Any other mode, or a call while not Safe, is rejected with 0.
     */
    int run(FireMode mode, int round_cap, std::vector<xcb_window_t> plan, FireParams const& params);

    void request_stop() { stop_requested_ = true; }

    FireMode mode() const { return mode_; }
    int round() const { return round_; }
    int64_t shots() const { return shots_; }

private:
    WindowEnumerator& windows_;
    InputInjector& input_;
    ClipboardSink& clipboard_;
    StatusSurface& status_;
    TargetLedger& ledger_;
    PollTiming timing_;

    ProgressCallback progress_;
    StopPredicate stop_predicate_;
    bool stop_requested_ = false;

    FireMode mode_ = FireMode::Safe;
    int round_ = 0;
    int64_t shots_ = 0;

    bool should_stop();
    bool run_round(std::vector<xcb_window_t>& plan, FireParams const& params);
    bool fire_window(xcb_window_t window, FireParams const& params);
    bool wait_between_rounds(std::chrono::milliseconds delay);
    void report(std::string status);
};

} // namespace blitz
