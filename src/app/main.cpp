#include <blitz/config/config.hpp>
#include <blitz/core/connection.hpp>
#include <blitz/core/ewmh.hpp>
#include <blitz/core/log.hpp>
#include <blitz/core/session_lock.hpp>
#include <blitz/fire/ledger.hpp>
#include <blitz/fire/sequencer.hpp>
#include <blitz/fire/session.hpp>
#include <blitz/input/clipboard.hpp>
#include <blitz/stage/launcher.hpp>
#include <blitz/stage/stager.hpp>
#include <blitz/x11/input.hpp>
#include <blitz/x11/panel.hpp>
#include <blitz/x11/windows.hpp>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

constexpr auto TakeoverGrace = std::chrono::milliseconds(2000);

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) { g_stop_requested = 1; }

void install_signal_handlers()
{
    struct sigaction sa = {};
    sa.sa_handler = handle_stop_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);
}

void print_usage()
{
    std::cerr << "usage: blitz [--config-dir DIR] COMMAND\n"
                 "  stage                     open and arrange the target windows\n"
                 "  fire [--auto [--rounds N]] fire one round, or rounds until stopped\n"
                 "  stop                      stop the active session\n"
                 "  status                    show the session state\n"
                 "  set KEY VALUE             persist a user override (e.g. fire.burst_count 3)\n";
}

fs::path default_config_dir()
{
    if (char const* dir = std::getenv("BLITZ_CONFIG_DIR"))
        return dir;

    if (char const* xdg = std::getenv("XDG_CONFIG_HOME"))
        return fs::path(xdg) / "blitz";

    if (char const* home = std::getenv("HOME"))
        return fs::path(home) / ".config" / "blitz";

    return fs::current_path();
}

int run_stage(blitz::Config const& config)
{
    blitz::SessionLock lock(config.paths.lock_file);
    lock.acquire_taking_over(TakeoverGrace);

    blitz::SessionStore store(config.paths.state_file);
    store.save(blitz::SessionState{ blitz::FireMode::Safe, 0, 0, "staging", ::getpid() });

    blitz::Connection conn;
    blitz::Ewmh ewmh(conn);
    blitz::X11Windows windows(conn, ewmh);
    blitz::ProcessLauncher launcher(config.browser);
    blitz::TargetLedger ledger(config.targets.ledger_dir);

    blitz::Stager stager(config, windows, windows, launcher, ledger);
    auto report = stager.run();

    std::string status;
    if (report.aborted)
        status = "no windows found";
    else if (report.ledger_failed)
        status = "staging ledger not written";
    else
        status = "staged " + std::to_string(report.ready) + "/" + std::to_string(report.requested);
    store.save(blitz::SessionState{ blitz::FireMode::Safe, 0, 0, status, 0 });

    std::cout << status << "\n";
    return report.aborted || report.ledger_failed ? 1 : 0;
}

int run_fire(blitz::Config const& config, bool automatic, std::optional<int> rounds)
{
    blitz::SessionLock lock(config.paths.lock_file);
    lock.acquire_taking_over(TakeoverGrace);

    auto plan = blitz::staging_ledger::read(config.stage.ledger);
    if (!plan || plan->empty())
    {
        LOG_ERROR("Nothing staged yet ({} is missing or empty); run 'blitz stage' first", config.stage.ledger.string());
        return 1;
    }

    blitz::Connection conn;
    blitz::Ewmh ewmh(conn);
    blitz::X11Windows windows(conn, ewmh);
    blitz::XTestInjector input(conn, ewmh);
    blitz::CommandClipboard clipboard(config.clipboard.command, config.clipboard.fallback);
    blitz::TargetLedger ledger(config.targets.ledger_dir);

    std::unique_ptr<blitz::StatusSurface> status;
    if (config.panel.title.empty())
        status = std::make_unique<blitz::LogStatus>();
    else
        status = std::make_unique<blitz::PanelTitleStatus>(conn, ewmh, config.panel.title);

    blitz::SessionStore store(config.paths.state_file);
    blitz::FireSequencer sequencer(windows, input, clipboard, *status, ledger);

    blitz::track_session(sequencer, store, ::getpid(), [] { return g_stop_requested != 0; });

    auto mode = automatic ? blitz::FireMode::Auto : blitz::FireMode::Semi;
    int cap = rounds.value_or(config.fire.rounds);
    int completed = sequencer.run(mode, cap, std::move(*plan), blitz::FireParams::from(config));

    std::cout << "fired " << completed << " rounds, " << sequencer.shots() << " shots\n";
    return 0;
}

int run_stop(blitz::Config const& config)
{
    blitz::SessionStore store(config.paths.state_file);
    if (!store.set_mode(blitz::FireMode::Stopping))
        LOG_WARN("Could not record stop request in {}", store.path().string());

    auto owner = blitz::SessionLock::read_owner(config.paths.lock_file);
    if (owner && *owner != ::getpid() && ::kill(*owner, SIGTERM) == 0)
    {
        LOG_INFO("Stop requested from pid {}", *owner);
        return 0;
    }

    LOG_INFO("No active session");
    store.set_mode(blitz::FireMode::Safe);
    return 0;
}

int run_status(blitz::Config const& config)
{
    blitz::SessionStore store(config.paths.state_file);
    auto state = store.load();
    auto owner = blitz::SessionLock::read_owner(config.paths.lock_file);

    std::cout << "mode:   " << blitz::to_string(state.mode) << "\n"
              << "round:  " << state.round << "\n"
              << "shots:  " << state.shots << "\n"
              << "status: " << state.status << "\n"
              << "owner:  " << (owner ? std::to_string(*owner) : std::string("none")) << "\n";
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    blitz::log::init();

    std::vector<std::string> args(argv + 1, argv + argc);
    fs::path config_dir = default_config_dir();

    if (args.size() >= 2 && args[0] == "--config-dir")
    {
        config_dir = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.empty() || args[0] == "-h" || args[0] == "--help")
    {
        print_usage();
        blitz::log::shutdown();
        return args.empty() ? 2 : 0;
    }

    std::string const command = args[0];
    auto layers = blitz::ConfigLayers::in(config_dir);
    int rc = 0;

    try
    {
        // Overrides are written before validation so a missing key can be supplied
        if (command == "set")
        {
            if (args.size() != 3)
            {
                print_usage();
                blitz::log::shutdown();
                return 2;
            }
            rc = blitz::set_user_override(layers.user, args[1], args[2]) ? 0 : 1;
            blitz::log::shutdown();
            return rc;
        }

        blitz::Config config = blitz::load_config(layers);
        if (config.paths.log_file != "/tmp/blitz.log")
            blitz::log::init(config.paths.log_file.string());

        install_signal_handlers();

        if (command == "stage")
        {
            rc = run_stage(config);
        }
        else if (command == "fire")
        {
            bool automatic = false;
            std::optional<int> rounds;
            for (size_t i = 1; i < args.size(); ++i)
            {
                if (args[i] == "--auto")
                    automatic = true;
                else if (args[i] == "--rounds" && i + 1 < args.size())
                    rounds = std::stoi(args[++i]);
                else
                    throw std::invalid_argument("unknown fire option " + args[i]);
            }
            rc = run_fire(config, automatic, rounds);
        }
        else if (command == "stop")
        {
            rc = run_stop(config);
        }
        else if (command == "status")
        {
            rc = run_status(config);
        }
        else
        {
            print_usage();
            rc = 2;
        }
    }
    catch (blitz::ConfigError const& e)
    {
        LOG_CRITICAL("Configuration error: {}", e.what());
        blitz::log::shutdown();
        return 1;
    }
    catch (std::exception const& e)
    {
        LOG_ERROR("Error: {}", e.what());
        blitz::log::shutdown();
        return 1;
    }

    blitz::log::shutdown();
    return rc;
}
