#include "session.hpp"
#include "blitz/core/atomic_file.hpp"
#include "blitz/core/log.hpp"
#include <sstream>
#include <toml++/toml.hpp>

namespace blitz {

namespace {

toml::table read_table(std::filesystem::path const& path)
{
    auto text = atomic_file::read(path);
    if (!text)
        return {};
    try
    {
        return toml::parse(*text, path.string());
    }
    catch (toml::parse_error const& err)
    {
        LOG_WARN("Ignoring unreadable state file {}: {}", path.string(), err.description());
        return {};
    }
}

bool write_table(std::filesystem::path const& path, toml::table const& tbl)
{
    std::ostringstream out;
    out << tbl << '\n';
    return atomic_file::write(path, out.str());
}

} // namespace

SessionStore::SessionStore(std::filesystem::path path)
    : path_(std::move(path))
{ }

SessionState SessionStore::load() const
{
    SessionState state;
    toml::table tbl = read_table(path_);
    auto session = tbl["session"];
    if (!session.is_table())
        return state;

    if (auto mode = session["mode"].value<std::string>())
        state.mode = parse_fire_mode(*mode).value_or(FireMode::Safe);
    state.round = static_cast<int>(session["round"].value_or(int64_t{ 0 }));
    state.shots = session["shots"].value_or(int64_t{ 0 });
    state.status = session["status"].value_or(std::string{});
    state.pid = static_cast<pid_t>(session["pid"].value_or(int64_t{ 0 }));
    return state;
}

bool SessionStore::save(SessionState const& state)
{
    toml::table tbl = read_table(path_);

    // A stop written by another process stays until the session leaves Semi/Auto
    FireMode mode = state.mode;
    bool active = mode == FireMode::Semi || mode == FireMode::Auto;
    if (active && tbl["session"]["mode"].value<std::string>() == std::string(to_string(FireMode::Stopping)))
        mode = FireMode::Stopping;

    tbl.insert_or_assign(
        "session",
        toml::table{
            { "mode", std::string(to_string(mode)) },
            { "round", int64_t{ state.round } },
            { "shots", state.shots },
            { "status", state.status },
            { "pid", int64_t{ state.pid } },
        }
    );
    if (!write_table(path_, tbl))
    {
        LOG_ERROR("Failed to persist session state to {}", path_.string());
        return false;
    }
    return true;
}

bool SessionStore::stop_pending() const
{
    return load().mode == FireMode::Stopping;
}

bool SessionStore::set_mode(FireMode mode)
{
    toml::table tbl = read_table(path_);
    if (!tbl["session"].is_table())
        tbl.insert_or_assign("session", toml::table{});
    tbl["session"].as_table()->insert_or_assign("mode", std::string(to_string(mode)));
    return write_table(path_, tbl);
}

void track_session(FireSequencer& sequencer, SessionStore& store, pid_t owner, std::function<bool()> external_stop)
{
    sequencer.set_progress_callback(
        [&sequencer, &store, owner](FireProgress const& progress)
        {
            store.save(SessionState{ progress.mode, progress.round, progress.shots, progress.status, owner });
            bool active = progress.mode == FireMode::Semi || progress.mode == FireMode::Auto;
            if (active && store.stop_pending())
                sequencer.request_stop();
        }
    );
    sequencer.set_stop_predicate([&store, external_stop = std::move(external_stop)]
                                 { return (external_stop && external_stop()) || store.stop_pending(); });
}

} // namespace blitz
