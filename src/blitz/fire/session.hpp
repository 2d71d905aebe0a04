#pragma once

#include "blitz/core/types.hpp"
#include "blitz/fire/sequencer.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <sys/types.h>

namespace blitz {

/// Persisted view of the active fire session, polled by the control surface.
struct SessionState
{
    FireMode mode = FireMode::Safe;
    int round = 0;
    int64_t shots = 0;
    std::string status;
    pid_t pid = 0;
};

/**
 * @brief Reads and replaces the [session] table of the state file.
 *
 * Other tables in the file belong to the session configuration layer and are
 * carried over untouched. Every save is an atomic replace.
 */
class SessionStore
{
public:
    explicit SessionStore(std::filesystem::path path);

    SessionState load() const;

    /// Replaces the session table. A pending stop survives saves of an active session.
    bool save(SessionState const& state);

    bool stop_pending() const;

    /// Only rewrites the mode; used by `stop` from another process.
    bool set_mode(FireMode mode);

    std::filesystem::path const& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * Persists every progress report of @p sequencer into @p store and stops the
 * sequencer once a stop request shows up in the store or @p external_stop
 * returns true. Both referenced objects must outlive the sequencer's run.
 */
void track_session(
    FireSequencer& sequencer,
    SessionStore& store,
    pid_t owner,
    std::function<bool()> external_stop = {}
);

} // namespace blitz
