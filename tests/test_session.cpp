#include "blitz/core/atomic_file.hpp"
#include "blitz/core/session_lock.hpp"
#include "blitz/fire/session.hpp"
#include "fakes.hpp"
#include <catch2/catch_test_macros.hpp>
#include <csignal>
#include <sys/wait.h>
#include <unistd.h>

using namespace blitz;
using namespace std::chrono_literals;

TEST_CASE("Session store round-trips the session table", "[session]")
{
    test::TempDir dir;
    SessionStore store(dir / "state.toml");

    auto empty = store.load();
    REQUIRE(empty.mode == FireMode::Safe);
    REQUIRE(empty.round == 0);

    REQUIRE(store.save(SessionState{ FireMode::Auto, 3, 42, "round complete", 1234 }));

    auto state = store.load();
    REQUIRE(state.mode == FireMode::Auto);
    REQUIRE(state.round == 3);
    REQUIRE(state.shots == 42);
    REQUIRE(state.status == "round complete");
    REQUIRE(state.pid == 1234);
}

TEST_CASE("Session store keeps other tables of the state layer", "[session]")
{
    test::TempDir dir;
    auto path = dir / "state.toml";
    REQUIRE(atomic_file::write(path, "[fire]\nburst_count = 4\n"));

    SessionStore store(path);
    REQUIRE(store.save(SessionState{ FireMode::Semi, 1, 4, "", 0 }));
    REQUIRE(store.set_mode(FireMode::Stopping));

    auto state = store.load();
    REQUIRE(state.mode == FireMode::Stopping);
    REQUIRE(state.shots == 4);

    auto text = atomic_file::read(path);
    REQUIRE(text);
    REQUIRE(text->find("burst_count = 4") != std::string::npos);
}

TEST_CASE("Session store keeps a pending stop while the session is active", "[session]")
{
    test::TempDir dir;
    SessionStore store(dir / "state.toml");

    REQUIRE(store.save(SessionState{ FireMode::Auto, 1, 3, "firing", 10 }));
    REQUIRE(store.set_mode(FireMode::Stopping));
    REQUIRE(store.stop_pending());

    REQUIRE(store.save(SessionState{ FireMode::Auto, 2, 6, "window done", 10 }));
    auto state = store.load();
    REQUIRE(state.mode == FireMode::Stopping);
    REQUIRE(state.round == 2);
    REQUIRE(state.shots == 6);

    // Returning to safe clears the request
    REQUIRE(store.save(SessionState{ FireMode::Safe, 2, 6, "idle", 10 }));
    REQUIRE_FALSE(store.stop_pending());
}

TEST_CASE("Session store ignores a corrupt state file", "[session]")
{
    test::TempDir dir;
    auto path = dir / "state.toml";
    REQUIRE(atomic_file::write(path, "[session\nmode = "));

    SessionStore store(path);
    REQUIRE(store.load().mode == FireMode::Safe);
    REQUIRE(store.save(SessionState{ FireMode::Auto, 0, 0, "firing", 1 }));
    REQUIRE(store.load().mode == FireMode::Auto);
}

TEST_CASE("Session lock admits one holder and records its pid", "[session][lock]")
{
    test::TempDir dir;
    auto path = dir / "blitz.lock";

    SessionLock first(path);
    SessionLock second(path);

    REQUIRE(first.try_acquire());
    REQUIRE(first.held());
    REQUIRE(SessionLock::read_owner(path) == ::getpid());
    REQUIRE_FALSE(second.try_acquire());

    first.release();
    REQUIRE_FALSE(first.held());
    REQUIRE_FALSE(SessionLock::read_owner(path).has_value());
    REQUIRE(second.try_acquire());
}

TEST_CASE("Session lock takes over from a running owner", "[session][lock]")
{
    test::TempDir dir;
    auto path = dir / "blitz.lock";

    int ready[2];
    REQUIRE(::pipe(ready) == 0);

    pid_t child = ::fork();
    REQUIRE(child >= 0);
    if (child == 0)
    {
        ::close(ready[0]);
        std::signal(SIGTERM, SIG_DFL);
        SessionLock held(path);
        char ok = held.try_acquire() ? '1' : '0';
        [[maybe_unused]] auto n = ::write(ready[1], &ok, 1);
        for (;;)
            ::pause();
    }

    ::close(ready[1]);
    char ok = 0;
    REQUIRE(::read(ready[0], &ok, 1) == 1);
    ::close(ready[0]);
    REQUIRE(ok == '1');
    REQUIRE(SessionLock::read_owner(path) == child);

    SessionLock lock(path);
    REQUIRE_NOTHROW(lock.acquire_taking_over(1000ms));
    REQUIRE(lock.held());
    REQUIRE(SessionLock::read_owner(path) == ::getpid());

    int status = 0;
    REQUIRE(::waitpid(child, &status, 0) == child);
    REQUIRE(WIFSIGNALED(status));
    REQUIRE(WTERMSIG(status) == SIGTERM);
}
