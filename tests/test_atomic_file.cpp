#include "blitz/core/atomic_file.hpp"
#include "fakes.hpp"
#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <thread>

using namespace blitz;

TEST_CASE("Atomic write replaces the whole file", "[atomic]")
{
    test::TempDir dir;
    auto path = dir / "state.toml";

    REQUIRE(atomic_file::write(path, "one\ntwo\n"));
    REQUIRE(atomic_file::read(path) == std::string("one\ntwo\n"));

    REQUIRE(atomic_file::write(path, "three\n"));
    REQUIRE(atomic_file::read(path) == std::string("three\n"));

    // No temporaries left behind
    size_t entries = 0;
    for ([[maybe_unused]] auto const& entry : std::filesystem::directory_iterator(dir.path()))
        ++entries;
    REQUIRE(entries == 1);
}

TEST_CASE("Atomic append keeps prior bytes and terminates lines", "[atomic]")
{
    test::TempDir dir;
    auto path = dir / "record";

    REQUIRE(atomic_file::write(path, "header"));
    REQUIRE(atomic_file::append_line(path, "a"));
    REQUIRE(atomic_file::append_line(path, "b"));

    REQUIRE(atomic_file::read(path) == std::string("header\na\nb\n"));
}

TEST_CASE("Atomic write reports failure without throwing", "[atomic]")
{
    test::TempDir dir;
    auto blocker = dir / "file";
    REQUIRE(atomic_file::write(blocker, "x"));

    REQUIRE_FALSE(atomic_file::write(blocker / "child", "y"));
    REQUIRE_FALSE(atomic_file::read(dir / "missing").has_value());
}

TEST_CASE("Concurrent readers never observe a partially written file", "[atomic]")
{
    test::TempDir dir;
    auto path = dir / "state";

    size_t const size = 256 * 1024;
    std::string const a(size, 'a');
    std::string const b(size, 'b');
    REQUIRE(atomic_file::write(path, a));

    std::atomic<bool> done{ false };
    std::atomic<int> torn{ 0 };
    std::atomic<int> reads{ 0 };

    std::thread reader(
        [&]
        {
            while (!done.load())
            {
                auto contents = atomic_file::read(path);
                if (!contents)
                    continue;
                ++reads;
                if (*contents != a && *contents != b)
                    ++torn;
            }
        }
    );

    bool all_written = true;
    for (int i = 0; i < 100; ++i)
        all_written = atomic_file::write(path, i % 2 ? a : b) && all_written;

    done = true;
    reader.join();

    REQUIRE(all_written);
    REQUIRE(reads.load() > 0);
    REQUIRE(torn.load() == 0);
}
