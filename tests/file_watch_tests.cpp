#include "test_common.hpp"
#include "watch_session.hpp"
#include <variant>

using namespace std::chrono_literals;
using watchrun::test_support::make_temp_dir;
using watchrun::test_support::watch_set;
using watchrun::test_support::write_file;

namespace {
/// Read from @p ch until an event of @p kind touching @p path shows up.
bool saw_event(EventChannel& ch, ChangeKind kind, const fs::path& path,
               std::chrono::milliseconds timeout = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    WatchMessage msg;
    while (ch.receive_until(deadline, msg) == EventChannel::RecvStatus::Message) {
        const auto* ev = std::get_if<ChangeEvent>(&msg);
        if (ev && ev->kind == kind && ev->paths.count(path))
            return true;
    }
    return false;
}
} // namespace

#if defined(__linux__)
TEST_CASE("FileWatcher reports files created in a watched directory") {
    fs::path dir = make_temp_dir("inotify_create");
    auto ch = std::make_shared<EventChannel>(64);
    {
        FileWatcher watcher(watch_set({dir}), ch);
        REQUIRE(watcher.active());
        REQUIRE(watcher.paths().contains(dir));
        write_file(dir / "new.txt", "hello");
        REQUIRE(saw_event(*ch, ChangeKind::Create, dir / "new.txt"));
    }
    FS_REMOVE_ALL(dir);
}

TEST_CASE("FileWatcher reports modifications and removals") {
    fs::path dir = make_temp_dir("inotify_modify");
    fs::path file = dir / "data.txt";
    write_file(file, "initial");
    auto ch = std::make_shared<EventChannel>(64);
    {
        FileWatcher watcher(watch_set({dir}), ch);
        write_file(file, "changed");
        REQUIRE(saw_event(*ch, ChangeKind::Modify, file));
        FS_REMOVE(file);
        REQUIRE(saw_event(*ch, ChangeKind::Remove, file));
    }
    FS_REMOVE_ALL(dir);
}

TEST_CASE("FileWatcher watches individual files") {
    fs::path dir = make_temp_dir("inotify_file");
    fs::path file = dir / "single.txt";
    write_file(file, "initial");
    auto ch = std::make_shared<EventChannel>(64);
    {
        FileWatcher watcher(watch_set({file}), ch);
        write_file(file, "changed");
        REQUIRE(saw_event(*ch, ChangeKind::Modify, file));
    }
    FS_REMOVE_ALL(dir);
}

TEST_CASE("FileWatcher does not recurse into subdirectories") {
    fs::path dir = make_temp_dir("inotify_nested");
    fs::create_directories(dir / "sub");
    auto ch = std::make_shared<EventChannel>(64);
    {
        FileWatcher watcher(watch_set({dir}), ch);
        write_file(dir / "sub" / "deep.txt", "x");
        REQUIRE_FALSE(saw_event(*ch, ChangeKind::Create, dir / "sub" / "deep.txt", 300ms));
    }
    FS_REMOVE_ALL(dir);
}

TEST_CASE("FileWatcher rejects a path that does not exist") {
    fs::path dir = make_temp_dir("inotify_missing");
    fs::path missing = dir / "missing";
    auto ch = std::make_shared<EventChannel>();
    try {
        FileWatcher watcher(watch_set({dir, missing}), ch);
        FAIL("expected WatchSetupError");
    } catch (const WatchSetupError& e) {
        REQUIRE(e.path() == missing);
    }
    FS_REMOVE_ALL(dir);
}
#endif

TEST_CASE("PollingWatcher detects create, modify and remove") {
    fs::path dir = make_temp_dir("polling");
    fs::path file = dir / "poll.txt";
    auto ch = std::make_shared<EventChannel>(64);
    {
        PollingWatcher watcher(watch_set({dir}), ch, 20ms);
        REQUIRE(watcher.active());
        write_file(file, "one");
        REQUIRE(saw_event(*ch, ChangeKind::Create, file));

        fs::last_write_time(file, fs::last_write_time(file) + 5s);
        REQUIRE(saw_event(*ch, ChangeKind::Modify, file));

        FS_REMOVE(file);
        REQUIRE(saw_event(*ch, ChangeKind::Remove, file));
    }
    FS_REMOVE_ALL(dir);
}

TEST_CASE("PollingWatcher rejects a path that does not exist") {
    auto ch = std::make_shared<EventChannel>();
    fs::path missing = fs::temp_directory_path() / "watchrun_polling_missing" / "x";
    REQUIRE_THROWS_AS(PollingWatcher(watch_set({missing}), ch, 20ms), WatchSetupError);
}

TEST_CASE("make_polling_watcher builds polling sources") {
    fs::path dir = make_temp_dir("polling_factory");
    auto ch = std::make_shared<EventChannel>();
    EventSourceFactory factory = make_polling_watcher(30ms);
    auto source = factory(watch_set({dir}), ch);
    REQUIRE(source);
    REQUIRE(dynamic_cast<PollingWatcher*>(source.get()) != nullptr);
    REQUIRE(source->active());
    source.reset();
    FS_REMOVE_ALL(dir);
}

TEST_CASE("make_file_watcher uses the native backend") {
    fs::path dir = make_temp_dir("native_factory");
    auto ch = std::make_shared<EventChannel>();
    auto source = make_file_watcher(watch_set({dir}), ch);
    REQUIRE(source->active());
#if defined(__linux__)
    REQUIRE(dynamic_cast<FileWatcher*>(source.get()) != nullptr);
#endif
    source.reset();
    FS_REMOVE_ALL(dir);
}

TEST_CASE("WatchSession closes its channel after releasing the source") {
    fs::path dir = make_temp_dir("session");
    std::shared_ptr<EventChannel> ch;
    {
        WatchSession session(watch_set({dir}), make_polling_watcher(20ms), 8);
        ch = session.channel();
        REQUIRE(session.active());
        REQUIRE(ch->capacity() == 8);
        REQUIRE_FALSE(ch->closed());
    }
    REQUIRE(ch->closed());
    FS_REMOVE_ALL(dir);
}

TEST_CASE("WatchSession rejects a factory that returns no source") {
    EventSourceFactory empty = [](const WatchSet&, std::shared_ptr<EventChannel>) {
        return std::unique_ptr<EventSource>();
    };
    REQUIRE_THROWS_AS(WatchSession(watch_set({"src"}), empty), WatchSetupError);
}
