#include "test_common.hpp"
#include "debouncer.hpp"

using namespace std::chrono_literals;

TEST_CASE("Debouncer coalesces a burst into one settled change") {
    auto ch = std::make_shared<EventChannel>();
    Debouncer debouncer(ch, 200ms);
    auto start = std::chrono::steady_clock::now();
    std::thread producer([&] {
        ch->try_send(ChangeEvent{ChangeKind::Create, {"a.txt"}});
        std::this_thread::sleep_until(start + 50ms);
        ch->try_send(ChangeEvent{ChangeKind::Modify, {"b.txt"}});
        std::this_thread::sleep_until(start + 120ms);
        ch->try_send(ChangeEvent{ChangeKind::Remove, {"a.txt"}});
    });

    std::optional<ChangeEvent> change = debouncer.next();
    auto elapsed = std::chrono::steady_clock::now() - start;
    producer.join();

    REQUIRE(change.has_value());
    REQUIRE(change->kind == ChangeKind::Remove);
    REQUIRE(change->paths == std::set<fs::path>{"a.txt", "b.txt"});
    REQUIRE(elapsed >= 300ms);
    REQUIRE(elapsed < 1500ms);
    REQUIRE(ch->size() == 0);
}

TEST_CASE("Debouncer separates bursts split by a quiet window") {
    auto ch = std::make_shared<EventChannel>();
    Debouncer debouncer(ch, 50ms);
    ch->try_send(ChangeEvent{ChangeKind::Modify, {"first"}});
    auto one = debouncer.next();
    ch->try_send(ChangeEvent{ChangeKind::Modify, {"second"}});
    auto two = debouncer.next();
    REQUIRE(one);
    REQUIRE(two);
    REQUIRE(one->paths == std::set<fs::path>{"first"});
    REQUIRE(two->paths == std::set<fs::path>{"second"});
}

TEST_CASE("Debouncer ignores irrelevant notifications") {
    auto ch = std::make_shared<EventChannel>();
    Debouncer debouncer(ch, 50ms);
    ch->try_send(ChangeEvent{ChangeKind::Other, {"noise"}});
    ch->try_send(ChangeEvent{ChangeKind::Modify, {"real"}});
    ch->try_send(ChangeEvent{ChangeKind::Other, {"more-noise"}});
    auto change = debouncer.next();
    REQUIRE(change);
    REQUIRE(change->kind == ChangeKind::Modify);
    REQUIRE(change->paths == std::set<fs::path>{"real"});
}

TEST_CASE("Irrelevant notifications do not extend the quiet window") {
    auto ch = std::make_shared<EventChannel>();
    Debouncer debouncer(ch, 200ms);
    auto start = std::chrono::steady_clock::now();
    std::thread producer([&] {
        ch->try_send(ChangeEvent{ChangeKind::Modify, {"real"}});
        std::this_thread::sleep_until(start + 150ms);
        ch->try_send(ChangeEvent{ChangeKind::Other, {"noise"}});
    });

    auto change = debouncer.next();
    auto elapsed = std::chrono::steady_clock::now() - start;
    producer.join();

    REQUIRE(change);
    REQUIRE(change->paths == std::set<fs::path>{"real"});
    REQUIRE(elapsed >= 200ms);
    REQUIRE(elapsed < 300ms);
    REQUIRE(debouncer.last_observed() < start + 100ms);
}

TEST_CASE("Debouncer does not trigger on irrelevant notifications alone") {
    auto ch = std::make_shared<EventChannel>();
    Debouncer debouncer(ch, 20ms);
    ch->try_send(ChangeEvent{ChangeKind::Other, {"noise"}});
    std::thread closer([&] {
        std::this_thread::sleep_for(150ms);
        ch->close();
    });
    auto change = debouncer.next();
    closer.join();
    REQUIRE_FALSE(change.has_value());
}

TEST_CASE("Debouncer propagates backend failures") {
    auto ch = std::make_shared<EventChannel>();
    Debouncer debouncer(ch, 50ms);
    ch->try_send(ChangeEvent{ChangeKind::Modify, {"a"}});
    ch->try_send(ChannelError("inotify read failed"));
    REQUIRE_THROWS_AS(debouncer.next(), ChannelError);
}

TEST_CASE("Debouncer returns nothing once the channel is closed") {
    auto ch = std::make_shared<EventChannel>();
    Debouncer debouncer(ch, 50ms);
    ch->close();
    REQUIRE_FALSE(debouncer.next().has_value());
}

TEST_CASE("Destroying the debouncer closes its channel") {
    auto ch = std::make_shared<EventChannel>();
    {
        Debouncer debouncer(ch);
        REQUIRE(debouncer.quiet_window() == kDefaultQuietWindow);
    }
    REQUIRE(ch->closed());
    REQUIRE_FALSE(ch->try_send(ChangeEvent{ChangeKind::Modify, {"late"}}));
}
