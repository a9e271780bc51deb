#include "jb/player/playback_engine.hpp"

#include <catch2/catch.hpp>

#include <algorithm>

#include "../fakes.hpp"

using namespace jb;
using namespace jb::player;
using jb::test::make_track;
using jb::test::wait_until;
using std::chrono::milliseconds;

namespace {

struct engine_fixture {
    std::shared_ptr<jb::test::fake_locator>    locator    = std::make_shared<jb::test::fake_locator>();
    std::shared_ptr<jb::test::fake_transcoder> transcoder = std::make_shared<jb::test::fake_transcoder>();
    std::shared_ptr<jb::test::transport_log>   transport  = std::make_shared<jb::test::transport_log>();
    jb::test::event_recorder                   events;
    engine_config                              cfg;
    std::unique_ptr<playback_engine>           engine;

    engine_fixture()
    {
        cfg.frame_interval       = milliseconds(2);
        cfg.reconnect_base_delay = milliseconds(5);
    }

    ~engine_fixture() { engine.reset(); }

    playback_engine& start()
    {
        engine_deps deps;
        deps.locator    = locator;
        deps.transcoder = transcoder;
        deps.transport  = std::make_unique<jb::test::recording_transport>(transport);
        deps.events     = events.sink();
        deps.log        = jb::test::quiet_log();

        engine = std::make_unique<playback_engine>(dpp::snowflake(10), voice_channel{ dpp::snowflake(10), dpp::snowflake(20) },
                                                   std::move(deps), cfg);
        REQUIRE(engine->open().ok());
        return *engine;
    }

    std::vector<std::string> timeline() const
    {
        std::vector<std::string> out;
        for (const auto& e : events.events()) {
            switch (e.type) {
            case event_type::track_started: out.push_back("start " + e.entry->track.title); break;
            case event_type::track_ended:   out.push_back("end " + e.entry->track.title); break;
            case event_type::queue_empty:   out.push_back("empty"); break;
            case event_type::error:         out.push_back("error"); break;
            }
        }
        return out;
    }

    std::vector<std::uint64_t> sequences_for(char tag) const
    {
        std::vector<std::uint64_t> out;
        for (const auto& f : transport->sent_frames()) {
            if (f.tag == tag) {
                out.push_back(f.sequence);
            }
        }
        return out;
    }

    std::optional<playback_event> ended(const std::string& title) const
    {
        for (const auto& e : events.events()) {
            if (e.type == event_type::track_ended && e.entry && e.entry->track.title == title) {
                return e;
            }
        }
        return std::nullopt;
    }

    bool queue_emptied() const { return events.count(event_type::queue_empty) > 0; }
};

std::vector<resolved_track> tracks(std::initializer_list<const char*> names)
{
    std::vector<resolved_track> out;
    for (const char* n : names) {
        out.push_back(make_track(n));
    }
    return out;
}

std::vector<std::uint64_t> iota(std::uint64_t count)
{
    std::vector<std::uint64_t> v;
    for (std::uint64_t i = 0; i < count; ++i) {
        v.push_back(i);
    }
    return v;
}

} // namespace

TEST_CASE_METHOD(engine_fixture, "PlaybackEngine: plays A, B, C in order without interleaving", "[engine]")
{
    auto& e = start();
    auto  r = e.enqueue(tracks({ "a", "b", "c" }));
    REQUIRE(r.ok());
    REQUIRE(r.entry_ids == std::vector<std::uint64_t>{ 1, 2, 3 });

    REQUIRE(wait_until([this] { return queue_emptied(); }));

    REQUIRE(timeline() == std::vector<std::string>{
        "start a", "end a", "start b", "end b", "start c", "end c", "empty" });
    REQUIRE(ended("a")->reason == end_reason::finished);

    // Frames: every track 0..N-1, tracks never mixed.
    REQUIRE(sequences_for('a') == iota(5));
    REQUIRE(sequences_for('b') == iota(5));
    REQUIRE(sequences_for('c') == iota(5));

    const auto frames = transport->sent_frames();
    std::string order;
    for (const auto& f : frames) {
        if (order.empty() || order.back() != f.tag) {
            order.push_back(f.tag);
        }
    }
    REQUIRE(order == "abc");
}

TEST_CASE_METHOD(engine_fixture, "PlaybackEngine: frames are paced by the frame interval", "[engine]")
{
    cfg.frame_interval = milliseconds(20);
    transcoder->frames_per_track = 10;

    auto& e = start();
    REQUIRE(e.enqueue(tracks({ "a" })).ok());
    REQUIRE(wait_until([this] { return queue_emptied(); }));

    const auto frames = transport->sent_frames();
    REQUIRE(frames.size() == 10);
    // Ten frames need nine intervals.
    REQUIRE(frames.back().at - frames.front().at >= milliseconds(170));
}

TEST_CASE_METHOD(engine_fixture, "PlaybackEngine: a decode failure skips to the next track", "[engine]")
{
    transcoder->failures["a"] = { 2, error_code::decode_process_failed };

    auto& e = start();
    REQUIRE(e.enqueue(tracks({ "a", "b" })).ok());
    REQUIRE(wait_until([this] { return queue_emptied(); }));

    const auto a = ended("a");
    REQUIRE(a->reason == end_reason::decode_error);
    REQUIRE(a->error == error_code::decode_process_failed);
    REQUIRE(ended("b")->reason == end_reason::finished);
    REQUIRE(events.count(event_type::error) == 1);

    REQUIRE(sequences_for('a') == iota(2));
    REQUIRE(sequences_for('b') == iota(5));
}

TEST_CASE_METHOD(engine_fixture, "PlaybackEngine: locate and start failures are per track", "[engine]")
{
    locator->fail("a", error_code::locate_expired);
    transcoder->refuse.insert("b");

    auto& e = start();
    REQUIRE(e.enqueue(tracks({ "a", "b", "c" })).ok());
    REQUIRE(wait_until([this] { return queue_emptied(); }));

    REQUIRE(ended("a")->reason == end_reason::locate_error);
    REQUIRE(ended("a")->error == error_code::locate_expired);
    REQUIRE(ended("b")->reason == end_reason::decode_error);
    REQUIRE(ended("c")->reason == end_reason::finished);
    REQUIRE(events.count(event_type::error) == 2);

    // Failed tracks are not retried.
    REQUIRE(locator->calls == 3);
}

TEST_CASE_METHOD(engine_fixture, "PlaybackEngine: no frames of a skipped track after the skip", "[engine]")
{
    transcoder->frames_per_track = 100000;

    auto& e = start();
    REQUIRE(e.enqueue(tracks({ "a", "b" })).ok());
    REQUIRE(wait_until([this] { return sequences_for('a').size() >= 5; }));

    REQUIRE(e.skip().ok());
    const auto sent_at_skip = sequences_for('a');

    REQUIRE(wait_until([this] { return sequences_for('b').size() >= 5; }));
    REQUIRE(sequences_for('a') == sent_at_skip);
    REQUIRE(sent_at_skip == iota(sent_at_skip.size()));
    REQUIRE(ended("a")->reason == end_reason::skipped);
    REQUIRE(transcoder->stats->peak == 1);
}

TEST_CASE_METHOD(engine_fixture, "PlaybackEngine: skip during a locate never runs two pipelines", "[engine]")
{
    transcoder->frames_per_track = 100000;
    locator->blocking            = true;

    auto& e = start();
    REQUIRE(e.enqueue(tracks({ "a", "b" })).ok());
    REQUIRE(wait_until([this] { return locator->waiting() == 1; }));

    REQUIRE(e.skip().ok());
    // a's locate is cancelled, b's starts and blocks.
    REQUIRE(wait_until([this] { return locator->calls == 2 && locator->waiting() == 1; }));
    REQUIRE(transcoder->starts().empty());

    locator->release();
    REQUIRE(wait_until([this] { return sequences_for('b').size() >= 3; }));

    const auto starts = transcoder->starts();
    REQUIRE(starts.size() == 1);
    REQUIRE(starts[0].url == "fake://b");
    REQUIRE(sequences_for('a').empty());
    REQUIRE(transcoder->stats->peak == 1);
}

TEST_CASE_METHOD(engine_fixture, "PlaybackEngine: rapid skips keep one pipeline", "[engine]")
{
    transcoder->frames_per_track = 100000;

    auto& e = start();
    REQUIRE(e.enqueue(tracks({ "a", "b", "c", "d" })).ok());
    REQUIRE(wait_until([this] { return !sequences_for('a').empty(); }));

    REQUIRE(e.skip().ok());
    REQUIRE(e.skip().ok());
    REQUIRE(e.skip().ok());
    REQUIRE(wait_until([this] { return !sequences_for('d').empty(); }));

    REQUIRE(transcoder->stats->peak == 1);
    REQUIRE(transcoder->stats->active == 1);
}

TEST_CASE_METHOD(engine_fixture, "PlaybackEngine: pause holds frames and resume continues", "[engine]")
{
    transcoder->frames_per_track = 100000;

    auto& e = start();
    REQUIRE(e.enqueue(tracks({ "a" })).ok());
    REQUIRE(wait_until([this] { return sequences_for('a').size() >= 3; }));

    REQUIRE(e.pause().ok());
    const auto at_pause = transport->frame_count();

    auto snap = e.list_queue();
    REQUIRE(snap.mode == session_mode::paused);
    REQUIRE(snap.position == milliseconds(20) * static_cast<int>(at_pause));

    std::this_thread::sleep_for(milliseconds(50));
    REQUIRE(transport->frame_count() == at_pause);
    REQUIRE(e.pause().code == error_code::invalid_state);

    REQUIRE(e.resume().ok());
    REQUIRE(e.resume().code == error_code::invalid_state);
    REQUIRE(wait_until([&] { return transport->frame_count() > at_pause + 3; }));

    const auto seqs = sequences_for('a');
    REQUIRE(seqs == iota(seqs.size()));
    // The decoder kept running through the short pause.
    REQUIRE(transcoder->starts().size() == 1);
}

TEST_CASE_METHOD(engine_fixture, "PlaybackEngine: a long pause releases the decoder", "[engine]")
{
    cfg.pause_timeout            = milliseconds(30);
    transcoder->frames_per_track = 100000;

    auto& e = start();
    REQUIRE(e.enqueue(tracks({ "a" })).ok());
    REQUIRE(wait_until([this] { return sequences_for('a').size() >= 3; }));

    REQUIRE(e.pause().ok());
    const auto at_pause = transport->frame_count();
    REQUIRE(wait_until([this] { return transcoder->stats->active == 0; }));

    REQUIRE(e.resume().ok());
    REQUIRE(wait_until([&] { return transport->frame_count() > at_pause + 3; }));

    // Located again, restarted where it stopped, numbering continued.
    REQUIRE(locator->calls == 2);
    const auto starts = transcoder->starts();
    REQUIRE(starts.size() == 2);
    REQUIRE(starts[1].start_frame == at_pause);

    const auto seqs = sequences_for('a');
    REQUIRE(seqs == iota(seqs.size()));
}

TEST_CASE_METHOD(engine_fixture, "PlaybackEngine: commands in the wrong state", "[engine]")
{
    auto& e = start();

    REQUIRE(e.skip().code == error_code::invalid_state);
    REQUIRE(e.pause().code == error_code::invalid_state);
    REQUIRE(e.resume().code == error_code::invalid_state);
    REQUIRE(e.remove(7).code == error_code::entry_not_found);
    REQUIRE(e.move(7, 0).code == error_code::entry_not_found);

    const auto snap = e.list_queue();
    REQUIRE(snap.mode == session_mode::idle);
    REQUIRE_FALSE(snap.current);
    REQUIRE(snap.upcoming.empty());
    REQUIRE(e.idle_since());
}

TEST_CASE_METHOD(engine_fixture, "PlaybackEngine: queue edits while playing", "[engine]")
{
    transcoder->frames_per_track = 100000;

    auto& e = start();
    const auto ids = e.enqueue(tracks({ "a", "b", "c", "d" })).entry_ids;
    REQUIRE(wait_until([this] { return !sequences_for('a').empty(); }));
    REQUIRE_FALSE(e.idle_since());

    REQUIRE(e.move(ids[3], 0).ok());
    REQUIRE(e.remove(ids[1]).ok());
    REQUIRE(e.move(ids[0], 1).code == error_code::invalid_state);

    auto snap = e.list_queue();
    REQUIRE(snap.current->entry.id == ids[0]);
    REQUIRE(snap.upcoming.size() == 2);
    REQUIRE(snap.upcoming[0].track.title == "d");
    REQUIRE(snap.upcoming[1].track.title == "c");

    // Removing the current entry behaves as a skip.
    REQUIRE(e.remove(ids[0]).ok());
    REQUIRE(ended("a")->reason == end_reason::removed);
    REQUIRE(wait_until([this] { return !sequences_for('d').empty(); }));
}

TEST_CASE_METHOD(engine_fixture, "PlaybackEngine: reconnects after a lost transport", "[engine]")
{
    transcoder->frames_per_track = 100000;

    auto& e = start();
    REQUIRE(e.enqueue(tracks({ "a" })).ok());
    REQUIRE(wait_until([this] { return sequences_for('a').size() >= 3; }));

    {
        std::lock_guard<std::mutex> lock(transport->mutex);
        transport->open_script.push_back(voice::transport_status::disconnected);
    }
    e.notify_transport_lost();

    REQUIRE(wait_until([this] { return transport->open_count() == 3; }));
    const auto before = transport->frame_count();
    REQUIRE(wait_until([&] { return transport->frame_count() > before + 3; }));

    REQUIRE_FALSE(e.terminated());
    REQUIRE(events.count(event_type::error) == 0);
    const auto seqs = sequences_for('a');
    REQUIRE(seqs == iota(seqs.size()));
}

TEST_CASE_METHOD(engine_fixture, "PlaybackEngine: a disconnect seen while sending triggers reconnect", "[engine]")
{
    transcoder->frames_per_track = 100000;

    auto& e = start();
    {
        std::lock_guard<std::mutex> lock(transport->mutex);
        transport->send_script = { voice::transport_status::ok, voice::transport_status::ok,
                                   voice::transport_status::disconnected };
    }
    REQUIRE(e.enqueue(tracks({ "a" })).ok());

    REQUIRE(wait_until([this] { return transport->open_count() == 2; }));
    REQUIRE(wait_until([this] { return sequences_for('a').size() >= 5; }));
    REQUIRE_FALSE(e.terminated());

    // The frame refused by the dead connection is sent after reconnecting.
    const auto seqs = sequences_for('a');
    REQUIRE(seqs == iota(seqs.size()));
}

TEST_CASE_METHOD(engine_fixture, "PlaybackEngine: reconnect exhaustion tears the session down", "[engine]")
{
    transcoder->frames_per_track = 100000;

    auto& e = start();
    REQUIRE(e.enqueue(tracks({ "a", "b" })).ok());
    REQUIRE(wait_until([this] { return !sequences_for('a').empty(); }));

    {
        std::lock_guard<std::mutex> lock(transport->mutex);
        transport->open_script.assign(3, voice::transport_status::disconnected);
    }
    e.notify_transport_lost();

    REQUIRE(wait_until([&] { return e.terminated(); }));
    REQUIRE(transport->open_count() == 4);
    REQUIRE(transport->close_count() == 1);
    REQUIRE(transcoder->stats->active == 0);

    // Reported once.
    std::size_t transport_errors = 0;
    for (const auto& ev : events.events()) {
        if (ev.type == event_type::error && ev.error == error_code::transport_disconnected) {
            ++transport_errors;
        }
    }
    REQUIRE(transport_errors == 1);
    REQUIRE(ended("a")->reason == end_reason::transport_error);
    REQUIRE_FALSE(ended("b"));

    REQUIRE(e.enqueue(tracks({ "c" })).code == error_code::session_not_found);
}

TEST_CASE_METHOD(engine_fixture, "PlaybackEngine: stop ends the track and the loop", "[engine]")
{
    transcoder->frames_per_track = 100000;

    auto& e = start();
    REQUIRE(e.enqueue(tracks({ "a", "b" })).ok());
    REQUIRE(wait_until([this] { return !sequences_for('a').empty(); }));

    REQUIRE(e.stop().ok());
    REQUIRE(ended("a")->reason == end_reason::stopped);
    REQUIRE(wait_until([&] { return e.terminated(); }));
    REQUIRE(transport->close_count() == 1);
    REQUIRE(transcoder->stats->active == 0);

    REQUIRE(e.skip().code == error_code::session_not_found);
    REQUIRE(e.stop().code == error_code::session_not_found);
    REQUIRE(e.list_queue().mode == session_mode::stopping);
}

TEST_CASE_METHOD(engine_fixture, "PlaybackEngine: idle time is tracked", "[engine]")
{
    auto& e = start();
    REQUIRE(e.idle_since());

    REQUIRE(e.enqueue(tracks({ "a" })).ok());
    REQUIRE_FALSE(e.idle_since());

    REQUIRE(wait_until([this] { return queue_emptied(); }));
    REQUIRE(e.idle_since());
}
