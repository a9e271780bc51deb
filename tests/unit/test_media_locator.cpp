#include "jb/resolve/media_locator.hpp"

#include <catch2/catch.hpp>

#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

#include "../fakes.hpp"

using namespace jb;
using namespace jb::resolve;
using std::chrono::milliseconds;

namespace {

// Executable shell script standing in for yt-dlp; removed on destruction.
class fake_ytdlp {
public:
    explicit fake_ytdlp(const std::string& body)
        : m_path("/tmp/jb-fake-ytdlp-" + std::to_string(::getpid()) + "-" + std::to_string(s_counter++))
    {
        std::ofstream out(m_path);
        out << "#!/bin/sh\n" << body << "\n";
        out.close();
        ::chmod(m_path.c_str(), 0755);
    }

    ~fake_ytdlp() { ::unlink(m_path.c_str()); }

    const std::string& path() const { return m_path; }

private:
    static inline int s_counter = 0;
    std::string       m_path;
};

resolved_track youtube_track()
{
    auto t = jb::test::make_track("Song");
    t.provider_locator = "https://www.youtube.com/watch?v=dQw4w9WgXcQ";
    return t;
}

} // namespace

TEST_CASE("MediaLocator: yt-dlp failures are classified", "[locator]")
{
    REQUIRE(classify_ytdlp_failure("ERROR: [youtube] abc: Video unavailable") == error_code::locate_expired);
    REQUIRE(classify_ytdlp_failure("ERROR: [youtube] abc: Private video. Sign in") == error_code::locate_expired);
    REQUIRE(classify_ytdlp_failure("ERROR: unable to download webpage: HTTP Error 410: Gone")
            == error_code::locate_expired);
    REQUIRE(classify_ytdlp_failure("ERROR: Unable to download API page: timed out")
            == error_code::locate_provider_unavailable);
    REQUIRE(classify_ytdlp_failure("") == error_code::locate_provider_unavailable);
}

TEST_CASE("MediaLocator: first stdout line is the media URL", "[locator]")
{
    // The watch URL is the last argument.
    fake_ytdlp script("for last; do :; done\necho \"https://media.test/audio?src=$last\"\necho second-line");
    ytdlp_media_locator locator(script.path(), milliseconds(5000), jb::test::quiet_log());

    auto r = locator.locate(youtube_track(), util::cancel_token{});
    REQUIRE(r.ok());
    REQUIRE(r.source.url == "https://media.test/audio?src=https://www.youtube.com/watch?v=dQw4w9WgXcQ");
}

TEST_CASE("MediaLocator: error paths", "[locator]")
{
    SECTION("removed video is Expired")
    {
        fake_ytdlp script("echo 'ERROR: [youtube] dQw4w9WgXcQ: Video unavailable' >&2\nexit 1");
        ytdlp_media_locator locator(script.path(), milliseconds(5000), jb::test::quiet_log());
        auto r = locator.locate(youtube_track(), util::cancel_token{});
        REQUIRE(r.code == error_code::locate_expired);
        REQUIRE_THAT(r.error_message, Catch::Contains("Video unavailable"));
    }

    SECTION("empty output is Expired")
    {
        fake_ytdlp script("exit 0");
        ytdlp_media_locator locator(script.path(), milliseconds(5000), jb::test::quiet_log());
        REQUIRE(locator.locate(youtube_track(), util::cancel_token{}).code == error_code::locate_expired);
    }

    SECTION("a hung locator times out")
    {
        fake_ytdlp script("exec sleep 10");
        ytdlp_media_locator locator(script.path(), milliseconds(200), jb::test::quiet_log());

        const auto before = std::chrono::steady_clock::now();
        auto r = locator.locate(youtube_track(), util::cancel_token{});
        REQUIRE(r.code == error_code::locate_provider_unavailable);
        REQUIRE(std::chrono::steady_clock::now() - before < std::chrono::seconds(5));
    }

    SECTION("cancellation stops the child")
    {
        fake_ytdlp script("exec sleep 10");
        ytdlp_media_locator locator(script.path(), milliseconds(10000), jb::test::quiet_log());

        util::cancel_token cancel;
        std::thread canceller([cancel] {
            std::this_thread::sleep_for(milliseconds(100));
            cancel.cancel();
        });
        const auto before = std::chrono::steady_clock::now();
        auto r = locator.locate(youtube_track(), cancel);
        canceller.join();

        REQUIRE(r.code == error_code::locate_provider_unavailable);
        REQUIRE(r.error_message == "cancelled");
        REQUIRE(std::chrono::steady_clock::now() - before < std::chrono::seconds(5));
    }

    SECTION("missing executable")
    {
        ytdlp_media_locator locator("/nonexistent/yt-dlp", milliseconds(1000), jb::test::quiet_log());
        REQUIRE(locator.locate(youtube_track(), util::cancel_token{}).code == error_code::locate_provider_unavailable);
    }

    SECTION("non-YouTube tracks have no locator")
    {
        ytdlp_media_locator locator("/bin/true", milliseconds(1000), jb::test::quiet_log());
        auto t     = youtube_track();
        t.provider = provider_kind::spotify;
        REQUIRE(locator.locate(t, util::cancel_token{}).code == error_code::locate_provider_unavailable);
    }
}
