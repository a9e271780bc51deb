#include "jb/audio/audio_pipeline.hpp"

#include <iomanip>
#include <sstream>

namespace jb::audio {

namespace {

constexpr std::chrono::milliseconds read_slice{ 20 };

std::string start_seconds(std::uint64_t start_frame)
{
    const auto ms = start_frame * static_cast<std::uint64_t>(frame_duration.count());
    std::ostringstream oss;
    oss << (ms / 1000) << '.' << std::setw(3) << std::setfill('0') << (ms % 1000);
    return oss.str();
}

} // namespace

std::vector<std::string> default_ffmpeg_command(const std::string& executable)
{
    return {
        executable,
        "-hide_banner", "-loglevel", "error", "-nostdin",
        "-reconnect", "1", "-reconnect_streamed", "1", "-reconnect_delay_max", "5",
        "-ss", "{start}",
        "-i", "{input}",
        "-vn",
        "-f", "s16le",
        "-ar", std::to_string(sample_rate),
        "-ac", std::to_string(channel_count),
        "pipe:1"
    };
}

std::vector<std::string> expand_command(const std::vector<std::string>& command,
                                        const std::string& input,
                                        std::uint64_t start_frame)
{
    const std::string start = start_seconds(start_frame);

    std::vector<std::string> out;
    out.reserve(command.size());
    for (std::string arg : command) {
        for (const auto& [key, value] : { std::make_pair(std::string("{input}"), input),
                                          std::make_pair(std::string("{start}"), start) })
        {
            std::size_t pos = 0;
            while ((pos = arg.find(key, pos)) != std::string::npos) {
                arg.replace(pos, key.size(), value);
                pos += value.size();
            }
        }
        out.push_back(std::move(arg));
    }
    return out;
}

audio_pipeline::audio_pipeline(pipeline_options options, log_sink log)
    : m_options(std::move(options))
    , m_log(std::move(log))
{
    if (m_options.buffer_frames == 0) {
        m_options.buffer_frames = 1;
    }
}

audio_pipeline::~audio_pipeline()
{
    stop();
}

bool audio_pipeline::start(const media_source& source, std::uint64_t start_frame, std::string& error)
{
    const auto argv = expand_command(m_options.command, source.url, start_frame);
    if (!m_child.spawn(argv, error)) {
        m_log(dpp::ll_warning, "Decoder failed to start: " + error);
        return false;
    }

    m_next_sequence = start_frame;

    std::ostringstream oss;
    oss << "Decoder started (pid " << m_child.pid() << ") at frame " << start_frame;
    m_log(dpp::ll_debug, oss.str());

    m_reader = std::thread(&audio_pipeline::reader_loop, this);
    return true;
}

void audio_pipeline::finish(error_code code, std::string message)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_done          = true;
        m_error         = code;
        m_error_message = std::move(message);
    }
    m_cv.notify_all();
}

void audio_pipeline::reader_loop()
{
    std::vector<std::uint8_t> pending(frame_bytes);
    std::size_t               have = 0;

    while (!m_stopping.load()) {
        std::size_t got = 0;
        const auto  rs  = m_child.read_stdout(pending.data() + have, frame_bytes - have, read_slice, got);

        if (rs == util::read_status::timeout) {
            continue;
        }

        if (rs == util::read_status::data) {
            have += got;
            if (have < frame_bytes) {
                continue;
            }

            audio_frame f;
            f.sequence = m_next_sequence++;
            f.payload  = pending;
            have       = 0;

            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this] {
                return m_stopping.load() || m_frames.size() < m_options.buffer_frames;
            });
            if (m_stopping.load()) {
                break;
            }
            m_frames.push_back(std::move(f));
            lock.unlock();
            m_cv.notify_all();
            continue;
        }

        // EOF or read error: the decoder is done one way or the other.
        const auto status = m_child.wait();
        if (m_stopping.load()) {
            break;
        }

        if (!status.success()) {
            std::ostringstream oss;
            if (status.exited) {
                oss << "decoder exited with status " << status.code;
            } else {
                oss << "decoder killed by signal " << status.signal;
            }
            if (!m_child.stderr_tail().empty()) {
                oss << ": " << m_child.stderr_tail();
            }
            m_log(dpp::ll_warning, oss.str());
            finish(error_code::decode_process_failed, oss.str());
        } else if (rs == util::read_status::error) {
            finish(error_code::decode_process_failed, "error reading decoder output");
        } else if (have != 0) {
            std::ostringstream oss;
            oss << "decoder output ended mid-frame (" << have << " of " << frame_bytes << " bytes)";
            m_log(dpp::ll_warning, oss.str());
            finish(error_code::decode_malformed_output, oss.str());
        } else {
            finish(error_code::none, {});
        }
        return;
    }

    // Cancelled: not an error, nothing more will be read.
    m_child.terminate();
    finish(error_code::none, {});
}

frame_status audio_pipeline::next(audio_frame& out, std::chrono::milliseconds wait)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait_for(lock, wait, [this] { return !m_frames.empty() || m_done; });

    if (!m_frames.empty()) {
        out = std::move(m_frames.front());
        m_frames.pop_front();
        lock.unlock();
        m_cv.notify_all();
        return frame_status::frame;
    }
    if (m_done) {
        return m_error == error_code::none ? frame_status::end_of_stream : frame_status::decode_error;
    }
    return frame_status::pending;
}

error_code audio_pipeline::error() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_error;
}

std::string audio_pipeline::error_message() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_error_message;
}

void audio_pipeline::stop()
{
    m_stopping.store(true);
    m_cv.notify_all();
    if (m_reader.joinable()) {
        m_reader.join();
    }
    m_child.terminate();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_frames.clear();
}

ffmpeg_transcoder::ffmpeg_transcoder(pipeline_options options, log_sink log)
    : m_options(std::move(options))
    , m_log(std::move(log))
{
}

std::unique_ptr<frame_stream> ffmpeg_transcoder::start(const media_source& source,
                                                       std::uint64_t start_frame,
                                                       std::string& error)
{
    auto p = std::make_unique<audio_pipeline>(m_options, m_log);
    if (!p->start(source, start_frame, error)) {
        return nullptr;
    }
    return p;
}

} // namespace jb::audio
