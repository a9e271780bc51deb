#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "jb/audio/frame_stream.hpp"
#include "jb/util/subprocess.hpp"

namespace jb::audio {

struct pipeline_options {
    // argv with "{input}" and "{start}" (seconds) placeholders
    std::vector<std::string> command;
    std::size_t              buffer_frames = 50;
};

/// ffmpeg argv writing s16le/48k/stereo to stdout.
std::vector<std::string> default_ffmpeg_command(const std::string& executable);

std::vector<std::string> expand_command(const std::vector<std::string>& command,
                                        const std::string& input,
                                        std::uint64_t start_frame);

/// One decoder process for one track. A reader thread cuts the process's
/// stdout into frames and keeps at most buffer_frames of them; when the
/// buffer is full the reader stops reading and the decoder blocks on its
/// pipe. The process, the pipes and the thread are released by stop() or
/// the destructor on every path.
class audio_pipeline : public frame_stream {
public:
    audio_pipeline(pipeline_options options, log_sink log);
    ~audio_pipeline() override;

    bool start(const media_source& source, std::uint64_t start_frame, std::string& error);

    frame_status next(audio_frame& out, std::chrono::milliseconds wait) override;
    error_code   error() const override;
    std::string  error_message() const override;
    void         stop() override;

private:
    void reader_loop();
    void finish(error_code code, std::string message);

    pipeline_options    m_options;
    log_sink            m_log;
    util::child_process m_child;
    std::thread         m_reader;
    std::atomic<bool>   m_stopping{ false };
    std::uint64_t       m_next_sequence = 0;

    mutable std::mutex      m_mutex;
    std::condition_variable m_cv;
    std::deque<audio_frame> m_frames;
    bool                    m_done = false;
    error_code              m_error = error_code::none;
    std::string             m_error_message;
};

class ffmpeg_transcoder : public transcoder {
public:
    ffmpeg_transcoder(pipeline_options options, log_sink log);

    std::unique_ptr<frame_stream> start(const media_source& source,
                                        std::uint64_t start_frame,
                                        std::string& error) override;

private:
    pipeline_options m_options;
    log_sink         m_log;
};

} // namespace jb::audio
