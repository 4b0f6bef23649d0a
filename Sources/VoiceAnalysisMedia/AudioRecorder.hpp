#pragma once

#include "CaptureDevice.hpp"
#include "Types.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>

struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct SwrContext;
struct AVAudioFifo;

namespace va {

/// Records one take from a capture device using FFmpeg's libavdevice
/// (PulseAudio or ALSA input on Linux) and encodes it to AAC in an M4A file.
///
/// pause() keeps draining the device but drops what it reads, so resume()
/// continues the same file without a gap in its timeline.
class AudioRecorder : public CaptureDevice {
public:
    struct Options {
        std::string input_format = "pulse";     // libavdevice demuxer name
        std::string device       = "default";
        int         sample_rate  = 44100;
        int         bit_rate     = 128000;
    };

    AudioRecorder();
    explicit AudioRecorder(Options options);
    ~AudioRecorder() override;

    // Non-copyable.
    AudioRecorder(const AudioRecorder&) = delete;
    AudioRecorder& operator=(const AudioRecorder&) = delete;

    bool start(const std::string& output_path) override;
    bool pause() override;
    bool resume() override;

    /// Finalize the file.  Returns false if the take could not be written
    /// completely; what was captured up to the failure is still on disk.
    bool stop() override;

    std::string last_error() const override;

    /// Current audio level in [0.0, 1.0].  Thread-safe.
    float get_metering() const;

    /// Called on the recording thread with each new level.
    void set_metering_callback(MeteringCallback cb);

    bool is_recording() const;
    bool is_paused() const;

private:
    /// Background thread entry point.
    void recording_loop();

    bool open_input();
    bool open_output(const std::string& path);

    /// Resample a decoded frame into the FIFO.
    bool queue_samples(const AVFrame* frame);

    /// Encode whole encoder frames from the FIFO; with `flush` also the tail.
    bool encode_queued(bool flush);

    /// Send one frame (null drains the encoder) and write its packets.
    bool encode_frame(AVFrame* frame);

    void close_all();
    void fail(const std::string& what, int av_code = 0);

    static float compute_rms(const float* samples, size_t count);

    Options options_;

    // ---- State ----
    std::atomic<bool>  recording_{false};
    std::atomic<bool>  paused_{false};
    std::atomic<bool>  loop_failed_{false};
    std::thread        record_thread_;
    mutable std::mutex mu_;          // guards last_error_ and meter_cb_

    std::string        last_error_;
    MeteringCallback   meter_cb_;
    std::string        output_path_;

    std::atomic<float> current_level_{0.0f};

    // FFmpeg state; touched only by the recording thread while it runs.
    AVFormatContext* fmt_ctx_in_  = nullptr;   // capture
    AVCodecContext*  dec_ctx_     = nullptr;   // device PCM decoder
    AVFormatContext* fmt_ctx_out_ = nullptr;   // M4A muxer
    AVCodecContext*  enc_ctx_     = nullptr;   // AAC encoder
    SwrContext*      swr_ctx_     = nullptr;   // device format -> FLTP mono
    AVAudioFifo*     fifo_        = nullptr;   // encoder frame-size buffer
    int              audio_stream_ = -1;
    int64_t          next_pts_     = 0;
    bool             header_written_ = false;
};

} // namespace va
