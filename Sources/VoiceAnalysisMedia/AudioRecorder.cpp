#include "AudioRecorder.hpp"

#include "Logging.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <system_error>
#include <utility>

extern "C" {
#include <libavdevice/avdevice.h>
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
#include <libavutil/audio_fifo.h>
#include <libavutil/channel_layout.h>
#include <libavutil/opt.h>
}

namespace va {

namespace {

std::string av_error(int code) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(code, errbuf, sizeof(errbuf));
    return errbuf;
}

constexpr int kDefaultFrameSize = 1024;   // AAC

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

AudioRecorder::AudioRecorder() : AudioRecorder(Options{}) {}

AudioRecorder::AudioRecorder(Options options) : options_(std::move(options)) {
    avdevice_register_all();
}

AudioRecorder::~AudioRecorder() {
    if (recording_.load()) {
        stop();
    }
}

// ---------------------------------------------------------------------------
// start
// ---------------------------------------------------------------------------

bool AudioRecorder::start(const std::string& output_path) {
    if (recording_.load()) {
        fail("Already recording to " + output_path_);
        return false;
    }

    // Ensure output directory exists.
    std::error_code ec;
    const auto parent = std::filesystem::path(output_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            fail("Cannot create " + parent.string() + ": " + ec.message());
            return false;
        }
    }

    if (!open_input() || !open_output(output_path)) {
        close_all();
        return false;
    }

    output_path_ = output_path;
    next_pts_    = 0;
    paused_.store(false);
    loop_failed_.store(false);
    recording_.store(true);
    record_thread_ = std::thread(&AudioRecorder::recording_loop, this);

    Log::debug("Capture started: " + options_.input_format + ":" + options_.device +
               " -> " + output_path);
    return true;
}

// ---------------------------------------------------------------------------
// pause / resume
// ---------------------------------------------------------------------------

bool AudioRecorder::pause() {
    if (!recording_.load()) {
        fail("Cannot pause: not recording");
        return false;
    }
    if (paused_.exchange(true)) {
        fail("Cannot pause: already paused");
        return false;
    }
    current_level_.store(0.0f);
    return true;
}

bool AudioRecorder::resume() {
    if (!recording_.load()) {
        fail("Cannot resume: not recording");
        return false;
    }
    if (!paused_.exchange(false)) {
        fail("Cannot resume: not paused");
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// stop
// ---------------------------------------------------------------------------

bool AudioRecorder::stop() {
    if (!recording_.load()) {
        fail("Cannot stop: not recording");
        return false;
    }

    recording_.store(false);
    if (record_thread_.joinable()) {
        record_thread_.join();
    }

    // Flush the FIFO tail and the encoder, then finalize the container.
    bool ok = !loop_failed_.load();
    if (!encode_queued(true) || !encode_frame(nullptr)) {
        ok = false;
    }
    if (header_written_) {
        const int ret = av_write_trailer(fmt_ctx_out_);
        if (ret < 0) {
            fail("Cannot finalize " + output_path_, ret);
            ok = false;
        }
    }

    close_all();
    paused_.store(false);
    current_level_.store(0.0f);

    Log::debug("Capture stopped: " + output_path_);
    return ok;
}

// ---------------------------------------------------------------------------
// Accessors
// ---------------------------------------------------------------------------

std::string AudioRecorder::last_error() const {
    std::lock_guard<std::mutex> lock(mu_);
    return last_error_;
}

float AudioRecorder::get_metering() const {
    return current_level_.load();
}

void AudioRecorder::set_metering_callback(MeteringCallback cb) {
    std::lock_guard<std::mutex> lock(mu_);
    meter_cb_ = std::move(cb);
}

bool AudioRecorder::is_recording() const {
    return recording_.load();
}

bool AudioRecorder::is_paused() const {
    return paused_.load();
}

// ---------------------------------------------------------------------------
// open_input
// ---------------------------------------------------------------------------

bool AudioRecorder::open_input() {
    const AVInputFormat* input = av_find_input_format(options_.input_format.c_str());
    if (!input) {
        fail("Capture backend '" + options_.input_format + "' is not available");
        return false;
    }

    AVDictionary* dict = nullptr;
    av_dict_set(&dict, "sample_rate", std::to_string(options_.sample_rate).c_str(), 0);
    av_dict_set(&dict, "channels", "1", 0);

    int ret = avformat_open_input(&fmt_ctx_in_, options_.device.c_str(), input, &dict);
    av_dict_free(&dict);
    if (ret < 0) {
        fmt_ctx_in_ = nullptr;
        fail("Cannot open capture device '" + options_.device + "'", ret);
        return false;
    }

    ret = avformat_find_stream_info(fmt_ctx_in_, nullptr);
    if (ret < 0) {
        fail("Cannot read capture stream info", ret);
        return false;
    }

    audio_stream_ = av_find_best_stream(fmt_ctx_in_, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (audio_stream_ < 0) {
        fail("Capture device has no audio stream", audio_stream_);
        return false;
    }

    const AVCodecParameters* par = fmt_ctx_in_->streams[audio_stream_]->codecpar;
    const AVCodec* decoder = avcodec_find_decoder(par->codec_id);
    if (!decoder) {
        fail("No decoder for the capture sample format");
        return false;
    }

    dec_ctx_ = avcodec_alloc_context3(decoder);
    if (!dec_ctx_) {
        fail("Out of memory allocating decoder");
        return false;
    }
    ret = avcodec_parameters_to_context(dec_ctx_, par);
    if (ret >= 0) ret = avcodec_open2(dec_ctx_, decoder, nullptr);
    if (ret < 0) {
        fail("Cannot open capture decoder", ret);
        return false;
    }

    if (dec_ctx_->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
        const int channels = dec_ctx_->ch_layout.nb_channels > 0 ? dec_ctx_->ch_layout.nb_channels : 1;
        av_channel_layout_uninit(&dec_ctx_->ch_layout);
        av_channel_layout_default(&dec_ctx_->ch_layout, channels);
    }
    return true;
}

// ---------------------------------------------------------------------------
// open_output
// ---------------------------------------------------------------------------

bool AudioRecorder::open_output(const std::string& path) {
    int ret = avformat_alloc_output_context2(&fmt_ctx_out_, nullptr, "ipod", path.c_str());
    if (ret < 0 || !fmt_ctx_out_) {
        fail("Cannot create M4A muxer for " + path, ret);
        return false;
    }

    const AVCodec* aac_codec = avcodec_find_encoder(AV_CODEC_ID_AAC);
    if (!aac_codec) {
        fail("AAC encoder not available");
        return false;
    }

    AVStream* out_stream = avformat_new_stream(fmt_ctx_out_, nullptr);
    enc_ctx_ = avcodec_alloc_context3(aac_codec);
    if (!out_stream || !enc_ctx_) {
        fail("Out of memory allocating encoder");
        return false;
    }

    AVChannelLayout mono = AV_CHANNEL_LAYOUT_MONO;
    av_channel_layout_copy(&enc_ctx_->ch_layout, &mono);
    enc_ctx_->sample_rate = options_.sample_rate;
    enc_ctx_->sample_fmt  = AV_SAMPLE_FMT_FLTP;
    enc_ctx_->bit_rate    = options_.bit_rate;
    enc_ctx_->time_base   = AVRational{1, options_.sample_rate};

    if (fmt_ctx_out_->oformat->flags & AVFMT_GLOBALHEADER)
        enc_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    ret = avcodec_open2(enc_ctx_, aac_codec, nullptr);
    if (ret < 0) {
        fail("Cannot open AAC encoder", ret);
        return false;
    }
    ret = avcodec_parameters_from_context(out_stream->codecpar, enc_ctx_);
    if (ret < 0) {
        fail("Cannot configure output stream", ret);
        return false;
    }
    out_stream->time_base = enc_ctx_->time_base;

    ret = avio_open(&fmt_ctx_out_->pb, path.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) {
        fail("Cannot open " + path + " for writing", ret);
        return false;
    }
    ret = avformat_write_header(fmt_ctx_out_, nullptr);
    if (ret < 0) {
        fail("Cannot write M4A header", ret);
        return false;
    }
    header_written_ = true;

    // Device format (often s16 interleaved) -> float planar mono for AAC.
    ret = swr_alloc_set_opts2(&swr_ctx_,
        &enc_ctx_->ch_layout, enc_ctx_->sample_fmt, enc_ctx_->sample_rate,
        &dec_ctx_->ch_layout, dec_ctx_->sample_fmt, dec_ctx_->sample_rate,
        0, nullptr);
    if (ret >= 0) ret = swr_init(swr_ctx_);
    if (ret < 0) {
        fail("Cannot initialize resampler", ret);
        return false;
    }

    const int frame_size = enc_ctx_->frame_size > 0 ? enc_ctx_->frame_size : kDefaultFrameSize;
    fifo_ = av_audio_fifo_alloc(enc_ctx_->sample_fmt, 1, frame_size);
    if (!fifo_) {
        fail("Out of memory allocating sample FIFO");
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// recording_loop  (runs on background thread)
// ---------------------------------------------------------------------------

void AudioRecorder::recording_loop() {
    AVPacket* pkt   = av_packet_alloc();
    AVFrame*  frame = av_frame_alloc();
    if (!pkt || !frame) {
        fail("Out of memory allocating capture buffers");
        loop_failed_.store(true);
        av_packet_free(&pkt);
        av_frame_free(&frame);
        return;
    }

    while (recording_.load()) {
        int ret = av_read_frame(fmt_ctx_in_, pkt);
        if (ret == AVERROR(EAGAIN)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            continue;
        }
        if (ret < 0) {
            fail("Capture read failed", ret);
            loop_failed_.store(true);
            break;
        }

        // Paused: keep the device drained, drop the samples.
        if (pkt->stream_index != audio_stream_ || paused_.load()) {
            av_packet_unref(pkt);
            continue;
        }

        ret = avcodec_send_packet(dec_ctx_, pkt);
        av_packet_unref(pkt);
        if (ret < 0 && ret != AVERROR(EAGAIN)) {
            fail("Capture decode failed", ret);
            loop_failed_.store(true);
            break;
        }

        bool ok = true;
        while (ok && avcodec_receive_frame(dec_ctx_, frame) == 0) {
            ok = queue_samples(frame);
            av_frame_unref(frame);
        }
        if (!ok || !encode_queued(false)) {
            loop_failed_.store(true);
            break;
        }
    }

    av_frame_free(&frame);
    av_packet_free(&pkt);
}

// ---------------------------------------------------------------------------
// queue_samples / encode_queued / encode_frame
// ---------------------------------------------------------------------------

bool AudioRecorder::queue_samples(const AVFrame* frame) {
    const int out_samples = static_cast<int>(av_rescale_rnd(
        swr_get_delay(swr_ctx_, dec_ctx_->sample_rate) + frame->nb_samples,
        enc_ctx_->sample_rate, dec_ctx_->sample_rate, AV_ROUND_UP));

    uint8_t** converted = nullptr;
    int ret = av_samples_alloc_array_and_samples(&converted, nullptr, 1, out_samples,
                                                 enc_ctx_->sample_fmt, 0);
    if (ret < 0) {
        fail("Out of memory converting samples", ret);
        return false;
    }

    const int n = swr_convert(swr_ctx_, converted, out_samples,
                              const_cast<const uint8_t**>(frame->extended_data),
                              frame->nb_samples);
    bool ok = n >= 0;
    if (!ok) {
        fail("Resampling failed", n);
    } else if (n > 0) {
        const float level = compute_rms(reinterpret_cast<const float*>(converted[0]),
                                        static_cast<size_t>(n));
        current_level_.store(level);

        MeteringCallback cb;
        {
            std::lock_guard<std::mutex> lock(mu_);
            cb = meter_cb_;
        }
        if (cb) cb(level);

        if (av_audio_fifo_write(fifo_, reinterpret_cast<void**>(converted), n) < n) {
            fail("Cannot buffer captured samples");
            ok = false;
        }
    }

    av_freep(&converted[0]);
    av_freep(&converted);
    return ok;
}

bool AudioRecorder::encode_queued(bool flush) {
    if (!enc_ctx_ || !fifo_) return true;

    const int frame_size = enc_ctx_->frame_size > 0 ? enc_ctx_->frame_size : kDefaultFrameSize;

    while (av_audio_fifo_size(fifo_) >= frame_size ||
           (flush && av_audio_fifo_size(fifo_) > 0)) {
        const int n = std::min(av_audio_fifo_size(fifo_), frame_size);

        AVFrame* frame = av_frame_alloc();
        if (!frame) {
            fail("Out of memory allocating encoder frame");
            return false;
        }
        frame->nb_samples  = n;
        frame->format      = enc_ctx_->sample_fmt;
        frame->sample_rate = enc_ctx_->sample_rate;
        av_channel_layout_copy(&frame->ch_layout, &enc_ctx_->ch_layout);

        int ret = av_frame_get_buffer(frame, 0);
        if (ret < 0 ||
            av_audio_fifo_read(fifo_, reinterpret_cast<void**>(frame->data), n) < n) {
            fail("Cannot prepare encoder frame", ret);
            av_frame_free(&frame);
            return false;
        }

        frame->pts = next_pts_;
        next_pts_ += n;

        const bool ok = encode_frame(frame);
        av_frame_free(&frame);
        if (!ok) return false;
    }
    return true;
}

bool AudioRecorder::encode_frame(AVFrame* frame) {
    if (!enc_ctx_ || !fmt_ctx_out_) return true;

    int ret = avcodec_send_frame(enc_ctx_, frame);
    if (ret < 0 && ret != AVERROR_EOF) {
        fail("AAC encoding failed", ret);
        return false;
    }

    AVPacket* pkt = av_packet_alloc();
    if (!pkt) {
        fail("Out of memory allocating packet");
        return false;
    }

    bool ok = true;
    while ((ret = avcodec_receive_packet(enc_ctx_, pkt)) == 0) {
        pkt->stream_index = 0;
        av_packet_rescale_ts(pkt, enc_ctx_->time_base, fmt_ctx_out_->streams[0]->time_base);
        ret = av_interleaved_write_frame(fmt_ctx_out_, pkt);
        if (ret < 0) {
            fail("Cannot write to " + output_path_, ret);
            ok = false;
            break;
        }
    }
    if (ok && ret != AVERROR(EAGAIN) && ret != AVERROR_EOF) {
        fail("AAC encoding failed", ret);
        ok = false;
    }

    av_packet_free(&pkt);
    return ok;
}

// ---------------------------------------------------------------------------
// close_all / fail
// ---------------------------------------------------------------------------

void AudioRecorder::close_all() {
    if (fifo_) {
        av_audio_fifo_free(fifo_);
        fifo_ = nullptr;
    }
    if (swr_ctx_) swr_free(&swr_ctx_);
    if (enc_ctx_) avcodec_free_context(&enc_ctx_);
    if (dec_ctx_) avcodec_free_context(&dec_ctx_);
    if (fmt_ctx_out_) {
        if (fmt_ctx_out_->pb) avio_closep(&fmt_ctx_out_->pb);
        avformat_free_context(fmt_ctx_out_);
        fmt_ctx_out_ = nullptr;
    }
    if (fmt_ctx_in_) avformat_close_input(&fmt_ctx_in_);

    audio_stream_   = -1;
    header_written_ = false;
}

void AudioRecorder::fail(const std::string& what, int av_code) {
    std::string message = what;
    if (av_code < 0) message += ": " + av_error(av_code);

    Log::error("AudioRecorder: " + message);
    std::lock_guard<std::mutex> lock(mu_);
    last_error_ = std::move(message);
}

// ---------------------------------------------------------------------------
// compute_rms
// ---------------------------------------------------------------------------

float AudioRecorder::compute_rms(const float* samples, size_t count) {
    if (!samples || count == 0) return 0.0f;

    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * static_cast<double>(samples[i]);
    }
    float rms = static_cast<float>(std::sqrt(sum / static_cast<double>(count)));

    // Clamp to [0, 1].
    return std::min(1.0f, std::max(0.0f, rms));
}

} // namespace va
