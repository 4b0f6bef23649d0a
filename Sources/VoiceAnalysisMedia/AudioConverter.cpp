#include "AudioConverter.hpp"

#include "Errors.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libswresample/swresample.h>
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

/// Owns every FFmpeg object used by one decode.
struct DecodeContext {
    AVFormatContext* fmt   = nullptr;
    AVCodecContext*  dec   = nullptr;
    SwrContext*      swr   = nullptr;
    AVPacket*        pkt   = nullptr;
    AVFrame*         frame = nullptr;
    int              audio_idx = -1;

    DecodeContext() = default;
    DecodeContext(const DecodeContext&) = delete;
    DecodeContext& operator=(const DecodeContext&) = delete;

    ~DecodeContext() {
        if (frame) av_frame_free(&frame);
        if (pkt) av_packet_free(&pkt);
        if (swr) swr_free(&swr);
        if (dec) avcodec_free_context(&dec);
        if (fmt) avformat_close_input(&fmt);
    }
};

void open_input(DecodeContext& c, const std::string& path) {
    int ret = avformat_open_input(&c.fmt, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        throw MediaError("Failed to open audio file '" + path + "': " + av_error(ret));
    }

    ret = avformat_find_stream_info(c.fmt, nullptr);
    if (ret < 0) {
        throw MediaError("Failed to find stream info in '" + path + "': " + av_error(ret));
    }

    c.audio_idx = av_find_best_stream(c.fmt, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (c.audio_idx < 0) {
        throw MediaError("No audio stream found in '" + path + "'");
    }
}

/// Convert `frame` (or flush the resampler when null) and append the output.
void append_converted(DecodeContext& c, const AVFrame* frame,
                      int target_sample_rate, std::vector<float>& out) {
    const int in_samples = frame ? frame->nb_samples : 0;
    const int out_samples = static_cast<int>(av_rescale_rnd(
        swr_get_delay(c.swr, c.dec->sample_rate) + in_samples,
        target_sample_rate, c.dec->sample_rate, AV_ROUND_UP));
    if (out_samples <= 0) return;

    std::vector<float> buf(static_cast<size_t>(out_samples));
    uint8_t* out_buf = reinterpret_cast<uint8_t*>(buf.data());
    const int converted = swr_convert(
        c.swr, &out_buf, out_samples,
        frame ? const_cast<const uint8_t**>(frame->extended_data) : nullptr,
        in_samples);
    if (converted < 0) {
        throw MediaError("Resampling failed: " + av_error(converted));
    }
    out.insert(out.end(), buf.begin(), buf.begin() + converted);
}

void drain_decoder(DecodeContext& c, int target_sample_rate, std::vector<float>& out) {
    while (true) {
        const int ret = avcodec_receive_frame(c.dec, c.frame);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return;
        if (ret < 0) {
            throw MediaError("Decoding failed: " + av_error(ret));
        }
        append_converted(c, c.frame, target_sample_rate, out);
        av_frame_unref(c.frame);
    }
}

} // namespace

// ---------------------------------------------------------------------------
// to_pcm
// ---------------------------------------------------------------------------

std::vector<float> AudioConverter::to_pcm(const std::string& input_path,
                                          int target_sample_rate) const {
    if (target_sample_rate <= 0) {
        throw MediaError("Target sample rate must be positive");
    }

    DecodeContext c;

    // 1. Open input and find the audio stream
    open_input(c, input_path);
    AVStream* stream = c.fmt->streams[c.audio_idx];

    // 2. Open decoder
    const AVCodec* decoder = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!decoder) {
        throw MediaError("No decoder for the audio codec in '" + input_path + "'");
    }
    c.dec = avcodec_alloc_context3(decoder);
    if (!c.dec) throw MediaError("Out of memory allocating decoder");

    int ret = avcodec_parameters_to_context(c.dec, stream->codecpar);
    if (ret < 0) {
        throw MediaError("Cannot configure decoder: " + av_error(ret));
    }
    ret = avcodec_open2(c.dec, decoder, nullptr);
    if (ret < 0) {
        throw MediaError("Failed to open audio decoder: " + av_error(ret));
    }

    // Some containers (raw PCM, WAV without a mask) leave the layout unset.
    if (c.dec->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
        const int channels = c.dec->ch_layout.nb_channels > 0 ? c.dec->ch_layout.nb_channels : 1;
        av_channel_layout_uninit(&c.dec->ch_layout);
        av_channel_layout_default(&c.dec->ch_layout, channels);
    }

    // 3. Set up resampler
    AVChannelLayout out_layout = AV_CHANNEL_LAYOUT_MONO;
    ret = swr_alloc_set_opts2(&c.swr,
        &out_layout, AV_SAMPLE_FMT_FLT, target_sample_rate,
        &c.dec->ch_layout, c.dec->sample_fmt, c.dec->sample_rate,
        0, nullptr);
    if (ret < 0 || (ret = swr_init(c.swr)) < 0) {
        throw MediaError("Failed to initialize audio resampler: " + av_error(ret));
    }

    c.pkt   = av_packet_alloc();
    c.frame = av_frame_alloc();
    if (!c.pkt || !c.frame) throw MediaError("Out of memory allocating frames");

    // 4. Read packets, decode frames, resample
    std::vector<float> pcm_out;
    while ((ret = av_read_frame(c.fmt, c.pkt)) >= 0) {
        if (c.pkt->stream_index != c.audio_idx) {
            av_packet_unref(c.pkt);
            continue;
        }
        ret = avcodec_send_packet(c.dec, c.pkt);
        av_packet_unref(c.pkt);
        if (ret < 0 && ret != AVERROR(EAGAIN)) {
            throw MediaError("Decoding '" + input_path + "' failed: " + av_error(ret));
        }
        drain_decoder(c, target_sample_rate, pcm_out);
    }
    if (ret != AVERROR_EOF) {
        throw MediaError("Reading '" + input_path + "' failed: " + av_error(ret));
    }

    // 5. Flush decoder, then resampler
    ret = avcodec_send_packet(c.dec, nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
        throw MediaError("Flushing decoder failed: " + av_error(ret));
    }
    drain_decoder(c, target_sample_rate, pcm_out);
    append_converted(c, nullptr, target_sample_rate, pcm_out);

    return pcm_out;
}

// ---------------------------------------------------------------------------
// duration_seconds
// ---------------------------------------------------------------------------

double AudioConverter::duration_seconds(const std::string& input_path) const {
    DecodeContext c;
    open_input(c, input_path);

    const AVStream* stream = c.fmt->streams[c.audio_idx];
    if (stream->duration != AV_NOPTS_VALUE) {
        return static_cast<double>(stream->duration) * av_q2d(stream->time_base);
    }
    if (c.fmt->duration != AV_NOPTS_VALUE) {
        return static_cast<double>(c.fmt->duration) / AV_TIME_BASE;
    }
    return -1.0;
}

} // namespace va
