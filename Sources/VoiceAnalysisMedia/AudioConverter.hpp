#pragma once

#include <string>
#include <vector>

namespace va {

/// Decodes stored recordings with FFmpeg's libavformat / libavcodec and
/// resamples them with libswresample.  Primary use-case: mono float32 PCM
/// at 16 kHz for whisper.cpp.
class AudioConverter {
public:
    AudioConverter() = default;

    // Non-copyable.
    AudioConverter(const AudioConverter&) = delete;
    AudioConverter& operator=(const AudioConverter&) = delete;

    /// Decode any audio file FFmpeg understands (M4A, WAV, OGG, ...) to
    /// mono float32 PCM at `target_sample_rate`.  Throws MediaError.
    std::vector<float> to_pcm(const std::string& input_path,
                              int target_sample_rate = 16000) const;

    /// Duration of the first audio stream in seconds, or a negative value
    /// if the container does not say.  Throws MediaError.
    double duration_seconds(const std::string& input_path) const;
};

} // namespace va
