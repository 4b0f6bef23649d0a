#pragma once

#include "AudioConverter.hpp"
#include "InferenceEngine.hpp"
#include "Types.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace va {

/// Spoken-language identification with whisper.cpp.
///
/// Loads a ggml model once, then reports for each recording the most
/// likely languages as the NATIONALITY channel, keyed by upper-case
/// language code:  [EN:0.87,DE:0.06,NL:0.03]
class WhisperLanguageDetector : public InferenceEngine {
public:
    explicit WhisperLanguageDetector(int top_n = 5, int n_threads = 4);
    ~WhisperLanguageDetector() override;

    // Non-copyable.
    WhisperLanguageDetector(const WhisperLanguageDetector&) = delete;
    WhisperLanguageDetector& operator=(const WhisperLanguageDetector&) = delete;

    /// Load the ggml model file (e.g. "ggml-base.bin").  Multilingual
    /// models only; ".en" models cannot tell languages apart.
    /// Returns true on success.  Thread-safe.
    bool init(const std::string& model_path);

    /// Whether a model has been successfully loaded.
    bool is_loaded() const;

    /// Decode `audio_path` and detect its language.  Throws MediaError.
    std::vector<PredictionResult> analyze(const std::string& audio_path,
                                          ProgressCallback progress) override;

    std::string name() const override { return "whisper language-id"; }

    /// Top-N language probabilities for mono float32 PCM at 16 kHz.
    /// Throws MediaError.
    ProbabilityMap detect_language(const std::vector<float>& pcm16k);

private:
    AudioConverter          converter_;
    struct whisper_context* ctx_ = nullptr;   // opaque whisper.h handle
    int                     top_n_;
    int                     n_threads_;
    mutable std::mutex      mu_;
};

} // namespace va
