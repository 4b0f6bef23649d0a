#include "WhisperLanguageDetector.hpp"

#include "Errors.hpp"
#include "Logging.hpp"

#include <algorithm>
#include <cctype>
#include <numeric>

#include "whisper.h"

namespace va {

namespace {

constexpr int kWhisperSampleRate = 16000;

std::string upper(const char* s) {
    std::string out = s ? s : "";
    for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return out;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction / destruction
// ---------------------------------------------------------------------------

WhisperLanguageDetector::WhisperLanguageDetector(int top_n, int n_threads)
    : top_n_(std::max(1, top_n)), n_threads_(std::max(1, n_threads)) {}

WhisperLanguageDetector::~WhisperLanguageDetector() {
    std::lock_guard<std::mutex> lock(mu_);
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

// ---------------------------------------------------------------------------
// init
// ---------------------------------------------------------------------------

bool WhisperLanguageDetector::init(const std::string& model_path) {
    std::lock_guard<std::mutex> lock(mu_);

    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }

    struct whisper_context_params cparams = whisper_context_default_params();
    ctx_ = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx_) {
        Log::error("Cannot load whisper model " + model_path);
        return false;
    }
    if (!whisper_is_multilingual(ctx_)) {
        Log::warn("Whisper model " + model_path +
                  " is English-only; language scores will be meaningless");
    }
    Log::info("Loaded whisper model " + model_path);
    return true;
}

// ---------------------------------------------------------------------------
// is_loaded
// ---------------------------------------------------------------------------

bool WhisperLanguageDetector::is_loaded() const {
    std::lock_guard<std::mutex> lock(mu_);
    return ctx_ != nullptr;
}

// ---------------------------------------------------------------------------
// analyze
// ---------------------------------------------------------------------------

std::vector<PredictionResult> WhisperLanguageDetector::analyze(const std::string& audio_path,
                                                               ProgressCallback progress) {
    if (!is_loaded()) {
        throw MediaError("No whisper model loaded");
    }

    // 1. Decode to whisper's native format.
    std::vector<float> pcm = converter_.to_pcm(audio_path, kWhisperSampleRate);
    if (pcm.empty()) {
        throw MediaError("No audio samples in " + audio_path);
    }
    if (progress) progress(0.3f);

    // 2. Detect.
    PredictionResult result;
    result.channel       = Channel::nationality;
    result.probabilities = detect_language(pcm);
    result.completed_at  = Clock::now();

    if (progress) progress(1.0f);
    return {result};
}

// ---------------------------------------------------------------------------
// detect_language
// ---------------------------------------------------------------------------

ProbabilityMap WhisperLanguageDetector::detect_language(const std::vector<float>& pcm16k) {
    std::lock_guard<std::mutex> lock(mu_);

    if (!ctx_) {
        throw MediaError("No whisper model loaded");
    }

    int ret = whisper_pcm_to_mel(ctx_, pcm16k.data(), static_cast<int>(pcm16k.size()),
                                 n_threads_);
    if (ret != 0) {
        throw MediaError("whisper_pcm_to_mel failed (" + std::to_string(ret) + ")");
    }

    std::vector<float> probs(static_cast<size_t>(whisper_lang_max_id() + 1), 0.0f);
    const int best = whisper_lang_auto_detect(ctx_, 0, n_threads_, probs.data());
    if (best < 0) {
        throw MediaError("whisper_lang_auto_detect failed (" + std::to_string(best) + ")");
    }

    // Keep the N most probable languages.
    std::vector<int> ids(probs.size());
    std::iota(ids.begin(), ids.end(), 0);
    const size_t keep = std::min(ids.size(), static_cast<size_t>(top_n_));
    std::partial_sort(ids.begin(), ids.begin() + static_cast<std::ptrdiff_t>(keep), ids.end(),
                      [&probs](int a, int b) { return probs[a] > probs[b]; });

    ProbabilityMap result;
    for (size_t i = 0; i < keep; ++i) {
        const int id = ids[i];
        result[upper(whisper_lang_str(id))] = static_cast<double>(probs[id]);
    }

    Log::debug("Detected language " + upper(whisper_lang_str(best)) +
               " (p=" + std::to_string(probs[best]) + ")");
    return result;
}

} // namespace va
