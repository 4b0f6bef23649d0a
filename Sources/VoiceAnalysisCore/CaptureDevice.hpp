#pragma once

#include <string>

namespace va {

/// Microphone capture as seen by RecordingSession.
///
/// One take is written to one file: start() opens it, pause()/resume()
/// suspend and continue appending to the same file, stop() finalizes it.
/// Every call reports success; on failure last_error() says why.
class CaptureDevice {
public:
    virtual ~CaptureDevice() = default;

    virtual bool start(const std::string& output_path) = 0;
    virtual bool pause() = 0;
    virtual bool resume() = 0;
    virtual bool stop() = 0;

    virtual std::string last_error() const = 0;
};

} // namespace va
