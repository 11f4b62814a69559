#pragma once

#include "core/Sink.h"

#include <juce_audio_formats/juce_audio_formats.h>

#include <memory>
#include <string>

namespace klang {

/// Writes the rendered stream to a WAV file. Sample rate and channel count
/// come from the run's EngineConfig.
class FileSink : public Sink {
public:
    explicit FileSink(const std::string& path, int bitsPerSample = 16);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    bool open(const EngineConfig& config, std::string& error) override;
    bool write(const juce::AudioBuffer<float>& buffer, std::string& error) override;
    void close() override;

    const std::string& getPath() const { return path_; }
    bool isOpen() const { return writer_ != nullptr; }
    juce::int64 getSamplesWritten() const { return samplesWritten_; }

private:
    std::string path_;
    int bitsPerSample_;
    std::unique_ptr<juce::AudioFormatWriter> writer_;
    juce::int64 samplesWritten_ = 0;
};

} // namespace klang
