#include "core/FileSink.h"
#include "core/Logger.h"

namespace klang {

FileSink::FileSink(const std::string& path, int bitsPerSample)
    : path_(path), bitsPerSample_(bitsPerSample)
{
}

FileSink::~FileSink()
{
    close();
}

bool FileSink::open(const EngineConfig& config, std::string& error)
{
    if (writer_)
    {
        error = "file sink already open: " + path_;
        KL_WARN("FileSink::open: %s", error.c_str());
        return false;
    }
    if (!isValid(config, error))
    {
        KL_WARN("FileSink::open: %s", error.c_str());
        return false;
    }
    if (bitsPerSample_ != 16 && bitsPerSample_ != 24 && bitsPerSample_ != 32)
    {
        error = "unsupported bit depth " + std::to_string(bitsPerSample_);
        KL_WARN("FileSink::open: %s", error.c_str());
        return false;
    }

    juce::File file(path_);
    if (file.exists() && !file.deleteFile())
    {
        error = "cannot replace existing file: " + path_;
        KL_WARN("FileSink::open: %s", error.c_str());
        return false;
    }

    auto stream = std::make_unique<juce::FileOutputStream>(file);
    if (stream->failedToOpen())
    {
        error = "cannot open for writing: " + path_ + " ("
              + stream->getStatus().getErrorMessage().toStdString() + ")";
        KL_WARN("FileSink::open: %s", error.c_str());
        return false;
    }

    // The writer takes ownership of the stream only when it is created.
    juce::WavAudioFormat wavFormat;
    writer_.reset(wavFormat.createWriterFor(stream.get(), config.sampleRate,
                                            static_cast<unsigned int>(config.numOutputChannels),
                                            bitsPerSample_, {}, 0));
    if (!writer_)
    {
        error = "WAV writer rejected format: " + std::to_string(config.numOutputChannels)
              + " channels at " + std::to_string(config.sampleRate) + " Hz";
        KL_WARN("FileSink::open: %s", error.c_str());
        return false;
    }
    stream.release();

    samplesWritten_ = 0;
    KL_INFO("FileSink::open: %s sr=%.0f ch=%d bits=%d", path_.c_str(),
            config.sampleRate, config.numOutputChannels, bitsPerSample_);
    return true;
}

bool FileSink::write(const juce::AudioBuffer<float>& buffer, std::string& error)
{
    if (!writer_)
    {
        error = "file sink is not open: " + path_;
        KL_WARN("FileSink::write: %s", error.c_str());
        return false;
    }
    if (!writer_->writeFromAudioSampleBuffer(buffer, 0, buffer.getNumSamples()))
    {
        error = "write failed: " + path_;
        KL_WARN("FileSink::write: %s", error.c_str());
        return false;
    }
    samplesWritten_ += buffer.getNumSamples();
    return true;
}

void FileSink::close()
{
    if (!writer_) return;
    writer_->flush();
    writer_.reset();
    KL_INFO("FileSink::close: %s (%lld samples)", path_.c_str(),
            static_cast<long long>(samplesWritten_));
}

} // namespace klang
