#include "LoudnessSampler.h"
#include "talk_core/talk_core.h"

std::unique_ptr<LoudnessSampler> LoudnessSampler::open (AudioInputSource& source, juce::Result& result)
{
    std::unique_ptr<LoudnessSampler> sampler (new LoudnessSampler());

    result = source.openInputStream (*sampler, sampler->stream);
    if (result.failed())
    {
        juce::Logger::writeToLog ("audio: input stream failed to open: " + result.getErrorMessage());
        return nullptr;
    }

    if (sampler->stream == nullptr)
    {
        result = juce::Result::fail ("Audio source returned no stream");
        juce::Logger::writeToLog ("audio: " + result.getErrorMessage());
        return nullptr;
    }

    return sampler;
}

LoudnessSampler::~LoudnessSampler()
{
    close();
}

void LoudnessSampler::stop() noexcept
{
    if (stream != nullptr)
        stream->stop();
}

void LoudnessSampler::close() noexcept
{
    if (stream == nullptr)
        return;

    stream->close();
    stream.reset();
}

// Producer (audio thread)
void LoudnessSampler::publish (float rms) noexcept
{
    const uint32_t w = levelWriteIndex.load (std::memory_order_relaxed);

    levelRing[(size_t) w].store (rms, std::memory_order_relaxed);

    const uint32_t wNext = (w + 1u) % kLevelRingCapacity;
    levelWriteIndex.store (wNext, std::memory_order_release);

    levelSeq.fetch_add (1u, std::memory_order_release);
}

// Consumer (message thread)
double LoudnessSampler::readLatest()
{
    if (streamFaulted.load (std::memory_order_acquire))
    {
        const juce::ScopedLock sl (faultLock);
        throw StreamFault (faultMessage.toStdString());
    }

    const uint32_t seqNow = levelSeq.load (std::memory_order_acquire);
    if (seqNow == levelLastReadSeq)
        return 0.0;

    const uint32_t pending = seqNow - levelLastReadSeq;
    if (pending > 1u)
        discarded += pending - 1u;

    levelLastReadSeq = seqNow;

    const uint32_t w   = levelWriteIndex.load (std::memory_order_acquire);
    const uint32_t idx = (w + kLevelRingCapacity - 1u) % kLevelRingCapacity;

    return (double) levelRing[(size_t) idx].load (std::memory_order_relaxed);
}

void LoudnessSampler::audioDeviceIOCallbackWithContext (const float* const* inputChannelData,
                                                        int numInputChannels,
                                                        float* const* outputChannelData,
                                                        int numOutputChannels,
                                                        int numSamples,
                                                        const juce::AudioIODeviceCallbackContext& context)
{
    juce::ignoreUnused (context);

    for (int ch = 0; ch < numOutputChannels; ++ch)
        if (outputChannelData[ch] != nullptr && numSamples > 0)
            juce::FloatVectorOperations::clear (outputChannelData[ch], numSamples);

    if (numSamples <= 0 || inputChannelData == nullptr)
        return;

    // Mono: first live input channel only.
    for (int ch = 0; ch < numInputChannels; ++ch)
    {
        if (const float* in = inputChannelData[ch])
        {
            publish ((float) talk_core::computeRms (in, numSamples));
            return;
        }
    }
}

void LoudnessSampler::audioDeviceAboutToStart (juce::AudioIODevice* device)
{
    if (device != nullptr)
        DBG ("LoudnessSampler: starting on " << device->getName());
}

void LoudnessSampler::audioDeviceStopped()
{
    DBG ("LoudnessSampler: device stopped");
}

void LoudnessSampler::audioDeviceError (const juce::String& errorMessage)
{
    {
        const juce::ScopedLock sl (faultLock);
        faultMessage = errorMessage.isNotEmpty() ? errorMessage : juce::String ("Audio input stream error");
    }

    streamFaulted.store (true, std::memory_order_release);
    juce::Logger::writeToLog ("audio: stream error: " + errorMessage);
}
