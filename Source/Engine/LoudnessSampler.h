#pragma once
#include <juce_audio_devices/juce_audio_devices.h>
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include "AudioInput.h"

// Raised on the consumer side once the driver has reported a stream error.
class StreamFault final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Audio callback -> poller loudness handoff.
//
// Producer: audio device thread (audioDeviceIOCallbackWithContext).
// Consumer: message thread (readLatest).
class LoudnessSampler final : public juce::AudioIODeviceCallback
{
public:
    // Opens the capture stream. On failure returns nullptr and a failed result;
    // the loudness feature cannot run without it.
    static std::unique_ptr<LoudnessSampler> open (AudioInputSource& source, juce::Result& result);

    ~LoudnessSampler() override;

    // Drains everything published since the last call and returns the newest
    // reading, or 0.0 if nothing is pending. Throws StreamFault after a driver error.
    double readLatest();

    // Number of readings published but superseded before a drain (diagnostics only).
    uint32_t getDiscardedCount() const noexcept { return discarded; }

    void stop() noexcept;
    void close() noexcept;

    //==============================================================================
    void audioDeviceIOCallbackWithContext (const float* const* inputChannelData,
                                           int numInputChannels,
                                           float* const* outputChannelData,
                                           int numOutputChannels,
                                           int numSamples,
                                           const juce::AudioIODeviceCallbackContext& context) override;
    void audioDeviceAboutToStart (juce::AudioIODevice* device) override;
    void audioDeviceStopped() override;
    void audioDeviceError (const juce::String& errorMessage) override;

private:
    LoudnessSampler() = default;

    void publish (float rms) noexcept;

    // Latest-value SPSC ring: fixed storage, no allocations, no locks.
    //
    // Publication rules:
    // - Producer writes slot, then advances writeIndex, then bumps seq (release).
    // - If the ring is full the oldest unread value is overwritten; only the newest matters.
    // - Consumer compares seq against its last seen value and reads slot writeIndex - 1.
    static constexpr uint32_t kLevelRingCapacity = 16;
    std::array<std::atomic<float>, (size_t) kLevelRingCapacity> levelRing {};

    std::atomic<uint32_t> levelWriteIndex { 0u };
    std::atomic<uint32_t> levelSeq        { 0u }; // wraparound OK

    // Consumer-side only.
    uint32_t levelLastReadSeq = 0u;
    uint32_t discarded = 0u;

    std::atomic<bool> streamFaulted { false };
    juce::CriticalSection faultLock;
    juce::String faultMessage;

    std::unique_ptr<AudioInputStream> stream;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (LoudnessSampler)
};
