#pragma once
#include <juce_audio_devices/juce_audio_devices.h>
#include <memory>

// An open capture stream. stop() detaches the callback, close() releases the device.
// Both are idempotent and safe to call in any order.
class AudioInputStream
{
public:
    virtual ~AudioInputStream() = default;

    virtual void stop() noexcept = 0;
    virtual void close() noexcept = 0;
};

// Capability that opens a mono capture stream feeding the given callback.
class AudioInputSource
{
public:
    virtual ~AudioInputSource() = default;

    virtual juce::Result openInputStream (juce::AudioIODeviceCallback& callback,
                                          std::unique_ptr<AudioInputStream>& stream) = 0;
};

// Default system input through juce::AudioDeviceManager.
// Must outlive every stream it opened.
class DeviceAudioInput final : public AudioInputSource
{
public:
    DeviceAudioInput() = default;
    ~DeviceAudioInput() override;

    juce::Result openInputStream (juce::AudioIODeviceCallback& callback,
                                  std::unique_ptr<AudioInputStream>& stream) override;

private:
    juce::AudioDeviceManager deviceManager;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (DeviceAudioInput)
};
