#include "AudioInput.h"

namespace
{
    class DeviceInputStream final : public AudioInputStream
    {
    public:
        DeviceInputStream (juce::AudioDeviceManager& dm, juce::AudioIODeviceCallback& cb)
            : manager (dm), callback (&cb)
        {
            manager.addAudioCallback (callback);
        }

        ~DeviceInputStream() override
        {
            close();
        }

        void stop() noexcept override
        {
            if (callback == nullptr)
                return;

            manager.removeAudioCallback (callback);
            callback = nullptr;
        }

        void close() noexcept override
        {
            stop();

            if (! closed)
            {
                manager.closeAudioDevice();
                closed = true;
            }
        }

    private:
        juce::AudioDeviceManager& manager;
        juce::AudioIODeviceCallback* callback = nullptr;
        bool closed = false;
    };
}

DeviceAudioInput::~DeviceAudioInput()
{
    deviceManager.closeAudioDevice();
}

juce::Result DeviceAudioInput::openInputStream (juce::AudioIODeviceCallback& callback,
                                                std::unique_ptr<AudioInputStream>& stream)
{
    // Mono capture, no outputs.
    const auto error = deviceManager.initialise (1, 0, nullptr, true);
    if (error.isNotEmpty())
        return juce::Result::fail (error);

    auto* device = deviceManager.getCurrentAudioDevice();
    if (device == nullptr)
        return juce::Result::fail ("No audio input device is available");

    if (device->getActiveInputChannels().countNumberOfSetBits() == 0)
    {
        deviceManager.closeAudioDevice();
        return juce::Result::fail ("Audio device \"" + device->getName() + "\" has no active input channel");
    }

    juce::Logger::writeToLog ("audio: opened \"" + device->getName() + "\" at "
                              + juce::String (device->getCurrentSampleRate(), 0) + " Hz, "
                              + juce::String (device->getCurrentBufferSizeSamples()) + " samples/block");

    stream = std::make_unique<DeviceInputStream> (deviceManager, callback);
    return juce::Result::ok();
}
