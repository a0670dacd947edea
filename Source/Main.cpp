#include <juce_gui_basics/juce_gui_basics.h>
#include "Config/AvatarConfig.h"
#include "Engine/AudioInput.h"
#include "Engine/LoudnessSampler.h"
#include "Engine/TalkEngine.h"
#include "UI/AvatarComponent.h"
#include "UI/PanelComponent.h"

class PanelWindow final : public juce::DocumentWindow
{
public:
    explicit PanelWindow (PanelComponent& panel)
        : juce::DocumentWindow ("Talk Sprite", juce::Colour (0xFF151515), juce::DocumentWindow::allButtons)
    {
        setUsingNativeTitleBar (true);
        setContentNonOwned (&panel, true);
        setResizable (true, false);
        centreWithSize (getWidth(), getHeight());
        setVisible (true);
    }

    void closeButtonPressed() override
    {
        juce::JUCEApplication::getInstance()->systemRequestedQuit();
    }

private:
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (PanelWindow)
};

//==============================================================================
class TalkSpriteApplication final : public juce::JUCEApplication
{
public:
    TalkSpriteApplication() = default;

    const juce::String getApplicationName() override       { return JUCE_APPLICATION_NAME_STRING; }
    const juce::String getApplicationVersion() override    { return JUCE_APPLICATION_VERSION_STRING; }
    bool moreThanOneInstanceAllowed() override             { return false; }

    void initialise (const juce::String&) override
    {
        logger.reset (juce::FileLogger::createDefaultAppLogger ("TalkSprite", "talk_sprite.log", "Talk Sprite log"));
        juce::Logger::setCurrentLogger (logger.get());

        store = std::make_unique<ConfigStore> (ConfigStore::defaultSettingsFile());
        config = store->load();

        avatar = std::make_unique<AvatarComponent>();
        avatar->applyAppearance (config);
        avatar->loadImages (config);
        avatar->onMoved = [this] (juce::Point<int> pos)
        {
            if (config.isRememberPosition())
                config = config.withAvatarPosition (pos.x, pos.y);
        };

        panel = std::make_unique<PanelComponent> (config, *avatar);
        panel->onConfigChanged = [this] (const AvatarConfig& c) { applyConfig (c); };
        panel->onSaveRequested = [this] { return store->save (currentConfigWithPosition()); };

        avatarWindow = std::make_unique<AvatarWindow> (config, *avatar);
        panelWindow  = std::make_unique<PanelWindow> (*panel);

        audioInput = std::make_unique<DeviceAudioInput>();

        auto result = juce::Result::ok();
        auto sampler = LoudnessSampler::open (*audioInput, result);
        if (result.failed())
        {
            // Fatal to the feature: tell the user and quit, no retry.
            juce::AlertWindow::showMessageBoxAsync (juce::MessageBoxIconType::WarningIcon,
                                                    "Microphone error",
                                                    "Could not open the audio input stream:\n" + result.getErrorMessage(),
                                                    "Quit",
                                                    nullptr,
                                                    juce::ModalCallbackFunction::create ([] (int)
                                                    {
                                                        juce::JUCEApplication::quit();
                                                    }));
            return;
        }

        engine = std::make_unique<TalkEngine> (std::move (sampler), config, *panel);
        engine->start();
    }

    void shutdown() override
    {
        if (engine != nullptr)
            engine->shutdown();

        if (store != nullptr && config.isRememberPosition())
        {
            const auto saved = store->save (currentConfigWithPosition());
            if (saved.failed())
                juce::Logger::writeToLog ("config: final save failed: " + saved.getErrorMessage());
        }

        engine = nullptr;
        panelWindow = nullptr;
        avatarWindow = nullptr;
        panel = nullptr;
        avatar = nullptr;
        audioInput = nullptr;

        juce::Logger::setCurrentLogger (nullptr);
        logger = nullptr;
    }

    void systemRequestedQuit() override
    {
        quit();
    }

private:
    void applyConfig (const AvatarConfig& c)
    {
        const auto previous = config;
        config = c;

        // Images first: the engine re-emits the current handle below.
        if (! config.hasSameImagesAs (previous))
            avatar->loadImages (config);

        if (! config.hasSameAppearanceAs (previous))
        {
            avatar->applyAppearance (config);
            avatarWindow->applyAppearance (config);
        }

        panel->setConfig (config);

        if (engine != nullptr)
            engine->applyConfiguration (config, ReconfigurePolicy::CarryState);
    }

    AvatarConfig currentConfigWithPosition() const
    {
        if (config.isRememberPosition() && avatarWindow != nullptr)
            return config.withAvatarPosition (avatarWindow->getX(), avatarWindow->getY());

        return config;
    }

    std::unique_ptr<juce::FileLogger> logger;
    std::unique_ptr<ConfigStore> store;
    AvatarConfig config;

    std::unique_ptr<AvatarComponent> avatar;
    std::unique_ptr<PanelComponent> panel;
    std::unique_ptr<AvatarWindow> avatarWindow;
    std::unique_ptr<PanelWindow> panelWindow;

    std::unique_ptr<DeviceAudioInput> audioInput;
    std::unique_ptr<TalkEngine> engine;
};

START_JUCE_APPLICATION (TalkSpriteApplication)
