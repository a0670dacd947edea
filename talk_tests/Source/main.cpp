#include <iostream>
#include <cmath>
#include <vector>

#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_events/juce_events.h>

#include "talk_core/talk_core.h"
#include "talk_core/talk_state.h"
#include "talk_core/variant_tiers.h"
#include "talk_core/idle_cadence.h"
#include "Config/AvatarConfig.h"
#include "Engine/IdleScheduler.h"
#include "Engine/LoudnessSampler.h"
#include "Engine/TalkEngine.h"

using talk_core::TalkState;
using talk_core::TalkStateMachine;

static bool near (double a, double b, double tol = 1.0e-9) noexcept
{
    return std::abs (a - b) <= tol;
}

//==============================================================================
// Test doubles

class FakeStream final : public AudioInputStream
{
public:
    FakeStream (int& s, int& c) : stops (s), closes (c) {}

    void stop() noexcept override  { ++stops; }
    void close() noexcept override { ++closes; }

private:
    int& stops;
    int& closes;
};

class FakeSource final : public AudioInputSource
{
public:
    juce::Result openInputStream (juce::AudioIODeviceCallback& cb,
                                  std::unique_ptr<AudioInputStream>& stream) override
    {
        if (failOpen)
            return juce::Result::fail ("Permission denied");

        callback = &cb;
        stream = std::make_unique<FakeStream> (stops, closes);
        return juce::Result::ok();
    }

    void push (const std::vector<float>& buf)
    {
        const float* chans[] = { buf.data() };
        juce::AudioIODeviceCallbackContext ctx {};
        callback->audioDeviceIOCallbackWithContext (chans, 1, nullptr, 0, (int) buf.size(), ctx);
    }

    // Constant buffer: RMS == |v| (+ epsilon).
    void pushLevel (float v)
    {
        push (std::vector<float> (256, v));
    }

    bool failOpen = false;
    juce::AudioIODeviceCallback* callback = nullptr;
    int stops = 0;
    int closes = 0;
};

class RecordingSink final : public RenderSink
{
public:
    void onLevelUpdate (double smoothedLevel) override      { levels.push_back (smoothedLevel); }
    void onTalkStateChanged (bool isTalking) override       { states.push_back (isTalking); }
    void onVariantChanged (const ImageHandle& image) override   { variants.add (image); }
    void onIdleFrameChanged (const ImageHandle& image) override { idleFrames.add (image); }
    void onEngineFault (const juce::String& message) override   { faults.add (message); }

    std::vector<double> levels;
    std::vector<bool> states;
    juce::StringArray variants;
    juce::StringArray idleFrames;
    juce::StringArray faults;
};

static AvatarConfig makeConfig (const juce::StringArray& idle)
{
    return AvatarConfig()
        .withTalkThreshold (0.03)
        .withIdleFrames (idle)
        .withTalkImage ("talk.png")
        .withTalkVariants ({ { 0.05, "loud.png" }, { 0.2, "shout.png" } })
        .withIdleTiming (0.2, 0.2, false);
}

//==============================================================================
//// [TSP:TEST] Level Smoother Convexity
static bool testSmootherConvex()
{
    juce::Random rng (42);
    double smoothed = 0.0;

    for (int i = 0; i < 2000; ++i)
    {
        const double raw = rng.nextDouble() * 0.5;
        const double next = talk_core::smoothLevel (smoothed, raw);

        const double lo = juce::jmin (smoothed, raw);
        const double hi = juce::jmax (smoothed, raw);
        if (next < 0.0 || next < lo - 1.0e-12 || next > hi + 1.0e-12)
            return false;

        smoothed = next;
    }

    // Exact coefficients and silence handling.
    if (! near (talk_core::smoothLevel (0.1, 0.2), 0.1 * 0.7 + 0.2 * 0.3))
        return false;

    return talk_core::smoothLevel (0.1, std::nan ("")) >= 0.0
        && talk_core::smoothLevel (0.1, -1.0) >= 0.0;
}

//// [TSP:TEST] RMS Epsilon Floor
static bool testRms()
{
    const std::vector<float> half (128, 0.5f);
    const std::vector<float> zeros (64, 0.0f);
    const std::vector<float> square { 1.0f, -1.0f, 1.0f, -1.0f };

    return near (talk_core::computeRms (half.data(), (int) half.size()), 0.5 + talk_core::kRmsEpsilon, 1.0e-7)
        && near (talk_core::computeRms (zeros.data(), (int) zeros.size()), talk_core::kRmsEpsilon, 1.0e-12)
        && near (talk_core::computeRms (square.data(), (int) square.size()), 1.0 + talk_core::kRmsEpsilon, 1.0e-9);
}

//// [TSP:TEST] Hysteresis Band
static bool testHysteresis()
{
    TalkStateMachine m (0.03, 0.0);

    if (! near (m.releaseThreshold(), 0.021, 1.0e-12))
        return false;

    // Band approached from below never starts talking.
    double t = 0.0;
    for (double lv : { 0.0, 0.015, 0.022, 0.028, 0.0299, 0.03 })
    {
        t += 0.1;
        if (m.update (lv, t) || m.isTalking())
            return false;
    }

    t += 0.1;
    if (! m.update (0.031, t) || ! m.isTalking())
        return false;

    // Band approached from above never stops talking.
    for (double lv : { 0.029, 0.025, 0.0215, 0.022 })
    {
        t += 0.1;
        if (m.update (lv, t) || ! m.isTalking())
            return false;
    }

    t += 0.1;
    return m.update (0.0209, t) && m.getState() == TalkState::Idle;
}

//// [TSP:TEST] Dwell Guard
static bool testDwellGuard()
{
    talk_core::transitionAudit().reset();

    TalkStateMachine m (0.03, 0.0);

    if (! m.update (0.05, 1.00))
        return false;

    // 0.02 s later a release candidate appears: rejected.
    if (m.update (0.0, 1.02) || ! m.isTalking())
        return false;

    if (m.update (0.0, 1.04) || ! m.isTalking())
        return false;

    if (! m.update (0.0, 1.06) || m.isTalking())
        return false;

    // Rejected candidates never move the transition clock.
    if (! near (m.getLastTransitionSec(), 1.06))
        return false;

   #if defined(TALK_CORE_ENABLE_TRANSITION_AUDIT) && (TALK_CORE_ENABLE_TRANSITION_AUDIT == 1)
    if (talk_core::transitionAudit().transitions != 2u || talk_core::transitionAudit().dwellRejected != 2u)
        return false;
   #endif

    // Exactly at the dwell floor is still locked out (strictly greater is required).
    TalkStateMachine atFloor (0.03, 0.0);
    if (atFloor.update (0.5, talk_core::kMinDwellSec) || atFloor.isTalking())
        return false;

    // Startup counts as a transition time.
    TalkStateMachine fresh (0.03, 10.0);
    return ! fresh.update (0.5, 10.03) && fresh.update (0.5, 10.06);
}

//// [TSP:TEST] Scenario Sequence
static bool testScenario()
{
    TalkStateMachine m (0.03, 0.0);

    const double levels[] = { 0.0, 0.01, 0.04, 0.04, 0.02, 0.018 };
    const TalkState expected[] = { TalkState::Idle, TalkState::Idle, TalkState::Talking,
                                   TalkState::Talking, TalkState::Idle, TalkState::Idle };

    for (int i = 0; i < 6; ++i)
    {
        m.update (levels[i], 0.1 * (double) i);
        if (m.getState() != expected[i])
            return false;
    }

    return true;
}

//// [TSP:TEST] Variant Tier Ordering
static bool testVariantOrdering()
{
    const auto c = AvatarConfig().withTalkVariants ({ { 0.05, "b" }, { 0.02, "a" }, { 0.02, "a2" } });
    const auto& v = c.getTalkVariants();

    if (v.size() != 3 || v[0].image != "a" || v[1].image != "a2" || v[2].image != "b")
        return false;

    if (! near (v[0].threshold, 0.02) || ! near (v[1].threshold, 0.02) || ! near (v[2].threshold, 0.05))
        return false;

    // Equality qualifies; the later tied entry wins.
    if (talk_core::selectTier (v, 0.02) != 1)
        return false;

    return talk_core::selectTier (v, 0.019) == talk_core::kNoVariant
        && talk_core::selectTier (v, 0.049) == 1
        && talk_core::selectTier (v, 0.05) == 2
        && talk_core::selectTier (v, 3.0) == 2
        && talk_core::selectTier (std::vector<TalkVariant>(), 0.5) == talk_core::kNoVariant;
}

//// [TSP:TEST] Variant Selection Monotonic
static bool testVariantMonotonic()
{
    std::vector<TalkVariant> v { { 0.01, "a" }, { 0.03, "b" }, { 0.03, "c" }, { 0.07, "d" }, { 0.2, "e" } };
    talk_core::sortTiers (v);

    int prev = talk_core::kNoVariant;
    double prevTh = -1.0;
    for (int i = 0; i <= 600; ++i)
    {
        const double level = 0.0005 * (double) i;
        const int idx = talk_core::selectTier (v, level);
        const double th = (idx == talk_core::kNoVariant) ? -1.0 : v[(size_t) idx].threshold;

        if (idx < prev || th < prevTh)
            return false;

        prev = idx;
        prevTh = th;
    }

    return prev == 4;
}

//// [TSP:TEST] Config Normalisation
static bool testConfigNormalisation()
{
    const char* json = R"({
        "talk_th": "abc",
        "idle_image": "idle.png",
        "idle_frames": [],
        "idle_interval_min": -1,
        "idle_interval_max": 0.01,
        "talk_frames": [ 5, { "image": "" }, { "image": "x.png", "threshold": "oops" },
                         { "image": "y.png", "threshold": -2 }, { "image": "z.png" },
                         { "image": "w.png", "threshold": "0.04" } ],
        "width": 5000,
        "avatar_position": [ 1 ],
        "drag_enabled": "maybe"
    })";

    juce::var parsed;
    if (juce::JSON::parse (json, parsed).failed())
        return false;

    const auto c = AvatarConfig::fromVar (parsed);

    if (! near (c.getTalkThreshold(), talk_core::kTalkThresholdDefault)) return false;
    if (c.getIdleFrames().size() != 1 || c.getIdleFrames()[0] != "idle.png") return false;
    if (! near (c.getIdleIntervalMinSec(), 0.05) || ! near (c.getIdleIntervalMaxSec(), 0.05)) return false;
    if (c.getDisplayWidth() != AvatarConfig::kWidthMax) return false;
    if (c.hasAvatarPosition() || ! c.isDragEnabled()) return false;

    const auto& v = c.getTalkVariants();
    if (v.size() != 3 || ! talk_core::tiersAreSorted (v)) return false;
    if (v[0].image != "y.png" || v[1].image != "z.png" || v[2].image != "w.png") return false;
    if (! near (v[0].threshold, 0.0) || ! near (v[2].threshold, 0.04)) return false;

    // Out-of-range values clamp, max below min follows min.
    const auto clamped = AvatarConfig().withTalkThreshold (2.0).withIdleTiming (3.0, 1.0, true);
    if (! near (clamped.getTalkThreshold(), talk_core::kTalkThresholdMax)) return false;
    if (! near (clamped.getIdleIntervalMaxSec(), 3.0) || ! clamped.isIdleRandom()) return false;

    // Non-object root heals to defaults.
    return near (AvatarConfig::fromVar (juce::var ("nonsense")).getTalkThreshold(), talk_core::kTalkThresholdDefault);
}

//// [TSP:TEST] Config Store Persistence
static bool testConfigStore()
{
    const auto file = juce::File::createTempFile (".json");
    const ConfigStore store (file);

    const auto original = makeConfig ({ "a.png", "b.png" }).withTalkThreshold (0.123).withAvatarPosition (40, 50);
    if (store.save (original).failed())
        return false;

    const auto loaded = store.load();
    const bool ok = near (loaded.getTalkThreshold(), 0.123)
                 && loaded.getIdleFrames() == original.getIdleFrames()
                 && loaded.getTalkVariants().size() == 2
                 && loaded.getTalkVariants()[1].image == "shout.png"
                 && loaded.hasAvatarPosition() && loaded.getAvatarX() == 40 && loaded.getAvatarY() == 50;

    // Garbage on disk heals to defaults.
    file.replaceWithText ("{ this is not json");
    const bool healed = near (store.load().getTalkThreshold(), talk_core::kTalkThresholdDefault);

    file.deleteFile();
    return ok && healed;
}

//// [TSP:TEST] Sampler Open Failure
static bool testSamplerOpenFailure()
{
    FakeSource src;
    src.failOpen = true;

    auto result = juce::Result::ok();
    auto sampler = LoudnessSampler::open (src, result);

    return sampler == nullptr && result.failed() && result.getErrorMessage().contains ("Permission");
}

//// [TSP:TEST] Sampler Drain Keeps Latest
static bool testSamplerDrain()
{
    FakeSource src;
    auto result = juce::Result::ok();
    auto sampler = LoudnessSampler::open (src, result);
    if (sampler == nullptr || result.failed())
        return false;

    if (sampler->readLatest() != 0.0)
        return false;

    // Zero-length buffers publish nothing.
    src.push ({});
    if (sampler->readLatest() != 0.0)
        return false;

    src.pushLevel (0.1f);
    src.pushLevel (0.2f);
    src.pushLevel (0.3f);

    if (! near (sampler->readLatest(), 0.3, 1.0e-5) || sampler->getDiscardedCount() != 2u)
        return false;

    if (sampler->readLatest() != 0.0)
        return false;

    // Overwrite-on-full: far more publishes than ring slots, newest still wins.
    for (int i = 1; i <= 50; ++i)
        src.pushLevel (0.01f * (float) i);

    if (! near (sampler->readLatest(), 0.5, 1.0e-5))
        return false;

    // Driver error surfaces on the consumer side.
    src.callback->audioDeviceError ("device unplugged");
    bool threw = false;
    try
    {
        sampler->readLatest();
    }
    catch (const StreamFault& e)
    {
        threw = juce::String (e.what()).contains ("unplugged");
    }

    return threw;
}

//// [TSP:TEST] Idle Fixed Cadence
static bool testIdleFixedCadence()
{
    IdleScheduler sched;
    sched.setRandomSeed (7);

    std::vector<int> seen;
    sched.onFrameAdvanced = [&seen] (int i) { seen.push_back (i); };

    sched.setTiming (0.2, 0.2, false);
    sched.setFrameCount (3);

    if (! sched.isScheduled() || sched.getCurrentIndex() != 0)
        return false;

    int elapsedMs = 0;
    for (int tick = 1; tick <= 100; ++tick)
    {
        if (sched.getScheduledIntervalMs() != 200)
            return false;

        elapsedMs += sched.getScheduledIntervalMs();
        sched.advance();

        if (elapsedMs != 200 * tick)
            return false;
    }

    if (seen.size() != 100)
        return false;

    for (size_t i = 0; i < seen.size(); ++i)
        if (seen[i] != (int) ((i + 1) % 3))
            return false;

    sched.stop();
    return ! sched.isScheduled();
}

//// [TSP:TEST] Idle Random Order And Gating
static bool testIdleRandomAndGating()
{
    IdleScheduler sched;
    sched.setRandomSeed (1234);
    sched.setTiming (0.1, 0.5, true);
    sched.setFrameCount (4);

    bool sawRepeat = false;
    int prev = sched.getCurrentIndex();
    for (int i = 0; i < 400; ++i)
    {
        const int ms = sched.getScheduledIntervalMs();
        if (ms < 100 || ms > 500)
            return false;

        sched.advance();
        const int idx = sched.getCurrentIndex();
        if (idx < 0 || idx >= 4)
            return false;

        sawRepeat = sawRepeat || (idx == prev);
        prev = idx;
    }

    if (! sawRepeat)
        return false;

    // Talking: no pending timer. Resume draws again.
    sched.setSuspended (true);
    if (sched.isScheduled())
        return false;

    sched.setSuspended (false);
    if (! sched.isScheduled())
        return false;

    // One frame or none: nothing to animate.
    sched.setFrameCount (1);
    if (sched.isScheduled())
        return false;

    sched.setFrameCount (0);
    return ! sched.isScheduled();
}

//// [TSP:TEST] Idle Timing Change Applies Next Tick
static bool testIdleTimingNextTick()
{
    IdleScheduler sched;
    sched.setTiming (0.2, 0.2, false);
    sched.setFrameCount (2);

    if (sched.getScheduledIntervalMs() != 200)
        return false;

    sched.setTiming (1.0, 1.0, false);
    if (sched.getScheduledIntervalMs() != 200 || ! sched.isScheduled())
        return false;

    sched.advance();
    return sched.getScheduledIntervalMs() == 1000;
}

//// [TSP:TEST] Engine Empty Idle Placeholder
static bool testEngineEmptyIdle()
{
    FakeSource src;
    RecordingSink sink;
    auto result = juce::Result::ok();
    auto sampler = LoudnessSampler::open (src, result);
    if (sampler == nullptr)
        return false;

    TalkEngine engine (std::move (sampler), makeConfig ({}), sink);
    engine.start();

    const bool ok = engine.isPolling()
                 && ! engine.getIdleScheduler().isScheduled()
                 && sink.idleFrames.size() == 1
                 && sink.idleFrames[0].isEmpty();

    engine.shutdown();
    return ok;
}

//// [TSP:TEST] Engine Talk Cycle
static bool testEngineTalkCycle()
{
    FakeSource src;
    RecordingSink sink;
    auto result = juce::Result::ok();
    auto sampler = LoudnessSampler::open (src, result);
    if (sampler == nullptr)
        return false;

    TalkEngine engine (std::move (sampler), makeConfig ({ "i0.png", "i1.png", "i2.png" }), sink);
    engine.start();

    if (! engine.getIdleScheduler().isScheduled() || sink.idleFrames.size() != 1 || sink.idleFrames[0] != "i0.png")
        return false;

    double t = 0.0;

    // Quiet polls: no state change, no variant work.
    for (int i = 0; i < 3; ++i)
    {
        t += 0.06;
        src.pushLevel (0.01f);
        engine.pollOnce (t);
    }

    if (engine.isTalking() || ! sink.variants.isEmpty())
        return false;

    // 0.2 raw -> smoothed ~0.065 on the first loud poll: talking, tier "loud".
    t += 0.06;
    src.pushLevel (0.2f);
    engine.pollOnce (t);

    if (! engine.isTalking() || engine.getIdleScheduler().isScheduled())
        return false;

    if (sink.variants.size() != 1 || sink.variants[0] != "loud.png")
        return false;

    // Level keeps rising inside the same tier: no redundant swaps.
    t += 0.06;
    src.pushLevel (0.12f);
    engine.pollOnce (t);
    if (sink.variants.size() != 1)
        return false;

    // Well above 0.2: tier changes once.
    for (int i = 0; i < 10; ++i)
    {
        t += 0.06;
        src.pushLevel (0.6f);
        engine.pollOnce (t);
    }

    if (sink.variants.size() != 2 || sink.variants[1] != "shout.png" || engine.getSelectedVariantIndex() != 1)
        return false;

    // Silence: decays under the release threshold, idle resumes.
    for (int i = 0; i < 40 && engine.isTalking(); ++i)
    {
        t += 0.06;
        src.pushLevel (0.0f);
        engine.pollOnce (t);
    }

    if (engine.isTalking() || ! engine.getIdleScheduler().isScheduled())
        return false;

    if (sink.states.size() != 3 || sink.states[1] != true || sink.states[2] != false)
        return false;

    const int variantsWhenIdle = sink.variants.size();

    // While idle, level swings never drive the selector.
    src.pushLevel (0.025f);
    engine.pollOnce (t + 0.06);
    if (sink.variants.size() != variantsWhenIdle)
        return false;

    if (sink.idleFrames[sink.idleFrames.size() - 1] != "i0.png")
        return false;

    for (auto lv : sink.levels)
        if (lv < 0.0)
            return false;

    engine.shutdown();
    return true;
}

//// [TSP:TEST] Engine Reconfigure Policies
static bool testEngineReconfigure()
{
    FakeSource src;
    RecordingSink sink;
    auto result = juce::Result::ok();
    auto sampler = LoudnessSampler::open (src, result);
    if (sampler == nullptr)
        return false;

    const auto base = makeConfig ({ "i0.png", "i1.png" });
    TalkEngine engine (std::move (sampler), base, sink);
    engine.start();

    src.pushLevel (0.3f);
    engine.pollOnce (0.1);
    if (! engine.isTalking())
        return false;

    const double levelBefore = engine.getSmoothedLevel();

    // Carry: state survives, new threshold is live, current image re-resolved.
    const int variantsBefore = sink.variants.size();
    engine.applyConfiguration (base.withTalkThreshold (0.08), ReconfigurePolicy::CarryState);

    if (! engine.isTalking() || ! near (engine.getSmoothedLevel(), levelBefore))
        return false;

    if (sink.variants.size() != variantsBefore + 1)
        return false;

    // Reset: back to idle with a cleared level.
    engine.applyConfiguration (base, ReconfigurePolicy::ResetState);
    if (engine.isTalking() || engine.getSmoothedLevel() != 0.0 || ! engine.getIdleScheduler().isScheduled())
        return false;

    engine.shutdown();
    return sink.states.back() == false;
}

//// [TSP:TEST] Engine Poll Fault Containment
static bool testEnginePollFault()
{
    FakeSource src;
    RecordingSink sink;
    auto result = juce::Result::ok();
    auto sampler = LoudnessSampler::open (src, result);
    if (sampler == nullptr)
        return false;

    TalkEngine engine (std::move (sampler), makeConfig ({ "i0.png", "i1.png" }), sink);
    engine.start();

    src.pushLevel (0.01f);
    engine.pollOnce (0.06);

    const size_t levelsBefore = sink.levels.size();

    src.callback->audioDeviceError ("stream died");
    engine.pollOnce (0.12);
    engine.pollOnce (0.18);

    if (engine.isPolling() || ! engine.hasFaulted() || sink.faults.size() != 1)
        return false;

    // Last visual state kept: nothing further emitted.
    if (sink.levels.size() != levelsBefore)
        return false;

    // Teardown is idempotent and ordered.
    engine.shutdown();
    engine.shutdown();

    return src.stops == 1 && src.closes == 1 && ! engine.getIdleScheduler().isScheduled();
}

//// [TSP:TEST] Config Idle Image And Change Detection
static bool testConfigIdleImageAndChanges()
{
    juce::var parsed;
    if (juce::JSON::parse (R"({ "idle_image": "base.png", "idle_frames": [ "a.png", "b.png" ] })", parsed).failed())
        return false;

    const auto c = AvatarConfig::fromVar (parsed);
    if (c.getIdleImage() != "base.png" || c.getIdleFrames().size() != 2)
        return false;

    // The fallback image is written back as loaded, not replaced by the first frame.
    if (c.toVar()["idle_image"].toString() != "base.png")
        return false;

    const auto reloaded = AvatarConfig::fromVar (c.withIdleFrames ({}).toVar());
    if (reloaded.getIdleFrames().size() != 1 || reloaded.getIdleFrames()[0] != "base.png")
        return false;

    const auto retuned = c.withTalkThreshold (0.2);
    if (! c.hasSameImagesAs (retuned) || ! c.hasSameAppearanceAs (retuned))
        return false;

    if (c.hasSameImagesAs (c.withTalkImage ("other.png"))
        || c.hasSameImagesAs (c.withTalkVariants ({ { 0.1, "v.png" } }))
        || c.hasSameImagesAs (c.withIdleFrames ({ "a.png" })))
        return false;

    juce::var styled;
    if (juce::JSON::parse (R"({ "bg": "#112233", "keep_on_top": true })", styled).failed())
        return false;

    return ! AvatarConfig::fromVar (styled).hasSameAppearanceAs (AvatarConfig());
}

//// [TSP:TEST] Engine Idle Frame Set Change
static bool testEngineFrameSetChange()
{
    FakeSource src;
    RecordingSink sink;
    auto result = juce::Result::ok();
    auto sampler = LoudnessSampler::open (src, result);
    if (sampler == nullptr)
        return false;

    const auto three = makeConfig ({ "i0.png", "i1.png", "i2.png" }).withIdleTiming (0.1, 0.4, false);
    TalkEngine engine (std::move (sampler), three, sink);
    engine.start();

    auto& idle = engine.getIdleScheduler();
    auto lastFrame = [&sink] { return sink.idleFrames[sink.idleFrames.size() - 1]; };
    auto intervalInBounds = [&idle] { return idle.getScheduledIntervalMs() >= 100 && idle.getScheduledIntervalMs() <= 400; };

    idle.advance();
    idle.advance();
    if (idle.getCurrentIndex() != 2 || lastFrame() != "i2.png")
        return false;

    // Carry: index kept but clamped into the shorter set, timer restarted.
    engine.applyConfiguration (three.withIdleFrames ({ "i0.png", "i1.png" }), ReconfigurePolicy::CarryState);
    if (idle.getFrameCount() != 2 || idle.getCurrentIndex() != 1 || ! idle.isScheduled() || ! intervalInBounds())
        return false;

    if (lastFrame() != "i1.png")
        return false;

    // Talk, then fall back to idle: a fresh interval is drawn and the same frame returns.
    double t = 0.1;
    src.pushLevel (0.3f);
    engine.pollOnce (t);
    if (! engine.isTalking() || idle.isScheduled())
        return false;

    for (int i = 0; i < 40 && engine.isTalking(); ++i)
    {
        t += 0.1;
        src.pushLevel (0.0f);
        engine.pollOnce (t);
    }

    if (engine.isTalking() || ! idle.isScheduled() || ! intervalInBounds())
        return false;

    if (idle.getCurrentIndex() != 1 || lastFrame() != "i1.png")
        return false;

    // Reset: back to the first frame.
    engine.applyConfiguration (three, ReconfigurePolicy::ResetState);
    const bool ok = idle.getFrameCount() == 3 && idle.getCurrentIndex() == 0
                 && idle.isScheduled() && lastFrame() == "i0.png";

    engine.shutdown();
    return ok;
}

//// [TSP:TEST] Engine Contains Non-Standard Exceptions
class ThrowingSink final : public RenderSink
{
public:
    void onLevelUpdate (double) override                 { throw 42; }
    void onTalkStateChanged (bool) override              {}
    void onVariantChanged (const ImageHandle&) override   {}
    void onIdleFrameChanged (const ImageHandle&) override {}
    void onEngineFault (const juce::String& message) override { faults.add (message); }

    juce::StringArray faults;
};

static bool testEngineNonStandardException()
{
    FakeSource src;
    ThrowingSink sink;
    auto result = juce::Result::ok();
    auto sampler = LoudnessSampler::open (src, result);
    if (sampler == nullptr)
        return false;

    TalkEngine engine (std::move (sampler), makeConfig ({ "i0.png", "i1.png" }), sink);
    engine.start();

    src.pushLevel (0.01f);
    engine.pollOnce (0.06);
    src.pushLevel (0.01f);
    engine.pollOnce (0.12);

    const bool ok = ! engine.isPolling() && engine.hasFaulted() && sink.faults.size() == 1;

    engine.shutdown();
    return ok && src.closes == 1;
}

//==============================================================================
int main()
{
    juce::ScopedJuceInitialiser_GUI juceInit;

    const bool okCore = (juce::String (talk_core::kTalkCoreId) == "talk_core_v1");
    if (! okCore)
    {
        std::cout << "talk_tests FAIL (talk_core)\n";
        return 1;
    }

    struct Case { const char* name; bool (*fn)(); };

    const Case cases[] =
    {
        { "smoother convexity",        testSmootherConvex },
        { "rms",                       testRms },
        { "hysteresis",                testHysteresis },
        { "dwell guard",               testDwellGuard },
        { "scenario",                  testScenario },
        { "variant ordering",          testVariantOrdering },
        { "variant monotonic",         testVariantMonotonic },
        { "config normalisation",      testConfigNormalisation },
        { "config store",              testConfigStore },
        { "config idle image",         testConfigIdleImageAndChanges },
        { "sampler open failure",      testSamplerOpenFailure },
        { "sampler drain",             testSamplerDrain },
        { "idle fixed cadence",        testIdleFixedCadence },
        { "idle random and gating",    testIdleRandomAndGating },
        { "idle timing next tick",     testIdleTimingNextTick },
        { "engine empty idle",         testEngineEmptyIdle },
        { "engine talk cycle",         testEngineTalkCycle },
        { "engine reconfigure",        testEngineReconfigure },
        { "engine poll fault",         testEnginePollFault },
        { "engine frame set change",   testEngineFrameSetChange },
        { "engine non-std exception",  testEngineNonStandardException },
    };

    for (const auto& c : cases)
    {
        if (! c.fn())
        {
            std::cout << "talk_tests FAIL (" << c.name << ")\n";
            return 1;
        }
    }

    std::cout << "talk_tests PASS\n";
    return 0;
}
