#include <juce_core/juce_core.h>
#include "../engine/ChannelRack.h"
#include "TestHelpers.h"

using namespace cadence;
using namespace cadence::testing;

namespace
{
    juce::AudioBuffer<float> renderRack(ChannelRack& rack, int numSamples = 2048)
    {
        juce::AudioBuffer<float> mix(2, numSamples);
        mix.clear();
        for (int start = 0; start < numSamples; start += 512)
            rack.renderSegment(mix, start, juce::jmin(512, numSamples - start), 0.0, 0.0, false);
        return mix;
    }
}

class ChannelRackTests final : public juce::UnitTest
{
public:
    ChannelRackTests() : juce::UnitTest("Channel rack", "Cadence") {}

    void runTest() override
    {
        const auto config = makeTestConfig();

        beginTest("ensureChannel is idempotent");
        {
            ChannelRack rack(config);
            juce::String error;
            expect(rack.ensureChannel("t1", TrackType::Instrument, "warm-pad", error));
            expect(rack.ensureChannel("t1", TrackType::Instrument, "saw-lead", error));
            expectEquals(rack.getNumChannels(), 1);
            expectEquals(rack.getChannelPresetId("t1"), juce::String("warm-pad"));
            expectEquals(rack.getInstrumentRevision("t1"), 1);
        }

        beginTest("Audio tracks get a channel without a voice");
        {
            ChannelRack rack(config);
            juce::String error;
            expect(rack.ensureChannel("a1", TrackType::Audio, {}, error));
            expect(rack.hasChannel("a1"));
            expectEquals(rack.getChannelPresetId("a1"), juce::String());
            rack.triggerAttack("a1", 60, 100);
            expectEquals(peakOf(renderRack(rack)), 0.0f);
        }

        beginTest("Unknown presets fall back to the default");
        {
            ChannelRack rack(config);
            juce::String error;
            expect(rack.ensureChannel("t1", TrackType::Midi, "not-a-preset", error));
            expectEquals(rack.getChannelPresetId("t1"), juce::String("triangle-lead"));
        }

        beginTest("Setting the same instrument does not rebuild it");
        {
            ChannelRack rack(config);
            juce::String error;
            rack.ensureChannel("t1", TrackType::Instrument, "organ", error);
            expect(rack.setTrackInstrument("t1", "organ", error));
            expectEquals(rack.getInstrumentRevision("t1"), 1);

            expect(rack.setTrackInstrument("t1", "fm-bell", error));
            expectEquals(rack.getInstrumentRevision("t1"), 2);
            expectEquals(rack.getChannelPresetId("t1"), juce::String("fm-bell"));

            expect(!rack.setTrackInstrument("nobody", "fm-bell", error));
        }

        beginTest("A failed swap keeps the old instrument");
        {
            ChannelRack rack(config);
            juce::String error;
            rack.ensureChannel("t1", TrackType::Instrument, "organ", error);
            expect(!rack.setTrackInstrument("t1", "acoustic-kit", error));
            expect(error.isNotEmpty());
            expectEquals(rack.getChannelPresetId("t1"), juce::String("organ"));
            expectEquals(rack.getInstrumentRevision("t1"), 1);

            expect(!rack.ensureChannel("t2", TrackType::Instrument, "acoustic-kit", error));
            expect(!rack.hasChannel("t2"));
        }

        beginTest("Swapping releases voices on the old instrument");
        {
            ChannelRack rack(config);
            juce::String error;
            rack.ensureChannel("t1", TrackType::Instrument, "organ", error);
            rack.triggerAttack("t1", 60, 100);
            renderRack(rack, 512);
            expectEquals(rack.getNumActiveVoices("t1"), 1);

            rack.setTrackInstrument("t1", "saw-lead", error);
            expectEquals(rack.getNumActiveVoices("t1"), 0);
        }

        beginTest("removeChannel is idempotent and missing channels are ignored");
        {
            ChannelRack rack(config);
            juce::String error;
            rack.ensureChannel("t1", TrackType::Instrument, {}, error);
            rack.setSchedule("t1", { { 0.0, 0.5, 60, 1.0f } }, 0.0);
            expect(rack.removeChannel("t1"));
            expect(!rack.removeChannel("t1"));
            expectEquals(rack.getNumChannels(), 0);

            rack.triggerAttack("t1", 60, 100);
            rack.triggerRelease("t1", 60);
            rack.setTrackVolume("t1", 0.1f);
            expect(rack.getSchedule("t1").empty());
        }

        beginTest("Mute and solo gate the mix");
        {
            ChannelRack rack(config);
            juce::String error;
            rack.ensureChannel("a", TrackType::Instrument, "organ", error);
            rack.ensureChannel("b", TrackType::Instrument, "organ", error);
            rack.triggerAttack("a", 60, 100);
            rack.triggerAttack("b", 67, 100);
            expect(peakOf(renderRack(rack)) > 0.0f);

            rack.setTrackMute("a", true);
            rack.setTrackMute("b", true);
            renderRack(rack, 512);
            expectEquals(peakOf(renderRack(rack)), 0.0f);

            rack.setTrackMute("a", false);
            rack.setTrackMute("b", false);
            rack.setTrackSolo("b", true);
            rack.setTrackVolume("b", 0.0f);
            renderRack(rack, 512);
            expectEquals(peakOf(renderRack(rack)), 0.0f);

            rack.setTrackVolume("b", 1.0f);
            renderRack(rack, 512);
            expect(peakOf(renderRack(rack)) > 0.0f);
        }

        beginTest("Equal-power pan");
        {
            ChannelRack rack(config);
            juce::String error;
            rack.ensureChannel("t1", TrackType::Instrument, "organ", error);
            rack.setTrackPan("t1", -1.0f);
            rack.triggerAttack("t1", 60, 100);
            renderRack(rack, 512);

            const auto mix = renderRack(rack);
            expect(mix.getMagnitude(0, 0, mix.getNumSamples()) > 0.0f);
            expect(mix.getMagnitude(1, 0, mix.getNumSamples()) < 1.0e-6f);
        }

        beginTest("Scheduled triggers fire only while the transport runs");
        {
            ChannelRack rack(config);
            juce::String error;
            rack.ensureChannel("t1", TrackType::Instrument, "organ", error);
            rack.setSchedule("t1", { { 0.01, 0.5, 60, 1.0f } }, 0.0);

            juce::AudioBuffer<float> mix(2, 512);
            mix.clear();
            rack.renderSegment(mix, 0, 512, 0.0, 512.0 / 44100.0, false);
            expectEquals(rack.getNumActiveVoices("t1"), 0);

            rack.renderSegment(mix, 0, 512, 0.0, 512.0 / 44100.0, true);
            expectEquals(rack.getNumActiveVoices("t1"), 1);

            // 0.01 s lands on sample 441.
            expectEquals(mix.getMagnitude(0, 0, 441), 0.0f);
            expect(mix.getMagnitude(0, 441, 71) > 0.0f);
        }

        beginTest("Preview uses a lazily built default voice");
        {
            ChannelRack rack(config);
            rack.previewNote(60, 0.25);
            expect(peakOf(renderRack(rack, 1024)) > 0.0f);
            expectEquals(rack.getNumChannels(), 0);
        }
    }
};

static ChannelRackTests channelRackTests;
