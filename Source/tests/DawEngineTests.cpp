#include <juce_core/juce_core.h>
#include <cmath>
#include "../engine/DawEngine.h"
#include "TestHelpers.h"

using namespace cadence;
using namespace cadence::testing;

namespace
{
    constexpr int blockSize = 512;

    // Peak of each rendered block, in order.
    std::vector<float> renderBlockPeaks(DawEngine& engine, double seconds)
    {
        const auto numBlocks = static_cast<int>(std::ceil(seconds * 44100.0 / blockSize));
        juce::AudioBuffer<float> buffer(2, blockSize);
        std::vector<float> peaks;
        peaks.reserve(static_cast<size_t>(numBlocks));
        for (int i = 0; i < numBlocks; ++i)
        {
            engine.renderBlock(buffer);
            peaks.push_back(peakOf(buffer));
        }
        return peaks;
    }

    float peakBetween(const std::vector<float>& peaks, double fromSeconds, double toSeconds)
    {
        const auto first = static_cast<size_t>(fromSeconds * 44100.0 / blockSize);
        const auto last = juce::jmin(peaks.size(), static_cast<size_t>(toSeconds * 44100.0 / blockSize));
        float peak = 0.0f;
        for (auto i = first; i < last; ++i)
            peak = juce::jmax(peak, peaks[i]);
        return peak;
    }

    Track addOrganTrack(DawEngine& engine, double noteBeats = 1.0)
    {
        const auto track = engine.addTrack(TrackType::Instrument, "Organ");
        juce::String error;
        engine.setTrackInstrument(track.id, "organ", error);

        const auto clipId = engine.getProject().addClip(track.id, 0.0, 4.0);
        Note note;
        note.pitch = 60;
        note.durationBeats = noteBeats;
        engine.getProject().addNote(clipId, note);
        return *engine.getProject().getTrack(track.id);
    }
}

class DawEngineTests final : public juce::UnitTest
{
public:
    DawEngineTests() : juce::UnitTest("DAW engine", "Cadence") {}

    void runTest() override
    {
        beginTest("Stopped engine renders silence");
        {
            DawEngine engine(makeTestConfig());
            addOrganTrack(engine);
            expectEquals(renderBlocks(engine, 20, blockSize), 0.0f);
            expectEquals(engine.getTransport().getCurrentBeat(), 0.0);
        }

        beginTest("Playing a clip produces sound that ends after the note");
        {
            DawEngine engine(makeTestConfig());
            const auto track = addOrganTrack(engine, 0.5);
            engine.play();
            expect(engine.getTransport().isPlaying());
            expectEquals(static_cast<int>(engine.getChannels().getSchedule(track.id).size()), 1);

            const auto peaks = renderBlockPeaks(engine, 1.5);
            expect(peakBetween(peaks, 0.05, 0.25) > 0.01f);
            expect(peakBetween(peaks, 0.8, 1.5) < 1.0e-3f);
            expectWithinAbsoluteError(engine.getTransport().getCurrentBeat(), peaks.size() * blockSize / 22050.0, 1.0e-6);
        }

        beginTest("Stop rewinds, clears schedules and silences voices");
        {
            DawEngine engine(makeTestConfig());
            const auto track = addOrganTrack(engine, 8.0);
            engine.play();
            renderBlockPeaks(engine, 0.5);

            engine.stop();
            expect(!engine.getTransport().isPlaying());
            expectEquals(engine.getTransport().getCurrentBeat(), 0.0);
            expect(engine.getChannels().getSchedule(track.id).empty());

            const auto peaks = renderBlockPeaks(engine, 0.6);
            expect(peakBetween(peaks, 0.4, 0.6) < 1.0e-3f);
        }

        beginTest("Pause keeps the position and resume continues from it");
        {
            DawEngine engine(makeTestConfig());
            addOrganTrack(engine);
            engine.play();
            renderBlocks(engine, 43, blockSize);
            engine.pause();
            const auto pausedAt = engine.getTransport().getCurrentBeat();
            expect(pausedAt > 0.0);

            renderBlocks(engine, 10, blockSize);
            expectEquals(engine.getTransport().getCurrentBeat(), pausedAt);

            engine.play();
            renderBlocks(engine, 1, blockSize);
            expect(engine.getTransport().getCurrentBeat() > pausedAt);
        }

        beginTest("Muted and soloed tracks");
        {
            DawEngine engine(makeTestConfig());
            const auto track = addOrganTrack(engine);
            engine.setTrackMute(track.id, true);
            expect(engine.getProject().getTrack(track.id)->muted);
            engine.play();
            expect(engine.getChannels().getSchedule(track.id).empty());
            expect(renderBlocks(engine, 20, blockSize) < 1.0e-6f);
            engine.stop();

            engine.setTrackMute(track.id, false);
            const auto other = engine.addTrack(TrackType::Instrument, "Other");
            engine.setTrackSolo(other.id, true);
            engine.play();
            expect(renderBlocks(engine, 20, blockSize) < 1.0e-6f);
            engine.stop();

            engine.setTrackSolo(other.id, false);
            engine.play();
            expect(renderBlocks(engine, 20, blockSize) > 0.01f);
        }

        beginTest("Looping retriggers notes from the loop start");
        {
            DawEngine engine(makeTestConfig());
            addOrganTrack(engine, 0.25);
            engine.setLoop(0.0, 2.0, true);
            engine.play();

            // Two beats at 120 bpm is one second.
            const auto peaks = renderBlockPeaks(engine, 2.5);
            expect(peakBetween(peaks, 0.05, 0.2) > 0.01f);
            expect(peakBetween(peaks, 0.6, 0.95) < 1.0e-3f);
            expect(peakBetween(peaks, 1.05, 1.2) > 0.01f);
            expect(peakBetween(peaks, 1.6, 1.95) < 1.0e-3f);
            expect(peakBetween(peaks, 2.05, 2.2) > 0.01f);
            expect(engine.getTransport().getCurrentBeat() < 2.0);
        }

        beginTest("A loop set behind the playhead wraps and retriggers");
        {
            DawEngine engine(makeTestConfig());
            addOrganTrack(engine, 0.25);
            engine.seek(6.0);
            engine.setLoop(0.0, 2.0, true);
            engine.play();

            const auto peaks = renderBlockPeaks(engine, 1.5);
            expect(peakBetween(peaks, 0.05, 0.2) > 0.01f);
            expect(peakBetween(peaks, 0.6, 0.95) < 1.0e-3f);
            expect(peakBetween(peaks, 1.05, 1.2) > 0.01f);
            expect(engine.getTransport().getCurrentBeat() < 2.0);
        }

        beginTest("A tempo change during playback keeps scheduled notes in place");
        {
            DawEngine engine(makeTestConfig());
            const auto track = engine.addTrack(TrackType::Instrument, "Organ");
            juce::String error;
            engine.setTrackInstrument(track.id, "organ", error);
            const auto clipId = engine.getProject().addClip(track.id, 0.0, 4.0);
            Note note;
            note.startBeat = 2.0;
            note.durationBeats = 0.5;
            engine.getProject().addNote(clipId, note);

            engine.play();
            const auto before = engine.getChannels().getSchedule(track.id);
            expectEquals(static_cast<int>(before.size()), 1);
            expectWithinAbsoluteError(before[0].timeSeconds, 1.0, 1.0e-9);

            const auto early = renderBlockPeaks(engine, 0.5);
            expect(peakBetween(early, 0.0, 0.5) < 1.0e-6f);

            expectEquals(engine.setTempo(60.0), 60.0);
            const auto after = engine.getChannels().getSchedule(track.id);
            expectEquals(static_cast<int>(after.size()), 1);
            expectEquals(after[0].timeSeconds, before[0].timeSeconds);
            expectEquals(after[0].durationSeconds, before[0].durationSeconds);

            // 44 blocks rendered so far (0.51 s); the note is due 0.49 s into this render.
            const auto late = renderBlockPeaks(engine, 0.8);
            expect(peakBetween(late, 0.0, 0.45) < 1.0e-6f);
            expect(peakBetween(late, 0.55, 0.8) > 0.01f);
        }

        beginTest("Notes are placed at the project tempo");
        {
            DawEngine engine(makeTestConfig());
            const auto track = engine.addTrack(TrackType::Instrument, "Organ");
            juce::String error;
            engine.setTrackInstrument(track.id, "organ", error);
            const auto clipId = engine.getProject().addClip(track.id, 4.0, 4.0);
            Note note;
            note.durationBeats = 1.0;
            engine.getProject().addNote(clipId, note);

            expectEquals(engine.setTempo(500.0), 300.0);
            expectEquals(engine.setTempo(60.0), 60.0);
            engine.play();

            const auto schedule = engine.getChannels().getSchedule(track.id);
            expectEquals(static_cast<int>(schedule.size()), 1);
            expectWithinAbsoluteError(schedule[0].timeSeconds, 4.0, 1.0e-9);
            expectWithinAbsoluteError(schedule[0].durationSeconds, 1.0, 1.0e-9);

            const auto peaks = renderBlockPeaks(engine, 4.5);
            expect(peakBetween(peaks, 0.0, 3.9) < 1.0e-6f);
            expect(peakBetween(peaks, 4.1, 4.5) > 0.01f);
        }

        beginTest("Seeking past a note skips it");
        {
            DawEngine engine(makeTestConfig());
            addOrganTrack(engine, 0.5);
            engine.seek(1.0);
            engine.play();
            expect(renderBlocks(engine, 40, blockSize) < 1.0e-6f);
        }

        beginTest("Instrument changes");
        {
            DawEngine engine(makeTestConfig());
            const auto track = engine.addTrack(TrackType::Instrument, "Keys");
            expectEquals(engine.getChannels().getChannelPresetId(track.id), juce::String("triangle-lead"));

            juce::String error;
            expect(engine.setTrackInstrument(track.id, "triangle-lead", error));
            expectEquals(engine.getChannels().getInstrumentRevision(track.id), 1);

            expect(engine.setTrackInstrument(track.id, "warm-pad", error));
            expectEquals(engine.getChannels().getInstrumentRevision(track.id), 2);
            expectEquals(engine.getProject().getTrack(track.id)->getPresetId(), juce::String("warm-pad"));

            expect(engine.setTrackInstrument(track.id, "no-such-preset", error));
            expectEquals(engine.getProject().getTrack(track.id)->getPresetId(), juce::String("triangle-lead"));

            expect(!engine.setTrackInstrument(track.id, "acoustic-kit", error));
            expectEquals(engine.getProject().getTrack(track.id)->getPresetId(), juce::String("triangle-lead"));

            const auto audio = engine.addTrack(TrackType::Audio, "Vox");
            expect(!engine.setTrackInstrument(audio.id, "organ", error));
            expect(!engine.setTrackInstrument("missing", "organ", error));
        }

        beginTest("Preview plays while stopped");
        {
            DawEngine engine(makeTestConfig());
            engine.previewNote(60);
            expect(renderBlocks(engine, 10, blockSize) > 0.01f);
            expect(!engine.getTransport().isPlaying());

            const auto track = engine.addTrack(TrackType::Instrument, "Keys");
            engine.removeTrack(track.id);
            expect(!engine.getChannels().hasChannel(track.id));
            expect(!engine.getProject().getTrack(track.id).has_value());
        }

        beginTest("Recording while playing");
        {
            DawEngine engine(makeTestConfig());
            const auto track = engine.addTrack(TrackType::Instrument, "Keys");
            engine.setTrackArmed(track.id, true);

            juce::String error;
            expect(engine.record(error));
            expect(engine.getTransport().isPlaying());
            expect(engine.getTransport().isRecording());

            renderBlocks(engine, 43, blockSize);
            engine.getLiveCapture().noteOn(60, 100);
            renderBlocks(engine, 43, blockSize);
            engine.getLiveCapture().noteOff(60);

            const auto clipId = engine.getLiveCapture().getRecordingClipId();
            engine.stop();
            expect(!engine.getLiveCapture().isRecording());

            const auto clip = engine.getProject().getClip(clipId);
            expect(clip.has_value());
            expectEquals(static_cast<int>(clip->notes.size()), 1);
            expectWithinAbsoluteError(clip->notes[0].startBeat, 43.0 * blockSize / 22050.0, 1.0e-6);
            expectWithinAbsoluteError(clip->durationBeats, 4.0, 1.0e-9);
        }

        beginTest("Projects load and save through a store");
        {
            InMemoryProjectStore store;
            juce::String projectId;
            {
                DawEngine engine(makeTestConfig());
                addOrganTrack(engine);
                engine.setTempo(90.0);
                engine.setTimeSignature(3, 4);
                projectId = engine.getProject().getProjectId();

                juce::String error;
                expect(engine.saveProject(store, error));
                expect(store.contains(projectId));
            }

            DawEngine engine(makeTestConfig());
            juce::String error;
            expect(!engine.loadProject(store, "unknown", error));
            expect(error.startsWith("Project not found"));

            expect(engine.loadProject(store, projectId, error));
            expectEquals(engine.getProject().getProjectId(), projectId);
            expectEquals(engine.getTransport().getTempo(), 90.0);
            expectEquals(engine.getTransport().getBeatsPerBar(), 3.0);
            expectEquals(engine.getChannels().getNumChannels(), 1);

            engine.play();
            expect(renderBlocks(engine, 20, blockSize) > 0.01f);
        }

        beginTest("Loading migrates legacy synth types to presets");
        {
            InMemoryProjectStore store;
            Project legacy;
            legacy.id = "legacy-project";
            Track keys;
            keys.id = "keys";
            keys.name = "Keys";
            keys.type = TrackType::Instrument;
            keys.instrument = InstrumentSettings { {}, "fm-synth" };
            Track drums;
            drums.id = "drums";
            drums.name = "Drums";
            drums.type = TrackType::Midi;
            drums.instrument = InstrumentSettings { "organ", "membrane" };
            legacy.tracks = { keys, drums };

            juce::String error;
            expect(store.save(legacy, error));

            DawEngine engine(makeTestConfig());
            expect(engine.loadProject(store, legacy.id, error), error);

            const auto loadedKeys = engine.getProject().getTrack("keys");
            expectEquals(loadedKeys->getPresetId(), juce::String("electric-piano"));
            expect(loadedKeys->instrument->legacyType.isEmpty());
            expectEquals(engine.getChannels().getChannelPresetId("keys"), juce::String("electric-piano"));

            // A valid preset id wins over the legacy type.
            expectEquals(engine.getProject().getTrack("drums")->getPresetId(), juce::String("organ"));
        }

        beginTest("Arrangements add tracks with voices");
        {
            DawEngine engine(makeTestConfig());
            AssistArrangement arrangement;
            AssistArrangementPart lead;
            lead.role = ArrangementRole::Lead;
            lead.name = "Lead";
            lead.notes = { { 72, 0.0, 1.0, 100 } };
            AssistArrangementPart bass;
            bass.role = ArrangementRole::Bass;
            bass.name = "Bass";
            bass.presetId = "sub-bass";
            arrangement.parts = { lead, bass };

            const auto ids = engine.applyArrangement(arrangement);
            expectEquals(static_cast<int>(ids.size()), 2);
            expectEquals(engine.getChannels().getChannelPresetId(ids[0]), juce::String("sub-bass"));
            expectEquals(engine.getChannels().getChannelPresetId(ids[1]), juce::String("saw-lead"));
        }

        beginTest("Offline render writes a WAV file");
        {
            DawEngine engine(makeTestConfig());
            addOrganTrack(engine);
            engine.play();

            const auto file = juce::File::getSpecialLocation(juce::File::tempDirectory).getChildFile("cadence_render_test.wav");
            juce::String error;
            expect(engine.renderToFile(file, 0.5, error), error);
            expect(file.getSize() > 44100 / 2 * 2 * 3);
            file.deleteFile();

            expect(!engine.renderToFile(file, 0.0, error));
            expect(!engine.getMasterBus().hadOutputFault());
        }
    }
};

static DawEngineTests dawEngineTests;
