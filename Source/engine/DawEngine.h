#pragma once
#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_audio_formats/juce_audio_formats.h>
#include "../core/EngineState.h"
#include "../audio/LiveCapture.h"
#include "../project/ClipEditing.h"
#include "../project/CompositionAssist.h"
#include "../project/ProjectStore.h"
#include "ChannelRack.h"
#include "ClipScheduler.h"
#include "MasterBus.h"

namespace cadence
{
    // Owns the engine state and every runtime component. Control calls come
    // from the message thread; the device (or renderBlock) drives the clock.
    class DawEngine final : public juce::AudioIODeviceCallback
    {
    public:
        explicit DawEngine(const EngineConfig& config = {});
        ~DawEngine() override;

        EngineState& getState() noexcept { return state; }
        ProjectModel& getProject() noexcept { return state.project; }
        TransportEngine& getTransport() noexcept { return state.transport; }
        ChannelRack& getChannels() noexcept { return rack; }
        LiveCapture& getLiveCapture() noexcept { return liveCapture; }
        MasterBus& getMasterBus() noexcept { return masterBus; }

        // Transport
        void play();
        void pause();
        void stop();
        void seek(double beat);
        double setTempo(double bpm);
        void setTimeSignature(int numerator, int denominator);
        void setLoop(double startBeat, double endBeat, bool enabled);
        bool record(juce::String& errorMessage);
        bool stopRecording();

        // Tracks
        Track addTrack(TrackType type, const juce::String& name = {});
        bool removeTrack(const juce::String& trackId);
        bool setTrackVolume(const juce::String& trackId, float volume);
        bool setTrackPan(const juce::String& trackId, float pan);
        bool setTrackMute(const juce::String& trackId, bool muted);
        bool setTrackSolo(const juce::String& trackId, bool solo);
        bool setTrackArmed(const juce::String& trackId, bool armed);
        bool setTrackInstrument(const juce::String& trackId, const juce::String& presetId, juce::String& errorMessage);
        void previewNote(int pitch, const juce::String& trackId = {});

        // Clip edits
        bool quantizeClip(const juce::String& clipId, double divisionBeats);

        // Composition assist
        std::vector<juce::String> applyArrangement(const AssistArrangement& arrangement);

        // Full resync of every channel from the project. Stopped or about to start only.
        int scheduleTracks();

        bool loadProject(ProjectStore& store, const juce::String& projectId, juce::String& errorMessage);
        bool saveProject(ProjectStore& store, juce::String& errorMessage);

        // Offline rendering shares the device path.
        void prepareToPlay(double sampleRate, int maxBlockSize);
        void renderBlock(juce::AudioBuffer<float>& buffer, int startSample, int numSamples);
        void renderBlock(juce::AudioBuffer<float>& buffer) { renderBlock(buffer, 0, buffer.getNumSamples()); }
        bool renderToFile(const juce::File& destination, double seconds, juce::String& errorMessage);

        void audioDeviceIOCallbackWithContext(const float* const* inputChannelData,
                                              int numInputChannels,
                                              float* const* outputChannelData,
                                              int numOutputChannels,
                                              int numSamples,
                                              const juce::AudioIODeviceCallbackContext& context) override;
        void audioDeviceAboutToStart(juce::AudioIODevice* device) override;
        void audioDeviceStopped() override;

    private:
        void syncTransportFromProject();

        EngineState state;
        ChannelRack rack;
        MasterBus masterBus;
        ClipScheduler scheduler;
        LiveCapture liveCapture;

        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(DawEngine)
    };
}
