#include "DawEngine.h"

namespace cadence
{
    DawEngine::DawEngine(const EngineConfig& config)
        : state(config),
          rack(state.config),
          masterBus(state.config.masterGain, state.config.limiterCeilingDb),
          scheduler(state, rack),
          liveCapture(state, rack)
    {
        prepareToPlay(state.config.sampleRate, state.config.blockSize);
        syncTransportFromProject();
    }

    DawEngine::~DawEngine()
    {
        rack.releaseAll();
        rack.removeAllChannels();
    }

    void DawEngine::syncTransportFromProject()
    {
        state.transport.setTempo(state.project.getTempo());
        const auto signature = state.project.getTimeSignature();
        state.transport.setTimeSignature(signature.numerator, signature.denominator);
    }

    //==============================================================================
    void DawEngine::play()
    {
        if (state.transport.isPlaying())
            return;

        // Re-anchor the seconds line to the current tempo before scheduling against it.
        state.transport.seek(state.transport.getCurrentBeat());
        scheduleTracks();
        state.transport.play();
    }

    void DawEngine::pause()
    {
        state.transport.pause();
        rack.releaseAll();
    }

    void DawEngine::stop()
    {
        if (liveCapture.isRecording())
            liveCapture.stopRecording();

        state.transport.stop();
        rack.clearAllSchedules();
        rack.releaseAll();
    }

    void DawEngine::seek(double beat)
    {
        state.transport.seek(beat);
        rack.resetScheduleCursors(state.transport.getPositionSeconds());
    }

    double DawEngine::setTempo(double bpm)
    {
        const auto applied = state.project.setTempo(bpm);
        state.transport.setTempo(applied);
        return applied;
    }

    void DawEngine::setTimeSignature(int numerator, int denominator)
    {
        state.project.setTimeSignature(numerator, denominator);
        syncTransportFromProject();
    }

    void DawEngine::setLoop(double startBeat, double endBeat, bool enabled)
    {
        state.transport.setLoop(startBeat, endBeat, enabled);
    }

    bool DawEngine::record(juce::String& errorMessage)
    {
        if (!liveCapture.startRecording(errorMessage))
        {
            juce::Logger::writeToLog("Cadence: recording not started: " + errorMessage);
            return false;
        }
        play();
        return true;
    }

    bool DawEngine::stopRecording()
    {
        return liveCapture.stopRecording();
    }

    //==============================================================================
    Track DawEngine::addTrack(TrackType type, const juce::String& name)
    {
        auto track = state.project.addTrack(type, name);
        juce::String error;
        if (!rack.ensureChannel(track, error))
            juce::Logger::writeToLog("Cadence: track " + track.name + " has no voice: " + error);
        return track;
    }

    bool DawEngine::removeTrack(const juce::String& trackId)
    {
        rack.removeChannel(trackId);
        return state.project.removeTrack(trackId);
    }

    bool DawEngine::setTrackVolume(const juce::String& trackId, float volume)
    {
        rack.setTrackVolume(trackId, volume);
        return state.project.updateTrack(trackId, [volume](Track& t) { t.volume = volume; });
    }

    bool DawEngine::setTrackPan(const juce::String& trackId, float pan)
    {
        rack.setTrackPan(trackId, pan);
        return state.project.updateTrack(trackId, [pan](Track& t) { t.pan = pan; });
    }

    bool DawEngine::setTrackMute(const juce::String& trackId, bool muted)
    {
        rack.setTrackMute(trackId, muted);
        return state.project.updateTrack(trackId, [muted](Track& t) { t.muted = muted; });
    }

    bool DawEngine::setTrackSolo(const juce::String& trackId, bool solo)
    {
        rack.setTrackSolo(trackId, solo);
        return state.project.updateTrack(trackId, [solo](Track& t) { t.solo = solo; });
    }

    bool DawEngine::setTrackArmed(const juce::String& trackId, bool armed)
    {
        return state.project.updateTrack(trackId, [armed](Track& t) { t.armed = armed; });
    }

    bool DawEngine::setTrackInstrument(const juce::String& trackId, const juce::String& presetId, juce::String& errorMessage)
    {
        const auto track = state.project.getTrack(trackId);
        if (!track.has_value())
        {
            errorMessage = "Unknown track " + trackId;
            return false;
        }
        if (!track->isNoteTrack())
        {
            errorMessage = "Audio tracks have no instrument";
            return false;
        }

        const auto resolvedId = PresetLibrary::resolve(presetId, state.config.defaultPresetId).id;
        if (!rack.hasChannel(trackId))
        {
            if (!rack.ensureChannel(trackId, track->type, resolvedId, errorMessage))
                return false;
            rack.applyMixSettings(*track);
        }
        else if (!rack.setTrackInstrument(trackId, resolvedId, errorMessage))
        {
            juce::Logger::writeToLog("Cadence: instrument swap failed on " + track->name + ": " + errorMessage);
            return false;
        }

        return state.project.updateTrack(trackId, [&resolvedId](Track& t) { t.instrument = InstrumentSettings { resolvedId }; });
    }

    void DawEngine::previewNote(int pitch, const juce::String& trackId)
    {
        const auto halfBeatSeconds = state.transport.beatsToSeconds(0.5);
        if (trackId.isNotEmpty() && !rack.hasChannel(trackId))
        {
            if (const auto track = state.project.getTrack(trackId))
            {
                juce::String error;
                if (!rack.ensureChannel(*track, error))
                    juce::Logger::writeToLog("Cadence: preview falls back to the default voice: " + error);
            }
        }
        rack.previewNote(pitch, halfBeatSeconds, trackId);
    }

    bool DawEngine::quantizeClip(const juce::String& clipId, double divisionBeats)
    {
        return ClipEditing::quantizeClip(state.project, clipId, divisionBeats);
    }

    std::vector<juce::String> DawEngine::applyArrangement(const AssistArrangement& arrangement)
    {
        const auto trackIds = CompositionAssist::applyArrangement(state.project, arrangement);
        for (const auto& trackId : trackIds)
        {
            if (const auto track = state.project.getTrack(trackId))
            {
                juce::String error;
                if (!rack.ensureChannel(*track, error))
                    juce::Logger::writeToLog("Cadence: arrangement track " + track->name + " has no voice: " + error);
            }
        }
        return trackIds;
    }

    int DawEngine::scheduleTracks()
    {
        return scheduler.scheduleTracks(state.project.getSnapshot().tracks);
    }

    //==============================================================================
    bool DawEngine::loadProject(ProjectStore& store, const juce::String& projectId, juce::String& errorMessage)
    {
        Project loaded;
        if (!store.load(projectId, loaded, errorMessage))
        {
            juce::Logger::writeToLog("Cadence: load failed: " + errorMessage);
            return false;
        }

        for (auto& track : loaded.tracks)
        {
            if (track.isNoteTrack() && track.instrument.has_value() && track.instrument->legacyType.isNotEmpty())
            {
                track.instrument->presetId = PresetLibrary::migratePresetId(track.instrument->presetId, track.instrument->legacyType);
                track.instrument->legacyType.clear();
            }
        }

        stop();
        state.project.hydrate(std::move(loaded));
        syncTransportFromProject();

        const auto tracks = state.project.getSnapshot().tracks;
        for (const auto& track : tracks)
        {
            juce::String error;
            if (!rack.ensureChannel(track, error))
                juce::Logger::writeToLog("Cadence: track " + track.name + " has no voice: " + error);
        }
        scheduleTracks();
        juce::Logger::writeToLog("Cadence: loaded project " + projectId + " with " + juce::String(static_cast<int>(tracks.size())) + " tracks");
        return true;
    }

    bool DawEngine::saveProject(ProjectStore& store, juce::String& errorMessage)
    {
        if (!store.save(state.project.getSnapshot(), errorMessage))
        {
            juce::Logger::writeToLog("Cadence: save failed: " + errorMessage);
            return false;
        }
        return true;
    }

    //==============================================================================
    void DawEngine::prepareToPlay(double sampleRate, int maxBlockSize)
    {
        const auto rate = sampleRate > 0.0 ? sampleRate : state.config.sampleRate;
        const auto block = maxBlockSize > 0 ? maxBlockSize : state.config.blockSize;
        state.transport.prepare(rate);
        rack.prepare(rate, block);
        masterBus.reset();
        // Pre-existing triggers were stamped against the old clock.
        rack.resetScheduleCursors(state.transport.getPositionSeconds());
    }

    void DawEngine::renderBlock(juce::AudioBuffer<float>& buffer, int startSample, int numSamples)
    {
        if (numSamples <= 0 || startSample < 0 || startSample + numSamples > buffer.getNumSamples())
            return;

        juce::ScopedNoDenormals noDenormals;
        buffer.clear(startSample, numSamples);

        const auto block = state.transport.advance(numSamples);
        for (int i = 0; i < block.numSegments; ++i)
        {
            const auto& segment = block.segments[static_cast<size_t>(i)];
            if (segment.startsAfterWrap)
                rack.resetScheduleCursors(segment.startSeconds);

            rack.renderSegment(buffer,
                               startSample + segment.startSample,
                               segment.numSamples,
                               segment.startSeconds,
                               segment.endSeconds,
                               block.running);
        }

        if (block.endsOnWrap)
            rack.resetScheduleCursors(state.transport.getPositionSeconds());

        masterBus.process(buffer, startSample, numSamples);
    }

    bool DawEngine::renderToFile(const juce::File& destination, double seconds, juce::String& errorMessage)
    {
        if (seconds <= 0.0)
        {
            errorMessage = "Nothing to render";
            return false;
        }

        destination.deleteFile();
        auto fileOutput = destination.createOutputStream();
        if (fileOutput == nullptr)
        {
            errorMessage = "Cannot write " + destination.getFullPathName();
            return false;
        }

        const auto sampleRate = state.transport.getSampleRate();
        juce::WavAudioFormat wavFormat;
        juce::AudioFormatWriterOptions writerOptions;
        writerOptions = writerOptions.withSampleRate(sampleRate)
                                     .withNumChannels(2)
                                     .withBitsPerSample(24);
        std::unique_ptr<juce::OutputStream> outputStream(std::move(fileOutput));
        auto writer = wavFormat.createWriterFor(outputStream, writerOptions);
        if (writer == nullptr)
        {
            errorMessage = "Unable to create WAV writer";
            return false;
        }

        const auto renderBlockSize = juce::jmax(64, state.config.blockSize);
        juce::AudioBuffer<float> block(2, renderBlockSize);
        const auto totalSamples = static_cast<juce::int64>(std::ceil(seconds * sampleRate));

        juce::int64 samplesRendered = 0;
        while (samplesRendered < totalSamples)
        {
            const int numSamples = static_cast<int>(juce::jmin<juce::int64>(renderBlockSize, totalSamples - samplesRendered));
            renderBlock(block, 0, numSamples);
            if (!writer->writeFromAudioSampleBuffer(block, 0, numSamples))
            {
                errorMessage = "Write failed after " + juce::String(samplesRendered) + " samples";
                return false;
            }
            samplesRendered += numSamples;
        }

        juce::Logger::writeToLog("Cadence: rendered " + juce::String(seconds, 2) + " s to " + destination.getFullPathName());
        return true;
    }

    //==============================================================================
    void DawEngine::audioDeviceIOCallbackWithContext(const float* const* inputChannelData,
                                                     int numInputChannels,
                                                     float* const* outputChannelData,
                                                     int numOutputChannels,
                                                     int numSamples,
                                                     const juce::AudioIODeviceCallbackContext&)
    {
        juce::ignoreUnused(inputChannelData, numInputChannels);
        if (numSamples <= 0 || outputChannelData == nullptr || numOutputChannels <= 0)
            return;

        juce::AudioBuffer<float> output(outputChannelData, juce::jmin(2, numOutputChannels), numSamples);
        renderBlock(output, 0, numSamples);

        for (int ch = 2; ch < numOutputChannels; ++ch)
            if (outputChannelData[ch] != nullptr)
                juce::FloatVectorOperations::clear(outputChannelData[ch], numSamples);
    }

    void DawEngine::audioDeviceAboutToStart(juce::AudioIODevice* device)
    {
        if (device == nullptr)
            return;

        prepareToPlay(juce::jmax(1.0, device->getCurrentSampleRate()),
                      juce::jmax(state.config.blockSize, device->getCurrentBufferSizeSamples()));
        juce::Logger::writeToLog("Cadence: audio device " + device->getName()
                                 + " @ " + juce::String(device->getCurrentSampleRate()) + " Hz");
    }

    void DawEngine::audioDeviceStopped()
    {
        rack.releaseAll();
        masterBus.reset();
    }
}
