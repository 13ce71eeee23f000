#include "ChannelRack.h"
#include <algorithm>

namespace cadence
{
    ChannelRack::ChannelRack(const EngineConfig& configToUse)
        : config(configToUse),
          sampleRate(configToUse.sampleRate),
          blockSize(configToUse.blockSize)
    {
    }

    ChannelRack::~ChannelRack()
    {
        removeAllChannels();

        std::unique_ptr<Channel> preview;
        {
            juce::ScopedLock lock(rackLock);
            preview = std::move(previewChannel);
        }
    }

    void ChannelRack::prepare(double newSampleRate, int maxBlockSize)
    {
        juce::ScopedLock lock(rackLock);
        sampleRate = newSampleRate > 0.0 ? newSampleRate : 44100.0;
        blockSize = juce::jmax(64, maxBlockSize);
        for (auto& channel : channels)
            channel->prepare(sampleRate, blockSize);
        if (previewChannel != nullptr)
            previewChannel->prepare(sampleRate, blockSize);
    }

    VoiceBuildContext ChannelRack::makeBuildContext() const
    {
        VoiceBuildContext context;
        context.sampleLoaderPool = &sampleLoaderPool;
        context.samplesDirectory = config.samplesDirectory;
        context.maxPolyphony = config.maxPolyphony;
        {
            juce::ScopedLock lock(rackLock);
            context.sampleRate = sampleRate;
            context.blockSize = blockSize;
        }
        return context;
    }

    std::unique_ptr<VoiceAdapter> ChannelRack::buildAdapter(const juce::String& presetId, juce::String& errorMessage)
    {
        const auto& preset = PresetLibrary::resolve(presetId, config.defaultPresetId);
        auto adapter = VoiceAdapter::create(preset, makeBuildContext(), errorMessage);
        if (adapter == nullptr)
            juce::Logger::writeToLog("Cadence: failed to build voice for preset " + preset.id + ": " + errorMessage);
        return adapter;
    }

    //==============================================================================
    bool ChannelRack::ensureChannel(const juce::String& trackId, TrackType type, const juce::String& presetId, juce::String& errorMessage)
    {
        if (hasChannel(trackId))
        {
            errorMessage.clear();
            return true;
        }

        std::unique_ptr<VoiceAdapter> adapter;
        if (isNoteTrackType(type))
        {
            adapter = buildAdapter(presetId, errorMessage);
            if (adapter == nullptr)
                return false;
        }

        auto channel = std::make_unique<Channel>(trackId, type, std::move(adapter));
        {
            juce::ScopedLock lock(rackLock);
            channel->prepare(sampleRate, blockSize);

            // Lost a race with another caller: keep theirs, drop ours outside the lock.
            if (findChannelLocked(trackId) == nullptr)
                channels.push_back(std::move(channel));
        }

        errorMessage.clear();
        return true;
    }

    bool ChannelRack::ensureChannel(const Track& track, juce::String& errorMessage)
    {
        if (!ensureChannel(track.id, track.type, track.getPresetId(), errorMessage))
            return false;
        applyMixSettings(track);
        return true;
    }

    bool ChannelRack::setTrackInstrument(const juce::String& trackId, const juce::String& presetId, juce::String& errorMessage)
    {
        const auto& resolved = PresetLibrary::resolve(presetId, config.defaultPresetId);
        {
            juce::ScopedLock lock(rackLock);
            auto* channel = findChannelLocked(trackId);
            if (channel == nullptr)
            {
                errorMessage = "No channel for track " + trackId;
                return false;
            }
            if (!isNoteTrackType(channel->getTrackType()) || channel->getPresetId() == resolved.id)
            {
                errorMessage.clear();
                return true;
            }
        }

        auto adapter = buildAdapter(resolved.id, errorMessage);
        if (adapter == nullptr)
            return false;

        std::unique_ptr<VoiceAdapter> old;
        {
            juce::ScopedLock lock(rackLock);
            auto* channel = findChannelLocked(trackId);
            if (channel == nullptr)
            {
                errorMessage = "Track " + trackId + " was removed during the instrument swap";
                return false;
            }
            old = channel->swapAdapter(std::move(adapter));
        }

        juce::Logger::writeToLog("Cadence: track " + trackId + " now plays " + resolved.id);
        errorMessage.clear();
        return true;
    }

    bool ChannelRack::removeChannel(const juce::String& trackId)
    {
        std::unique_ptr<Channel> removed;
        {
            juce::ScopedLock lock(rackLock);
            const auto it = std::find_if(channels.begin(), channels.end(),
                                         [&](const std::unique_ptr<Channel>& c) { return c->getTrackId() == trackId; });
            if (it == channels.end())
                return false;

            (*it)->clearSchedule();
            (*it)->releaseAll();
            removed = std::move(*it);
            channels.erase(it);
        }
        return true;
    }

    void ChannelRack::removeAllChannels()
    {
        std::vector<std::unique_ptr<Channel>> removed;
        {
            juce::ScopedLock lock(rackLock);
            for (auto& channel : channels)
            {
                channel->clearSchedule();
                channel->releaseAll();
            }
            removed.swap(channels);
        }
    }

    Channel* ChannelRack::findChannelLocked(const juce::String& trackId) const
    {
        for (const auto& channel : channels)
            if (channel->getTrackId() == trackId)
                return channel.get();
        return nullptr;
    }

    bool ChannelRack::hasChannel(const juce::String& trackId) const
    {
        juce::ScopedLock lock(rackLock);
        return findChannelLocked(trackId) != nullptr;
    }

    int ChannelRack::getNumChannels() const
    {
        juce::ScopedLock lock(rackLock);
        return static_cast<int>(channels.size());
    }

    std::vector<juce::String> ChannelRack::getChannelIds() const
    {
        juce::ScopedLock lock(rackLock);
        std::vector<juce::String> ids;
        ids.reserve(channels.size());
        for (const auto& channel : channels)
            ids.push_back(channel->getTrackId());
        return ids;
    }

    juce::String ChannelRack::getChannelPresetId(const juce::String& trackId) const
    {
        juce::ScopedLock lock(rackLock);
        if (auto* channel = findChannelLocked(trackId))
            return channel->getPresetId();
        return {};
    }

    int ChannelRack::getInstrumentRevision(const juce::String& trackId) const
    {
        juce::ScopedLock lock(rackLock);
        if (auto* channel = findChannelLocked(trackId))
            return channel->getInstrumentRevision();
        return 0;
    }

    int ChannelRack::getNumActiveVoices(const juce::String& trackId) const
    {
        juce::ScopedLock lock(rackLock);
        if (auto* channel = findChannelLocked(trackId); channel != nullptr && channel->getAdapter() != nullptr)
            return channel->getAdapter()->getNumActiveVoices();
        return 0;
    }

    bool ChannelRack::waitForSamples(const juce::String& trackId, int timeoutMs)
    {
        // Polls rather than blocking on the adapter so a concurrent swap cannot free it mid-wait.
        const auto deadline = juce::Time::getMillisecondCounter() + static_cast<juce::uint32>(juce::jmax(0, timeoutMs));
        for (;;)
        {
            {
                juce::ScopedLock lock(rackLock);
                auto* channel = trackId.isEmpty() ? previewChannel.get() : findChannelLocked(trackId);
                if (channel == nullptr || channel->getAdapter() == nullptr)
                    return false;
                if (channel->getAdapter()->isLoaded())
                    return true;
            }

            if (juce::Time::getMillisecondCounter() >= deadline)
                return false;
            juce::Thread::sleep(5);
        }
    }

    //==============================================================================
    void ChannelRack::setTrackVolume(const juce::String& trackId, float volume)
    {
        juce::ScopedLock lock(rackLock);
        if (auto* channel = findChannelLocked(trackId))
            channel->setVolume(volume);
    }

    void ChannelRack::setTrackPan(const juce::String& trackId, float pan)
    {
        juce::ScopedLock lock(rackLock);
        if (auto* channel = findChannelLocked(trackId))
            channel->setPan(pan);
    }

    void ChannelRack::setTrackMute(const juce::String& trackId, bool muted)
    {
        juce::ScopedLock lock(rackLock);
        if (auto* channel = findChannelLocked(trackId))
            channel->setMuted(muted);
    }

    void ChannelRack::setTrackSolo(const juce::String& trackId, bool solo)
    {
        juce::ScopedLock lock(rackLock);
        if (auto* channel = findChannelLocked(trackId))
            channel->setSolo(solo);
    }

    void ChannelRack::applyMixSettings(const Track& track)
    {
        juce::ScopedLock lock(rackLock);
        if (auto* channel = findChannelLocked(track.id))
        {
            channel->setVolume(track.volume);
            channel->setPan(track.pan);
            channel->setMuted(track.muted);
            channel->setSolo(track.solo);
        }
    }

    //==============================================================================
    void ChannelRack::triggerAttack(const juce::String& trackId, int pitch, int velocity)
    {
        juce::ScopedLock lock(rackLock);
        if (auto* channel = findChannelLocked(trackId); channel != nullptr && channel->getAdapter() != nullptr)
            channel->getAdapter()->attack(pitch, juce::jlimit(0, 127, velocity) / 127.0f);
    }

    void ChannelRack::triggerRelease(const juce::String& trackId, int pitch)
    {
        juce::ScopedLock lock(rackLock);
        if (auto* channel = findChannelLocked(trackId); channel != nullptr && channel->getAdapter() != nullptr)
            channel->getAdapter()->release(pitch);
    }

    void ChannelRack::previewNote(int pitch, double durationSeconds, const juce::String& trackId)
    {
        if (trackId.isEmpty())
        {
            bool needsPreviewVoice = false;
            {
                juce::ScopedLock lock(rackLock);
                needsPreviewVoice = previewChannel == nullptr;
            }

            if (needsPreviewVoice)
            {
                juce::String error;
                auto adapter = buildAdapter(config.defaultPresetId, error);
                if (adapter == nullptr)
                    return;

                auto channel = std::make_unique<Channel>(juce::String(), TrackType::Instrument, std::move(adapter));
                juce::ScopedLock lock(rackLock);
                channel->prepare(sampleRate, blockSize);
                if (previewChannel == nullptr)
                    previewChannel = std::move(channel);
            }
        }

        bool sampleBased = false;
        {
            juce::ScopedLock lock(rackLock);
            auto* channel = trackId.isEmpty() ? previewChannel.get() : findChannelLocked(trackId);
            if (channel == nullptr || channel->getAdapter() == nullptr)
                return;
            sampleBased = channel->getAdapter()->getFamily() == VoiceFamily::SampleBased;
        }

        if (sampleBased && !waitForSamples(trackId, config.sampleLoadTimeoutMs))
            juce::Logger::writeToLog("Cadence: samples not ready for preview on track " + trackId);

        juce::ScopedLock lock(rackLock);
        auto* channel = trackId.isEmpty() ? previewChannel.get() : findChannelLocked(trackId);
        if (channel != nullptr && channel->getAdapter() != nullptr)
            channel->getAdapter()->attackRelease(pitch, durationSeconds, 0.8f);
    }

    //==============================================================================
    void ChannelRack::setSchedule(const juce::String& trackId, std::vector<ScheduledTrigger> triggers, double transportSeconds)
    {
        juce::ScopedLock lock(rackLock);
        if (auto* channel = findChannelLocked(trackId))
            channel->setSchedule(std::move(triggers), transportSeconds);
    }

    void ChannelRack::clearSchedule(const juce::String& trackId)
    {
        juce::ScopedLock lock(rackLock);
        if (auto* channel = findChannelLocked(trackId))
            channel->clearSchedule();
    }

    void ChannelRack::clearAllSchedules()
    {
        juce::ScopedLock lock(rackLock);
        for (auto& channel : channels)
            channel->clearSchedule();
    }

    std::vector<ScheduledTrigger> ChannelRack::getSchedule(const juce::String& trackId) const
    {
        juce::ScopedLock lock(rackLock);
        if (auto* channel = findChannelLocked(trackId))
            return channel->getSchedule();
        return {};
    }

    void ChannelRack::resetScheduleCursors(double transportSeconds)
    {
        juce::ScopedLock lock(rackLock);
        for (auto& channel : channels)
            channel->resetScheduleCursor(transportSeconds);
    }

    void ChannelRack::releaseAll()
    {
        juce::ScopedLock lock(rackLock);
        for (auto& channel : channels)
            channel->releaseAll();
        if (previewChannel != nullptr)
            previewChannel->releaseAll();
    }

    void ChannelRack::renderSegment(juce::AudioBuffer<float>& mix,
                                    int startSample,
                                    int numSamples,
                                    double segmentStartSeconds,
                                    double segmentEndSeconds,
                                    bool transportRunning)
    {
        juce::ScopedLock lock(rackLock);

        const bool anySolo = std::any_of(channels.begin(), channels.end(),
                                         [](const std::unique_ptr<Channel>& c) { return c->isSolo(); });

        for (auto& channel : channels)
        {
            if (transportRunning)
                channel->fireScheduled(segmentStartSeconds, segmentEndSeconds);

            const bool audible = !channel->isMuted() && (!anySolo || channel->isSolo());
            channel->render(mix, startSample, numSamples, audible);
        }

        if (previewChannel != nullptr)
            previewChannel->render(mix, startSample, numSamples, true);
    }
}
