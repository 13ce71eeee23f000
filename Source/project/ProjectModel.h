#pragma once
#include <juce_core/juce_core.h>
#include <functional>
#include <optional>
#include <tuple>
#include <vector>

namespace cadence
{
    // --- Data Types ---
    enum class TrackType
    {
        Audio,
        Midi,
        Instrument
    };

    juce::String trackTypeToString(TrackType type);
    TrackType trackTypeFromString(const juce::String& text);

    inline bool isNoteTrackType(TrackType type)
    {
        return type == TrackType::Midi || type == TrackType::Instrument;
    }

    struct Note
    {
        juce::String id;
        int pitch = 60;
        double startBeat = 0.0;      // relative to the owning clip's start
        double durationBeats = 1.0;
        int velocity = 100;

        bool operator==(const Note& other) const
        {
            return std::tie(id, pitch, startBeat, durationBeats, velocity)
                == std::tie(other.id, other.pitch, other.startBeat, other.durationBeats, other.velocity);
        }
    };

    struct Clip
    {
        juce::String id;
        juce::String trackId;
        juce::String name = "Clip";
        double startBeat = 0.0;
        double durationBeats = 4.0;

        // Note content (midi / instrument tracks)
        std::vector<Note> notes;

        // Audio content: reference only, the engine does not decode it.
        juce::String audioSource;

        bool hasNotes() const { return !notes.empty(); }
        double getEndBeat() const { return startBeat + durationBeats; }

        Note* findNote(const juce::String& noteId);
        void sortNotes();

        bool operator==(const Clip& other) const
        {
            return std::tie(id, trackId, name, startBeat, durationBeats, notes, audioSource)
                == std::tie(other.id, other.trackId, other.name, other.startBeat, other.durationBeats, other.notes, other.audioSource);
        }
    };

    struct InstrumentSettings
    {
        juce::String presetId;
        // Synth type stored by projects that predate presets ("fm-synth", "membrane", ...).
        juce::String legacyType;

        bool operator==(const InstrumentSettings& other) const
        {
            return presetId == other.presetId && legacyType == other.legacyType;
        }
    };

    struct Track
    {
        juce::String id;
        juce::String name;
        TrackType type = TrackType::Instrument;
        juce::String colour = "#6c63ff";
        float volume = 0.8f;
        float pan = 0.0f;
        bool muted = false;
        bool solo = false;
        bool armed = false;
        std::optional<InstrumentSettings> instrument;
        std::vector<Clip> clips;

        bool isNoteTrack() const { return isNoteTrackType(type); }
        juce::String getPresetId() const { return instrument.has_value() ? instrument->presetId : juce::String(); }
        Clip* findClip(const juce::String& clipId);
        const Clip* findClip(const juce::String& clipId) const;
    };

    struct TimeSignature
    {
        int numerator = 4;
        int denominator = 4;

        double getBeatsPerBar() const
        {
            return static_cast<double>(juce::jmax(1, numerator)) * (4.0 / static_cast<double>(juce::jmax(1, denominator)));
        }
    };

    struct Project
    {
        static constexpr double minBpm = 20.0;
        static constexpr double maxBpm = 300.0;

        juce::String id;
        juce::String name = "Untitled Project";
        double bpm = 120.0;
        TimeSignature timeSignature;
        double sampleRate = 44100.0;
        std::vector<Track> tracks;

        Track* findTrack(const juce::String& trackId);
        const Track* findTrack(const juce::String& trackId) const;
        Clip* findClip(const juce::String& clipId, Track** owner = nullptr);
        const Clip* findClip(const juce::String& clipId) const;
    };

    juce::String makeId();

    // The project store. Every operation locks; readers get copies so the
    // audio and MIDI threads never hold references into the live tree.
    class ProjectModel final
    {
    public:
        ProjectModel();

        Project getSnapshot() const;
        void hydrate(Project project);

        juce::String getProjectId() const;
        void setProjectName(const juce::String& newName);
        double getTempo() const;
        double setTempo(double bpm);
        TimeSignature getTimeSignature() const;
        void setTimeSignature(int numerator, int denominator);

        // --- Tracks ---
        Track addTrack(TrackType type, const juce::String& name = {});
        bool removeTrack(const juce::String& trackId);
        bool updateTrack(const juce::String& trackId, const std::function<void(Track&)>& edit);
        bool reorderTracks(int fromIndex, int toIndex);
        std::optional<Track> getTrack(const juce::String& trackId) const;
        std::optional<Track> findFirstArmedTrack() const;
        // Armed track, else the first midi/instrument track. Only the id is copied.
        juce::String findLiveInputTargetId() const;
        std::vector<juce::String> getTrackIds() const;

        // --- Clips ---
        juce::String addClip(const juce::String& trackId, double startBeat, double durationBeats = 4.0);
        bool removeClip(const juce::String& clipId);
        bool updateClip(const juce::String& clipId, const std::function<void(Clip&)>& edit);
        bool moveClip(const juce::String& clipId, const juce::String& newTrackId, double newStartBeat);
        std::optional<Clip> getClip(const juce::String& clipId) const;
        juce::String getTrackIdForClip(const juce::String& clipId) const;

        // --- Notes ---
        juce::String addNote(const juce::String& clipId, Note note);
        bool removeNote(const juce::String& clipId, const juce::String& noteId);
        bool updateNote(const juce::String& clipId, const juce::String& noteId, const std::function<void(Note&)>& edit);

    private:
        static void sanitiseNote(Note& note);

        mutable juce::CriticalSection modelLock;
        Project project;

        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ProjectModel)
    };
}
