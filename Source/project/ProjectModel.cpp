#include "ProjectModel.h"
#include <algorithm>

namespace cadence
{
    namespace
    {
        const char* const trackColours[] = {
            "#6c63ff", "#ff6584", "#43e97b", "#f7971e",
            "#38f9d7", "#fa709a", "#fee140", "#a18cd1"
        };
        constexpr int numTrackColours = static_cast<int>(sizeof(trackColours) / sizeof(trackColours[0]));

        template <typename Vec, typename Id>
        auto findById(Vec& items, const Id& id) -> decltype(&items.front())
        {
            for (auto& item : items)
                if (item.id == id)
                    return &item;
            return nullptr;
        }
    }

    juce::String trackTypeToString(TrackType type)
    {
        switch (type)
        {
            case TrackType::Audio: return "audio";
            case TrackType::Midi: return "midi";
            case TrackType::Instrument:
            default: return "instrument";
        }
    }

    TrackType trackTypeFromString(const juce::String& text)
    {
        const auto lowered = text.trim().toLowerCase();
        if (lowered == "audio")
            return TrackType::Audio;
        if (lowered == "midi")
            return TrackType::Midi;
        return TrackType::Instrument;
    }

    juce::String makeId()
    {
        return juce::Uuid().toDashedString();
    }

    Note* Clip::findNote(const juce::String& noteId)
    {
        return findById(notes, noteId);
    }

    void Clip::sortNotes()
    {
        std::stable_sort(notes.begin(), notes.end(), [](const Note& a, const Note& b)
        {
            return a.startBeat < b.startBeat;
        });
    }

    Clip* Track::findClip(const juce::String& clipId)
    {
        return findById(clips, clipId);
    }

    const Clip* Track::findClip(const juce::String& clipId) const
    {
        for (const auto& clip : clips)
            if (clip.id == clipId)
                return &clip;
        return nullptr;
    }

    Track* Project::findTrack(const juce::String& trackId)
    {
        return findById(tracks, trackId);
    }

    const Track* Project::findTrack(const juce::String& trackId) const
    {
        for (const auto& track : tracks)
            if (track.id == trackId)
                return &track;
        return nullptr;
    }

    Clip* Project::findClip(const juce::String& clipId, Track** owner)
    {
        for (auto& track : tracks)
        {
            if (auto* clip = track.findClip(clipId))
            {
                if (owner != nullptr)
                    *owner = &track;
                return clip;
            }
        }
        return nullptr;
    }

    const Clip* Project::findClip(const juce::String& clipId) const
    {
        for (const auto& track : tracks)
            if (const auto* clip = track.findClip(clipId))
                return clip;
        return nullptr;
    }

    //==============================================================================
    ProjectModel::ProjectModel()
    {
        project.id = makeId();
    }

    Project ProjectModel::getSnapshot() const
    {
        juce::ScopedLock lock(modelLock);
        return project;
    }

    void ProjectModel::hydrate(Project newProject)
    {
        newProject.bpm = juce::jlimit(Project::minBpm, Project::maxBpm, newProject.bpm);
        if (newProject.id.isEmpty())
            newProject.id = makeId();

        for (auto& track : newProject.tracks)
        {
            for (auto& clip : track.clips)
            {
                clip.trackId = track.id;
                for (auto& note : clip.notes)
                {
                    if (note.id.isEmpty())
                        note.id = makeId();
                    sanitiseNote(note);
                }
                clip.sortNotes();
            }
        }

        juce::ScopedLock lock(modelLock);
        project = std::move(newProject);
    }

    juce::String ProjectModel::getProjectId() const
    {
        juce::ScopedLock lock(modelLock);
        return project.id;
    }

    void ProjectModel::setProjectName(const juce::String& newName)
    {
        juce::ScopedLock lock(modelLock);
        project.name = newName;
    }

    double ProjectModel::getTempo() const
    {
        juce::ScopedLock lock(modelLock);
        return project.bpm;
    }

    double ProjectModel::setTempo(double bpm)
    {
        juce::ScopedLock lock(modelLock);
        project.bpm = juce::jlimit(Project::minBpm, Project::maxBpm, bpm);
        return project.bpm;
    }

    TimeSignature ProjectModel::getTimeSignature() const
    {
        juce::ScopedLock lock(modelLock);
        return project.timeSignature;
    }

    void ProjectModel::setTimeSignature(int numerator, int denominator)
    {
        juce::ScopedLock lock(modelLock);
        project.timeSignature.numerator = juce::jlimit(1, 32, numerator);
        project.timeSignature.denominator = juce::jlimit(1, 32, denominator);
    }

    //==============================================================================
    Track ProjectModel::addTrack(TrackType type, const juce::String& name)
    {
        juce::ScopedLock lock(modelLock);

        Track track;
        track.id = makeId();
        track.type = type;
        const auto index = static_cast<int>(project.tracks.size());
        track.name = name.isNotEmpty() ? name : ("Track " + juce::String(index + 1));
        track.colour = trackColours[index % numTrackColours];
        if (type != TrackType::Audio)
            track.instrument = InstrumentSettings {};

        project.tracks.push_back(track);
        return track;
    }

    bool ProjectModel::removeTrack(const juce::String& trackId)
    {
        juce::ScopedLock lock(modelLock);
        const auto before = project.tracks.size();
        project.tracks.erase(std::remove_if(project.tracks.begin(), project.tracks.end(),
                                            [&](const Track& t) { return t.id == trackId; }),
                             project.tracks.end());
        return project.tracks.size() != before;
    }

    bool ProjectModel::updateTrack(const juce::String& trackId, const std::function<void(Track&)>& edit)
    {
        juce::ScopedLock lock(modelLock);
        auto* track = project.findTrack(trackId);
        if (track == nullptr || !edit)
            return false;

        const auto id = track->id;
        edit(*track);
        track->id = id;
        track->volume = juce::jlimit(0.0f, 1.0f, track->volume);
        track->pan = juce::jlimit(-1.0f, 1.0f, track->pan);
        return true;
    }

    bool ProjectModel::reorderTracks(int fromIndex, int toIndex)
    {
        juce::ScopedLock lock(modelLock);
        const auto count = static_cast<int>(project.tracks.size());
        if (!juce::isPositiveAndBelow(fromIndex, count) || !juce::isPositiveAndBelow(toIndex, count))
            return false;
        if (fromIndex == toIndex)
            return true;

        auto moved = std::move(project.tracks[static_cast<size_t>(fromIndex)]);
        project.tracks.erase(project.tracks.begin() + fromIndex);
        project.tracks.insert(project.tracks.begin() + toIndex, std::move(moved));
        return true;
    }

    std::optional<Track> ProjectModel::getTrack(const juce::String& trackId) const
    {
        juce::ScopedLock lock(modelLock);
        if (const auto* track = project.findTrack(trackId))
            return *track;
        return std::nullopt;
    }

    std::optional<Track> ProjectModel::findFirstArmedTrack() const
    {
        juce::ScopedLock lock(modelLock);
        for (const auto& track : project.tracks)
            if (track.armed)
                return track;
        return std::nullopt;
    }

    juce::String ProjectModel::findLiveInputTargetId() const
    {
        juce::ScopedLock lock(modelLock);
        for (const auto& track : project.tracks)
            if (track.armed)
                return track.id;
        for (const auto& track : project.tracks)
            if (track.isNoteTrack())
                return track.id;
        return {};
    }

    std::vector<juce::String> ProjectModel::getTrackIds() const
    {
        juce::ScopedLock lock(modelLock);
        std::vector<juce::String> ids;
        ids.reserve(project.tracks.size());
        for (const auto& track : project.tracks)
            ids.push_back(track.id);
        return ids;
    }

    //==============================================================================
    juce::String ProjectModel::addClip(const juce::String& trackId, double startBeat, double durationBeats)
    {
        juce::ScopedLock lock(modelLock);
        auto* track = project.findTrack(trackId);
        if (track == nullptr)
            return {};

        Clip clip;
        clip.id = makeId();
        clip.trackId = trackId;
        clip.name = track->name + " " + juce::String(static_cast<int>(track->clips.size()) + 1);
        clip.startBeat = juce::jmax(0.0, startBeat);
        clip.durationBeats = juce::jmax(0.0, durationBeats);
        track->clips.push_back(clip);
        return clip.id;
    }

    bool ProjectModel::removeClip(const juce::String& clipId)
    {
        juce::ScopedLock lock(modelLock);
        for (auto& track : project.tracks)
        {
            const auto before = track.clips.size();
            track.clips.erase(std::remove_if(track.clips.begin(), track.clips.end(),
                                             [&](const Clip& c) { return c.id == clipId; }),
                              track.clips.end());
            if (track.clips.size() != before)
                return true;
        }
        return false;
    }

    bool ProjectModel::updateClip(const juce::String& clipId, const std::function<void(Clip&)>& edit)
    {
        juce::ScopedLock lock(modelLock);
        auto* clip = project.findClip(clipId);
        if (clip == nullptr || !edit)
            return false;

        const auto id = clip->id;
        const auto trackId = clip->trackId;
        edit(*clip);
        clip->id = id;
        clip->trackId = trackId;
        clip->startBeat = juce::jmax(0.0, clip->startBeat);
        clip->durationBeats = juce::jmax(0.0, clip->durationBeats);
        for (auto& note : clip->notes)
        {
            if (note.id.isEmpty())
                note.id = makeId();
            sanitiseNote(note);
        }
        clip->sortNotes();
        return true;
    }

    bool ProjectModel::moveClip(const juce::String& clipId, const juce::String& newTrackId, double newStartBeat)
    {
        juce::ScopedLock lock(modelLock);
        Track* owner = nullptr;
        auto* clip = project.findClip(clipId, &owner);
        auto* destination = newTrackId.isEmpty() ? owner : project.findTrack(newTrackId);
        if (clip == nullptr || owner == nullptr || destination == nullptr)
            return false;

        clip->startBeat = juce::jmax(0.0, newStartBeat);
        if (destination == owner)
            return true;

        auto moved = std::move(*clip);
        moved.trackId = destination->id;
        owner->clips.erase(std::remove_if(owner->clips.begin(), owner->clips.end(),
                                          [&](const Clip& c) { return c.id == clipId; }),
                           owner->clips.end());
        destination->clips.push_back(std::move(moved));
        return true;
    }

    std::optional<Clip> ProjectModel::getClip(const juce::String& clipId) const
    {
        juce::ScopedLock lock(modelLock);
        if (const auto* clip = project.findClip(clipId))
            return *clip;
        return std::nullopt;
    }

    juce::String ProjectModel::getTrackIdForClip(const juce::String& clipId) const
    {
        juce::ScopedLock lock(modelLock);
        if (const auto* clip = project.findClip(clipId))
            return clip->trackId;
        return {};
    }

    //==============================================================================
    juce::String ProjectModel::addNote(const juce::String& clipId, Note note)
    {
        juce::ScopedLock lock(modelLock);
        auto* clip = project.findClip(clipId);
        if (clip == nullptr)
            return {};

        note.id = makeId();
        sanitiseNote(note);
        clip->notes.push_back(note);
        clip->sortNotes();
        return note.id;
    }

    bool ProjectModel::removeNote(const juce::String& clipId, const juce::String& noteId)
    {
        juce::ScopedLock lock(modelLock);
        auto* clip = project.findClip(clipId);
        if (clip == nullptr)
            return false;

        const auto before = clip->notes.size();
        clip->notes.erase(std::remove_if(clip->notes.begin(), clip->notes.end(),
                                         [&](const Note& n) { return n.id == noteId; }),
                          clip->notes.end());
        return clip->notes.size() != before;
    }

    bool ProjectModel::updateNote(const juce::String& clipId, const juce::String& noteId, const std::function<void(Note&)>& edit)
    {
        juce::ScopedLock lock(modelLock);
        auto* clip = project.findClip(clipId);
        if (clip == nullptr || !edit)
            return false;

        auto* note = clip->findNote(noteId);
        if (note == nullptr)
            return false;

        edit(*note);
        note->id = noteId;
        sanitiseNote(*note);
        clip->sortNotes();
        return true;
    }

    void ProjectModel::sanitiseNote(Note& note)
    {
        note.pitch = juce::jlimit(0, 127, note.pitch);
        note.velocity = juce::jlimit(0, 127, note.velocity);
        note.startBeat = juce::jmax(0.0, note.startBeat);
        if (!(note.durationBeats > 0.0))
            note.durationBeats = 0.001;
    }
}
