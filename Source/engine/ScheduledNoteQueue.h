#pragma once
#include <juce_audio_basics/juce_audio_basics.h>
#include <array>

namespace cadence
{
    // Fixed-capacity queue of MIDI messages keyed on an owner's private sample
    // clock. Delays are in samples from the start of the next processed block.
    class ScheduledNoteQueue
    {
    public:
        ScheduledNoteQueue() = default;

        bool schedule(const juce::MidiMessage& msg, int64_t delaySamples)
        {
            if (numEvents >= maxEvents)
                return false;

            ScheduledEvent ev;
            ev.msg = msg;
            ev.deliverySample = currentSample + juce::jmax<int64_t>(0, delaySamples);
            events[static_cast<size_t>(numEvents++)] = std::move(ev);
            return true;
        }

        // Drops note-offs for a pitch that would land at or after the given delay,
        // so a retriggered pitch is not cut short by its predecessor's release.
        void cancelNoteOffs(int noteNumber, int64_t fromDelaySamples)
        {
            const auto fromSample = currentSample + juce::jmax<int64_t>(0, fromDelaySamples);
            removeIf([noteNumber, fromSample](const ScheduledEvent& ev)
            {
                return ev.deliverySample >= fromSample && ev.msg.isNoteOff() && ev.msg.getNoteNumber() == noteNumber;
            });
        }

        // Moves every message due before the end of this block into the buffer,
        // positioned relative to startSample.
        void process(int startSample, int numSamples, juce::MidiBuffer& outputBuffer)
        {
            if (numSamples <= 0)
                return;

            const auto endSample = currentSample + numSamples;
            int write = 0;
            for (int i = 0; i < numEvents; ++i)
            {
                const auto& ev = events[static_cast<size_t>(i)];
                if (ev.deliverySample < endSample)
                {
                    const auto offset = static_cast<int>(juce::jlimit<int64_t>(0, numSamples - 1, ev.deliverySample - currentSample));
                    outputBuffer.addEvent(ev.msg, startSample + offset);
                }
                else
                {
                    events[static_cast<size_t>(write++)] = ev;
                }
            }
            numEvents = write;
            currentSample = endSample;
        }

        void clear()
        {
            numEvents = 0;
        }

        int getNumPending() const noexcept { return numEvents; }
        int64_t getCurrentSample() const noexcept { return currentSample; }

    private:
        struct ScheduledEvent
        {
            juce::MidiMessage msg;
            int64_t deliverySample = 0;
        };

        template <typename Predicate>
        void removeIf(Predicate&& shouldRemove)
        {
            int write = 0;
            for (int i = 0; i < numEvents; ++i)
            {
                if (shouldRemove(events[static_cast<size_t>(i)]))
                    continue;
                events[static_cast<size_t>(write++)] = events[static_cast<size_t>(i)];
            }
            numEvents = write;
        }

        static constexpr int maxEvents = 2048;
        std::array<ScheduledEvent, static_cast<size_t>(maxEvents)> events;
        int numEvents = 0;
        int64_t currentSample = 0;
    };
}
