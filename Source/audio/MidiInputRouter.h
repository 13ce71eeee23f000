#pragma once
#include <juce_audio_devices/juce_audio_devices.h>
#include <memory>
#include <vector>
#include "LiveCapture.h"

namespace cadence
{
    // Feeds hardware MIDI input into LiveCapture on the MIDI thread.
    class MidiInputRouter final : public juce::MidiInputCallback
    {
    public:
        explicit MidiInputRouter(LiveCapture& captureToUse);
        ~MidiInputRouter() override;

        std::vector<juce::MidiDeviceInfo> getInputs() const;

        // Closes any open device first. An empty identifier picks the default input.
        bool openDevice(const juce::String& identifier, juce::String& errorMessage);
        void closeDevice();
        juce::String getActiveInputName() const;

        // Note-on with velocity 0 is a note-off.
        void handleIncomingMidiMessage(juce::MidiInput* source, const juce::MidiMessage& message) override;

    private:
        LiveCapture& capture;
        std::unique_ptr<juce::MidiInput> input;

        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MidiInputRouter)
    };
}
