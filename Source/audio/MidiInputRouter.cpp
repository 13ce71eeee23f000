#include "MidiInputRouter.h"

namespace cadence
{
    MidiInputRouter::MidiInputRouter(LiveCapture& captureToUse)
        : capture(captureToUse)
    {
    }

    MidiInputRouter::~MidiInputRouter()
    {
        closeDevice();
    }

    std::vector<juce::MidiDeviceInfo> MidiInputRouter::getInputs() const
    {
        const auto devices = juce::MidiInput::getAvailableDevices();
        std::vector<juce::MidiDeviceInfo> out;
        out.reserve(static_cast<size_t>(devices.size()));
        for (int i = 0; i < devices.size(); ++i)
            out.push_back(devices.getReference(i));
        return out;
    }

    bool MidiInputRouter::openDevice(const juce::String& identifier, juce::String& errorMessage)
    {
        closeDevice();

        auto deviceId = identifier;
        if (deviceId.isEmpty())
        {
            const auto inputs = getInputs();
            if (inputs.empty())
            {
                errorMessage = "No MIDI inputs available";
                return false;
            }
            deviceId = juce::MidiInput::getDefaultDevice().identifier;
            if (deviceId.isEmpty())
                deviceId = inputs.front().identifier;
        }

        input = juce::MidiInput::openDevice(deviceId, this);
        if (input == nullptr)
        {
            errorMessage = "Could not open MIDI input " + deviceId;
            return false;
        }

        input->start();
        juce::Logger::writeToLog("Cadence: MIDI input " + input->getName());
        return true;
    }

    void MidiInputRouter::closeDevice()
    {
        if (input != nullptr)
        {
            input->stop();
            input.reset();
        }
    }

    juce::String MidiInputRouter::getActiveInputName() const
    {
        return input != nullptr ? input->getName() : juce::String("None");
    }

    void MidiInputRouter::handleIncomingMidiMessage(juce::MidiInput*, const juce::MidiMessage& message)
    {
        if (message.isNoteOn())
            capture.noteOn(message.getNoteNumber(), message.getVelocity());
        else if (message.isNoteOff())
            capture.noteOff(message.getNoteNumber());
        else if (message.isAllNotesOff() || message.isAllSoundOff())
            capture.panic();
    }
}
