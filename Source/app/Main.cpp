#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_events/juce_events.h>
#include <iostream>
#include <memory>

#include "../AppMetadata.h"
#include "../audio/MidiInputRouter.h"
#include "../engine/DawEngine.h"
#include "../engine/PresetLibrary.h"

using namespace cadence;

namespace
{
    static juce::String getCommandArgValue(const juce::StringArray& tokens, const juce::String& key)
    {
        const auto keyWithEquals = key + "=";
        for (int i = 0; i < tokens.size(); ++i)
        {
            auto token = tokens[i].trim();
            if (token.startsWithIgnoreCase(keyWithEquals))
                return token.fromFirstOccurrenceOf("=", false, false).trim().unquoted();
            if (token.equalsIgnoreCase(key) && i + 1 < tokens.size())
                return tokens[i + 1].trim().unquoted();
        }
        return {};
    }

    static bool hasArg(const juce::StringArray& tokens, const juce::String& key)
    {
        const auto keyWithEquals = key + "=";
        for (auto token : tokens)
        {
            token = token.trim();
            if (token.equalsIgnoreCase(key) || token.startsWithIgnoreCase(keyWithEquals))
                return true;
        }
        return false;
    }

    static juce::String familyName(VoiceFamily family)
    {
        switch (family)
        {
            case VoiceFamily::Polyphonic:  return "poly";
            case VoiceFamily::Monophonic:  return "mono";
            case VoiceFamily::SampleBased: return "sampler";
        }
        return "poly";
    }

    static void printUsage()
    {
        std::cout << meta::productName << " " << meta::versionString << "\n"
                  << "  --presets                          list instrument presets\n"
                  << "  --render <file.wav> [--preset id] [--bpm n] [--seconds n]\n"
                  << "                                     render a demo phrase offline\n"
                  << "  --play <seconds> [--record] [--preset id] [--midi id]\n"
                  << "                                     play live on the default audio device\n"
                  << "  --config <file>                    engine settings (XML)\n";
    }

    static int runPresetListMode()
    {
        for (const auto& preset : PresetLibrary::getAll())
        {
            std::cout << preset.id.paddedRight(' ', 18)
                      << presetCategoryToString(preset.category).paddedRight(' ', 9)
                      << familyName(preset.getVoiceFamily()).paddedRight(' ', 9)
                      << preset.name << "\n";
        }
        return 0;
    }

    // One instrument track with a two-bar arpeggio.
    static juce::String buildDemoProject(DawEngine& engine, const juce::String& presetId)
    {
        auto track = engine.addTrack(TrackType::Instrument, "Demo");
        juce::String error;
        if (!engine.setTrackInstrument(track.id, presetId, error))
            std::cout << "WARNING: " << error << "\n";

        const auto clipId = engine.getProject().addClip(track.id, 0.0, 8.0);
        static constexpr int phrase[] = { 60, 64, 67, 72, 67, 64, 60, 55 };
        double beat = 0.0;
        for (auto pitch : phrase)
        {
            Note note;
            note.pitch = pitch;
            note.startBeat = beat;
            note.durationBeats = 0.75;
            note.velocity = 100;
            engine.getProject().addNote(clipId, note);
            beat += 1.0;
        }
        return track.id;
    }

    static int runRenderMode(const juce::StringArray& tokens, const EngineConfig& config)
    {
        const auto destination = juce::File::getCurrentWorkingDirectory().getChildFile(getCommandArgValue(tokens, "--render"));
        if (getCommandArgValue(tokens, "--render").isEmpty())
        {
            std::cout << "ERROR: --render needs an output file.\n";
            return 2;
        }

        const auto presetArg = getCommandArgValue(tokens, "--preset");
        const auto bpmArg = getCommandArgValue(tokens, "--bpm");
        const auto secondsArg = getCommandArgValue(tokens, "--seconds");

        DawEngine engine(config);
        if (bpmArg.isNotEmpty())
            engine.setTempo(bpmArg.getDoubleValue());

        buildDemoProject(engine, presetArg.isNotEmpty() ? presetArg : config.defaultPresetId);
        const auto seconds = secondsArg.isNotEmpty()
            ? juce::jmax(0.1, secondsArg.getDoubleValue())
            : engine.getTransport().beatsToSeconds(8.0) + 1.0;

        // Sample kits stream in on a pool thread.
        for (const auto& trackId : engine.getProject().getTrackIds())
            engine.getChannels().waitForSamples(trackId, config.sampleLoadTimeoutMs);

        engine.play();
        juce::String error;
        if (!engine.renderToFile(destination, seconds, error))
        {
            std::cout << "ERROR: " << error << "\n";
            return 1;
        }
        engine.stop();

        if (engine.getMasterBus().hadOutputFault())
            std::cout << "WARNING: master bus caught non-finite output.\n";
        std::cout << "OK: " << destination.getFullPathName() << "\n";
        return 0;
    }

    static int runLiveMode(const juce::StringArray& tokens, const EngineConfig& config)
    {
        const auto seconds = juce::jmax(1.0, getCommandArgValue(tokens, "--play").getDoubleValue());
        const auto presetArg = getCommandArgValue(tokens, "--preset");

        juce::ScopedJuceInitialiser_GUI juceInit;
        DawEngine engine(config);
        const auto trackId = buildDemoProject(engine, presetArg.isNotEmpty() ? presetArg : config.defaultPresetId);
        engine.setTrackArmed(trackId, true);

        juce::AudioDeviceManager deviceManager;
        const auto deviceError = deviceManager.initialiseWithDefaultDevices(0, 2);
        if (deviceError.isNotEmpty())
        {
            std::cout << "ERROR: " << deviceError << "\n";
            return 1;
        }
        deviceManager.addAudioCallback(&engine);

        MidiInputRouter midiRouter(engine.getLiveCapture());
        juce::String midiError;
        if (!midiRouter.openDevice(getCommandArgValue(tokens, "--midi"), midiError))
            std::cout << "WARNING: " << midiError << "\n";

        juce::String error;
        if (hasArg(tokens, "--record"))
        {
            if (!engine.record(error))
                std::cout << "WARNING: " << error << "\n";
        }
        else
        {
            engine.play();
        }

        const auto endTime = juce::Time::getMillisecondCounterHiRes() + seconds * 1000.0;
        while (juce::Time::getMillisecondCounterHiRes() < endTime)
        {
            engine.getLiveCapture().updateRecordingClipLength();
            juce::Thread::sleep(30);
        }

        engine.stop();
        midiRouter.closeDevice();
        deviceManager.removeAudioCallback(&engine);
        deviceManager.closeAudioDevice();

        int recordedNotes = 0;
        if (const auto track = engine.getProject().getTrack(trackId))
            for (const auto& clip : track->clips)
                recordedNotes += static_cast<int>(clip.notes.size());
        std::cout << "OK: played " << seconds << " s, " << recordedNotes << " notes on the demo track.\n";
        return 0;
    }
}

int main(int argc, char* argv[])
{
    juce::StringArray args;
    for (int i = 1; i < argc; ++i)
        args.add(juce::String(argv[i]));

    std::unique_ptr<juce::FileLogger> logger(juce::FileLogger::createDefaultAppLogger(meta::appDataFolder,
                                                                                      "cadence-host.log",
                                                                                      juce::String(meta::productName) + " " + meta::versionString));
    juce::Logger::setCurrentLogger(logger.get());

    EngineConfig config;
    auto configFile = EngineConfig::getDefaultConfigFile();
    const auto configArg = getCommandArgValue(args, "--config");
    if (configArg.isNotEmpty())
        configFile = juce::File::getCurrentWorkingDirectory().getChildFile(configArg);

    if (configFile.existsAsFile() || configArg.isNotEmpty())
    {
        juce::String error;
        if (!EngineConfig::loadFromFile(configFile, config, error))
            std::cout << "WARNING: " << error << " (using defaults)\n";
    }

    int result = 0;
    if (hasArg(args, "--presets"))
        result = runPresetListMode();
    else if (hasArg(args, "--render"))
        result = runRenderMode(args, config);
    else if (hasArg(args, "--play"))
        result = runLiveMode(args, config);
    else
        printUsage();

    juce::Logger::setCurrentLogger(nullptr);
    return result;
}
