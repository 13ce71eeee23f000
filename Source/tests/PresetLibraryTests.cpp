#include <juce_core/juce_core.h>
#include <set>
#include "../engine/PresetLibrary.h"

using namespace cadence;

class PresetLibraryTests final : public juce::UnitTest
{
public:
    PresetLibraryTests() : juce::UnitTest("Preset library", "Cadence") {}

    void runTest() override
    {
        beginTest("Ids are unique and every category is populated");
        {
            std::set<juce::String> ids;
            for (const auto& preset : PresetLibrary::getAll())
            {
                expect(ids.insert(preset.id).second, "duplicate preset " + preset.id);
                expect(preset.name.isNotEmpty());
            }

            for (auto category : { PresetCategory::Keys, PresetCategory::Leads, PresetCategory::Pads, PresetCategory::Bass,
                                   PresetCategory::Plucked, PresetCategory::Bells, PresetCategory::Drums, PresetCategory::Fx })
                expect(!PresetLibrary::getByCategory(category).empty(), presetCategoryToString(category));
        }

        beginTest("Unknown ids resolve to the default preset");
        {
            expectEquals(PresetLibrary::resolve("no-such-preset").id, juce::String("triangle-lead"));
            expectEquals(PresetLibrary::resolve({}).id, juce::String("triangle-lead"));
            expectEquals(PresetLibrary::resolve("bogus", "warm-pad").id, juce::String("warm-pad"));
            expectEquals(PresetLibrary::resolve("bogus", "also-bogus").id, juce::String("triangle-lead"));
            expectEquals(PresetLibrary::resolve("fm-bell").id, juce::String("fm-bell"));
            expect(PresetLibrary::find("nope") == nullptr);
        }

        beginTest("Legacy instrument types migrate to presets");
        {
            expectEquals(PresetLibrary::migratePresetId("organ", "fm-synth"), juce::String("organ"));
            expectEquals(PresetLibrary::migratePresetId({}, "fm-synth"), juce::String("electric-piano"));
            expectEquals(PresetLibrary::migratePresetId({}, "membrane"), juce::String("kick"));
            expectEquals(PresetLibrary::migratePresetId({}, "metal"), juce::String("hi-hat"));
            expectEquals(PresetLibrary::migratePresetId({}, "am-synth"), juce::String("am-pad"));
            expectEquals(PresetLibrary::migratePresetId({}, "theremin"), juce::String("triangle-lead"));
            expectEquals(PresetLibrary::migratePresetId({}, {}), juce::String("triangle-lead"));

            for (const auto& legacy : { "synth", "am-synth", "fm-synth", "membrane", "metal", "sampler" })
                expect(PresetLibrary::contains(PresetLibrary::migratePresetId({}, legacy)));
        }

        beginTest("Role defaults");
        {
            expectEquals(PresetLibrary::getRoleDefault("drums"), juce::String("acoustic-kit"));
            expectEquals(PresetLibrary::getRoleDefault("Bass"), juce::String("synth-bass"));
            expectEquals(PresetLibrary::getRoleDefault("chords"), juce::String("warm-pad"));
            expectEquals(PresetLibrary::getRoleDefault("lead"), juce::String("saw-lead"));
            expectEquals(PresetLibrary::getRoleDefault("kazoo"), juce::String("triangle-lead"));
        }

        beginTest("Voice families");
        {
            expect(PresetLibrary::resolve("triangle-lead").getVoiceFamily() == VoiceFamily::Polyphonic);
            expect(PresetLibrary::resolve("kick").getVoiceFamily() == VoiceFamily::Monophonic);
            expect(PresetLibrary::resolve("acoustic-kit").getVoiceFamily() == VoiceFamily::SampleBased);
            expect(PresetLibrary::resolve("kick").isOneShot());
            expect(PresetLibrary::resolve("guitar").isOneShot());
            expect(!PresetLibrary::resolve("acid-bass").isOneShot());
            expect(!PresetLibrary::resolve("acoustic-kit").sampleMap.empty());
        }
    }
};

static PresetLibraryTests presetLibraryTests;
