#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>
#include <iostream>

namespace
{
    juce::String getCommandArgValue(const juce::StringArray& tokens, const juce::String& key)
    {
        for (int i = 0; i < tokens.size(); ++i)
        {
            const auto& token = tokens[i];
            if (token == key && i + 1 < tokens.size())
                return tokens[i + 1];
            if (token.startsWith(key + "="))
                return token.fromFirstOccurrenceOf("=", false, false);
        }
        return {};
    }
}

int main(int argc, char* argv[])
{
    juce::ScopedJuceInitialiser_GUI juceInit;

    juce::StringArray tokens;
    for (int i = 1; i < argc; ++i)
        tokens.add(juce::String::fromUTF8(argv[i]));

    juce::UnitTestRunner runner;
    runner.setAssertOnFailure(false);

    const auto category = getCommandArgValue(tokens, "--category");
    if (category.isNotEmpty())
        runner.runTestsInCategory(category);
    else
        runner.runAllTests();

    int failures = 0;
    for (int i = 0; i < runner.getNumResults(); ++i)
        if (const auto* result = runner.getResult(i))
            failures += result->failures;

    if (failures > 0)
    {
        std::cout << "FAIL: " << failures << " assertion(s) failed" << std::endl;
        return 1;
    }

    std::cout << "PASS: " << runner.getNumResults() << " test groups" << std::endl;
    return 0;
}
