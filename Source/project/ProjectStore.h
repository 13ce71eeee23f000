#pragma once
#include <map>
#include "ProjectModel.h"

namespace cadence
{
    // Load/save contract for whatever persistence layer the host uses.
    // Both directions replace the whole project.
    class ProjectStore
    {
    public:
        virtual ~ProjectStore() = default;

        virtual bool load(const juce::String& projectId, Project& destination, juce::String& errorMessage) = 0;
        virtual bool save(const Project& project, juce::String& errorMessage) = 0;
    };

    class InMemoryProjectStore final : public ProjectStore
    {
    public:
        bool load(const juce::String& projectId, Project& destination, juce::String& errorMessage) override
        {
            juce::ScopedLock lock(storeLock);
            const auto it = projects.find(projectId);
            if (it == projects.end())
            {
                errorMessage = "Project not found: " + projectId;
                return false;
            }
            destination = it->second;
            return true;
        }

        bool save(const Project& project, juce::String& errorMessage) override
        {
            if (project.id.isEmpty())
            {
                errorMessage = "Project has no id";
                return false;
            }
            juce::ScopedLock lock(storeLock);
            projects[project.id] = project;
            return true;
        }

        bool contains(const juce::String& projectId) const
        {
            juce::ScopedLock lock(storeLock);
            return projects.count(projectId) > 0;
        }

    private:
        mutable juce::CriticalSection storeLock;
        std::map<juce::String, Project> projects;
    };
}
