#pragma once
#include <juce_core/juce_core.h>

/**
 * A uniquely named scratch directory that is deleted, with its contents,
 * when this object goes out of scope.
 */
class ScopedWorkingDirectory
{
public:
    /**
     * Creates `<baseDirectory>/<prefix>_<unique id>`. With no base directory
     * the system temp folder is used. Check isValid() before use.
     */
    explicit ScopedWorkingDirectory(const juce::String& prefix,
                                    const juce::File& baseDirectory = juce::File())
    {
        const juce::File base = baseDirectory != juce::File()
            ? baseDirectory
            : juce::File::getSpecialLocation(juce::File::tempDirectory);

        if (! base.isDirectory() && ! base.createDirectory().wasOk())
            return;

        const juce::String uniqueId = juce::String::toHexString(juce::Random::getSystemRandom().nextInt64())
                                    + "_" + juce::String(juce::Time::currentTimeMillis());

        const juce::File candidate = base.getChildFile(prefix + "_" + uniqueId);
        if (candidate.createDirectory().wasOk())
            directory = candidate;
    }

    ~ScopedWorkingDirectory()
    {
        if (directory.isDirectory())
            directory.deleteRecursively();
    }

    bool isValid() const noexcept                   { return directory != juce::File(); }
    const juce::File& getDirectory() const noexcept { return directory; }

    juce::File getChildFile(const juce::String& name) const { return directory.getChildFile(name); }

private:
    juce::File directory;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ScopedWorkingDirectory)
};
