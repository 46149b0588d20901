#pragma once
#include <juce_core/juce_core.h>
#include <optional>

/**
 * Error and result types shared by every stage of the clip engine.
 *
 * Stages never throw across their public boundary; they return a ClipResult
 * which either holds a value or a ClipError describing the first failure.
 */

/** Categories of failure the engine can report. */
enum class ClipErrorKind
{
    None,
    Configuration,      // invalid settings, rejected before any stage runs
    Probe,              // ffprobe could not report dimensions or streams
    Extraction,         // no usable subtitle track, or extraction wrote nothing
    ToolInvocation,     // ffmpeg/ffprobe exited non-zero, failed to start or timed out
    MissingArtifact,    // tool reported success but the expected file is absent
    Sequence,           // multi-segment selection is not contiguous
    Cancelled           // caller asked to stop before the next stage
};

/** Returns a short, stable name for an error kind (used in log lines). */
juce::String getErrorKindName(ClipErrorKind kind);

/**
 * A structured failure. When the failure came from an external tool,
 * `command` holds the fully reconstructed command line so it can be
 * pasted into a shell to reproduce the problem.
 */
struct ClipError
{
    ClipErrorKind kind = ClipErrorKind::None;
    juce::String message;
    juce::String command;
    bool retryable = false;

    static ClipError make(ClipErrorKind kind,
                          const juce::String& message,
                          const juce::String& command = {},
                          bool retryable = false)
    {
        ClipError e;
        e.kind = kind;
        e.message = message;
        e.command = command;
        e.retryable = retryable;
        return e;
    }

    /** One-line description suitable for showing to a user. */
    juce::String describe() const
    {
        juce::String text = getErrorKindName(kind) + ": " + message;
        if (command.isNotEmpty())
            text << " (command: " << command << ")";
        return text;
    }
};

//==============================================================================
/**
 * Value-or-error result, modelled on juce::Result.
 *
 * getValue() may only be called when wasOk() is true.
 */
template <typename ValueType>
class ClipResult
{
public:
    static ClipResult ok(ValueType value)
    {
        ClipResult r;
        r.value.emplace(std::move(value));
        return r;
    }

    static ClipResult fail(ClipError error)
    {
        ClipResult r;
        r.error = std::move(error);
        return r;
    }

    static ClipResult fail(ClipErrorKind kind, const juce::String& message, const juce::String& command = {})
    {
        return fail(ClipError::make(kind, message, command));
    }

    bool wasOk() const noexcept    { return value.has_value(); }
    bool failed() const noexcept   { return ! value.has_value(); }

    const ValueType& getValue() const
    {
        jassert(wasOk());
        return *value;
    }

    const ClipError& getError() const noexcept          { return error; }
    juce::String getErrorMessage() const                { return error.describe(); }

private:
    ClipResult() = default;

    std::optional<ValueType> value;
    ClipError error;
};

/** Specialisation for stages that produce no value, only success or failure. */
template <>
class ClipResult<void>
{
public:
    static ClipResult ok()                      { return ClipResult(); }

    static ClipResult fail(ClipError error)
    {
        ClipResult r;
        r.error = std::move(error);
        r.succeeded = false;
        return r;
    }

    static ClipResult fail(ClipErrorKind kind, const juce::String& message, const juce::String& command = {})
    {
        return fail(ClipError::make(kind, message, command));
    }

    bool wasOk() const noexcept    { return succeeded; }
    bool failed() const noexcept   { return ! succeeded; }

    const ClipError& getError() const noexcept          { return error; }
    juce::String getErrorMessage() const                { return error.describe(); }

private:
    ClipResult() = default;

    bool succeeded = true;
    ClipError error;
};

using ClipStatus = ClipResult<void>;
