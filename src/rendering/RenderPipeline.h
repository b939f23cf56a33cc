#pragma once
#include <JuceHeader.h>
#include "RenderTypes.h"
#include "FFmpegExecutor.h"
#include "ClipProcessor.h"
#include "SubtitleOverlay.h"
#include "TimelineAssembler.h"
#include "AudioMixer.h"
#include "OutputWriter.h"
#include "ScratchDirectory.h"
#include "../core/RenderConfig.h"
#include "../assets/AssetSource.h"
#include "../assets/AssetFetcher.h"
#include "../assets/OutputSink.h"
#include "../tasks/RenderTaskRecorder.h"

/**
 * Runs one render request from Pending to a terminal state.
 *
 * Phases, with the progress reported after each:
 *   scratch setup (10), asset fetch (10..50), timeline assembly (50..80),
 *   audio mix (85), final encode and publish (100).
 *
 * Any phase failure, and any std::exception escaping a phase, ends the task
 * as Failed with a readable message. The scratch directory is removed on
 * every exit path before the terminal state is recorded.
 *
 * A pipeline owns its ffmpeg executor and media components and runs one
 * render at a time; RenderService creates one per job.
 */
class RenderPipeline
{
public:
    /**
     * @param config      Settings for every component
     * @param assetSource Resolves footage, voice-over and music references
     * @param outputSink  Receives the encoded video
     */
    RenderPipeline(const RenderConfig& config, AssetSource& assetSource, OutputSink& outputSink);
    ~RenderPipeline();

    /** Extra listener for every log line of the render (e.g. the CLI's console). */
    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /**
     * Executes the request and records every transition through the recorder.
     * @return the task as it was left by the render
     */
    RenderTask run(const RenderTypes::RenderRequest& request, RenderTaskRecorder& recorder);

    /** The per-render log directory of the last run; empty if logging files were unavailable. */
    juce::File getSessionLogDirectory() const { return renderSessionDirectory; }

private:
    juce::Result runPhases(const RenderTypes::RenderRequest& request,
                           RenderTaskRecorder& recorder,
                           ScratchDirectory& scratch,
                           juce::String& outputLocation);

    /** Forwards progress to the recorder, never moving backwards. */
    void advanceProgress(RenderTaskRecorder& recorder, int progress);

    void configureComponents();
    void initialiseLoggingSession(const juce::String& taskId);
    void teardownLoggingSession();
    void log(const juce::String& message);

    RenderConfig config;
    AssetSource& assetSource;
    OutputSink& outputSink;

    // Component instances
    std::unique_ptr<FFmpegExecutor> ffmpegExecutor;
    std::unique_ptr<ClipProcessor> clipProcessor;
    std::unique_ptr<SubtitleOverlay> subtitleOverlay;
    std::unique_ptr<TimelineAssembler> timelineAssembler;
    std::unique_ptr<AudioMixer> audioMixer;
    std::unique_ptr<OutputWriter> outputWriter;

    std::function<void(const juce::String&)> externalLogCallback;
    std::function<void(const juce::String&)> logFunction;

    juce::String logPrefix;
    juce::CriticalSection progressLock;
    int reportedProgress = 0;

    // Timing information
    juce::Time renderStartTime;

    // Session logging infrastructure
    juce::File renderSessionDirectory;
    juce::File ffmpegLogDirectory;
    std::unique_ptr<juce::FileOutputStream> renderSessionLogStream;
    juce::CriticalSection logWriteLock;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(RenderPipeline)
};
