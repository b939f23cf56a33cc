#include "RenderPipeline.h"

namespace
{
    constexpr int progressScratchReady = 10;
    constexpr int progressAssetsFetched = 50;
    constexpr int progressTimelineAssembled = 80;
    constexpr int progressAudioMixed = 85;

    int mapProgress(int rangeStart, int rangeEnd, int done, int total)
    {
        if (total <= 0)
            return rangeEnd;

        return rangeStart + (rangeEnd - rangeStart) * juce::jlimit(0, total, done) / total;
    }

    juce::String getElapsedTimeString(juce::Time since)
    {
        const auto elapsed = juce::Time::getCurrentTime() - since;
        const int totalSeconds = static_cast<int>(elapsed.inSeconds());

        return juce::String::formatted("%02d:%02d:%02d",
                                       totalSeconds / 3600,
                                       (totalSeconds / 60) % 60,
                                       totalSeconds % 60);
    }
}

RenderPipeline::RenderPipeline(const RenderConfig& renderConfig, AssetSource& source, OutputSink& sink)
    : config(renderConfig),
      assetSource(source),
      outputSink(sink)
{
    // Create component instances
    ffmpegExecutor = std::make_unique<FFmpegExecutor>();
    clipProcessor = std::make_unique<ClipProcessor>(ffmpegExecutor.get());
    subtitleOverlay = std::make_unique<SubtitleOverlay>();
    timelineAssembler = std::make_unique<TimelineAssembler>(ffmpegExecutor.get(), clipProcessor.get(), subtitleOverlay.get());
    audioMixer = std::make_unique<AudioMixer>();
    outputWriter = std::make_unique<OutputWriter>(ffmpegExecutor.get());

    configureComponents();
}

RenderPipeline::~RenderPipeline()
{
    teardownLoggingSession();
}

void RenderPipeline::setLogCallback(std::function<void(const juce::String&)> callback)
{
    externalLogCallback = callback;
}

void RenderPipeline::configureComponents()
{
    const auto format = config.getVideoFormat();

    ffmpegExecutor->setExecutablePaths(config.ffmpegPath, config.ffprobePath);

    clipProcessor->setOutputFormat(format, config.intermediatePreset);

    SubtitleOverlay::Style style;
    style.fontFile = config.subtitleFontFile;
    style.fontSize = config.subtitleFontSize;
    style.maxCharsPerLine = config.subtitleMaxCharsPerLine;
    subtitleOverlay->setStyle(style);

    timelineAssembler->setOutputFormat(format);
    timelineAssembler->setTrailingPad(config.trailingPadSeconds);

    AudioMixer::Settings mixSettings;
    mixSettings.sampleRate = config.audioSampleRate;
    mixSettings.musicFadeOutSeconds = config.musicFadeOutSeconds;
    mixSettings.voiceOffsetSeconds = config.voiceOffsetSeconds;
    audioMixer->setSettings(mixSettings);

    outputWriter->setOutputFormat(format);
    outputWriter->setAudioSettings(config.audioBitrate, static_cast<int>(config.audioSampleRate));
}

void RenderPipeline::initialiseLoggingSession(const juce::String& taskId)
{
    teardownLoggingSession();
    renderSessionDirectory = juce::File();

    const juce::String timestamp = juce::Time::getCurrentTime().formatted("%Y%m%d_%H%M%S");
    const juce::File sessionDir = config.logDirectory.getChildFile(
        "render_" + juce::File::createLegalFileName(taskId) + "_" + timestamp);

    if (sessionDir.createDirectory().wasOk())
    {
        renderSessionDirectory = sessionDir;
        ffmpegLogDirectory = renderSessionDirectory.getChildFile("ffmpeg");

        if (ffmpegLogDirectory.createDirectory().wasOk())
            ffmpegExecutor->setSessionLogDirectory(ffmpegLogDirectory);
        else
            ffmpegLogDirectory = juce::File();

        renderSessionLogStream = std::make_unique<juce::FileOutputStream>(renderSessionDirectory.getChildFile("render.log"));
        if (renderSessionLogStream->openedOk())
        {
            renderSessionLogStream->writeText("Render session started at " + juce::Time::getCurrentTime().toString(true, true) + "\n", false, false, nullptr);
            renderSessionLogStream->flush();
        }
        else
        {
            renderSessionLogStream.reset();
        }
    }
    else
    {
        juce::Logger::writeToLog("WARNING: Could not create log directory " + sessionDir.getFullPathName()
                                 + ", render logs go to the main log only");
        ffmpegExecutor->setSessionLogDirectory(juce::File());
    }
}

void RenderPipeline::teardownLoggingSession()
{
    {
        juce::ScopedLock sl(logWriteLock);
        if (renderSessionLogStream != nullptr)
            renderSessionLogStream->flush();
        renderSessionLogStream.reset();
    }

    if (ffmpegExecutor != nullptr)
        ffmpegExecutor->setSessionLogDirectory(juce::File());

    ffmpegLogDirectory = juce::File();
}

void RenderPipeline::log(const juce::String& message)
{
    juce::Logger::writeToLog(logPrefix + message);

    {
        juce::ScopedLock sl(logWriteLock);
        if (renderSessionLogStream != nullptr)
        {
            renderSessionLogStream->writeText(juce::Time::getCurrentTime().toString(true, true) + ": " + message + "\n",
                                              false, false, nullptr);
            renderSessionLogStream->flush();
        }
    }

    if (externalLogCallback)
        externalLogCallback(message);
}

void RenderPipeline::advanceProgress(RenderTaskRecorder& recorder, int progress)
{
    juce::ScopedLock sl(progressLock);

    if (progress <= reportedProgress)
        return;

    if (recorder.updateProgress(progress))
        reportedProgress = progress;
}

RenderTask RenderPipeline::run(const RenderTypes::RenderRequest& request, RenderTaskRecorder& recorder)
{
    const juce::String taskId = recorder.getTaskId();

    logPrefix = "[render " + taskId + "] ";
    renderStartTime = juce::Time::getCurrentTime();
    reportedProgress = 0;

    initialiseLoggingSession(taskId);

    logFunction = [this](const juce::String& message) { log(message); };

    ffmpegExecutor->setLogCallback(logFunction);
    clipProcessor->setLogCallback(logFunction);
    subtitleOverlay->setLogCallback(logFunction);
    timelineAssembler->setLogCallback(logFunction);
    audioMixer->setLogCallback(logFunction);
    outputWriter->setLogCallback(logFunction);
    recorder.setLogCallback(logFunction);

    // Write initial log entries
    log("=== RENDER LOG ===");
    if (renderSessionDirectory.isDirectory())
        log("Log directory: " + renderSessionDirectory.getFullPathName());
    log("Project: " + request.projectRef);
    log("Segments: " + juce::String(request.segments.size()));
    log("Voice-over: " + request.voiceOver);
    log("Music: " + (request.music.isNotEmpty() ? request.music : juce::String("none")));
    log("Subtitles: " + juce::String(request.addSubtitles ? "yes" : "no")
        + ", audio: " + juce::String(request.includeAudio ? "yes" : "no"));

    if (!recorder.startProcessing())
    {
        log("ERROR: Task " + taskId + " is not pending, render not started");
        recorder.setLogCallback(nullptr);
        teardownLoggingSession();
        return recorder.getSnapshot();
    }

    juce::String outputLocation;
    juce::Result result = juce::Result::ok();

    {
        ScratchDirectory scratch(config.scratchRoot, taskId);
        scratch.setLogCallback(logFunction);

        try
        {
            result = runPhases(request, recorder, scratch, outputLocation);
        }
        catch (const std::exception& e)
        {
            log("ERROR: Exception during render: " + juce::String(e.what()));
            result = juce::Result::fail("Unexpected render failure: " + juce::String(e.what()));
        }

        const int cleanupFailures = scratch.cleanup();
        if (cleanupFailures > 0)
            log("WARNING: " + juce::String(cleanupFailures) + " scratch entries could not be removed");
        else
            log("Scratch directory cleaned up");
    }

    if (result.wasOk())
    {
        if (recorder.complete(outputLocation))
            log("Render completed in " + getElapsedTimeString(renderStartTime) + ": " + outputLocation);
        else
            result = juce::Result::fail("The render finished but its task could not be completed (output location: \""
                                        + outputLocation + "\")");
    }

    if (result.failed())
    {
        log("ERROR: " + result.getErrorMessage());
        recorder.fail(result.getErrorMessage());
        log("Render failed after " + getElapsedTimeString(renderStartTime));
    }

    recorder.setLogCallback(nullptr);
    teardownLoggingSession();
    return recorder.getSnapshot();
}

juce::Result RenderPipeline::runPhases(const RenderTypes::RenderRequest& request,
                                       RenderTaskRecorder& recorder,
                                       ScratchDirectory& scratch,
                                       juce::String& outputLocation)
{
    auto validation = request.validate();
    if (validation.failed())
        return validation;

    auto created = scratch.create();
    if (created.failed())
        return created;

    log("Scratch directory: " + scratch.getDirectory().getFullPathName());
    advanceProgress(recorder, progressScratchReady);

    const auto sortedSegments = request.getSortedSegments();

    //==========================================================================
    // Assets
    FetchedAssets assets;
    {
        AssetFetcher fetcher(assetSource, config.maxConcurrentDownloads);
        fetcher.setLogCallback(logFunction);
        fetcher.setProgressCallback([this, &recorder](int finished, int total)
        {
            advanceProgress(recorder, mapProgress(progressScratchReady, progressAssetsFetched, finished, total));
        });

        auto fetched = fetcher.fetchAssets(sortedSegments, request.voiceOver, request.music, scratch, assets);
        if (fetched.failed())
            return fetched;
    }

    advanceProgress(recorder, progressAssetsFetched);

    //==========================================================================
    // Timeline
    timelineAssembler->setProgressCallback([this, &recorder](int attempted, int total)
    {
        advanceProgress(recorder, mapProgress(progressAssetsFetched, progressTimelineAssembled, attempted, total));
    });

    RenderTypes::AssembledTimeline timeline;
    auto assembled = timelineAssembler->assembleTimeline(sortedSegments, assets.footage,
                                                         request.addSubtitles, scratch, timeline);
    timelineAssembler->setProgressCallback(nullptr);

    if (assembled.failed())
        return assembled;

    advanceProgress(recorder, progressTimelineAssembled);

    //==========================================================================
    // Audio
    const DuckingEnvelope envelope(DuckingEnvelope::intervalsFromSegments(sortedSegments),
                                   config.defaultMusicVolume,
                                   config.duckedMusicVolume,
                                   config.duckFadeSeconds);

    const juce::File audioFile = scratch.createFile("audio.wav");
    auto mixed = audioMixer->mixAudio(audioFile, timeline.getTotalDuration(), assets.voiceOver,
                                      assets.music, envelope, request.includeAudio);
    if (mixed.failed())
        return mixed;

    advanceProgress(recorder, progressAudioMixed);

    //==========================================================================
    // Output
    const juce::File renderedFile = scratch.createFile("output.mp4");
    auto written = outputWriter->writeOutput(timeline, audioFile, renderedFile);
    if (written.failed())
        return written;

    const juce::String fileName = OutputWriter::createOutputFileName(request.projectRef, juce::Time::getCurrentTime());
    auto published = outputSink.publish(renderedFile, fileName, outputLocation);
    if (published.failed())
        return juce::Result::fail("Could not publish the rendered video: " + published.getErrorMessage());

    return juce::Result::ok();
}
