#include "RenderConfig.h"

namespace
{
    bool isNumber(const juce::var& value)
    {
        return value.isInt() || value.isInt64() || value.isDouble();
    }

    juce::File resolvePath(const juce::String& path)
    {
        if (juce::File::isAbsolutePath(path))
            return juce::File(path);

        return juce::File::getCurrentWorkingDirectory().getChildFile(path);
    }

    class ConfigReader
    {
    public:
        ConfigReader(const juce::var& json, juce::StringArray& warnings)
            : json(json), warnings(warnings)
        {
        }

        void read(const char* key, double& target)
        {
            if (const auto* value = find(key))
            {
                if (isNumber(*value))
                    target = static_cast<double>(*value);
                else
                    warnWrongType(key, "a number");
            }
        }

        void read(const char* key, float& target)
        {
            double value = target;
            read(key, value);
            target = static_cast<float>(value);
        }

        void read(const char* key, int& target)
        {
            if (const auto* value = find(key))
            {
                if (isNumber(*value))
                    target = static_cast<int>(*value);
                else
                    warnWrongType(key, "a number");
            }
        }

        void read(const char* key, juce::String& target)
        {
            if (const auto* value = find(key))
            {
                if (value->isString())
                    target = value->toString().trim();
                else
                    warnWrongType(key, "a string");
            }
        }

        void read(const char* key, juce::File& target)
        {
            juce::String path;
            read(key, path);
            if (path.isNotEmpty())
                target = resolvePath(path);
        }

    private:
        const juce::var* find(const char* key) const
        {
            auto* object = json.getDynamicObject();
            if (object == nullptr || !object->hasProperty(key))
                return nullptr;

            return object->getProperties().getVarPointer(key);
        }

        void warnWrongType(const char* key, const juce::String& expected)
        {
            warnings.add("Config key '" + juce::String(key) + "' should be " + expected + "; keeping default");
        }

        const juce::var& json;
        juce::StringArray& warnings;
    };
}

RenderConfig::RenderConfig()
    : scratchRoot(juce::File::getSpecialLocation(juce::File::tempDirectory).getChildFile("narration-render")),
      outputDirectory(juce::File::getCurrentWorkingDirectory().getChildFile("output")),
      logDirectory(juce::File::getSpecialLocation(juce::File::userDocumentsDirectory).getChildFile("NarrationRender Logs"))
{
}

juce::Result RenderConfig::applyVar(const juce::var& json, juce::StringArray& warnings)
{
    if (json.getDynamicObject() == nullptr)
        return juce::Result::fail("Configuration must be a JSON object");

    ConfigReader reader(json, warnings);

    reader.read("scratch_root", scratchRoot);
    reader.read("output_dir", outputDirectory);
    reader.read("log_dir", logDirectory);
    reader.read("ffmpeg_path", ffmpegPath);
    reader.read("ffprobe_path", ffprobePath);

    reader.read("frame_width", frameWidth);
    reader.read("frame_height", frameHeight);
    reader.read("frame_rate", frameRate);
    reader.read("trailing_pad_seconds", trailingPadSeconds);
    reader.read("video_crf", videoCrf);
    reader.read("video_preset", videoPreset);
    reader.read("intermediate_preset", intermediatePreset);

    reader.read("subtitle_font_file", subtitleFontFile);
    reader.read("subtitle_font_size", subtitleFontSize);
    reader.read("subtitle_max_chars_per_line", subtitleMaxCharsPerLine);

    reader.read("audio_sample_rate", audioSampleRate);
    reader.read("audio_bitrate", audioBitrate);
    reader.read("default_music_volume", defaultMusicVolume);
    reader.read("ducked_music_volume", duckedMusicVolume);
    reader.read("duck_fade_seconds", duckFadeSeconds);
    reader.read("music_fade_out_seconds", musicFadeOutSeconds);
    reader.read("voice_offset_seconds", voiceOffsetSeconds);

    reader.read("download_timeout_ms", downloadTimeoutMs);
    reader.read("max_concurrent_downloads", maxConcurrentDownloads);

    return validate();
}

juce::Result RenderConfig::loadFromFile(const juce::File& file, juce::StringArray& warnings)
{
    if (!file.existsAsFile())
        return juce::Result::fail("Config file not found: " + file.getFullPathName());

    juce::var json;
    auto parseResult = juce::JSON::parse(file.loadFileAsString(), json);
    if (parseResult.failed())
        return juce::Result::fail("Config file " + file.getFileName() + " is not valid JSON: "
                                  + parseResult.getErrorMessage());

    return applyVar(json, warnings);
}

void RenderConfig::applyEnvironment()
{
    const juce::String ffmpeg = juce::SystemStats::getEnvironmentVariable("NARRATION_RENDER_FFMPEG", {});
    if (ffmpeg.isNotEmpty())
        ffmpegPath = ffmpeg;

    const juce::String scratch = juce::SystemStats::getEnvironmentVariable("NARRATION_RENDER_SCRATCH", {});
    if (scratch.isNotEmpty())
        scratchRoot = resolvePath(scratch);

    const juce::String output = juce::SystemStats::getEnvironmentVariable("NARRATION_RENDER_OUTPUT", {});
    if (output.isNotEmpty())
        outputDirectory = resolvePath(output);
}

juce::Result RenderConfig::validate() const
{
    if (frameWidth <= 0 || frameHeight <= 0 || frameWidth % 2 != 0 || frameHeight % 2 != 0)
        return juce::Result::fail("Frame size must be positive and even, got "
                                  + juce::String(frameWidth) + "x" + juce::String(frameHeight));

    if (frameRate <= 0)
        return juce::Result::fail("Frame rate must be positive");

    if (audioSampleRate < 8000.0)
        return juce::Result::fail("Audio sample rate is too low: " + juce::String(audioSampleRate));

    if (defaultMusicVolume < 0.0f || duckedMusicVolume < 0.0f)
        return juce::Result::fail("Music volumes must not be negative");

    if (trailingPadSeconds < 0.0 || duckFadeSeconds < 0.0 || musicFadeOutSeconds < 0.0)
        return juce::Result::fail("Pad and fade durations must not be negative");

    if (maxConcurrentDownloads < 1)
        return juce::Result::fail("At least one concurrent download is required");

    if (subtitleFontSize <= 0 || subtitleMaxCharsPerLine <= 0)
        return juce::Result::fail("Caption size settings must be positive");

    return juce::Result::ok();
}

RenderTypes::VideoFormat RenderConfig::getVideoFormat() const
{
    RenderTypes::VideoFormat format;
    format.width = frameWidth;
    format.height = frameHeight;
    format.frameRate = frameRate;
    format.preset = videoPreset;
    format.crf = videoCrf;
    return format;
}
