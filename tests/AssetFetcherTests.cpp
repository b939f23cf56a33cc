#include <JuceHeader.h>
#include "TestHelpers.h"
#include "../src/assets/AssetFetcher.h"
#include "../src/assets/OutputSink.h"

namespace
{
    /** Serves references from a map of name -> content, tracking how many fetches overlap. */
    class FakeAssetSource : public AssetSource
    {
    public:
        bool canFetch(const juce::String&) const override { return true; }

        juce::Result fetch(const juce::String& reference, const juce::File& destination) override
        {
            const int running = ++active;
            {
                const juce::ScopedLock sl(lock);
                peak = juce::jmax(peak, running);
                fetched.add(reference);
            }

            juce::Thread::sleep(delayMs);
            --active;

            if (!contents.getAllKeys().contains(reference))
                return juce::Result::fail("HTTP 404 for " + reference);

            return destination.replaceWithText(contents[reference])
                       ? juce::Result::ok()
                       : juce::Result::fail("Cannot write " + destination.getFullPathName());
        }

        int getPeak() const
        {
            const juce::ScopedLock sl(lock);
            return peak;
        }

        int getNumFetched() const
        {
            const juce::ScopedLock sl(lock);
            return fetched.size();
        }

        juce::StringPairArray contents;
        int delayMs = 0;

    private:
        std::atomic<int> active { 0 };
        juce::CriticalSection lock;
        juce::StringArray fetched;
        int peak = 0;
    };
}

class AssetFetcherTests : public juce::UnitTest
{
public:
    AssetFetcherTests() : juce::UnitTest("AssetFetcher", "NarrationRender") {}

    void runTest() override
    {
        using TestHelpers::makeSegment;

        TestHelpers::TemporaryDirectory temp;

        beginTest("footage file names keep the reference extension");
        {
            expectEquals(AssetFetcher::getFootageFileName(makeSegment(3, 0.0, 1.0, "https://cdn.example.com/clips/a.MOV?sig=abc")),
                         juce::String("segment_3.mov"));
            expectEquals(AssetFetcher::getFootageFileName(makeSegment(4, 0.0, 1.0, "https://cdn.example.com/clips/stream")),
                         juce::String("segment_4.mp4"));
            expectEquals(AssetSource::getExtensionForReference("/media/voice.wav", ".mp3"), juce::String(".wav"));
            expectEquals(AssetSource::getExtensionForReference("/media/voice.not-an-ext", ".mp3"), juce::String(".mp3"));
        }

        beginTest("every asset is fetched into the scratch directory");
        {
            FakeAssetSource source;
            source.contents.set("a.mp4", "footage a");
            source.contents.set("b.mp4", "footage b");
            source.contents.set("voice.mp3", "voice");
            source.contents.set("music.mp3", "music");

            ScratchDirectory scratch(temp.getDirectory(), "fetch-all");
            expect(scratch.create().wasOk());

            AssetFetcher fetcher(source, 4);
            juce::Array<int> progress;
            juce::Array<int> totals;
            juce::CriticalSection progressLock;
            fetcher.setProgressCallback([&](int done, int total)
            {
                const juce::ScopedLock sl(progressLock);
                progress.add(done);
                totals.addIfNotAlreadyThere(total);
            });

            FetchedAssets assets;
            auto result = fetcher.fetchAssets({ makeSegment(0, 0.0, 2.0, "a.mp4"), makeSegment(1, 2.0, 4.0, "b.mp4") },
                                              "voice.mp3", "music.mp3", scratch, assets);

            expect(result.wasOk(), result.getErrorMessage());
            expectEquals(static_cast<int>(assets.footage.size()), 2);
            expectEquals(assets.requestedFootage, 2);
            expect(assets.footage[0].isAChildOf(scratch.getDirectory()));
            expectEquals(assets.footage[1].loadFileAsString(), juce::String("footage b"));
            expectEquals(assets.voiceOver.getFileName(), juce::String("voice.mp3"));
            expect(assets.music.existsAsFile());
            expectEquals(progress.size(), 4);
            expect(progress.contains(4));
            expectEquals(totals.size(), 1);
            expectEquals(totals[0], 4);
        }

        beginTest("downloads run concurrently up to the limit");
        {
            FakeAssetSource source;
            source.delayMs = 60;
            std::vector<RenderTypes::Segment> segments;
            for (int i = 0; i < 6; ++i)
            {
                source.contents.set("clip" + juce::String(i) + ".mp4", "x");
                segments.push_back(makeSegment(i, i, i + 1.0, "clip" + juce::String(i) + ".mp4"));
            }
            source.contents.set("voice.mp3", "voice");

            ScratchDirectory scratch(temp.getDirectory(), "fetch-parallel");
            expect(scratch.create().wasOk());

            AssetFetcher fetcher(source, 3);
            FetchedAssets assets;
            expect(fetcher.fetchAssets(segments, "voice.mp3", {}, scratch, assets).wasOk());

            expect(source.getPeak() > 1);
            expect(source.getPeak() <= 3);
            expectEquals(static_cast<int>(assets.footage.size()), 6);
        }

        beginTest("failed footage drops only its segment");
        {
            FakeAssetSource source;
            source.contents.set("a.mp4", "footage a");
            source.contents.set("voice.mp3", "voice");

            ScratchDirectory scratch(temp.getDirectory(), "fetch-partial");
            expect(scratch.create().wasOk());

            TestHelpers::LogCollector logs;
            AssetFetcher fetcher(source, 2);
            fetcher.setLogCallback(logs.callback());

            FetchedAssets assets;
            auto result = fetcher.fetchAssets({ makeSegment(0, 0.0, 2.0, "a.mp4"),
                                                makeSegment(1, 2.0, 4.0, "missing.mp4"),
                                                makeSegment(2, 4.0, 6.0) },
                                              "voice.mp3", {}, scratch, assets);

            expect(result.wasOk(), result.getErrorMessage());
            expectEquals(static_cast<int>(assets.footage.size()), 1);
            expect(assets.footage.count(0) == 1);
            expectEquals(assets.requestedFootage, 2);
            expect(assets.music == juce::File());
            expect(logs.contains("WARNING: Could not fetch footage for segment 1"));
            expect(logs.contains("Segment 2 has no footage reference"));
        }

        beginTest("no footage at all fails the fetch");
        {
            FakeAssetSource source;
            source.contents.set("voice.mp3", "voice");

            ScratchDirectory scratch(temp.getDirectory(), "fetch-none");
            expect(scratch.create().wasOk());

            AssetFetcher fetcher(source, 2);
            FetchedAssets assets;
            auto result = fetcher.fetchAssets({ makeSegment(0, 0.0, 2.0, "gone.mp4"), makeSegment(1, 2.0, 3.0) },
                                              "voice.mp3", {}, scratch, assets);

            expect(result.failed());
            expect(result.getErrorMessage().startsWith("No footage available"));
        }

        beginTest("the voice-over is required");
        {
            FakeAssetSource source;
            source.contents.set("a.mp4", "footage a");

            ScratchDirectory scratch(temp.getDirectory(), "fetch-voice");
            expect(scratch.create().wasOk());

            AssetFetcher fetcher(source, 2);
            FetchedAssets assets;
            auto result = fetcher.fetchAssets({ makeSegment(0, 0.0, 2.0, "a.mp4") }, "voice.mp3", {}, scratch, assets);

            expect(result.failed());
            expect(result.getErrorMessage().startsWith("Voice-over unavailable"));

            expect(fetcher.fetchAssets({ makeSegment(0, 0.0, 2.0, "a.mp4") }, {}, {}, scratch, assets).failed());
        }

        beginTest("failed music is only a warning");
        {
            FakeAssetSource source;
            source.contents.set("a.mp4", "footage a");
            source.contents.set("voice.mp3", "voice");

            ScratchDirectory scratch(temp.getDirectory(), "fetch-music");
            expect(scratch.create().wasOk());

            TestHelpers::LogCollector logs;
            AssetFetcher fetcher(source, 2);
            fetcher.setLogCallback(logs.callback());

            FetchedAssets assets;
            auto result = fetcher.fetchAssets({ makeSegment(0, 0.0, 2.0, "a.mp4") }, "voice.mp3", "music.mp3", scratch, assets);

            expect(result.wasOk(), result.getErrorMessage());
            expect(assets.music == juce::File());
            expect(logs.contains("without background music"));
        }

        beginTest("existing destinations are reused");
        {
            FakeAssetSource source;
            source.contents.set("a.mp4", "fresh");
            source.contents.set("voice.mp3", "voice");

            ScratchDirectory scratch(temp.getDirectory(), "fetch-reuse");
            expect(scratch.create().wasOk());
            expect(scratch.createFile("segment_0.mp4").replaceWithText("cached"));

            AssetFetcher fetcher(source, 2);
            FetchedAssets assets;
            expect(fetcher.fetchAssets({ makeSegment(0, 0.0, 2.0, "a.mp4") }, "voice.mp3", {}, scratch, assets).wasOk());

            expectEquals(assets.footage[0].loadFileAsString(), juce::String("cached"));
            expectEquals(source.getNumFetched(), 1);
        }

        beginTest("local files are copied, never moved");
        {
            const juce::File original = temp.getChildFile("local_clip.mp4");
            expect(original.replaceWithText("local footage"));
            const juce::File voice = temp.getChildFile("local_voice.wav");
            expect(voice.replaceWithText("local voice"));

            auto source = CompositeAssetSource::createDefault(1000);
            expect(source->canFetch(original.getFullPathName()));
            expect(source->canFetch("https://cdn.example.com/a.mp4"));
            expect(!source->canFetch("ftp://cdn.example.com/a.mp4"));

            ScratchDirectory scratch(temp.getDirectory(), "fetch-local");
            expect(scratch.create().wasOk());

            AssetFetcher fetcher(*source, 2);
            FetchedAssets assets;
            auto result = fetcher.fetchAssets({ makeSegment(0, 0.0, 2.0, juce::URL(original).toString(false)) },
                                              voice.getFullPathName(), {}, scratch, assets);

            expect(result.wasOk(), result.getErrorMessage());
            expect(original.existsAsFile());
            expectEquals(assets.footage[0].loadFileAsString(), juce::String("local footage"));
            expectEquals(assets.voiceOver.getFileExtension(), juce::String(".wav"));

            auto missing = source->fetch(temp.getChildFile("nope.mp4").getFullPathName(), scratch.createFile("nope.mp4"));
            expect(missing.failed());
            expect(!scratch.getDirectory().getChildFile("nope.mp4").exists());
        }
    }
};

static AssetFetcherTests assetFetcherTests;

//==============================================================================
class ScratchDirectoryTests : public juce::UnitTest
{
public:
    ScratchDirectoryTests() : juce::UnitTest("ScratchDirectory", "NarrationRender") {}

    void runTest() override
    {
        TestHelpers::TemporaryDirectory temp;

        beginTest("cleanup removes tracked files and the directory");
        {
            ScratchDirectory scratch(temp.getDirectory(), "task-1");
            expect(scratch.create().wasOk());
            expect(scratch.getDirectory().isDirectory());
            expectEquals(scratch.getDirectory().getFileName(), juce::String("render-task-1"));

            expect(scratch.createFile("a.mp4").replaceWithText("a"));
            expect(scratch.createFile("b.wav").replaceWithText("b"));
            scratch.createFile("never_written.txt");
            expectEquals(scratch.getNumTrackedFiles(), 3);

            const juce::File directory = scratch.getDirectory();
            expectEquals(scratch.cleanup(), 0);
            expect(!directory.exists());
            expect(scratch.isCleanedUp());
            expectEquals(scratch.cleanup(), 0);
        }

        beginTest("untracked files keep the directory");
        {
            ScratchDirectory scratch(temp.getDirectory(), "task-2");
            expect(scratch.create().wasOk());
            expect(scratch.createFile("tracked.txt").replaceWithText("x"));
            expect(scratch.getDirectory().getChildFile("stray.txt").replaceWithText("y"));

            TestHelpers::LogCollector logs;
            scratch.setLogCallback(logs.callback());

            expectEquals(scratch.cleanup(), 0);
            expect(scratch.getDirectory().isDirectory());
            expect(!scratch.getDirectory().getChildFile("tracked.txt").exists());
            expect(logs.contains("untracked"));
        }

        beginTest("the destructor cleans up");
        {
            juce::File directory;
            {
                ScratchDirectory scratch(temp.getDirectory(), "task-3");
                expect(scratch.create().wasOk());
                expect(scratch.createFile("clip.mp4").replaceWithText("x"));
                directory = scratch.getDirectory();
            }
            expect(!directory.exists());
        }

        beginTest("two scratch directories for one task never collide");
        {
            ScratchDirectory first(temp.getDirectory(), "same");
            ScratchDirectory second(temp.getDirectory(), "same");
            expect(first.create().wasOk());
            expect(second.create().wasOk());
            expect(first.getDirectory() != second.getDirectory());
            expect(second.getDirectory().getFileName().startsWith("render-same-"));

            first.cleanup();

            // Once released, the plain name is available again
            ScratchDirectory third(temp.getDirectory(), "same");
            expect(third.create().wasOk());
            expectEquals(third.getDirectory().getFileName(), juce::String("render-same"));
        }

        beginTest("a retried render picks up what an interrupted one left behind");
        {
            const juce::File leftover = temp.getChildFile("render-task-4").getChildFile("segment_0.mp4");
            expect(leftover.getParentDirectory().createDirectory().wasOk());
            expect(leftover.replaceWithText("fetched before the crash"));
            expect(leftover.getSiblingFile("voice.mp3.part").replaceWithText("trunc"));

            TestHelpers::LogCollector logs;
            ScratchDirectory scratch(temp.getDirectory(), "task-4");
            scratch.setLogCallback(logs.callback());
            expect(scratch.create().wasOk());

            expect(scratch.getDirectory() == leftover.getParentDirectory());
            expectEquals(scratch.getNumTrackedFiles(), 2);
            expect(logs.contains("2 file(s) from an earlier attempt"));

            FakeAssetSource source;
            source.contents.set("voice.mp3", "voice");

            AssetFetcher fetcher(source, 2);
            FetchedAssets assets;
            auto result = fetcher.fetchAssets({ TestHelpers::makeSegment(0, 0.0, 2.0, "offline.mp4") },
                                              "voice.mp3", {}, scratch, assets);

            expect(result.wasOk(), result.getErrorMessage());
            expectEquals(assets.footage[0].loadFileAsString(), juce::String("fetched before the crash"));
            expectEquals(assets.voiceOver.loadFileAsString(), juce::String("voice"));
            expectEquals(source.getNumFetched(), 1);

            const juce::File directory = scratch.getDirectory();
            expectEquals(scratch.cleanup(), 0);
            expect(!directory.exists());
        }
    }
};

static ScratchDirectoryTests scratchDirectoryTests;

//==============================================================================
class OutputSinkTests : public juce::UnitTest
{
public:
    OutputSinkTests() : juce::UnitTest("OutputSink", "NarrationRender") {}

    void runTest() override
    {
        TestHelpers::TemporaryDirectory temp;

        beginTest("publishing moves the video into the output directory");
        {
            const juce::File rendered = temp.getChildFile("output.mp4");
            expect(rendered.replaceWithText("video"));

            LocalDirectoryOutputSink sink(temp.getChildFile("renders"));
            juce::String location;
            auto result = sink.publish(rendered, "project_20240101_120000.mp4", location);

            expect(result.wasOk(), result.getErrorMessage());
            expect(!rendered.exists());
            expectEquals(juce::File(location).getFileName(), juce::String("project_20240101_120000.mp4"));
            expectEquals(juce::File(location).loadFileAsString(), juce::String("video"));
        }

        beginTest("an existing name is never overwritten");
        {
            LocalDirectoryOutputSink sink(temp.getChildFile("renders"));

            const juce::File rendered = temp.getChildFile("second.mp4");
            expect(rendered.replaceWithText("second"));

            juce::String location;
            expect(sink.publish(rendered, "project_20240101_120000.mp4", location).wasOk());
            expect(juce::File(location).getFileName() != "project_20240101_120000.mp4");
            expectEquals(sink.getDirectory().getChildFile("project_20240101_120000.mp4").loadFileAsString(),
                         juce::String("video"));
        }

        beginTest("a missing rendered file fails");
        {
            LocalDirectoryOutputSink sink(temp.getChildFile("renders"));
            juce::String location;
            expect(sink.publish(temp.getChildFile("absent.mp4"), "x.mp4", location).failed());
            expect(location.isEmpty());
        }
    }
};

static OutputSinkTests outputSinkTests;
