// SPDX-License-Identifier: Apache-2.0
#include <pipeline/TimingAssembler.hpp>

#include "TestSupport.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <format>
#include <string>

using namespace srtvoice;
using namespace std::chrono_literals;

namespace
{

/// @brief Backend, cache and synthesizer wired together over a temporary cache directory.
struct Harness
{
    test::TempDirectory directory { "assembler" };
    test::FakeBackend backend;
    SynthesisCache cache { directory.path(), "fake", "job", "wav" };
    SpeechSynthesizer synthesizer { backend,
                                    cache,
                                    RetryPolicy { .maxAttempts = 2, .initialBackoff = 1ms, .maxBackoff = 1ms } };

    auto build(std::span<const Cue> cues, PipelineConfig config = {}) -> Result<AudioSegment>
    {
        auto assembler = TimingAssembler(synthesizer, config);
        auto track = assembler.build(cues);
        placements = assembler.placements();
        return track;
    }

    std::vector<CuePlacement> placements;
};

auto cue(int index, Milliseconds start, Milliseconds end, std::string text) -> Cue
{
    return Cue { .index = index, .start = start, .end = end, .text = std::move(text) };
}

auto isSilent(const AudioSegment& track, std::uint64_t firstFrame, std::uint64_t lastFrame) -> bool
{
    auto const samples = track.samples();
    return std::all_of(samples.begin() + static_cast<std::ptrdiff_t>(firstFrame),
                       samples.begin() + static_cast<std::ptrdiff_t>(lastFrame),
                       [](float s) { return s == 0.0f; });
}

} // namespace

TEST_CASE("Speech shorter than its slot is padded to the slot", "[assembler]")
{
    auto harness = Harness {};
    harness.backend.setDuration("short", 500ms);
    auto const cues = std::vector { cue(1, 0ms, 2000ms, "short") };

    auto const track = harness.build(cues);
    REQUIRE(track.has_value());
    CHECK(track->duration() == 2000ms);
    REQUIRE(harness.placements.size() == 1);
    CHECK(harness.placements[0].fit == SlotFit::Padded);
    CHECK(harness.placements[0].rawDuration == 500ms);
    CHECK(harness.placements[0].emittedDuration == 2000ms);
    CHECK(isSilent(*track, 12000, 48000));
}

TEST_CASE("Speech shorter than its slot is kept as-is without fill", "[assembler]")
{
    auto harness = Harness {};
    harness.backend.setDuration("short", 500ms);
    auto const cues = std::vector { cue(1, 0ms, 2000ms, "short") };

    auto const track = harness.build(cues, PipelineConfig { .fillToEnd = false });
    REQUIRE(track.has_value());
    CHECK(track->duration() == 500ms);
    CHECK(harness.placements[0].fit == SlotFit::Fits);
}

TEST_CASE("Hard cut truncates overflowing speech to the slot", "[assembler]")
{
    auto harness = Harness {};
    harness.backend.setDuration("long", 5000ms);
    auto const cues = std::vector { cue(1, 0ms, 2000ms, "long") };

    auto const track = harness.build(cues, PipelineConfig { .hardCut = true });
    REQUIRE(track.has_value());
    CHECK(track->duration() == 2000ms);
    CHECK(harness.placements[0].fit == SlotFit::HardCut);
    CHECK(harness.placements[0].speed == 1.0);
}

TEST_CASE("Overflow within the speed cap fills the slot exactly", "[assembler]")
{
    auto harness = Harness {};
    harness.backend.setDuration("hello", 3000ms);
    auto const cues = std::vector { cue(1, 0ms, 2000ms, "hello") };

    auto const track = harness.build(cues, PipelineConfig { .maxSpeedup = 1.5 });
    REQUIRE(track.has_value());
    CHECK(track->frameCount() == 48000);
    CHECK(track->duration() == 2000ms);
    CHECK(harness.placements[0].fit == SlotFit::SpedUp);
    CHECK(harness.placements[0].speed == 1.5);
}

TEST_CASE("Overflow beyond the speed cap keeps the residual overflow", "[assembler]")
{
    auto harness = Harness {};
    harness.backend.setDuration("hello", 4000ms);
    auto const cues = std::vector { cue(1, 0ms, 2000ms, "hello") };

    auto const track = harness.build(cues, PipelineConfig { .maxSpeedup = 1.5 });
    REQUIRE(track.has_value());
    CHECK(track->frameCount() == 64000);
    CHECK(track->duration() == 2667ms);
    CHECK(harness.placements[0].fit == SlotFit::Overflow);
    CHECK(harness.placements[0].speed == 1.5);
}

TEST_CASE("Overflowing cues push later cues back", "[assembler]")
{
    auto harness = Harness {};
    harness.backend.setDuration("first", 3000ms);
    auto const cues = std::vector { cue(1, 0ms, 1000ms, "first"), cue(2, 1000ms, 2000ms, "second") };

    auto const track = harness.build(cues);
    REQUIRE(track.has_value());
    REQUIRE(harness.placements.size() == 2);
    CHECK(harness.placements[0].fit == SlotFit::Overflow);
    CHECK(harness.placements[1].position == 2609ms);
    CHECK(harness.placements[1].fit == SlotFit::Padded);
}

TEST_CASE("Gaps between cues are filled with silence", "[assembler]")
{
    auto harness = Harness {};
    auto const cues = std::vector { cue(1, 0ms, 1000ms, "a"), cue(2, 2000ms, 3000ms, "b") };

    auto const track = harness.build(cues);
    REQUIRE(track.has_value());
    CHECK(track->duration() == 3000ms);
    CHECK(track->samples()[23999] == test::ToneLevel);
    CHECK(isSilent(*track, 24000, 48000));
    CHECK(track->samples()[48000] == test::ToneLevel);
    CHECK(harness.placements[1].position == 2000ms);
}

TEST_CASE("An empty cue list yields only the padding", "[assembler]")
{
    auto harness = Harness {};
    auto const track = harness.build({}, PipelineConfig { .padLeadingMs = 500, .padTrailingMs = 500 });
    REQUIRE(track.has_value());
    CHECK(track->duration() == 1000ms);
    CHECK(isSilent(*track, 0, track->frameCount()));
    CHECK(harness.backend.callCount() == 0);
}

TEST_CASE("Padding surrounds the cues", "[assembler]")
{
    auto harness = Harness {};
    auto const config = PipelineConfig { .padLeadingMs = 500, .padTrailingMs = 250 };

    SECTION("A cue after the leading pad keeps its start")
    {
        auto const cues = std::vector { cue(1, 1000ms, 2000ms, "a") };
        auto const track = harness.build(cues, config);
        REQUIRE(track.has_value());
        CHECK(harness.placements[0].position == 1000ms);
        CHECK(track->duration() == 2250ms);
    }

    SECTION("A cue inside the leading pad starts after it")
    {
        auto const cues = std::vector { cue(1, 0ms, 1000ms, "a") };
        auto const track = harness.build(cues, config);
        REQUIRE(track.has_value());
        CHECK(harness.placements[0].position == 500ms);
        CHECK(track->duration() == 1750ms);
    }
}

TEST_CASE("Cues without text contribute silence", "[assembler]")
{
    auto harness = Harness {};
    auto const cues = std::vector { cue(1, 0ms, 1000ms, "  \n ") };

    auto const filled = harness.build(cues);
    REQUIRE(filled.has_value());
    CHECK(filled->duration() == 1000ms);
    CHECK(harness.backend.callCount() == 0);

    auto const unfilled = harness.build(cues, PipelineConfig { .fillToEnd = false });
    REQUIRE(unfilled.has_value());
    CHECK(unfilled->empty());
}

TEST_CASE("Cues with a zero-length slot are emitted unchanged", "[assembler]")
{
    auto harness = Harness {};
    auto const cues = std::vector { cue(1, 1000ms, 1000ms, "x"), cue(2, 3000ms, 2000ms, "y") };

    auto const track = harness.build(cues);
    REQUIRE(track.has_value());
    CHECK(harness.placements[0].fit == SlotFit::Unslotted);
    CHECK(harness.placements[0].emittedDuration == 1000ms);
    CHECK(harness.placements[1].fit == SlotFit::Unslotted);
    CHECK(track->duration() == 4000ms);
}

TEST_CASE("Long cue text is synthesized in chunks", "[assembler]")
{
    auto harness = Harness {};
    auto const cues = std::vector { cue(1, 0ms, 5000ms, "alpha beta gamma") };

    auto const track = harness.build(cues, PipelineConfig { .maxCharsPerCall = 10 });
    REQUIRE(track.has_value());
    auto const expected = std::vector<std::string> { "alpha beta", "gamma" };
    CHECK(harness.backend.requests() == expected);
    CHECK(harness.placements[0].rawDuration == 2000ms);
    CHECK(track->duration() == 5000ms);
}

TEST_CASE("Backend audio is converted to the track format", "[assembler]")
{
    auto harness = Harness {};
    harness.backend.sampleRate = 16000;
    auto const cues = std::vector { cue(1, 0ms, 1000ms, "a") };

    auto const track = harness.build(cues, PipelineConfig { .sampleRate = 48000, .channels = 2 });
    REQUIRE(track.has_value());
    CHECK(track->sampleRate() == 48000);
    CHECK(track->channels() == 2);
    CHECK(track->frameCount() == 48000);
}

TEST_CASE("A failing Cyrillic cue is quoted on whole characters", "[assembler]")
{
    auto text = std::string {};
    for (auto i = 0; i < 60; ++i)
        text += "Ћ";

    auto harness = Harness {};
    harness.backend.failNext(text, ErrorCode::FatalSynthesisError, "HTTP 400: bad input");
    auto const cues = std::vector { cue(3, 0ms, 1000ms, text) };

    auto const track = harness.build(cues);
    REQUIRE_FALSE(track.has_value());

    auto expected = std::string { "\"" };
    for (auto i = 0; i < 40; ++i)
        expected += "Ћ";
    expected += "...\"";
    CHECK(track.error().message.find(expected) != std::string::npos);
}

TEST_CASE("A failing cue aborts the build and names the cue", "[assembler]")
{
    auto harness = Harness {};
    harness.backend.failNext("broken", ErrorCode::FatalSynthesisError, "HTTP 400: bad input");
    auto const cues = std::vector {
        cue(1, 0ms, 1000ms, "fine"),
        cue(7, 1000ms, 2000ms, "broken"),
        cue(8, 2000ms, 3000ms, "after"),
    };

    auto const track = harness.build(cues);
    REQUIRE_FALSE(track.has_value());
    CHECK(track.error().code == ErrorCode::SynthesisFailure);
    CHECK(track.error().message.find("Cue 7") != std::string::npos);
    CHECK(track.error().message.find("bad input") != std::string::npos);
    CHECK(harness.placements.empty());

    // Audio synthesized before the failure stays cached for the next run.
    CHECK(harness.cache.contains(harness.synthesizer.fingerprint("fine")));
}

TEST_CASE("An invalid configuration is rejected before synthesis", "[assembler]")
{
    auto harness = Harness {};
    auto const cues = std::vector { cue(1, 0ms, 1000ms, "a") };

    auto const track = harness.build(cues, PipelineConfig { .maxSpeedup = 0.9 });
    REQUIRE_FALSE(track.has_value());
    CHECK(track.error().code == ErrorCode::ConfigError);
    CHECK(harness.backend.callCount() == 0);
}

TEST_CASE("A second build over the same cache makes no backend calls", "[assembler]")
{
    auto harness = Harness {};
    auto const cues = std::vector { cue(1, 0ms, 1000ms, "a"), cue(2, 1500ms, 2500ms, "b") };

    auto const first = harness.build(cues);
    REQUIRE(first.has_value());
    auto const callsAfterFirst = harness.backend.callCount();
    CHECK(callsAfterFirst == 2);

    auto const second = harness.build(cues);
    REQUIRE(second.has_value());
    CHECK(harness.backend.callCount() == callsAfterFirst);
    CHECK(std::ranges::equal(first->samples(), second->samples()));
}

TEST_CASE("The track does not depend on the worker count", "[assembler]")
{
    auto cues = std::vector<Cue> {};
    for (auto i = 0; i < 24; ++i)
    {
        auto const start = Milliseconds { i * 1000 };
        cues.push_back(cue(i + 1, start, start + 800ms, std::format("line {}", i)));
    }

    auto sequential = Harness {};
    auto parallel = Harness {};
    for (auto i = 0; i < 24; ++i)
    {
        auto const duration = Milliseconds { 300 + (i % 5) * 200 };
        sequential.backend.setDuration(std::format("line {}", i), duration);
        parallel.backend.setDuration(std::format("line {}", i), duration);
    }

    auto const one = sequential.build(cues, PipelineConfig { .workerCount = 1 });
    auto const many = parallel.build(cues, PipelineConfig { .workerCount = 8 });
    REQUIRE(one.has_value());
    REQUIRE(many.has_value());
    CHECK(one->frameCount() == many->frameCount());
    CHECK(std::ranges::equal(one->samples(), many->samples()));
    CHECK(parallel.backend.callCount() == 24);
}
