// SPDX-License-Identifier: Apache-2.0
#include <audio/AudioSegment.hpp>

#include "TestSupport.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>

using namespace srtvoice;
using namespace std::chrono_literals;

namespace
{

auto tone(Milliseconds duration, unsigned sampleRate = 24000, unsigned channels = 1) -> AudioSegment
{
    auto const frames = static_cast<std::size_t>(duration.count()) * sampleRate / 1000;
    return AudioSegment(sampleRate, channels, std::vector<float>(frames * channels, test::ToneLevel));
}

} // namespace

TEST_CASE("AudioSegment silence has the requested length", "[audio]")
{
    auto const segment = AudioSegment::silence(1500ms, 24000, 1);
    CHECK(segment.frameCount() == 36000);
    CHECK(segment.duration() == 1500ms);
    CHECK(std::ranges::all_of(segment.samples(), [](float s) { return s == 0.0f; }));

    CHECK(AudioSegment::silence(0ms).empty());
    CHECK(AudioSegment::silence(-5ms).empty());
}

TEST_CASE("AudioSegment encodes and decodes WAV", "[audio]")
{
    auto const original = tone(250ms, 22050, 2);
    auto const bytes = original.encodeWav();
    REQUIRE(bytes.has_value());
    REQUIRE(bytes->size() > 44);

    auto const decoded = AudioSegment::decode(*bytes);
    REQUIRE(decoded.has_value());
    CHECK(decoded->sampleRate() == 22050);
    CHECK(decoded->channels() == 2);
    CHECK(decoded->frameCount() == original.frameCount());
    CHECK(decoded->samples()[10] == Catch::Approx(test::ToneLevel).margin(1e-3));
}

TEST_CASE("AudioSegment decode rejects garbage", "[audio]")
{
    auto const empty = AudioSegment::decode({});
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code == ErrorCode::DecodeError);

    auto const garbage = AudioBytes(512, 0x42);
    auto const decoded = AudioSegment::decode(garbage);
    REQUIRE_FALSE(decoded.has_value());
    CHECK(decoded.error().code == ErrorCode::DecodeError);
}

TEST_CASE("AudioSegment resizes exactly", "[audio]")
{
    auto const segment = tone(1000ms);

    SECTION("Padding appends silence")
    {
        auto const padded = segment.resizedToFrames(36000);
        CHECK(padded.frameCount() == 36000);
        CHECK(padded.samples()[23999] == test::ToneLevel);
        CHECK(padded.samples()[24000] == 0.0f);
        CHECK(padded.samples().back() == 0.0f);
    }

    SECTION("Truncation cuts the tail")
    {
        auto const cut = segment.truncated(400ms);
        CHECK(cut.frameCount() == 9600);
        CHECK(cut.duration() == 400ms);
    }

    SECTION("Truncation beyond the end keeps everything")
    {
        CHECK(segment.truncated(5000ms).frameCount() == segment.frameCount());
    }
}

TEST_CASE("AudioSegment append converts the format", "[audio]")
{
    auto track = AudioSegment(24000, 1);
    REQUIRE(track.append(tone(500ms, 24000, 1)).has_value());
    REQUIRE(track.append(tone(500ms, 48000, 2)).has_value());
    REQUIRE(track.append(tone(500ms, 16000, 1)).has_value());

    CHECK(track.sampleRate() == 24000);
    CHECK(track.channels() == 1);
    CHECK(track.frameCount() == 36000);
    CHECK(track.duration() == 1500ms);
}

TEST_CASE("AudioSegment appendSilence adds frames", "[audio]")
{
    auto track = AudioSegment(16000, 2);
    track.appendSilence(1600);
    CHECK(track.frameCount() == 1600);
    CHECK(track.samples().size() == 3200);
    CHECK(track.duration() == 100ms);
}

TEST_CASE("AudioSegment withSpeed shortens by the speed factor", "[audio]")
{
    auto const segment = tone(3000ms);

    auto const faster = segment.withSpeed(1.5);
    REQUIRE(faster.has_value());
    CHECK(faster->sampleRate() == 24000);
    CHECK(faster->frameCount() == 48000);
    CHECK(faster->duration() == 2000ms);

    auto const slower = segment.withSpeed(0.5);
    REQUIRE(slower.has_value());
    CHECK(slower->frameCount() == 144000);
}

TEST_CASE("AudioSegment withSpeed near 1.0 is the identity", "[audio]")
{
    auto const segment = tone(100ms);
    auto const same = segment.withSpeed(1.0005);
    REQUIRE(same.has_value());
    CHECK(same->frameCount() == segment.frameCount());
}

TEST_CASE("AudioSegment withSpeed rejects non-positive speeds", "[audio]")
{
    auto const segment = tone(100ms);
    for (auto const speed: { 0.0, -1.0, std::nan("") })
    {
        auto const result = segment.withSpeed(speed);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == ErrorCode::InvalidArgument);
    }
}

TEST_CASE("AudioSegment writeWav writes a decodable file", "[audio]")
{
    auto const dir = test::TempDirectory("audio");
    auto const path = dir.path() / "out.wav";
    REQUIRE(tone(200ms).writeWav(path.string()).has_value());

    auto file = std::ifstream(path, std::ios::binary);
    auto const bytes = AudioBytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    auto const decoded = AudioSegment::decode(bytes);
    REQUIRE(decoded.has_value());
    CHECK(decoded->duration() == 200ms);

    auto const failed = tone(10ms).writeWav((dir.path() / "missing" / "out.wav").string());
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code == ErrorCode::IoError);
}
