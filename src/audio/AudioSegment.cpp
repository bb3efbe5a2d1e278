// SPDX-License-Identifier: Apache-2.0
#include "AudioSegment.hpp"

#include <core/Log.hpp>
#include <core/Timing.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <format>
#include <fstream>
#include <string>

namespace srtvoice
{

namespace
{

    constexpr auto DecodeBlockFrames = ma_uint64 { 4096 };

    /// @brief Growable in-memory sink for ma_encoder.
    struct MemoryWriter
    {
        AudioBytes bytes;
        std::size_t position = 0;
    };

    auto memoryWrite(ma_encoder* encoder, const void* data, size_t bytesToWrite, size_t* bytesWritten) -> ma_result
    {
        auto* writer = static_cast<MemoryWriter*>(encoder->pUserData);
        if (writer->position + bytesToWrite > writer->bytes.size())
            writer->bytes.resize(writer->position + bytesToWrite);
        std::memcpy(writer->bytes.data() + writer->position, data, bytesToWrite);
        writer->position += bytesToWrite;
        *bytesWritten = bytesToWrite;
        return MA_SUCCESS;
    }

    auto memorySeek(ma_encoder* encoder, ma_int64 offset, ma_seek_origin origin) -> ma_result
    {
        auto* writer = static_cast<MemoryWriter*>(encoder->pUserData);
        auto base = ma_int64 { 0 };
        switch (origin)
        {
            case ma_seek_origin_start: base = 0; break;
            case ma_seek_origin_current: base = static_cast<ma_int64>(writer->position); break;
            case ma_seek_origin_end: base = static_cast<ma_int64>(writer->bytes.size()); break;
        }
        auto const target = base + offset;
        if (target < 0 || target > static_cast<ma_int64>(writer->bytes.size()))
            return MA_INVALID_ARGS;
        writer->position = static_cast<std::size_t>(target);
        return MA_SUCCESS;
    }

    /// @brief Runs interleaved float samples through a miniaudio data converter.
    ///
    /// The output is forced to exactly `targetFrames` frames so callers get deterministic
    /// lengths regardless of resampler latency.
    auto convert(std::span<const float> input,
                 unsigned channelsIn,
                 unsigned rateIn,
                 unsigned channelsOut,
                 unsigned rateOut,
                 std::uint64_t targetFrames) -> Result<std::vector<float>>
    {
        auto output = std::vector<float> {};

        if (channelsIn == channelsOut && rateIn == rateOut)
        {
            output.assign(input.begin(), input.end());
            output.resize(targetFrames * channelsOut, 0.0f);
            return output;
        }

        auto config =
            ma_data_converter_config_init(ma_format_f32, ma_format_f32, channelsIn, channelsOut, rateIn, rateOut);
        config.resampling.algorithm = ma_resample_algorithm_linear;

        auto converter = ma_data_converter {};
        if (ma_data_converter_init(&config, nullptr, &converter) != MA_SUCCESS)
            return makeError(ErrorCode::AudioError,
                             std::format("Failed to create converter ({} Hz/{} ch -> {} Hz/{} ch)",
                                         rateIn,
                                         channelsIn,
                                         rateOut,
                                         channelsOut));

        auto const inputFrames = static_cast<ma_uint64>(input.size() / channelsIn);
        output.resize((targetFrames + DecodeBlockFrames) * channelsOut);

        auto consumed = ma_uint64 { 0 };
        auto produced = ma_uint64 { 0 };
        while (consumed < inputFrames && produced < targetFrames)
        {
            auto framesIn = inputFrames - consumed;
            auto framesOut = static_cast<ma_uint64>(output.size() / channelsOut) - produced;
            auto const result = ma_data_converter_process_pcm_frames(&converter,
                                                                     input.data() + consumed * channelsIn,
                                                                     &framesIn,
                                                                     output.data() + produced * channelsOut,
                                                                     &framesOut);
            if (result != MA_SUCCESS)
            {
                ma_data_converter_uninit(&converter, nullptr);
                return makeError(ErrorCode::AudioError,
                                 std::format("Audio conversion failed ({})", static_cast<int>(result)));
            }
            consumed += framesIn;
            produced += framesOut;
            if (framesIn == 0 && framesOut == 0)
                break;
        }

        ma_data_converter_uninit(&converter, nullptr);

        // Zero-fill the resampler's latency tail, or cut its overshoot.
        output.resize(targetFrames * channelsOut, 0.0f);
        return output;
    }

} // namespace

AudioSegment::AudioSegment(unsigned sampleRate, unsigned channels, std::vector<float> samples):
    _sampleRate(sampleRate), _channels(std::max(channels, 1u)), _samples(std::move(samples))
{
    _samples.resize(frameCount() * _channels);
}

auto AudioSegment::silence(Milliseconds duration, unsigned sampleRate, unsigned channels) -> AudioSegment
{
    auto segment = AudioSegment(sampleRate, channels);
    segment.appendSilence(framesForDuration(duration, sampleRate));
    return segment;
}

auto AudioSegment::decode(std::span<const std::uint8_t> bytes) -> Result<AudioSegment>
{
    if (bytes.empty())
        return makeError(ErrorCode::DecodeError, "Cannot decode empty audio data");

    auto config = ma_decoder_config_init(ma_format_f32, 0, 0);
    auto decoder = ma_decoder {};
    auto const initResult = ma_decoder_init_memory(bytes.data(), bytes.size(), &config, &decoder);
    if (initResult != MA_SUCCESS)
        return makeError(ErrorCode::DecodeError,
                         std::format("Unrecognized or corrupt audio data ({} bytes, error {})",
                                     bytes.size(),
                                     static_cast<int>(initResult)));

    auto const channels = decoder.outputChannels;
    auto const sampleRate = decoder.outputSampleRate;

    auto samples = std::vector<float> {};
    auto block = std::vector<float>(DecodeBlockFrames * channels);
    while (true)
    {
        auto framesRead = ma_uint64 { 0 };
        auto const result = ma_decoder_read_pcm_frames(&decoder, block.data(), DecodeBlockFrames, &framesRead);
        auto const blockEnd = block.begin() + static_cast<std::ptrdiff_t>(framesRead * channels);
        samples.insert(samples.end(), block.begin(), blockEnd);
        if (result != MA_SUCCESS || framesRead == 0)
            break;
    }

    ma_decoder_uninit(&decoder);

    if (channels == 0 || sampleRate == 0)
        return makeError(ErrorCode::DecodeError, "Decoded audio has no channels or sample rate");

    log::trace("Decoded {} bytes into {} frames ({} Hz, {} ch)",
               bytes.size(),
               samples.size() / channels,
               sampleRate,
               channels);
    return AudioSegment(sampleRate, channels, std::move(samples));
}

auto AudioSegment::encodeWav() const -> Result<AudioBytes>
{
    auto config = ma_encoder_config_init(ma_encoding_format_wav, ma_format_s16, _channels, _sampleRate);
    auto writer = MemoryWriter {};
    auto encoder = ma_encoder {};
    if (ma_encoder_init(&memoryWrite, &memorySeek, &writer, &config, &encoder) != MA_SUCCESS)
        return makeError(ErrorCode::AudioError, "Failed to initialize WAV encoder");

    auto pcm = std::vector<ma_int16>(_samples.size());
    ma_pcm_f32_to_s16(pcm.data(), _samples.data(), _samples.size(), ma_dither_mode_none);

    auto framesWritten = ma_uint64 { 0 };
    auto const result = ma_encoder_write_pcm_frames(&encoder, pcm.data(), frameCount(), &framesWritten);
    ma_encoder_uninit(&encoder);

    if (result != MA_SUCCESS || framesWritten != frameCount())
        return makeError(ErrorCode::AudioError,
                         std::format("WAV encoding wrote {} of {} frames", framesWritten, frameCount()));

    return std::move(writer.bytes);
}

auto AudioSegment::writeWav(std::string_view path) const -> VoidResult
{
    auto bytes = encodeWav();
    if (!bytes)
        return std::unexpected(bytes.error());

    auto file = std::ofstream(std::string(path), std::ios::binary | std::ios::trunc);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot write audio file: {}", path));

    file.write(reinterpret_cast<const char*>(bytes->data()), static_cast<std::streamsize>(bytes->size()));
    if (!file)
        return makeError(ErrorCode::IoError, std::format("Failed while writing audio file: {}", path));
    return {};
}

auto AudioSegment::duration() const -> Milliseconds
{
    return durationForFrames(frameCount(), _sampleRate);
}

auto AudioSegment::convertedTo(unsigned sampleRate, unsigned channels) const -> Result<AudioSegment>
{
    if (sampleRate == 0 || channels == 0)
        return makeError(ErrorCode::InvalidArgument, "Target sample rate and channel count must be positive");

    auto const targetFrames = static_cast<std::uint64_t>(
        std::llround(static_cast<double>(frameCount()) * sampleRate / static_cast<double>(_sampleRate)));

    auto samples = convert(_samples, _channels, _sampleRate, channels, sampleRate, targetFrames);
    if (!samples)
        return std::unexpected(samples.error());
    return AudioSegment(sampleRate, channels, std::move(*samples));
}

auto AudioSegment::append(const AudioSegment& other) -> VoidResult
{
    if (other.empty())
        return {};

    if (other._sampleRate == _sampleRate && other._channels == _channels)
    {
        _samples.insert(_samples.end(), other._samples.begin(), other._samples.end());
        return {};
    }

    auto converted = other.convertedTo(_sampleRate, _channels);
    if (!converted)
        return std::unexpected(converted.error());
    _samples.insert(_samples.end(), converted->_samples.begin(), converted->_samples.end());
    return {};
}

void AudioSegment::appendSilence(std::uint64_t frames)
{
    _samples.resize(_samples.size() + frames * _channels, 0.0f);
}

auto AudioSegment::truncated(Milliseconds duration) const -> AudioSegment
{
    auto const frames = std::min(framesForDuration(duration, _sampleRate), frameCount());
    return resizedToFrames(frames);
}

auto AudioSegment::resizedToFrames(std::uint64_t frames) const -> AudioSegment
{
    auto const kept = static_cast<std::ptrdiff_t>(std::min(frames, frameCount()) * _channels);
    auto samples = std::vector<float>(_samples.begin(), _samples.begin() + kept);
    samples.resize(frames * _channels, 0.0f);
    return AudioSegment(_sampleRate, _channels, std::move(samples));
}

auto AudioSegment::withSpeed(double speed) const -> Result<AudioSegment>
{
    if (!(speed > 0.0))
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Playback speed must be greater than zero (got {})", speed));

    if (isClose(speed, 1.0, 1e-3))
        return *this;

    auto const shiftedRate = static_cast<unsigned>(std::llround(_sampleRate * speed));
    auto const targetFrames = static_cast<std::uint64_t>(std::llround(static_cast<double>(frameCount()) / speed));

    auto samples = convert(_samples, _channels, shiftedRate, _channels, _sampleRate, targetFrames);
    if (!samples)
        return std::unexpected(samples.error());
    return AudioSegment(_sampleRate, _channels, std::move(*samples));
}

} // namespace srtvoice
