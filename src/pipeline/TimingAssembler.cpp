// SPDX-License-Identifier: Apache-2.0
#include "TimingAssembler.hpp"

#include <core/Log.hpp>
#include <core/Timing.hpp>
#include <text/TextChunker.hpp>

#include <algorithm>
#include <condition_variable>
#include <format>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace srtvoice
{

namespace
{

    /// @brief Synthesizes cues on worker threads ahead of the in-order assembly.
    ///
    /// Workers claim cues in order and stay at most a fixed number of cues ahead of the
    /// consumer. After the first failure no new cues are claimed; running ones finish
    /// when the prefetcher is destroyed.
    class CuePrefetcher
    {
      public:
        using Work = std::function<Result<AudioSegment>(const Cue&)>;

        CuePrefetcher(std::span<const Cue> cues, int workerCount, Work work):
            _cues(cues),
            _work(std::move(work)),
            _slots(cues.size()),
            _lookahead(static_cast<std::size_t>(workerCount) * 2)
        {
            auto const threads = std::min(static_cast<std::size_t>(workerCount), cues.size());
            for (auto i = std::size_t { 0 }; i < threads; ++i)
                _workers.emplace_back([this](const std::stop_token& stopToken) { run(stopToken); });
        }

        ~CuePrefetcher()
        {
            for (auto& worker: _workers)
                worker.request_stop();
        }

        CuePrefetcher(const CuePrefetcher&) = delete;
        CuePrefetcher& operator=(const CuePrefetcher&) = delete;

        /// @brief Blocks until the given cue is synthesized and hands over its result.
        auto take(std::size_t index) -> Result<AudioSegment>
        {
            auto lock = std::unique_lock(_mutex);
            _cv.wait(lock, [&] { return _slots[index].has_value(); });

            auto result = std::move(*_slots[index]);
            _slots[index].reset();
            _taken = index + 1;
            lock.unlock();

            _cv.notify_all();
            return result;
        }

      private:
        void run(const std::stop_token& stopToken)
        {
            while (true)
            {
                auto index = std::size_t { 0 };
                {
                    auto lock = std::unique_lock(_mutex);
                    _cv.wait(lock, stopToken, [this] {
                        return _failed || _next >= _cues.size() || _next < _taken + _lookahead;
                    });
                    if (stopToken.stop_requested() || _failed || _next >= _cues.size())
                        return;
                    index = _next++;
                }

                auto result = _work(_cues[index]);

                {
                    auto lock = std::lock_guard(_mutex);
                    if (!result)
                        _failed = true;
                    _slots[index] = std::move(result);
                }
                _cv.notify_all();
            }
        }

        std::span<const Cue> _cues;
        Work _work;
        std::vector<std::optional<Result<AudioSegment>>> _slots;
        std::size_t _lookahead;
        std::size_t _next = 0;
        std::size_t _taken = 0;
        bool _failed = false;
        std::mutex _mutex;
        std::condition_variable_any _cv;
        std::vector<std::jthread> _workers; // last member: joined before the state above is destroyed
    };

    constexpr auto slotFitName(SlotFit fit) -> std::string_view
    {
        switch (fit)
        {
            case SlotFit::Fits: return "fits";
            case SlotFit::Padded: return "padded";
            case SlotFit::HardCut: return "hard-cut";
            case SlotFit::SpedUp: return "sped-up";
            case SlotFit::Overflow: return "overflow";
            case SlotFit::Unslotted: return "unslotted";
        }
        return "?";
    }

} // namespace

TimingAssembler::TimingAssembler(SpeechSynthesizer& synthesizer, PipelineConfig config):
    _synthesizer(synthesizer), _config(config)
{
}

auto TimingAssembler::build(std::span<const Cue> cues) -> Result<AudioSegment>
{
    _placements.clear();

    if (auto valid = validate(_config); !valid)
        return std::unexpected(valid.error());

    auto const sampleRate = static_cast<unsigned>(_config.sampleRate);
    auto const channels = static_cast<unsigned>(_config.channels);

    log::info("Assembling {} cues ({} workers, fill-to-end: {}, hard-cut: {}, max speed-up: {:.2f})",
              cues.size(),
              _config.workerCount,
              _config.fillToEnd,
              _config.hardCut,
              _config.maxSpeedup);

    auto track = AudioSegment::silence(Milliseconds { _config.padLeadingMs }, sampleRate, channels);
    auto placements = std::vector<CuePlacement> {};
    placements.reserve(cues.size());

    auto prefetcher = CuePrefetcher(cues, _config.workerCount, [this](const Cue& cue) { return synthesizeCue(cue); });

    for (auto i = std::size_t { 0 }; i < cues.size(); ++i)
    {
        auto const& cue = cues[i];

        // Gap-fill up to the authored start.
        auto const startFrame = framesForDuration(cue.start, sampleRate);
        if (track.frameCount() < startFrame)
            track.appendSilence(startFrame - track.frameCount());
        else if (track.frameCount() > startFrame)
            log::debug("Cue {} starts {} ms late", cue.index, (track.duration() - cue.start).count());

        auto raw = prefetcher.take(i);
        if (!raw)
            return std::unexpected(raw.error());

        auto placement = CuePlacement {
            .cueIndex = cue.index,
            .position = track.duration(),
            .slot = cue.slot(),
            .rawDuration = raw->duration(),
        };

        auto fitted = fitToSlot(*raw, cue.slot(), placement);
        if (!fitted)
            return makeError(fitted.error().code, std::format("Cue {}: {}", cue.index, fitted.error().message));

        placement.emittedDuration = fitted->duration();
        if (auto appended = track.append(*fitted); !appended)
            return makeError(appended.error().code, std::format("Cue {}: {}", cue.index, appended.error().message));

        log::debug("Cue {} at {} ms: speech {} ms, slot {} ms, emitted {} ms ({}, speed {:.3f})",
                   placement.cueIndex,
                   placement.position.count(),
                   placement.rawDuration.count(),
                   placement.slot.count(),
                   placement.emittedDuration.count(),
                   slotFitName(placement.fit),
                   placement.speed);
        placements.push_back(placement);
    }

    track.appendSilence(framesForDuration(Milliseconds { _config.padTrailingMs }, sampleRate));

    auto const overflows = std::ranges::count(placements, SlotFit::Overflow, &CuePlacement::fit);
    if (overflows > 0)
        log::warning("{} cue(s) exceed their slot even at {:.2f}x speed", overflows, _config.maxSpeedup);

    log::info("Assembled {} ms of audio from {} cues", track.duration().count(), cues.size());
    _placements = std::move(placements);
    return track;
}

auto TimingAssembler::synthesizeCue(const Cue& cue) const -> Result<AudioSegment>
{
    auto segment = AudioSegment(static_cast<unsigned>(_config.sampleRate), static_cast<unsigned>(_config.channels));

    auto chunkNumber = 0;
    for (auto const& piece: TextChunker(cue.text, static_cast<std::size_t>(_config.maxCharsPerCall)))
    {
        ++chunkNumber;
        auto audio = _synthesizer.synthesize(piece);
        if (!audio)
            return makeError(audio.error().code,
                             std::format("Cue {}, chunk {} (\"{}\"): {}",
                                         cue.index,
                                         chunkNumber,
                                         textPreview(piece),
                                         audio.error().message));

        if (auto appended = segment.append(*audio); !appended)
            return makeError(appended.error().code,
                             std::format("Cue {}, chunk {}: {}", cue.index, chunkNumber, appended.error().message));
    }

    return segment;
}

auto TimingAssembler::fitToSlot(const AudioSegment& raw, Milliseconds slot, CuePlacement& placement) const
    -> Result<AudioSegment>
{
    auto const slotFrames = framesForDuration(slot, raw.sampleRate());
    auto const rawFrames = raw.frameCount();

    if (slotFrames == 0)
    {
        placement.fit = SlotFit::Unslotted;
        return raw;
    }

    if (rawFrames <= slotFrames)
    {
        if (!_config.fillToEnd)
        {
            placement.fit = SlotFit::Fits;
            return raw;
        }
        placement.fit = SlotFit::Padded;
        return raw.resizedToFrames(slotFrames);
    }

    if (_config.hardCut)
    {
        placement.fit = SlotFit::HardCut;
        return raw.truncated(slot);
    }

    auto const neededSpeed = static_cast<double>(rawFrames) / static_cast<double>(slotFrames);
    auto const speed = clamp(neededSpeed, 1.0, _config.maxSpeedup);
    placement.speed = speed;

    auto sped = raw.withSpeed(speed);
    if (!sped)
        return sped;

    if (neededSpeed <= _config.maxSpeedup)
    {
        // Absorb the rounding of the resampled length.
        placement.fit = SlotFit::SpedUp;
        return sped->resizedToFrames(slotFrames);
    }

    // The cap binds: keep the remaining overflow rather than cutting speech.
    placement.fit = SlotFit::Overflow;
    return sped;
}

} // namespace srtvoice
