// SPDX-License-Identifier: Apache-2.0
#include "PiperEngine.hpp"

#include <audio/WavFormat.hpp>
#include <core/Log.hpp>

#include <atomic>
#include <format>
#include <map>
#include <string>
#include <vector>

extern "C"
{
#include <piper.h>
}

namespace narrator
{

namespace
{

    constexpr auto PiperChannels = std::uint16_t { 1 };

    struct SynthesizerDeleter
    {
        void operator()(piper_synthesizer* synth) const { piper_free(synth); }
    };

    using SynthesizerPtr = std::unique_ptr<piper_synthesizer, SynthesizerDeleter>;

} // namespace

struct PiperEngine::Impl
{
    PiperEngineConfig config;
    std::map<std::string, SynthesizerPtr> synthesizers;
    std::atomic<bool> interrupted { false };

    [[nodiscard]] auto espeakData() const -> std::string
    {
        return config.espeakDataPath.empty() ? std::string(NARRATOR_ESPEAK_DATA_DIR) : config.espeakDataPath;
    }

    auto synthesizerFor(const std::string& modelPath) -> Result<piper_synthesizer*>
    {
        if (auto const it = synthesizers.find(modelPath); it != synthesizers.end())
            return it->second.get();

        auto const configPath = modelPath + ".json";
        auto const espeak = espeakData();
        auto synth = SynthesizerPtr(piper_create(modelPath.c_str(), configPath.c_str(), espeak.c_str()));
        if (!synth)
            return makeError(ErrorCode::ModelLoadError,
                             std::format("Failed to create piper synthesizer (model: {}, config: {}, espeak: {})",
                                         modelPath,
                                         configPath,
                                         espeak));

        log::info("Loaded piper voice model {}", modelPath);
        auto* const raw = synth.get();
        synthesizers.emplace(modelPath, std::move(synth));
        return raw;
    }
};

PiperEngine::PiperEngine(PiperEngineConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

PiperEngine::~PiperEngine() = default;

auto PiperEngine::synthesize(const SynthesisRequest& request) -> Result<std::vector<std::uint8_t>>
{
    if (request.text.empty())
        return makeError(ErrorCode::InvalidInput, "Cannot synthesize empty text");
    if (request.voice.modelPath.empty())
        return makeError(ErrorCode::UnsupportedVoice, std::format("Voice '{}' has no model", request.voice.voice));

    auto synth = _impl->synthesizerFor(request.voice.modelPath);
    if (!synth)
        return std::unexpected(synth.error());

    auto opts = piper_default_synthesize_options(*synth);
    opts.length_scale = request.voice.lengthScale;
    auto const startResult = piper_synthesize_start(*synth, request.text.c_str(), &opts);
    if (startResult != 0)
        return makeError(ErrorCode::EngineError, std::format("piper_synthesize_start failed ({})", startResult));

    auto audioData = std::vector<float> {};
    auto sampleRate = 0;
    auto chunk = piper_audio_chunk {};

    while (true)
    {
        if (_impl->interrupted.load(std::memory_order_relaxed))
            return makeError(ErrorCode::Cancelled, "Synthesis interrupted");

        auto const rc = piper_synthesize_next(*synth, &chunk);
        if (rc == 1) // PIPER_DONE
            break;
        if (rc < 0) // PIPER_ERR_GENERIC
            return makeError(ErrorCode::EngineError, std::format("piper_synthesize_next failed ({})", rc));
        // rc == 0: PIPER_OK
        sampleRate = chunk.sample_rate;
        audioData.insert(audioData.end(), chunk.samples, chunk.samples + chunk.num_samples);
    }

    if (audioData.empty() || sampleRate <= 0)
        return makeError(ErrorCode::EngineError, "piper produced no audio");

    return encodeWav16(audioData, static_cast<std::uint32_t>(sampleRate), PiperChannels);
}

auto PiperEngine::restart() -> VoidResult
{
    auto const count = _impl->synthesizers.size();
    _impl->synthesizers.clear();
    log::info("Piper engine restarted ({} synthesizer(s) released)", count);
    return {};
}

void PiperEngine::interrupt()
{
    _impl->interrupted.store(true, std::memory_order_relaxed);
}

void PiperEngine::resetInterrupt()
{
    _impl->interrupted.store(false, std::memory_order_relaxed);
}

} // namespace narrator
