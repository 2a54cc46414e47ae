// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <tts/SpeechEngine.hpp>

#include <memory>
#include <string>

namespace narrator
{

/// @brief Configuration for the piper engine.
struct PiperEngineConfig
{
    /// @brief Path to the espeak-ng-data directory (defaults to built-in).
    std::string espeakDataPath;
};

/// @brief Synthesizes speech using the piper library (linked at build time).
///
/// Keeps one piper synthesizer per voice model, created on first use. Output is
/// encoded as 16-bit PCM WAV at the model's sample rate.
class PiperEngine final: public SpeechEngine
{
  public:
    explicit PiperEngine(PiperEngineConfig config = {});
    ~PiperEngine() override;

    PiperEngine(const PiperEngine&) = delete;
    PiperEngine& operator=(const PiperEngine&) = delete;

    [[nodiscard]] auto synthesize(const SynthesisRequest& request) -> Result<std::vector<std::uint8_t>> override;

    /// @brief Frees every loaded synthesizer; they are re-created on next use.
    [[nodiscard]] auto restart() -> VoidResult override;

    void interrupt() override;
    void resetInterrupt() override;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace narrator
