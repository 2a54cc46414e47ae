// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace narrator
{

/// @brief A single synthesis job: text plus the voice configuration to speak it with.
struct SynthesisRequest
{
    std::string text;
    TierConfig voice;
};

/// @brief Abstract interface for text-to-speech engines.
///
/// Implementations are driven from the GenerationCoordinator's worker thread
/// and are never called concurrently.
class SpeechEngine
{
  public:
    virtual ~SpeechEngine() = default;

    /// @brief Synthesizes speech (blocking).
    /// @param request The text and voice.
    /// @return A complete WAV file or a raw engine error.
    [[nodiscard]] virtual auto synthesize(const SynthesisRequest& request) -> Result<std::vector<std::uint8_t>> = 0;

    /// @brief Discards the engine's execution context and creates a fresh one.
    /// @return Success or an error if the new context could not be created.
    [[nodiscard]] virtual auto restart() -> VoidResult = 0;

    /// @brief Asks an in-progress synthesize() call to return early.
    ///
    /// May be called from any thread, also before the call has started. The
    /// request stays pending until resetInterrupt(). Best effort: the interrupted
    /// call returns a Cancelled error or finishes normally.
    virtual void interrupt() = 0;

    /// @brief Clears a pending interrupt ahead of the next synthesize() call.
    virtual void resetInterrupt() = 0;
};

} // namespace narrator
