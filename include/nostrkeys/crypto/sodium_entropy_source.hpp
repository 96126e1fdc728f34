#pragma once
#include "nostrkeys/interfaces/i_entropy_source.hpp"
namespace nostrkeys::crypto {
/// IEntropySource backed by randombytes_buf (getrandom(2) on Linux).
/// Stateless and safe for concurrent use.
class SodiumEntropySource final : public interfaces::IEntropySource {
public:
    [[nodiscard]] Result<Unit, KeyFailure> Fill(std::span<uint8_t> output) override;
    /// Process-wide instance used by the parameterless Generate().
    [[nodiscard]] static SodiumEntropySource& Instance() noexcept;
};
}
