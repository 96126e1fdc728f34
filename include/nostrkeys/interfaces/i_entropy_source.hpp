#pragma once
#include "nostrkeys/core/result.hpp"
#include "nostrkeys/core/failures.hpp"
#include <cstdint>
#include <span>
namespace nostrkeys::interfaces {
using nostrkeys::Result;
using nostrkeys::Unit;
using nostrkeys::KeyFailure;
/// Source of secret randomness for key generation.
///
/// Fill() either writes every byte of output or fails with
/// EntropyUnavailable. Implementations used from several threads at once must
/// synchronize internally.
class IEntropySource {
public:
    virtual ~IEntropySource() = default;
    [[nodiscard]] virtual Result<Unit, KeyFailure> Fill(std::span<uint8_t> output) = 0;
};
}
