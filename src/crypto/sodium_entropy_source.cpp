#include "nostrkeys/crypto/sodium_entropy_source.hpp"
#include "nostrkeys/crypto/sodium_interop.hpp"

namespace nostrkeys::crypto {

Result<Unit, KeyFailure> SodiumEntropySource::Fill(std::span<uint8_t> output) {
    auto fill_result = SodiumInterop::FillRandom(output);
    if (fill_result.IsErr()) {
        return Result<Unit, KeyFailure>::Err(
            KeyFailure::EntropyUnavailable(fill_result.UnwrapErr().message));
    }
    return Result<Unit, KeyFailure>::Ok(unit);
}

SodiumEntropySource& SodiumEntropySource::Instance() noexcept {
    static SodiumEntropySource instance;
    return instance;
}

}
