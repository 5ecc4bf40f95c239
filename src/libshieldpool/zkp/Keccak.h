#pragma once

#include <xrpl/basics/Slice.h>
#include <xrpl/basics/base_uint.h>
#include <array>
#include <cstdint>

namespace shieldpool {
namespace zkp {

/**
 * Keccak-256 with the original 0x01 domain padding (not FIPS-202 SHA3-256).
 *
 * Incremental: call update() any number of times, then finish() once.
 */
class Keccak256 {
public:
    Keccak256();

    void update(void const* data, std::size_t size);
    void update(ripple::Slice data) { update(data.data(), data.size()); }

    ripple::uint256 finish();

private:
    static constexpr std::size_t rate = 136;

    void absorbBlock();

    std::array<std::uint64_t, 25> state_{};
    std::array<std::uint8_t, rate> buffer_{};
    std::size_t used_ = 0;
};

ripple::uint256 keccak256(ripple::Slice data);

} // namespace zkp
} // namespace shieldpool
