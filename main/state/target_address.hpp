#ifndef TARGET_ADDRESS_HPP
#define TARGET_ADDRESS_HPP

#include <cstddef>

namespace TargetAddress {
    // "AA:BB:CC:DD:EE:FF"
    static constexpr std::size_t LENGTH = 17;

    bool isValid(const char* address);

    // NVS override (bridge/target_mac) if present and valid, otherwise
    // Config::Device::default_target_mac. out_size must be > LENGTH.
    void load(char* out, std::size_t out_size);
}

#endif // TARGET_ADDRESS_HPP
