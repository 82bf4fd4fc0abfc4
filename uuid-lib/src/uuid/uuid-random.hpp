#ifndef UUID_RANDOM_HPP
#define UUID_RANDOM_HPP
#include <cstdint>
#include <cstddef>
#include <vector>
namespace UUID{
namespace random{
    // Process wide state for time based UUIDs. There is no persistent
    // clock sequence and no hardware address, both are random per process.
    struct GenerationState
    {
        std::uint64_t clock_sequence;
        std::uint64_t node; // 48 bits.
    };

    // Fills buf from the kernel CSPRNG. Throws std::system_error if getrandom fails.
    void fill(unsigned char* buf, std::size_t len);
    std::vector<unsigned char> bytes(std::size_t len);

    // Initialized on first use, immutable afterwards.
    const GenerationState& state();
}// namespace random
}// namespace UUID
#endif
