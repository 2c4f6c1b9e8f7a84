#ifndef METACLEAN_RANDOM_UTILS_H
#define METACLEAN_RANDOM_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

/**
 * @brief Thread-local random helpers used for output names.
 *
 * The generator (std::mt19937_64) is seeded once per thread from
 * std::random_device.
 */
namespace RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    std::uint64_t next_u64();

    /**
     * @brief Renders the low digits of @p value in lowercase base 36.
     * @return Exactly @p width characters from [0-9a-z], zero padded.
     */
    std::string to_base36(std::uint64_t value, std::size_t width);

    /**
     * @brief Finalizer of the splitmix64 generator.
     *
     * Spreads the bits of @p x so that nearby inputs (consecutive
     * timestamps, similar paths) give unrelated outputs.
     */
    constexpr std::uint64_t mix64(std::uint64_t x) noexcept {
        x += 0x9E3779B97F4A7C15ULL;
        x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
        x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
        return x ^ (x >> 31);
    }

} // namespace

#endif //METACLEAN_RANDOM_UTILS_H
