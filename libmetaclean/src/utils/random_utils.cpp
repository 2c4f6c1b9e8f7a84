#include "../../include/random_utils.hpp"
#include <random>

namespace {
    thread_local std::mt19937_64 engine{std::random_device{}()};

    constexpr std::string_view kBase36 = "0123456789abcdefghijklmnopqrstuvwxyz";
}

std::uint64_t RandomUtils::next_u64() {
    return engine();
}

std::string RandomUtils::to_base36(std::uint64_t value, const std::size_t width) {
    std::string out(width, '0');
    for (auto it = out.rbegin(); it != out.rend(); ++it) {
        *it = kBase36[value % kBase36.size()];
        value /= kBase36.size();
    }
    return out;
}
