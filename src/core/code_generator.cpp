#include "core/code_generator.hpp"

namespace {

[[nodiscard]] std::uint64_t make_seed(std::optional<std::uint64_t> seed) {
    if (seed) {
        return *seed;
    }
    std::random_device rd;
    return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
}

}  // namespace

CodeGenerator::CodeGenerator(std::optional<std::uint64_t> seed)
    : engine_{make_seed(seed)}
{}

std::string CodeGenerator::generate() {
    std::string code(kCodeLength, '\0');

    std::lock_guard<std::mutex> lock{mutex_};
    for (auto& ch : code) {
        ch = kAlphabet[dist_(engine_)];
    }
    return code;
}
