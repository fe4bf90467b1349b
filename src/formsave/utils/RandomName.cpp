#include "formsave/utils/RandomName.hpp"
#include <mutex>
#include <random>

namespace formsave {
namespace utils {

namespace {

constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789";

struct NameGenerator {
    std::mutex mutex;
    std::mt19937_64 engine{std::random_device{}()};
};

NameGenerator& generator() {
    static NameGenerator instance;
    return instance;
}

} // namespace

std::string randomAlphanumeric(size_t length) {
    auto& gen = generator();
    std::uniform_int_distribution<size_t> dist(0, sizeof(kAlphabet) - 2);

    std::string name;
    name.reserve(length);
    std::lock_guard<std::mutex> lock(gen.mutex);
    for (size_t i = 0; i < length; ++i) {
        name.push_back(kAlphabet[dist(gen.engine)]);
    }
    return name;
}

} // namespace utils
} // namespace formsave
