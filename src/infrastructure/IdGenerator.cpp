#include "infrastructure/IdGenerator.hpp"
#include <random>

namespace quietledger::infrastructure {

std::string GenerateId() {
    static const char hex[] = "0123456789abcdef";
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<int> digit(0, 15);

    std::string s;
    s.reserve(32);
    for (int i = 0; i < 32; ++i) {
        s += hex[digit(engine)];
    }
    return s;
}

} // namespace quietledger::infrastructure
