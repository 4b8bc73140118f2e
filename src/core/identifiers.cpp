/**
 * @file identifiers.cpp
 * @brief Random identifiers for jobs and workers
 */

#include <genqueue/core/identifiers.hpp>

#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace genqueue::core {

namespace {

auto random_engine() -> std::mt19937_64& {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    return gen;
}

}  // namespace

auto generate_uuid() -> std::string {
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    uint64_t ab = dis(random_engine());
    uint64_t cd = dis(random_engine());

    // Set version (4) and variant (8, 9, A, or B)
    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8) << (ab >> 32);
    oss << '-';
    oss << std::setw(4) << ((ab >> 16) & 0xFFFF);
    oss << '-';
    oss << std::setw(4) << (ab & 0xFFFF);
    oss << '-';
    oss << std::setw(4) << (cd >> 48);
    oss << '-';
    oss << std::setw(12) << (cd & 0xFFFFFFFFFFFFULL);

    return oss.str();
}

auto generate_worker_id() -> std::string {
    static thread_local std::uniform_int_distribution<uint32_t> dis(0, 0xFFFFFF);

    std::ostringstream oss;
    oss << "worker-" << std::hex << std::setfill('0') << std::setw(6)
        << dis(random_engine());
    return oss.str();
}

}  // namespace genqueue::core
