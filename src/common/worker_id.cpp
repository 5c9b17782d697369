#include "worker_id.hpp"
#include <unistd.h>
#include <array>
#include <cstdint>
#include <random>
#include <sstream>
#include <iomanip>

WorkerId WorkerId::generate() {
    return WorkerId(hostName() + ":" + randomToken());
}

std::string WorkerId::hostName() {
    char buf[256];
    if (gethostname(buf, sizeof(buf)) != 0) {
        return "localhost";
    }
    buf[sizeof(buf) - 1] = '\0';
    return buf;
}

std::string WorkerId::randomToken() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};

    std::array<uint8_t, 16> id{};
    for (auto& b : id) {
        b = static_cast<uint8_t>(rng());
    }

    // RFC4122 variant + version 4
    id[6] = (id[6] & 0x0F) | 0x40;
    id[8] = (id[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
        oss << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(id[i]);
    }
    return oss.str();
}
