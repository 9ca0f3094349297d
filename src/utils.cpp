#include "utils.h"
#include <array>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace rtvoice {
namespace utils {

namespace {

const char* kBase64Table = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<int, 256> make_decode_table() {
    std::array<int, 256> table;
    table.fill(-1);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(kBase64Table[i])] = i;
    }
    return table;
}

} // namespace

std::string base64_encode_pcm16(const AudioFrame& samples) {
    std::vector<uint8_t> bytes;
    bytes.reserve(samples.size() * 2);
    for (Sample s : samples) {
        uint16_t u = static_cast<uint16_t>(s);
        bytes.push_back(static_cast<uint8_t>(u & 0xFF));
        bytes.push_back(static_cast<uint8_t>((u >> 8) & 0xFF));
    }

    std::string ret;
    ret.reserve(((bytes.size() + 2) / 3) * 4);
    uint32_t val = 0;
    int valb = -6;
    for (uint8_t b : bytes) {
        val = (val << 8) + b;
        valb += 8;
        while (valb >= 0) {
            ret.push_back(kBase64Table[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) {
        ret.push_back(kBase64Table[((val << 8) >> (valb + 8)) & 0x3F]);
    }
    while (ret.size() % 4) {
        ret.push_back('=');
    }
    return ret;
}

AudioBuffer base64_decode_pcm16(const std::string& encoded) {
    static const std::array<int, 256> table = make_decode_table();

    std::vector<uint8_t> bytes;
    bytes.reserve(encoded.size() * 3 / 4);
    uint32_t val = 0;
    int valb = -8;
    for (unsigned char c : encoded) {
        if (table[c] == -1) break;
        val = (val << 6) + static_cast<uint32_t>(table[c]);
        valb += 6;
        if (valb >= 0) {
            bytes.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }

    AudioBuffer out(bytes.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        uint16_t u = static_cast<uint16_t>(bytes[2 * i] | (bytes[2 * i + 1] << 8));
        out[i] = static_cast<Sample>(u);
    }
    return out;
}

std::string random_id(size_t bytes) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes; ++i) {
        oss << std::setw(2) << dist(rng);
    }
    return oss.str();
}

std::string iso_timestamp_now() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::tm utc_tm{};
    gmtime_r(&time_t, &utc_tm);

    std::ostringstream oss;
    oss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

} // namespace utils
} // namespace rtvoice
