#pragma once
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace eio::utils {

    // URL-safe alphabet, 64 symbols
    inline constexpr char kIdAlphabet[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz-_";

    inline std::string encode_id_component(uint64_t value) {
        std::string encoded;
        do {
            encoded.insert(encoded.begin(), kIdAlphabet[value % 64]);
            value /= 64;
        } while (value > 0);
        return encoded;
    }

    /**
     * @brief Generate a session id from the current millisecond timestamp.
     * Ids generated within the same millisecond get a ".<seed>" suffix, so ids
     * are unique within the process and sort roughly by creation time.
     */
    inline std::string generate_session_id() {
        static std::mutex mutex;
        static uint64_t previous = 0;
        static uint64_t seed = 0;

        // clock read and seed update must be atomic together
        std::lock_guard<std::mutex> lock(mutex);
        auto now = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                                 std::chrono::system_clock::now().time_since_epoch())
                                                 .count());
        if (now > previous) {
            seed = 0;
            previous = now;
            return encode_id_component(now);
        }
        // same millisecond, or the wall clock stepped back
        return encode_id_component(previous) + "." + encode_id_component(seed++);
    }

}// namespace eio::utils
