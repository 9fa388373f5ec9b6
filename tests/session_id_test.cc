#include "utils/session_id.h"
#include <cctype>
#include <gtest/gtest.h>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using eio::utils::encode_id_component;
using eio::utils::generate_session_id;

TEST(SessionIdTest, EncodesInBase64Alphabet) {
    EXPECT_EQ(encode_id_component(0), "0");
    EXPECT_EQ(encode_id_component(63), "_");
    EXPECT_EQ(encode_id_component(64), "10");
    EXPECT_EQ(encode_id_component(64 * 64 - 1), "__");
}

TEST(SessionIdTest, IdsAreUrlSafe) {
    for (int i = 0; i < 100; ++i) {
        auto id = generate_session_id();
        ASSERT_FALSE(id.empty());
        for (char c: id) {
            bool allowed = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
            EXPECT_TRUE(allowed) << "unexpected character in " << id;
        }
    }
}

TEST(SessionIdTest, ConcurrentIdsNeverCollide) {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;

    std::mutex mutex;
    std::set<std::string> ids;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&]() {
            std::vector<std::string> local;
            for (int i = 0; i < kPerThread; ++i) {
                local.push_back(generate_session_id());
            }
            std::lock_guard<std::mutex> lock(mutex);
            ids.insert(local.begin(), local.end());
        });
    }
    for (auto &thread: threads) {
        thread.join();
    }

    EXPECT_EQ(ids.size(), static_cast<size_t>(kThreads * kPerThread));
}
