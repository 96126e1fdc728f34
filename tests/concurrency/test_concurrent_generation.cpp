#include <catch2/catch_test_macros.hpp>
#include "nostrkeys/keys/keys.hpp"
#include "helpers/fake_entropy_source.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

using namespace nostrkeys;
using namespace nostrkeys::keys;
using nostrkeys::test_helpers::FakeEntropySource;

TEST_CASE("Concurrency - Parallel Generation", "[concurrency][keys][generate]") {
    SECTION("16 threads generating 250 keypairs each - no collisions") {
        constexpr int THREAD_COUNT = 16;
        constexpr int KEYS_PER_THREAD = 250;

        std::unordered_set<std::string> secret_set;
        std::mutex secret_set_mutex;
        std::atomic<int> failures{0};
        std::atomic<int> mismatches{0};

        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);

        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&]() {
                for (int i = 0; i < KEYS_PER_THREAD; ++i) {
                    auto result = Generate();
                    if (result.IsErr()) {
                        failures.fetch_add(1, std::memory_order_relaxed);
                        continue;
                    }
                    const auto& keypair = result.Unwrap();
                    auto derived = models::PublicKey::FromSecretKey(keypair.GetSecretKey());
                    if (derived.IsErr() || derived.Unwrap() != keypair.GetPublicKey()) {
                        mismatches.fetch_add(1, std::memory_order_relaxed);
                    }
                    std::lock_guard lock(secret_set_mutex);
                    secret_set.insert(ToHex(keypair.GetSecretKey()));
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(failures.load() == 0);
        REQUIRE(mismatches.load() == 0);
        REQUIRE(secret_set.size() == static_cast<size_t>(THREAD_COUNT * KEYS_PER_THREAD));
    }

    SECTION("Shared fake source hands each block to one caller") {
        constexpr int THREAD_COUNT = 8;
        constexpr int KEYS_PER_THREAD = 32;

        FakeEntropySource entropy;
        for (int i = 1; i <= THREAD_COUNT * KEYS_PER_THREAD; ++i) {
            std::vector<uint8_t> block(32, 0);
            block[30] = static_cast<uint8_t>(i >> 8);
            block[31] = static_cast<uint8_t>(i & 0xFF);
            entropy.Push(block);
        }

        std::unordered_set<std::string> secret_set;
        std::mutex secret_set_mutex;
        std::atomic<int> failures{0};
        std::vector<std::thread> threads;
        threads.reserve(THREAD_COUNT);

        for (int t = 0; t < THREAD_COUNT; ++t) {
            threads.emplace_back([&]() {
                for (int i = 0; i < KEYS_PER_THREAD; ++i) {
                    auto result = Generate(entropy);
                    if (result.IsErr()) {
                        failures.fetch_add(1, std::memory_order_relaxed);
                        continue;
                    }
                    std::lock_guard lock(secret_set_mutex);
                    secret_set.insert(ToHex(result.Unwrap().GetSecretKey()));
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        REQUIRE(failures.load() == 0);
        REQUIRE(secret_set.size() == static_cast<size_t>(THREAD_COUNT * KEYS_PER_THREAD));
        REQUIRE(entropy.Remaining() == 0);
    }
}

TEST_CASE("Concurrency - Parallel Parsing", "[concurrency][keys][parse]") {
    constexpr int THREAD_COUNT = 16;
    constexpr int PARSES_PER_THREAD = 200;
    const std::string nsec = "nsec1j4c6269y9w0q2er2xjw8sv2ehyrtfxq3jwgdlxj6qfn8z4gjsq5qfvfk99";
    const std::string npub = "npub14f8usejl26twx0dhuxjh9cas7keav9vr0v8nvtwtrjqx3vycc76qqh9nsy";

    std::atomic<int> wrong{0};
    std::vector<std::thread> threads;
    threads.reserve(THREAD_COUNT);

    for (int t = 0; t < THREAD_COUNT; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < PARSES_PER_THREAD; ++i) {
                auto result = ParseKeypair(nsec);
                if (result.IsErr() || ToHumanReadable(result.Unwrap().GetPublicKey()) != npub) {
                    wrong.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(wrong.load() == 0);
}
