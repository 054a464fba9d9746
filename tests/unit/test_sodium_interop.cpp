#include <catch2/catch_test_macros.hpp>
#include "hookseal/crypto/sodium_interop.hpp"
#include <algorithm>
#include <set>
using namespace hookseal::protocol;
using namespace hookseal::protocol::crypto;
TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        auto result = SodiumInterop::Initialize();
        REQUIRE(result.IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Multiple Initialize calls are safe") {
        auto result1 = SodiumInterop::Initialize();
        auto result2 = SodiumInterop::Initialize();
        REQUIRE(result1.IsOk());
        REQUIRE(result2.IsOk());
    }
}

TEST_CASE("SodiumInterop - Secure Wipe", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Wipe empty buffer is a no-op") {
        std::vector<uint8_t> buffer;
        SodiumInterop::SecureWipe(buffer);
        REQUIRE(buffer.empty());
    }
    SECTION("Wipe zeroes every byte") {
        std::vector<uint8_t> buffer(100, 0xFF);
        SodiumInterop::SecureWipe(buffer);
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
    }
}

TEST_CASE("SodiumInterop - Constant Time Comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Equal buffers return true") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 5};
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b));
    }
    SECTION("Different buffers return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 6};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b));
    }
    SECTION("Different sizes return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4};
        REQUIRE_FALSE(SodiumInterop::ConstantTimeEquals(a, b));
    }
    SECTION("Empty buffers are equal") {
        std::vector<uint8_t> a;
        std::vector<uint8_t> b;
        REQUIRE(SodiumInterop::ConstantTimeEquals(a, b));
    }
}

TEST_CASE("SodiumInterop - Random Generation", "[sodium][crypto][random]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Requested length is honoured") {
        REQUIRE(SodiumInterop::GetRandomBytes(16).size() == 16);
        REQUIRE(SodiumInterop::GetRandomBytes(0).empty());
    }
    SECTION("Consecutive prefixes differ") {
        std::set<std::vector<uint8_t>> seen;
        for (int i = 0; i < 64; ++i) {
            seen.insert(SodiumInterop::GetRandomBytes(16));
        }
        REQUIRE(seen.size() == 64);
    }
    SECTION("RandomUniform stays below the bound") {
        for (int i = 0; i < 1000; ++i) {
            REQUIRE(SodiumInterop::RandomUniform(10) < 10);
        }
    }
}

TEST_CASE("SodiumInterop - Hex Encoding", "[sodium][encoding]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> data = {0x00, 0x0f, 0xa5, 0xff};
    REQUIRE(SodiumInterop::ToHex(data) == "000fa5ff");
    REQUIRE(SodiumInterop::ToHex(std::vector<uint8_t>{}).empty());
}
