#include <benchmark/benchmark.h>
#include "trustchain/base64.hpp"
#include <vector>
#include <string>
#include <random>

using namespace trustchain;

// Ed25519 signature and public key sizes
static const std::vector<uint8_t> SIGNATURE_DATA(64, 0xA5);
static const std::vector<uint8_t> PUBLIC_KEY_DATA(32, 0x5A);

static std::vector<uint8_t> CreateLargeData() {
    std::vector<uint8_t> data(10240); // 10KB
    std::mt19937 gen(42); // Fixed seed for reproducible benchmarks
    std::uniform_int_distribution<int> dis(0, 255);
    for (auto& byte : data) {
        byte = static_cast<uint8_t>(dis(gen));
    }
    return data;
}

static void BM_Base64_Encode_Signature(benchmark::State& state) {
    for (auto _ : state) {
        std::string encoded = base64Encode(SIGNATURE_DATA);
        benchmark::DoNotOptimize(encoded);
    }
}
BENCHMARK(BM_Base64_Encode_Signature);

static void BM_Base64_Decode_Signature(benchmark::State& state) {
    std::string encoded = base64Encode(SIGNATURE_DATA);

    for (auto _ : state) {
        std::vector<uint8_t> decoded = base64Decode(encoded);
        benchmark::DoNotOptimize(decoded);
    }
}
BENCHMARK(BM_Base64_Decode_Signature);

static void BM_Base64_Decode_PublicKey_Unpadded(benchmark::State& state) {
    std::string encoded = base64Encode(PUBLIC_KEY_DATA);
    encoded.erase(encoded.find_last_not_of('=') + 1);

    for (auto _ : state) {
        std::vector<uint8_t> decoded = base64Decode(encoded);
        benchmark::DoNotOptimize(decoded);
    }
}
BENCHMARK(BM_Base64_Decode_PublicKey_Unpadded);

static void BM_Base64_Encode_Large(benchmark::State& state) {
    auto data = CreateLargeData();

    for (auto _ : state) {
        std::string encoded = base64Encode(data);
        benchmark::DoNotOptimize(encoded);
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * data.size()));
}
BENCHMARK(BM_Base64_Encode_Large);

static void BM_Base64_Decode_ParameterizedSize(benchmark::State& state) {
    const size_t size = static_cast<size_t>(state.range(0));
    std::vector<uint8_t> data(size, 0x42);
    std::string encoded = base64Encode(data);

    for (auto _ : state) {
        std::vector<uint8_t> decoded = base64Decode(encoded);
        benchmark::DoNotOptimize(decoded);
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * size));
}
BENCHMARK(BM_Base64_Decode_ParameterizedSize)->Range(8, 8<<10)->Complexity(benchmark::oN);

static void BM_Hex_Encode_Digest(benchmark::State& state) {
    std::vector<uint8_t> digest(32, 0x3C);

    for (auto _ : state) {
        std::string hex = hexEncode(digest);
        benchmark::DoNotOptimize(hex);
    }
}
BENCHMARK(BM_Hex_Encode_Digest);
