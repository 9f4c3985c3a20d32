#include <benchmark/benchmark.h>
#include "trustchain/crypto.hpp"
#include <vector>
#include <string>

using namespace trustchain;

// Test data of different sizes
static const std::vector<uint8_t> SMALL_DATA = {0x48, 0x65, 0x6C, 0x6C, 0x6F, 0x2C, 0x20, 0x57, 0x6F, 0x72, 0x6C, 0x64, 0x21}; // "Hello, World!"
static std::vector<uint8_t> CreatePayloadData() {
    std::string data = R"({"arguments":{"limit":25,"status":"open"},"execution_context":null,"key_id":"3f2a9c0d1e4b5a6c7d8e9f00","name":"list_tasks","sequence":42,"signature_schema_version":1,"tenant_id":null,"timestamp":"2025-03-01T12:00:00.000Z"})";
    return std::vector<uint8_t>(data.begin(), data.end());
}
static const std::vector<uint8_t> LARGE_DATA(1024, 0x42);

// HMAC256 Benchmarks
static void BM_HMAC_KeyGeneration(benchmark::State& state) {
    for (auto _ : state) {
        auto key = HmacSha256Algorithm::generateSecureKey();
        benchmark::DoNotOptimize(key);
    }
}
BENCHMARK(BM_HMAC_KeyGeneration);

static void BM_HMAC_Sign_Payload(benchmark::State& state) {
    HmacSha256Algorithm hmac(HmacSha256Algorithm::generateSecureKey());
    auto payload = CreatePayloadData();

    for (auto _ : state) {
        auto signature = hmac.sign(payload);
        benchmark::DoNotOptimize(signature);
    }
}
BENCHMARK(BM_HMAC_Sign_Payload);

static void BM_HMAC_Verify_Payload(benchmark::State& state) {
    HmacSha256Algorithm hmac(HmacSha256Algorithm::generateSecureKey());
    auto payload = CreatePayloadData();
    auto signature = hmac.sign(payload);

    for (auto _ : state) {
        bool result = hmac.verify(payload, signature);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_HMAC_Verify_Payload);

// Ed25519 Benchmarks
static void BM_Ed25519_KeyGeneration(benchmark::State& state) {
    for (auto _ : state) {
        Ed25519Algorithm ed25519;
        benchmark::DoNotOptimize(ed25519);
    }
}
BENCHMARK(BM_Ed25519_KeyGeneration);

static void BM_Ed25519_Sign_Small(benchmark::State& state) {
    Ed25519Algorithm ed25519;

    for (auto _ : state) {
        auto signature = ed25519.sign(SMALL_DATA);
        benchmark::DoNotOptimize(signature);
    }
}
BENCHMARK(BM_Ed25519_Sign_Small);

static void BM_Ed25519_Sign_Payload(benchmark::State& state) {
    Ed25519Algorithm ed25519;
    auto payload = CreatePayloadData();

    for (auto _ : state) {
        auto signature = ed25519.sign(payload);
        benchmark::DoNotOptimize(signature);
    }
}
BENCHMARK(BM_Ed25519_Sign_Payload);

static void BM_Ed25519_Sign_Large(benchmark::State& state) {
    Ed25519Algorithm ed25519;

    for (auto _ : state) {
        auto signature = ed25519.sign(LARGE_DATA);
        benchmark::DoNotOptimize(signature);
    }
}
BENCHMARK(BM_Ed25519_Sign_Large);

static void BM_Ed25519_Verify_Payload(benchmark::State& state) {
    Ed25519Algorithm ed25519;
    auto payload = CreatePayloadData();
    auto signature = ed25519.sign(payload);

    for (auto _ : state) {
        bool result = ed25519.verify(payload, signature);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Ed25519_Verify_Payload);

// Verification against a bare public key, as a tool server does it
static void BM_Ed25519_VerifyDetached_Payload(benchmark::State& state) {
    Ed25519Algorithm ed25519;
    auto payload = CreatePayloadData();
    auto signature = ed25519.sign(payload);
    auto publicKey = ed25519.publicKey();

    for (auto _ : state) {
        bool result = verifyEd25519(publicKey, payload, signature);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Ed25519_VerifyDetached_Payload);

// SHA-256 Benchmarks
static void BM_SHA256_Hex(benchmark::State& state) {
    const size_t size = static_cast<size_t>(state.range(0));
    std::string data(size, 'x');

    for (auto _ : state) {
        auto digest = sha256Hex(data);
        benchmark::DoNotOptimize(digest);
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * size));
}
BENCHMARK(BM_SHA256_Hex)->Range(64, 64<<10);

static void BM_RandomHex_SessionId(benchmark::State& state) {
    for (auto _ : state) {
        auto id = randomHex(16);
        benchmark::DoNotOptimize(id);
    }
}
BENCHMARK(BM_RandomHex_SessionId);
