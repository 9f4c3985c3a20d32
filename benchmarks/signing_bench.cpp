#include <benchmark/benchmark.h>
#include "trustchain/canonical_json.hpp"
#include "trustchain/signing_engine.hpp"
#include "trustchain/verification_engine.hpp"
#include <string>

using namespace trustchain;
using json = nlohmann::json;

static json CreateArguments(size_t fields) {
    json args = json::object();
    for (size_t i = 0; i < fields; ++i) {
        args["field_" + std::to_string(fields - i)] = {
            {"value", static_cast<int>(i)}, {"label", "entry " + std::to_string(i)}, {"tags", {"a", "b"}}};
    }
    return args;
}

static void BM_Canonicalize_ParameterizedSize(benchmark::State& state) {
    auto args = CreateArguments(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        auto canonical = canonicalize(args);
        benchmark::DoNotOptimize(canonical);
    }
}
BENCHMARK(BM_Canonicalize_ParameterizedSize)->Range(1, 256)->Complexity(benchmark::oN);

static void BM_BuildSigningPayload(benchmark::State& state) {
    auto args = CreateArguments(8);

    for (auto _ : state) {
        auto payload = buildSigningPayload("list_tasks", args, 42, "2025-03-01T12:00:00.000Z",
                                           "3f2a9c0d1e4b5a6c7d8e9f00", SIGNATURE_SCHEMA_VERSION,
                                           std::string("acme"), std::nullopt);
        auto bytes = canonicalBytes(payload);
        benchmark::DoNotOptimize(bytes);
    }
}
BENCHMARK(BM_BuildSigningPayload);

// Full sign path: payload, canonical form, Ed25519, envelope and audit entry
static void BM_SigningEngine_Sign(benchmark::State& state) {
    KeyManager keys(true);
    AuditTrail audit;
    SigningEngine engine(keys, audit, "bench-agent", Tier::Pro);
    engine.reset("sess_bench", "2025-03-01T12:00:00.000Z");
    auto args = CreateArguments(8);

    for (auto _ : state) {
        auto envelope = engine.sign("list_tasks", args);
        benchmark::DoNotOptimize(envelope);
        if (audit.size() >= 4096) {
            state.PauseTiming();
            engine.reset("sess_bench", "2025-03-01T12:00:00.000Z");
            state.ResumeTiming();
        }
    }
}
BENCHMARK(BM_SigningEngine_Sign);

static void BM_VerificationEngine_Verify(benchmark::State& state) {
    KeyManager keys(true);
    AuditTrail audit;
    SigningEngine engine(keys, audit, "bench-agent", Tier::Community);
    engine.reset("sess_bench", "2025-03-01T12:00:00.000Z");
    VerificationEngine verifier;
    auto args = CreateArguments(8);
    auto envelope = engine.sign("list_tasks", args);

    for (auto _ : state) {
        bool result = verifier.verify(envelope, "list_tasks", args);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_VerificationEngine_Verify);
