// Performance benchmarks for dmutil formatting and hashing
// Uses Google Benchmark for accurate measurement and CI regression tracking
//
// Benchmark hygiene:
// - Pre-generate all test data outside timing loops
// - Use fixed dataset sizes for reproducible results

#include <benchmark/benchmark.h>

#include <dmutil/formatter.hpp>
#include <dmutil/internal.hpp>

#include <string>
#include <vector>

namespace {

// =============================================================================
// Internal Utilities Benchmarks
// =============================================================================

static void BM_SHA256(benchmark::State& state) {
  std::string data(state.range(0), 'x');
  for (auto _ : state) {
    auto digest = dmutil::internal::Sha256::Digest(data);
    benchmark::DoNotOptimize(digest);
  }
  state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_SHA256)->Range(16, 4096);

static void BM_HexEncode(benchmark::State& state) {
  auto digest = dmutil::HashString("benchmark");
  for (auto _ : state) {
    auto hex = dmutil::HexEncode(digest);
    benchmark::DoNotOptimize(hex);
  }
}
BENCHMARK(BM_HexEncode);

static void BM_Base64Encode(benchmark::State& state) {
  auto digest = dmutil::HashString("benchmark");
  for (auto _ : state) {
    auto b64 = dmutil::Base64Encode(digest);
    benchmark::DoNotOptimize(b64);
  }
}
BENCHMARK(BM_Base64Encode);

// =============================================================================
// Formatter Benchmarks
// =============================================================================

static void BM_FormatEmail_Plain(benchmark::State& state) {
  const std::string email = "  Some.User@Example.COM ";
  for (auto _ : state) {
    auto out = dmutil::FormatEmailAddress(email);
    benchmark::DoNotOptimize(out);
  }
}
BENCHMARK(BM_FormatEmail_Plain);

static void BM_FormatEmail_Gmail(benchmark::State& state) {
  const std::string email = "Some.Dotted.User@GoogleMail.com";
  for (auto _ : state) {
    auto out = dmutil::FormatEmailAddress(email);
    benchmark::DoNotOptimize(out);
  }
}
BENCHMARK(BM_FormatEmail_Gmail);

static void BM_FormatPhone(benchmark::State& state) {
  const std::string phone = "+1 (800) 555-0100";
  for (auto _ : state) {
    auto out = dmutil::FormatPhoneNumber(phone);
    benchmark::DoNotOptimize(out);
  }
}
BENCHMARK(BM_FormatPhone);

static void BM_FormatGivenName(benchmark::State& state) {
  const std::string name = "Mrs. Jane";
  for (auto _ : state) {
    auto out = dmutil::FormatGivenName(name);
    benchmark::DoNotOptimize(out);
  }
}
BENCHMARK(BM_FormatGivenName);

static void BM_FormatFamilyName(benchmark::State& state) {
  const std::string name = "Doe, Jr. PhD";
  for (auto _ : state) {
    auto out = dmutil::FormatFamilyName(name);
    benchmark::DoNotOptimize(out);
  }
}
BENCHMARK(BM_FormatFamilyName);

// =============================================================================
// Process Benchmarks
// =============================================================================

static void BM_ProcessEmail_Batch(benchmark::State& state) {
  std::vector<std::string> emails;
  emails.reserve(state.range(0));
  for (int64_t i = 0; i < state.range(0); ++i) {
    emails.push_back("user." + std::to_string(i) + "@example.com");
  }
  for (auto _ : state) {
    for (const auto& email : emails) {
      auto out = dmutil::ProcessEmailAddress(email, dmutil::Encoding::kHex);
      benchmark::DoNotOptimize(out);
    }
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ProcessEmail_Batch)->Range(8, 1024);

}  // namespace

BENCHMARK_MAIN();
