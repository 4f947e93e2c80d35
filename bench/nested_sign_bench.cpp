#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "nmusig/common/bytes.hpp"
#include "nmusig/common/logging.hpp"
#include "nmusig/common/secure_zeroize.hpp"
#include "nmusig/crypto/random.hpp"
#include "nmusig/musig/nested_musig2.hpp"
#include "nmusig/protocol/nested_sign_session.hpp"

INITIALIZE_EASYLOGGINGPP

namespace {

using nmusig::Bytes;
using nmusig::KeyPair;
using nmusig::NestedMusig2;
using nmusig::NestedSignSession;
using nmusig::NestedSignSessionConfig;

struct BenchArgs {
  std::optional<uint32_t> n;
  uint32_t iters = 1;
  std::string message = "test tx message";
  bool sequential = false;
};

struct PhaseMetric {
  double total_ms = 0.0;
  uint64_t samples = 0;
};

struct SignMetrics {
  PhaseMetric keygen;
  PhaseMetric round1;
  PhaseMetric round2;
  PhaseMetric verify;
};

uint32_t ParsePositiveU32(const std::string& value, const char* what) {
  try {
    size_t consumed = 0;
    const unsigned long parsed = std::stoul(value, &consumed);
    if (consumed != value.size() || parsed == 0 || parsed > UINT32_MAX) {
      throw std::out_of_range("out of range");
    }
    return static_cast<uint32_t>(parsed);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string("invalid value for ") + what + ": " + value);
  }
}

BenchArgs ParseArgs(int argc, char** argv) {
  BenchArgs args;
  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];
    if (flag == "--n" && i + 1 < argc) {
      args.n = ParsePositiveU32(argv[++i], "--n");
    } else if (flag == "--iters" && i + 1 < argc) {
      args.iters = ParsePositiveU32(argv[++i], "--iters");
    } else if (flag == "--message" && i + 1 < argc) {
      args.message = argv[++i];
    } else if (flag == "--sequential") {
      args.sequential = true;
    } else if (flag == "--help") {
      std::cout << "Usage: nested_sign_bench [--n N] [--iters I] [--message M] [--sequential]\n"
                << "Reads N from standard input when --n is absent.\n";
      std::exit(0);
    } else {
      throw std::invalid_argument("unknown argument: " + flag);
    }
  }
  return args;
}

uint32_t ReadParticipantCount() {
  std::cout << "Enter n" << std::endl;
  std::string line;
  if (!std::getline(std::cin, line)) {
    throw std::invalid_argument("no participant count on standard input");
  }
  const size_t first = line.find_first_not_of(" \t\r");
  const size_t last = line.find_last_not_of(" \t\r");
  if (first == std::string::npos) {
    throw std::invalid_argument("empty participant count");
  }
  return ParsePositiveU32(line.substr(first, last - first + 1), "n");
}

void RecordMetric(PhaseMetric* metric, std::chrono::steady_clock::time_point start) {
  const auto end = std::chrono::steady_clock::now();
  metric->total_ms += std::chrono::duration<double, std::milli>(end - start).count();
  ++metric->samples;
}

bool RunSignIteration(const BenchArgs& args,
                      uint32_t n,
                      const std::shared_ptr<const NestedMusig2>& backend,
                      SignMetrics* metrics) {
  auto start = std::chrono::steady_clock::now();
  NestedSignSessionConfig cfg;
  cfg.session_id = nmusig::Csprng::RandomBytes(16);
  cfg.participants.reserve(n);
  for (uint32_t i = 0; i < n; ++i) {
    KeyPair pair = nmusig::GenerateKeyPair();
    cfg.participants.push_back(pair.public_key);
    cfg.local_secret_keys.emplace(pair.public_key, pair.secret_key);
    nmusig::SecureZeroize(&pair.secret_key);
  }
  cfg.message = Bytes(args.message.begin(), args.message.end());
  cfg.backend = backend;
  cfg.parallel_round1 = !args.sequential;
  RecordMetric(&metrics->keygen, start);

  NestedSignSession session(std::move(cfg));

  start = std::chrono::steady_clock::now();
  session.RunRound1();
  RecordMetric(&metrics->round1, start);

  start = std::chrono::steady_clock::now();
  session.RunRound2();
  RecordMetric(&metrics->round2, start);

  start = std::chrono::steady_clock::now();
  const bool verified = session.VerifySignature();
  RecordMetric(&metrics->verify, start);

  session.ReleaseState();
  return verified;
}

void PrintMetricLine(const std::string& name, const PhaseMetric& metric) {
  const double avg_ms = metric.total_ms / static_cast<double>(metric.samples);
  std::cout << std::left << std::setw(10) << name << "  " << std::right << std::setw(12)
            << std::fixed << std::setprecision(3) << avg_ms << '\n';
}

void PrintSummary(const SignMetrics& metrics) {
  std::cout << "\n[Sign]\n";
  std::cout << std::left << std::setw(10) << "Phase"
            << "  " << std::right << std::setw(12) << "Avg ms" << '\n';
  PrintMetricLine("keygen", metrics.keygen);
  PrintMetricLine("round1", metrics.round1);
  PrintMetricLine("round2", metrics.round2);
  PrintMetricLine("verify", metrics.verify);
}

}  // namespace

int main(int argc, char** argv) {
  try {
    nmusig::ConfigureLogging(nmusig::LoggingOptionsFromEnv());

    const BenchArgs args = ParseArgs(argc, argv);
    const uint32_t n = args.n.has_value() ? *args.n : ReadParticipantCount();
    std::cout << "Nested MuSig2 over a binary aggregation tree: n=" << n
              << ", iters=" << args.iters
              << ", round1=" << (args.sequential ? "sequential" : "parallel") << '\n';

    const auto backend = std::make_shared<const NestedMusig2>();
    SignMetrics metrics;
    uint32_t failures = 0;
    for (uint32_t i = 0; i < args.iters; ++i) {
      if (RunSignIteration(args, n, backend, &metrics)) {
        std::cout << "SUCCESS" << '\n';
      } else {
        std::cout << "FAIL" << '\n';
        ++failures;
      }
    }

    PrintSummary(metrics);
    return failures == 0 ? 0 : 1;
  } catch (const std::exception& ex) {
    std::cerr << "nested_sign_bench failed: " << ex.what() << '\n';
    return 1;
  }
}
