#include "core/errors.hpp"
#include "plugin/timeout_supervisor.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace crush;
using namespace std::chrono_literals;
using crush::test::HangingAlgorithm;
using crush::test::make_metadata;
using crush::test::SlowAlgorithm;
using crush::test::StubAlgorithm;
using crush::test::ThrowingAlgorithm;

class TimeoutSupervisorTest : public ::testing::Test {
protected:
  SharedBuffer buffer(size_t size) {
    return std::make_shared<const std::vector<uint8_t>>(
        crush::test::repetitive_bytes(size));
  }

  std::shared_ptr<StubAlgorithm> fallback = std::make_shared<StubAlgorithm>(
      make_metadata("fallback", 0x00, 200, 0.35));
  CancellationToken cancel;
};

TEST_F(TimeoutSupervisorTest, ReturnsWorkerResult) {
  auto algorithm =
      std::make_shared<StubAlgorithm>(make_metadata("stub", 0x01, 100, 0.5));
  TimeoutSupervisor supervisor(1s);
  auto input = buffer(1000);

  auto output =
      supervisor.run(algorithm, AlgorithmOperation::Compress, input, cancel);
  EXPECT_EQ(output, *input);
  EXPECT_EQ(algorithm->compress_calls.load(), 1);
}

TEST_F(TimeoutSupervisorTest, HangingAlgorithmTimesOut) {
  auto hanging = std::make_shared<HangingAlgorithm>(
      make_metadata("hang", 0x02, 100, 0.5));
  TimeoutSupervisor supervisor(50ms);

  const auto start = std::chrono::steady_clock::now();
  try {
    supervisor.run(hanging, AlgorithmOperation::Compress, buffer(10), cancel);
    FAIL() << "Expected Timeout";
  } catch (const CrushError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::Timeout);
  }
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST_F(TimeoutSupervisorTest, ThrowingAlgorithmIsReportedAsCrash) {
  auto throwing = std::make_shared<ThrowingAlgorithm>(
      make_metadata("throw", 0x03, 100, 0.5));
  TimeoutSupervisor supervisor(1s);
  try {
    supervisor.run(throwing, AlgorithmOperation::Decompress, buffer(10),
                   cancel);
    FAIL() << "Expected WorkerCrashed";
  } catch (const CrushError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::WorkerCrashed);
    EXPECT_NE(std::string(e.what()).find("simulated algorithm crash"),
              std::string::npos);
  }
}

TEST_F(TimeoutSupervisorTest, CrushErrorsPassThroughUnchanged) {
  class CorruptAlgorithm : public StubAlgorithm {
  public:
    using StubAlgorithm::StubAlgorithm;
    std::vector<uint8_t> decompress(const std::vector<uint8_t> &, size_t,
                                    const CancellationToken &) override {
      throw CrushError(ErrorKind::Corruption, "bad stream");
    }
  };
  auto corrupt = std::make_shared<CorruptAlgorithm>(
      make_metadata("corrupt", 0x04, 100, 0.5));

  TimeoutSupervisor supervisor(1s);
  try {
    supervisor.run(corrupt, AlgorithmOperation::Decompress, buffer(10), cancel);
    FAIL() << "Expected Corruption";
  } catch (const CrushError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::Corruption);
  }
}

TEST_F(TimeoutSupervisorTest, ZeroTimeoutWaitsForCompletion) {
  auto slow = std::make_shared<SlowAlgorithm>(
      make_metadata("slow", 0x05, 100, 0.5), 30ms);
  TimeoutSupervisor supervisor(0ms);
  auto input = buffer(10);
  EXPECT_EQ(supervisor.run(slow, AlgorithmOperation::Compress, input, cancel),
            *input);
}

TEST_F(TimeoutSupervisorTest, FallbackAfterTimeout) {
  auto hanging = std::make_shared<HangingAlgorithm>(
      make_metadata("hang", 0x06, 100, 0.5));
  TimeoutSupervisor supervisor(50ms);
  auto input = buffer(4096);

  const auto start = std::chrono::steady_clock::now();
  auto outcome = supervisor.run_with_fallback(
      hanging, fallback, AlgorithmOperation::Compress, input, cancel);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(outcome.used_fallback);
  EXPECT_EQ(outcome.algorithm.name, "fallback");
  EXPECT_EQ(outcome.output, *input);
  EXPECT_EQ(fallback->compress_calls.load(), 1);
  // Roughly one deadline plus the fallback's own work
  EXPECT_LT(elapsed, 1s);
}

TEST_F(TimeoutSupervisorTest, FallbackAfterCrash) {
  auto throwing = std::make_shared<ThrowingAlgorithm>(
      make_metadata("throw", 0x07, 100, 0.5));
  TimeoutSupervisor supervisor(1s);
  auto outcome = supervisor.run_with_fallback(
      throwing, fallback, AlgorithmOperation::Compress, buffer(10), cancel);
  EXPECT_TRUE(outcome.used_fallback);
  EXPECT_EQ(outcome.algorithm.name, "fallback");
}

TEST_F(TimeoutSupervisorTest, NoFallbackWhenPrimarySucceeds) {
  auto primary =
      std::make_shared<StubAlgorithm>(make_metadata("primary", 0x08, 100, 0.5));
  TimeoutSupervisor supervisor(1s);
  auto outcome = supervisor.run_with_fallback(
      primary, fallback, AlgorithmOperation::Compress, buffer(10), cancel);
  EXPECT_FALSE(outcome.used_fallback);
  EXPECT_EQ(outcome.algorithm.name, "primary");
  EXPECT_EQ(fallback->compress_calls.load(), 0);
}

TEST_F(TimeoutSupervisorTest, FailedFallbackIsReported) {
  auto hanging = std::make_shared<HangingAlgorithm>(
      make_metadata("hang", 0x09, 100, 0.5));
  auto also_hanging = std::make_shared<HangingAlgorithm>(
      make_metadata("hang-too", 0x0a, 100, 0.5));
  TimeoutSupervisor supervisor(30ms);
  try {
    supervisor.run_with_fallback(hanging, also_hanging,
                                 AlgorithmOperation::Compress, buffer(10),
                                 cancel);
    FAIL() << "Expected Timeout";
  } catch (const CrushError &e) {
    EXPECT_EQ(e.kind(), ErrorKind::Timeout);
    EXPECT_NE(std::string(e.what()).find("hang-too"), std::string::npos);
  }
}

TEST_F(TimeoutSupervisorTest, NonTimeoutErrorsAreNotRetried) {
  class RejectingAlgorithm : public StubAlgorithm {
  public:
    using StubAlgorithm::StubAlgorithm;
    std::vector<uint8_t> compress(const std::vector<uint8_t> &,
                                  const CancellationToken &) override {
      throw CrushError(ErrorKind::OperationFailed, "unsupported input");
    }
  };
  auto rejecting = std::make_shared<RejectingAlgorithm>(
      make_metadata("reject", 0x0b, 100, 0.5));
  TimeoutSupervisor supervisor(1s);
  EXPECT_THROW(supervisor.run_with_fallback(rejecting, fallback,
                                            AlgorithmOperation::Compress,
                                            buffer(10), cancel),
               CrushError);
  EXPECT_EQ(fallback->compress_calls.load(), 0);
}

TEST_F(TimeoutSupervisorTest, CancellationIsNotRetried) {
  auto slow = std::make_shared<SlowAlgorithm>(
      make_metadata("slow", 0x0c, 100, 0.5), 20ms);
  TimeoutSupervisor supervisor(5s);

  std::thread canceller([this] {
    std::this_thread::sleep_for(30ms);
    cancel.cancel();
  });

  try {
    supervisor.run_with_fallback(slow, fallback, AlgorithmOperation::Compress,
                                 buffer(4 * 1024 * 1024), cancel);
    canceller.join();
    FAIL() << "Expected Cancelled";
  } catch (const CrushError &e) {
    canceller.join();
    EXPECT_TRUE(e.is_cancellation());
  }
  EXPECT_EQ(fallback->compress_calls.load(), 0);
}

TEST_F(TimeoutSupervisorTest, AlreadyCancelledTokenNeverStartsWorker) {
  auto algorithm =
      std::make_shared<StubAlgorithm>(make_metadata("stub", 0x0d, 100, 0.5));
  cancel.cancel();
  TimeoutSupervisor supervisor(1s);
  EXPECT_THROW(
      supervisor.run(algorithm, AlgorithmOperation::Compress, buffer(10), cancel),
      CrushError);
  EXPECT_EQ(algorithm->compress_calls.load(), 0);
}
