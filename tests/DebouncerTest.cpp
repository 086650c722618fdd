#include "TestSupport.hpp"
#include "dirsync/Debouncer.hpp"
#include <gtest/gtest.h>
#include <map>

using namespace dirsync;
using namespace dirsync::test;
using namespace std::chrono_literals;

namespace {

struct FireLog {
  std::mutex mtx;
  std::map<std::string, int> counts;

  void add(const std::string &key) {
    std::lock_guard<std::mutex> lock(mtx);
    ++counts[key];
  }
  int count(const std::string &key) {
    std::lock_guard<std::mutex> lock(mtx);
    return counts.count(key) ? counts[key] : 0;
  }
};

} // namespace

TEST(DebouncerTest, BurstCollapsesIntoOneFire) {
  CapturingLogger logger;
  FireLog fired;
  Debouncer debouncer(50ms, [&](const std::string &k) { fired.add(k); }, logger);
  debouncer.start();

  for (int i = 0; i < 5; ++i) {
    debouncer.touch("a.txt");
    std::this_thread::sleep_for(10ms);
  }

  ASSERT_TRUE(waitFor([&] { return fired.count("a.txt") == 1; }));
  std::this_thread::sleep_for(150ms);
  EXPECT_EQ(fired.count("a.txt"), 1);
}

TEST(DebouncerTest, KeysAreIndependent) {
  CapturingLogger logger;
  FireLog fired;
  Debouncer debouncer(20ms, [&](const std::string &k) { fired.add(k); }, logger);
  debouncer.start();

  debouncer.touch("a");
  debouncer.touch("b");

  ASSERT_TRUE(waitFor([&] { return fired.count("a") == 1 && fired.count("b") == 1; }));
}

TEST(DebouncerTest, StopCancelsPendingWithoutFiring) {
  CapturingLogger logger;
  FireLog fired;
  Debouncer debouncer(100ms, [&](const std::string &k) { fired.add(k); }, logger);
  debouncer.start();

  debouncer.touch("a");
  EXPECT_TRUE(debouncer.isPending("a"));
  debouncer.stop();

  EXPECT_EQ(debouncer.pendingCount(), 0u);
  std::this_thread::sleep_for(200ms);
  EXPECT_EQ(fired.count("a"), 0);
}

TEST(DebouncerTest, HandlerExceptionDoesNotStopWorker) {
  CapturingLogger logger;
  FireLog fired;
  Debouncer debouncer(
      10ms,
      [&](const std::string &k) {
        fired.add(k);
        if (k == "bad")
          throw std::runtime_error("boom");
      },
      logger);
  debouncer.start();

  debouncer.touch("bad");
  ASSERT_TRUE(waitFor([&] { return fired.count("bad") == 1; }));
  debouncer.touch("good");
  ASSERT_TRUE(waitFor([&] { return fired.count("good") == 1; }));
  EXPECT_TRUE(logger.contains("boom"));
}

TEST(DebouncerTest, TouchBeforeStartIsIgnored) {
  CapturingLogger logger;
  FireLog fired;
  Debouncer debouncer(10ms, [&](const std::string &k) { fired.add(k); }, logger);

  debouncer.touch("a");
  EXPECT_FALSE(debouncer.isPending("a"));
}
