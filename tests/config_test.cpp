#include "batchq/config/config.hpp"

#include <fstream>

#include "gtest/gtest.h"
#include "test_utils.hpp"

using namespace batchq;

TEST(ConfigTest, Defaults) {
  SystemConfig config;

  EXPECT_EQ(config.scheduler.log_level, "info");
  EXPECT_TRUE(config.scheduler.log_file.empty());
  EXPECT_EQ(config.queue.user_concurrent_limit, 3);
  EXPECT_EQ(config.queue.global_concurrent_limit, 50);
  EXPECT_EQ(config.queue.visibility_timeout(), std::chrono::seconds(300));
  EXPECT_EQ(config.queue.cleanup_age(), std::chrono::hours(24 * 7));
  EXPECT_EQ(config.queue.max_batch_size, 100);
  EXPECT_FALSE(config.queue.max_retries.has_value());
  EXPECT_FALSE(config.storage.enabled);
  EXPECT_EQ(config.workers.count, 4);
  EXPECT_EQ(config.workers.engine, "noop");
  EXPECT_TRUE(ConfigLoader::validate(config).has_value());
}

TEST(ConfigTest, LoadFromString_AllSections) {
  auto result = ConfigLoader::load_from_string(R"(
scheduler:
  log_level: debug
  log_file: /var/log/batchq.log
queue:
  user_concurrent_limit: 5
  global_concurrent_limit: 20
  visibility_timeout_sec: 60
  sweep_interval_ms: 1000
  task_cleanup_age_days: 3
  cleanup_interval_sec: 600
  max_batch_size: 10
  max_retries: 4
storage:
  enabled: true
  db_file: /tmp/q.db
workers:
  count: 2
  engine: noop
  type: fast
  poll_interval_ms: 50
  heartbeat_interval_ms: 500
)");

  ASSERT_TRUE(result.has_value());
  const auto& c = *result;
  EXPECT_EQ(c.scheduler.log_level, "debug");
  EXPECT_EQ(c.scheduler.log_file, "/var/log/batchq.log");
  EXPECT_EQ(c.queue.user_concurrent_limit, 5);
  EXPECT_EQ(c.queue.global_concurrent_limit, 20);
  EXPECT_EQ(c.queue.visibility_timeout_sec, 60);
  EXPECT_EQ(c.queue.sweep_interval(), std::chrono::milliseconds(1000));
  EXPECT_EQ(c.queue.task_cleanup_age_days, 3);
  EXPECT_EQ(c.queue.cleanup_interval_sec, 600);
  EXPECT_EQ(c.queue.max_batch_size, 10);
  EXPECT_EQ(c.queue.max_retries, 4);
  EXPECT_TRUE(c.storage.enabled);
  EXPECT_EQ(c.storage.db_file, "/tmp/q.db");
  EXPECT_EQ(c.workers.count, 2);
  EXPECT_EQ(c.workers.type, "fast");
  EXPECT_EQ(c.workers.poll_interval_ms, 50);
  EXPECT_EQ(c.workers.heartbeat_interval_ms, 500);
}

TEST(ConfigTest, LoadFromString_PartialUsesDefaults) {
  auto result = ConfigLoader::load_from_string(R"(
queue:
  user_concurrent_limit: 7
)");

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->queue.user_concurrent_limit, 7);
  EXPECT_EQ(result->queue.global_concurrent_limit, 50);
  EXPECT_EQ(result->workers.count, 4);
  EXPECT_EQ(result->scheduler.log_level, "info");
}

TEST(ConfigTest, NullMaxRetries_MeansUnbounded) {
  auto result = ConfigLoader::load_from_string("queue:\n  max_retries: ~\n");

  ASSERT_TRUE(result.has_value());
  EXPECT_FALSE(result->queue.max_retries.has_value());
}

TEST(ConfigTest, LoadFromString_Empty_ParseError) {
  auto result = ConfigLoader::load_from_string("");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, LoadFromString_Malformed_ParseError) {
  auto result = ConfigLoader::load_from_string("queue: [unclosed");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, LoadFromString_WrongType_ParseError) {
  auto result = ConfigLoader::load_from_string(
      "queue:\n  user_concurrent_limit: lots\n");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::ParseError));
}

TEST(ConfigTest, LoadFromFile_Missing_FileNotFound) {
  auto result = ConfigLoader::load_from_file("/nonexistent/batchq.yaml");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), make_error_code(Error::FileNotFound));
}

TEST(ConfigTest, LoadFromFile_ReadsYaml) {
  batchq::test::TempDbPath path;
  ASSERT_TRUE(path.valid());
  {
    std::ofstream out(path.str());
    out << "workers:\n  count: 9\n";
  }

  auto result = ConfigLoader::load_from_file(path.str());

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->workers.count, 9);
}

TEST(ConfigTest, Validate_RejectsBadValues) {
  auto expect_invalid = [](auto mutate) {
    SystemConfig config;
    mutate(config);
    auto r = ConfigLoader::validate(config);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), make_error_code(Error::InvalidInput));
  };

  expect_invalid([](SystemConfig& c) { c.scheduler.log_level = "verbose"; });
  expect_invalid([](SystemConfig& c) { c.queue.user_concurrent_limit = 0; });
  expect_invalid([](SystemConfig& c) { c.queue.global_concurrent_limit = -1; });
  expect_invalid([](SystemConfig& c) { c.queue.visibility_timeout_sec = 0; });
  expect_invalid([](SystemConfig& c) { c.queue.sweep_interval_ms = 0; });
  expect_invalid([](SystemConfig& c) { c.queue.max_batch_size = 0; });
  expect_invalid([](SystemConfig& c) { c.queue.max_retries = -1; });
  expect_invalid([](SystemConfig& c) { c.workers.count = -2; });
  expect_invalid([](SystemConfig& c) { c.workers.poll_interval_ms = 0; });
  expect_invalid([](SystemConfig& c) {
    c.storage.enabled = true;
    c.storage.db_file.clear();
  });
}

TEST(ConfigTest, Validate_AcceptsZeroWorkersAndZeroRetries) {
  SystemConfig config;
  config.workers.count = 0;
  config.queue.max_retries = 0;

  EXPECT_TRUE(ConfigLoader::validate(config).has_value());
}

TEST(ConfigTest, ToString_ReloadsToSameValues) {
  SystemConfig config;
  config.queue.user_concurrent_limit = 6;
  config.queue.max_retries = 2;
  config.storage.enabled = true;
  config.workers.type = "bulk";

  auto reloaded = ConfigLoader::load_from_string(ConfigLoader::to_string(config));

  ASSERT_TRUE(reloaded.has_value());
  EXPECT_EQ(reloaded->queue.user_concurrent_limit, 6);
  EXPECT_EQ(reloaded->queue.max_retries, 2);
  EXPECT_TRUE(reloaded->storage.enabled);
  EXPECT_EQ(reloaded->workers.type, "bulk");
}
