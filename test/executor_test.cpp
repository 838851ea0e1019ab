#include <atomic>
#include <thread>
#include <gtest/gtest.h>

#include <dsbox/paths.h>
#include <dsbox/result_codec.h>
#include <dsbox/data_source.h>
#include "fake_sandbox.h"
#include "container_executor.h"
#include "shared_executor.h"
#include "transport.h"
#include "utils.h"

namespace {

Table SmallTable() {
  Table table;
  table.columns = {"a", "b"};
  table.index = {int64_t(0), int64_t(1), int64_t(2)};
  table.rows = {
    {int64_t(1), int64_t(4)},
    {int64_t(2), int64_t(5)},
    {int64_t(3), int64_t(6)},
  };
  return table;
}

std::string OkPayload(const std::string& text) {
  ExecuteResult res;
  res.success = true;
  res.result = OtherValue{text};
  return DumpResult(res);
}

class FailingDataSource : public DataSource {
 public:
  Table GetFull() const override { throw DataSourceError("warehouse unavailable"); }
  std::string Name() const override { return "failing"; }
};

class ExecutorTest : public ::testing::Test {
 protected:
  std::shared_ptr<FakeSandboxStats> stats = std::make_shared<FakeSandboxStats>();
  ExecutorConfig config;

  void SetUp() override {
    config.image = "dsbox-runner:test";
    config.timeout = std::chrono::milliseconds(5000);
    config.poll_interval = std::chrono::milliseconds(10);
    config.stop_timeout = std::chrono::seconds(0);
  }

  std::unique_ptr<ContainerExecutor> Make(FakeHandler handler,
                                          std::shared_ptr<const DataSource> source = nullptr) {
    if (!source) source = std::make_shared<TableDataSource>(SmallTable());
    return std::make_unique<ContainerExecutor>(config, std::move(source),
                                               FakeSandboxFactory(stats, std::move(handler)));
  }

  static size_t WorkspaceCount() {
    std::error_code ec;
    if (!fs::is_directory(kWorkspaceRoot, ec)) return 0;
    size_t ret = 0;
    for (auto& i : fs::directory_iterator(kWorkspaceRoot)) ret += i.is_directory();
    return ret;
  }
};

TEST_F(ExecutorTest, SyntaxErrorNeverStartsSandbox) {
  auto executor = Make([](const std::string&) { return FakeReply::Respond(OkPayload("x")); });
  ExecuteResult res = executor->Execute("def f(:\n  pass\n");
  EXPECT_FALSE(res.success);
  EXPECT_NE(res.error.find("syntax error at line 1 col "), std::string::npos) << res.error;
  EXPECT_EQ(executor->LastOutcome(), ExecuteOutcome::SYNTAX_REJECTED);
  EXPECT_EQ(stats->launches, 0);
  EXPECT_FALSE(executor->IsRunning());
  EXPECT_EQ(WorkspaceCount(), 0);
}

TEST_F(ExecutorTest, ExecuteStartsLazilyAndStagesDataset) {
  std::string seen;
  auto executor = Make([&](const std::string& code) {
    seen = code;
    return FakeReply::Respond(OkPayload("6"));
  });
  ExecuteResult res = executor->Execute("result = df['a'].sum()");
  ASSERT_TRUE(res.success) << res.error;
  ASSERT_TRUE(res.result);
  EXPECT_EQ(std::get<OtherValue>(*res.result).text, "6");
  EXPECT_EQ(seen, "result = df['a'].sum()");
  EXPECT_EQ(executor->LastOutcome(), ExecuteOutcome::SUCCESS);
  EXPECT_TRUE(executor->IsRunning());
  auto csv = ReadFile(DatasetFile(executor->WorkspacePath()));
  ASSERT_TRUE(csv);
  EXPECT_EQ(*csv, "a,b\n1,4\n2,5\n3,6\n");
}

TEST_F(ExecutorTest, LifecycleIsIdempotent) {
  auto executor = Make([](const std::string&) { return FakeReply::Respond(OkPayload("x")); });
  executor->Stop();
  executor->Start();
  fs::path workspace = executor->WorkspacePath();
  EXPECT_TRUE(fs::is_directory(workspace));
  executor->Start();
  EXPECT_EQ(stats->launches, 1);
  EXPECT_EQ(executor->WorkspacePath(), workspace);
  executor->Stop();
  executor->Stop();
  EXPECT_EQ(stats->terminations, 1);
  EXPECT_FALSE(executor->IsRunning());
  EXPECT_FALSE(fs::exists(workspace));
}

TEST_F(ExecutorTest, FailedScriptKeepsSandboxUsable) {
  auto executor = Make([](const std::string& code) {
    if (code.find("raise") != std::string::npos) {
      return FakeReply::Respond(DumpResult(ExecuteResult::Failure("ValueError: boom\n")));
    }
    return FakeReply::Respond(OkPayload("ok"));
  });
  ExecuteResult bad = executor->Execute("raise ValueError('boom')");
  EXPECT_FALSE(bad.success);
  EXPECT_EQ(bad.error, "ValueError: boom\n");
  EXPECT_EQ(executor->LastOutcome(), ExecuteOutcome::RUNTIME_FAILURE);
  ExecuteResult good = executor->Execute("result = 1");
  EXPECT_TRUE(good.success);
  EXPECT_EQ(stats->launches, 1);
  EXPECT_EQ(stats->terminations, 0);
}

TEST_F(ExecutorTest, TimeoutDiscardsSandbox) {
  config.timeout = std::chrono::milliseconds(200);
  int calls = 0;
  auto executor = Make([&](const std::string&) {
    return calls++ == 0 ? FakeReply::Hang() : FakeReply::Respond(OkPayload("late"));
  });
  ExecuteResult res = executor->Execute("while True: pass");
  EXPECT_FALSE(res.success);
  EXPECT_EQ(res.error, "execution timed out");
  EXPECT_EQ(executor->LastOutcome(), ExecuteOutcome::TIMEOUT);
  EXPECT_EQ(stats->terminations, 1);
  EXPECT_FALSE(executor->IsRunning());
  EXPECT_EQ(WorkspaceCount(), 0);

  // a fresh sandbox is started for the next call
  ExecuteResult next = executor->Execute("result = 1");
  EXPECT_TRUE(next.success) << next.error;
  EXPECT_EQ(stats->launches, 2);
}

TEST_F(ExecutorTest, CancelInterruptsWait) {
  auto executor = Make([](const std::string&) { return FakeReply::Hang(); });
  CancelToken cancel;
  auto start = std::chrono::steady_clock::now();
  auto future = executor->ExecuteAsync("while True: pass", cancel);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  cancel.Cancel();
  ExecuteResult res = future.get();
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
  EXPECT_FALSE(res.success);
  EXPECT_EQ(res.error, "execution cancelled");
  EXPECT_EQ(executor->LastOutcome(), ExecuteOutcome::CANCELLED);
  EXPECT_FALSE(executor->IsRunning());
  EXPECT_EQ(stats->terminations, 1);
}

TEST_F(ExecutorTest, DeadSandboxIsReported) {
  auto executor = Make([](const std::string&) { return FakeReply::Die(); });
  ExecuteResult res = executor->Execute("import os; os._exit(1)");
  EXPECT_FALSE(res.success);
  EXPECT_EQ(res.error, "sandbox exited unexpectedly");
  EXPECT_EQ(executor->LastOutcome(), ExecuteOutcome::RUNTIME_FAILURE);
  EXPECT_FALSE(executor->IsRunning());
}

TEST_F(ExecutorTest, MalformedResponseIsAFailure) {
  auto executor = Make([](const std::string&) { return FakeReply::Respond("{not json"); });
  ExecuteResult res = executor->Execute("result = 1");
  EXPECT_FALSE(res.success);
  EXPECT_EQ(res.error.rfind("failed to parse result: ", 0), 0u) << res.error;
  // the sandbox itself is fine
  EXPECT_TRUE(executor->IsRunning());
}

TEST_F(ExecutorTest, LaunchFailureRaisesAndCleansUp) {
  stats->fail_launch = true;
  auto executor = Make([](const std::string&) { return FakeReply::Respond(OkPayload("x")); });
  EXPECT_THROW(executor->Execute("result = 1"), LaunchError);
  EXPECT_FALSE(executor->IsRunning());
  EXPECT_EQ(WorkspaceCount(), 0);
}

TEST_F(ExecutorTest, DataSourceFailureRaisesLaunchError) {
  auto executor = Make([](const std::string&) { return FakeReply::Respond(OkPayload("x")); },
                       std::make_shared<FailingDataSource>());
  EXPECT_THROW(executor->Start(), LaunchError);
  EXPECT_EQ(stats->launches, 0);
  EXPECT_EQ(WorkspaceCount(), 0);
}

TEST_F(ExecutorTest, ScopedExecutorStartsAndStops) {
  {
    ScopedExecutor executor(Make([](const std::string&) { return FakeReply::Respond(OkPayload("x")); }));
    EXPECT_TRUE(executor->IsRunning());
    EXPECT_TRUE(executor->Execute("result = 1").success);
  }
  EXPECT_EQ(stats->launches, 1);
  EXPECT_EQ(stats->terminations, 1);
  EXPECT_EQ(WorkspaceCount(), 0);
}

TEST_F(ExecutorTest, LazyScopedExecutorChecksSyntaxFirst) {
  {
    ScopedExecutor executor(Make([](const std::string&) { return FakeReply::Respond(OkPayload("x")); }),
                            StartPolicy::LAZY);
    EXPECT_FALSE(executor->IsRunning());
    ExecuteResult res = executor->Execute("def broken(:\n");
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.error.rfind("syntax error at line 1", 0), 0u) << res.error;
    EXPECT_EQ(stats->launches, 0);
    EXPECT_EQ(WorkspaceCount(), 0);
  }
  EXPECT_EQ(stats->launches, 0);
  {
    ScopedExecutor executor(Make([](const std::string&) { return FakeReply::Respond(OkPayload("x")); }),
                            StartPolicy::LAZY);
    EXPECT_TRUE(executor->Execute("result = 1").success);
    EXPECT_EQ(stats->launches, 1);
  }
  EXPECT_EQ(stats->terminations, 1);
  EXPECT_EQ(WorkspaceCount(), 0);
}

TEST_F(ExecutorTest, BackstopTerminatesRegisteredSandboxes) {
  auto executor = Make([](const std::string&) { return FakeReply::Respond(OkPayload("x")); });
  executor->Start();
  EXPECT_EQ(TerminateLiveSandboxes(), 1u);
  EXPECT_EQ(stats->terminations, 1);
  EXPECT_EQ(TerminateLiveSandboxes(), 0u);
  executor->Stop();
  EXPECT_EQ(stats->terminations, 1);
}

// stands in for `dsbox-runtime --shared`: echoes each request's dataset back
class EchoWorker {
  fs::path dir_;
  std::atomic<bool> done_{false};
  std::thread thread_;
 public:
  explicit EchoWorker(fs::path dir) : dir_(std::move(dir)), thread_([this]() { Loop(); }) {}
  ~EchoWorker() {
    done_ = true;
    thread_.join();
  }
  void Loop() {
    while (!done_) {
      std::error_code ec;
      for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        Channel channel(it->path());
        if (!channel.TakeRequest()) continue;
        EXPECT_TRUE(channel.PutResponse(OkPayload(ReadFile(DatasetFile(it->path())).value_or(""))));
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }
};

class SharedExecutorTest : public ::testing::Test {
 protected:
  ExecutorConfig config;

  void SetUp() override {
    config.data_dir = kWorkspaceRoot / "shared";
    config.timeout = std::chrono::milliseconds(5000);
    config.poll_interval = std::chrono::milliseconds(10);
    ASSERT_TRUE(CreateDirs(config.data_dir));
  }
  void TearDown() override {
    RemoveAll(config.data_dir);
  }
  static bool Empty(const fs::path& dir) {
    return fs::directory_iterator(dir) == fs::directory_iterator();
  }
};

TEST_F(SharedExecutorTest, RequestDirectoryPerCall) {
  EchoWorker worker(config.data_dir);
  SharedExecutor executor(config, std::make_shared<TableDataSource>(SmallTable()));
  EXPECT_FALSE(executor.IsRunning());
  for (int i = 0; i < 2; i++) {
    ExecuteResult res = executor.Execute("result = 1");
    ASSERT_TRUE(res.success) << res.error;
    EXPECT_EQ(std::get<OtherValue>(*res.result).text, "a,b\n1,4\n2,5\n3,6\n");
    EXPECT_TRUE(Empty(config.data_dir));
  }
  EXPECT_TRUE(executor.IsRunning());
  EXPECT_EQ(executor.LastOutcome(), ExecuteOutcome::SUCCESS);
  executor.Stop();
  EXPECT_FALSE(executor.IsRunning());
}

TEST_F(SharedExecutorTest, NoWorkerTimesOut) {
  config.timeout = std::chrono::milliseconds(100);
  SharedExecutor executor(config, std::make_shared<TableDataSource>(SmallTable()));
  ExecuteResult res = executor.Execute("x = 1");
  EXPECT_FALSE(res.success);
  EXPECT_EQ(res.error, "execution timed out");
  EXPECT_EQ(executor.LastOutcome(), ExecuteOutcome::TIMEOUT);
  EXPECT_TRUE(Empty(config.data_dir));
}

TEST_F(SharedExecutorTest, MissingDirectoryFailsToStart) {
  config.data_dir = kWorkspaceRoot / "missing";
  SharedExecutor executor(config, std::make_shared<TableDataSource>(SmallTable()));
  EXPECT_THROW(executor.Start(), LaunchError);
  EXPECT_THROW(executor.Execute("x = 1"), LaunchError);
  SharedExecutor failing(config, std::make_shared<FailingDataSource>());
  EXPECT_THROW(failing.Start(), LaunchError);
}

TEST(CreateExecutorTest, RequiresAMode) {
  ExecutorConfig config;
  auto source = std::make_shared<TableDataSource>(SmallTable());
  EXPECT_THROW(CreateExecutor(config, source), ConfigError);
  config.image = "dsbox-runner";
  config.memory_limit = "lots";
  EXPECT_THROW(CreateExecutor(config, source), ConfigError);
  config.memory_limit = "256m";
  EXPECT_THROW(CreateExecutor(config, nullptr), ConfigError);
}

TEST(CreateExecutorTest, SelectsImplementation) {
  auto source = std::make_shared<TableDataSource>(SmallTable());
  ExecutorConfig config;
  config.image = "dsbox-runner";
  config.data_dir = "/srv/dsbox";
  auto container = CreateExecutor(config, source);
  EXPECT_NE(dynamic_cast<ContainerExecutor*>(container.get()), nullptr);
  EXPECT_FALSE(container->IsRunning());

  config.image.clear();
  auto shared = CreateExecutor(config, source);
  EXPECT_EQ(dynamic_cast<ContainerExecutor*>(shared.get()), nullptr);
  EXPECT_FALSE(shared->IsRunning());

  config.jail_root = "/srv/rootfs";
  config.pinned_cpus = "3-1";
  EXPECT_THROW(CreateExecutor(config, source), ConfigError);
}

} // namespace
