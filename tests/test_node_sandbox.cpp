#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include <boost/asio/io_context.hpp>

#include "config/config_schema.hpp"
#include "sandbox/execution_dispatcher.hpp"
#include "sandbox/process_launcher.hpp"
#include "test_support.hpp"

using katabox::sandbox::ExecutionDispatcher;
using katabox::sandbox::ExecutionStatus;
using katabox::testing::Await;
using katabox::testing::Pool;

// Runs against the default launch options, so these need a JavaScript
// runtime on the configured search path.
class NodeSandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        boost::asio::io_context io;
        katabox::sandbox::ProcessLauncher launcher(io, sandbox_.launch);
        if (launcher.ResolveInterpreter().empty()) {
            GTEST_SKIP() << "node not found on " << sandbox_.launch.search_path;
        }
    }

    katabox::config::SandboxConfig sandbox_{};
};

TEST_F(NodeSandboxTest, PrintsConsoleOutput) {
    ExecutionDispatcher dispatcher(sandbox_, Pool(1, 4));
    auto future = dispatcher.Execute("console.log(\"hi\")");
    const auto outcome = Await(future);

    EXPECT_EQ(outcome.status, ExecutionStatus::Success);
    EXPECT_EQ(outcome.stdout_data, "hi\n");
    EXPECT_FALSE(outcome.error.has_value());
}

TEST_F(NodeSandboxTest, SyntaxErrorIsReportedOnStderr) {
    ExecutionDispatcher dispatcher(sandbox_, Pool(1, 4));
    auto future = dispatcher.Execute("console.log(");
    const auto outcome = Await(future);

    EXPECT_EQ(outcome.status, ExecutionStatus::Failure);
    EXPECT_NE(outcome.stderr_data.find("SyntaxError"), std::string::npos) << outcome.stderr_data;
}

TEST_F(NodeSandboxTest, UncaughtThrowIsFailure) {
    ExecutionDispatcher dispatcher(sandbox_, Pool(1, 4));
    auto future = dispatcher.Execute("throw new Error(\"boom\")");
    const auto outcome = Await(future);

    EXPECT_EQ(outcome.status, ExecutionStatus::Failure);
    EXPECT_FALSE(outcome.success);
    EXPECT_NE(outcome.stderr_data.find("boom"), std::string::npos);
    EXPECT_FALSE(outcome.error.has_value());
}

TEST_F(NodeSandboxTest, HeapBombFailsWithinLimits) {
    sandbox_.limits.timeout_ms = 15000;
    ExecutionDispatcher dispatcher(sandbox_, Pool(1, 4));
    auto future = dispatcher.Execute(
        "const a = []; for (;;) { a.push(new Array(100000).fill('x')); }");
    const auto outcome = Await(future, std::chrono::seconds(30));

    EXPECT_FALSE(outcome.success);
    EXPECT_TRUE(outcome.status == ExecutionStatus::Failure ||
                outcome.status == ExecutionStatus::Timeout)
        << katabox::sandbox::ToString(outcome.status);
}

TEST_F(NodeSandboxTest, BusyNeighbourDoesNotStallPrint) {
    sandbox_.limits.timeout_ms = 3000;
    ExecutionDispatcher dispatcher(sandbox_, Pool(2, 4));
    auto busy = dispatcher.Execute("for (;;) {}");
    auto print = dispatcher.Execute("console.log('hi')");

    const auto outcome = Await(print);
    EXPECT_EQ(outcome.status, ExecutionStatus::Success);
    EXPECT_EQ(outcome.stdout_data, "hi\n");
    EXPECT_LT(outcome.elapsed_ms, 2500.0);
    EXPECT_EQ(Await(busy).status, ExecutionStatus::Timeout);
}
