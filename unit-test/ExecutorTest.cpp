#include <filesystem>
#include <thread>
#include "common/io_utils.hpp"
#include "execution/executor.hpp"
#include "gtest/gtest.h"
#include "test/fake_container_runtime.hpp"

using namespace std;
using namespace runner;
using namespace runner::sandbox;
using runner::sandbox::mock::fake_container_runtime;
using runner::sandbox::mock::frame;
namespace fs = std::filesystem;

class ExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        parent = create_temp_directory(fs::temp_directory_path(), "executor-test-");
        options.temp_dir = parent;
        options.profile = confinement_profile::from_config();
        options.image_prefix = "runner-";
        options.max_timeout = chrono::seconds(60);
        options.log_grace = chrono::milliseconds(20);
        options.kill_grace = chrono::milliseconds(500);
        options.ready_timeout = chrono::milliseconds(1000);
    }

    void TearDown() override {
        fs::remove_all(parent);
    }

    execution_outcome run(const string &language, const vector<source_file> &files,
                          optional<chrono::milliseconds> timeout = nullopt) {
        executor engine(runtime, options);
        return engine.execute(language, files, timeout);
    }

    bool workspaces_removed() const {
        return fs::is_empty(parent);
    }

    fs::path parent;
    executor_options options;
    fake_container_runtime runtime;
};

TEST_F(ExecutorTest, PythonHelloWorld) {
    runtime.script.frames = {frame(stream_type::STDOUT, "hi\n")};
    auto outcome = run("python", {{"main.py", "print('hi')"}});
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.output, "hi");
    EXPECT_FALSE(outcome.error.has_value());
    EXPECT_EQ(outcome.exit_code, 0);

    auto specs = runtime.specs();
    ASSERT_EQ(specs.size(), 1u);
    EXPECT_EQ(specs[0].image, "runner-python");
    EXPECT_EQ(specs[0].workspace.parent_path(), parent);
    EXPECT_NE(specs[0].command.back().find("python main.py"), string::npos);
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(ExecutorTest, InfiniteLoopTimesOut) {
    runtime.script.hang = true;
    auto outcome = run("python", {{"main.py", "while True: pass"}}, chrono::milliseconds(100));
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.exit_code, -1);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_NE(outcome.error->find("timeout"), string::npos);
    EXPECT_EQ(runtime.count("kill"), 1u);
    EXPECT_EQ(runtime.live_containers(), 0u);
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(ExecutorTest, TimeoutAboveMaximumIsRejected) {
    auto outcome = run("python", {{"main.py", "print(1)"}}, chrono::milliseconds(10000000000000LL));
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.exit_code, -1);
    EXPECT_EQ(outcome.error, optional<string>("Timeout must be between 1 and 60000 ms, got 10000000000000 ms"));
    EXPECT_EQ(runtime.count("create"), 0u);
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(ExecutorTest, OutputFloodIsCutOff) {
    options.profile.output_limit = 1024;
    runtime.script.hang = true;
    runtime.script.frames.assign(200, frame(stream_type::STDOUT, string(100, 'x')));
    auto outcome = run("python", {{"main.py", "while True: print('x' * 100)"}}, chrono::milliseconds(5000));
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.exit_code, -1);
    EXPECT_EQ(outcome.error, optional<string>("Output limit exceeded (1024 bytes)"));
    EXPECT_LE(outcome.output.size(), 1024u);
    EXPECT_FALSE(outcome.output.empty());
    EXPECT_EQ(runtime.count("kill"), 1u);
    EXPECT_EQ(runtime.live_containers(), 0u);
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(ExecutorTest, TimeoutKeepsPartialOutput) {
    runtime.script.hang = true;
    runtime.script.frames = {frame(stream_type::STDOUT, "tick\n"), frame(stream_type::STDERR, "noise")};
    auto outcome = run("python", {{"main.py", "..."}}, chrono::milliseconds(100));
    EXPECT_EQ(outcome.output, "tick");
    EXPECT_EQ(outcome.error, optional<string>("Execution timeout (100 ms)"));
}

TEST_F(ExecutorTest, NonZeroExit) {
    runtime.script.exit_code = 2;
    auto outcome = run("c", {{"main.c", "int main(){return 2;}"}});
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.exit_code, 2);
    EXPECT_EQ(outcome.error, optional<string>("Process exited with code 2"));
    EXPECT_NE(runtime.specs()[0].command.back().find("gcc main.c -o main && ./main"), string::npos);
}

TEST_F(ExecutorTest, JavaEntryInSubdirectory) {
    runtime.script.frames = {frame(stream_type::STDOUT, "ok\n")};
    auto outcome = run("java", {{"src/Main.java", "public class Main{public static void main(String[] a){System.out.println(\"ok\");}}"}});
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.output, "ok");
    auto command = runtime.specs()[0].command.back();
    EXPECT_EQ(command.substr(command.size() - string("cd src && javac Main.java && java Main").size()),
              "cd src && javac Main.java && java Main");
    EXPECT_EQ(runtime.specs()[0].image, "runner-java");
}

TEST_F(ExecutorTest, UnsupportedLanguage) {
    auto outcome = run("ruby", {{"main.rb", "puts 1"}});
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, optional<string>("Unsupported language: ruby"));
    EXPECT_EQ(outcome.exit_code, -1);
    EXPECT_EQ(runtime.count("create"), 0u);
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(ExecutorTest, PathTraversalFailsBeforeContainer) {
    auto outcome = run("python", {{"main.py", "print(1)"}, {"../../etc/cron.d/x", "boom"}});
    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_NE(outcome.error->find("escapes the workspace"), string::npos);
    EXPECT_EQ(runtime.count("create"), 0u);
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(ExecutorTest, EntryFileNotFound) {
    auto outcome = run("python", {{"notes.txt", "hello"}});
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, optional<string>("No Python file found"));
    EXPECT_EQ(runtime.count("create"), 0u);
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(ExecutorTest, MissingImage) {
    runtime.script.fail_create = true;
    auto outcome = run("cpp", {{"main.cpp", "int main(){}"}});
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, optional<string>("No such image: runner-cpp"));
    EXPECT_EQ(outcome.exit_code, -1);
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(ExecutorTest, StartFailureRemovesContainer) {
    runtime.script.fail_start = true;
    auto outcome = run("python", {{"main.py", "print(1)"}});
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(runtime.count("remove"), 1u);
    EXPECT_EQ(runtime.live_containers(), 0u);
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(ExecutorTest, StderrWithZeroExitIsFailure) {
    runtime.script.frames = {frame(stream_type::STDOUT, "42\n"), frame(stream_type::STDERR, "DeprecationWarning\n")};
    auto outcome = run("python", {{"main.py", "..."}});
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.output, "42");
    EXPECT_EQ(outcome.error, optional<string>("DeprecationWarning"));
}

TEST_F(ExecutorTest, VanishedContainerUsesWaitStatus) {
    runtime.script.exit_code = 5;
    runtime.script.vanish = true;
    auto outcome = run("javascript", {{"main.js", "process.exit(5)"}});
    EXPECT_EQ(outcome.exit_code, 5);
    EXPECT_EQ(outcome.error, optional<string>("Process exited with code 5"));
}

TEST_F(ExecutorTest, IdenticalRequestsGiveIdenticalResults) {
    runtime.script.frames = {frame(stream_type::STDOUT, "same\n")};
    auto first = run("python", {{"main.py", "print('same')"}});
    auto second = run("python", {{"main.py", "print('same')"}});
    EXPECT_EQ(first.output, second.output);
    EXPECT_EQ(first.exit_code, second.exit_code);
    EXPECT_NE(runtime.specs()[0].workspace, runtime.specs()[1].workspace);
}

TEST_F(ExecutorTest, ConcurrentJobs) {
    runtime.script.run_time = chrono::milliseconds(30);
    runtime.script.frames = {frame(stream_type::STDOUT, "done")};
    executor engine(runtime, options);

    vector<execution_outcome> outcomes(4);
    vector<thread> threads;
    for (size_t i = 0; i < outcomes.size(); ++i)
        threads.emplace_back([&, i] {
            outcomes[i] = engine.execute("python", {{"main.py", "print('done')"}});
        });
    for (auto &th : threads)
        th.join();

    for (auto &outcome : outcomes) {
        EXPECT_TRUE(outcome.success);
        EXPECT_EQ(outcome.output, "done");
    }
    EXPECT_EQ(runtime.count("create"), 4u);
    EXPECT_TRUE(workspaces_removed());
}

TEST_F(ExecutorTest, ExecutesParsedRequest) {
    runtime.script.frames = {frame(stream_type::STDOUT, "from request")};
    executor engine(runtime, options);
    auto outcome = engine.execute(parse_request(nlohmann::json::parse(R"json({
        "language": "node",
        "files": [{"path": "lib\\util.js", "content": ""}, {"path": "main.js", "content": "require('./lib/util')"}],
        "timeoutMs": 3000
    })json")));
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.output, "from request");
    EXPECT_EQ(runtime.specs()[0].image, "runner-node");
}
