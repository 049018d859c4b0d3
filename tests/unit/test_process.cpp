// Rotor Process Supervisor Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <sys/wait.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

#include "../../src/core/errors.hpp"
#include "../../src/core/process.hpp"
#include "test_helpers.hpp"

using namespace std::chrono_literals;
using namespace rotor::core;
using rotor::testing::TempDir;
using rotor::testing::wait_until;
using rotor::testing::write_script;

namespace {

ProcessSpec make_spec(const std::string& program, std::vector<std::string> args = {}) {
    ProcessSpec spec;
    spec.service = "fake";
    spec.port = 30000;
    spec.program = program;
    spec.args = std::move(args);
    spec.settle = 100ms;
    return spec;
}

}  // namespace

TEST_CASE("Supervised process start and terminate", "[core][process]") {
    TempDir dir;
    auto program = write_script(dir.path(), "long-running", rotor::testing::LONG_RUNNING_BODY);

    std::stop_source stop;
    std::error_code ec;
    auto process = SupervisedProcess::start(make_spec(program), stop.get_token(), ec);
    REQUIRE_FALSE(ec);
    REQUIRE(process != nullptr);
    REQUIRE(process->pid() > 0);
    REQUIRE(rotor::testing::process_exists(process->pid()));
    REQUIRE_FALSE(process->exited().is_set());

    process->wait_async();

    REQUIRE_FALSE(process->terminate());
    REQUIRE(process->exited().is_set());

    auto status = process->exit_status();
    REQUIRE(status.has_value());
    REQUIRE(WIFSIGNALED(*status));
    REQUIRE(WTERMSIG(*status) == SIGKILL);

    // The reaped pid may be reused by the kernel
    REQUIRE(process->pid() == -1);

    SECTION("terminate is idempotent") {
        REQUIRE_FALSE(process->terminate());
        REQUIRE_FALSE(process->terminate());
    }

    SECTION("late waiter sees completion") {
        auto start = std::chrono::steady_clock::now();
        process->exited().wait();
        REQUIRE(std::chrono::steady_clock::now() - start < 1s);
    }
}

TEST_CASE("Supervised process natural exit", "[core][process]") {
    TempDir dir;
    auto program = write_script(dir.path(), "short-lived", "echo working\nsleep 0.4\nexit 3");

    std::stop_source stop;
    std::error_code ec;
    auto process = SupervisedProcess::start(make_spec(program), stop.get_token(), ec);
    REQUIRE_FALSE(ec);
    REQUIRE(process != nullptr);

    // Drains output until EOF, then reaps
    int pid = process->pid();
    REQUIRE(pid > 0);
    process->wait();

    REQUIRE(process->exited().is_set());
    REQUIRE(process->pid() == -1);
    REQUIRE_FALSE(rotor::testing::process_exists(pid));
    auto status = process->exit_status();
    REQUIRE(status.has_value());
    REQUIRE(WIFEXITED(*status));
    REQUIRE(WEXITSTATUS(*status) == 3);

    // Killing an exited process succeeds
    REQUIRE_FALSE(process->terminate());

    // A second wait returns immediately
    process->wait();
    REQUIRE(process->exit_status() == status);
}

TEST_CASE("Supervised process exit during settle window", "[core][process]") {
    TempDir dir;
    auto program = write_script(dir.path(), "failing", rotor::testing::FAILING_BODY);

    std::stop_source stop;
    std::error_code ec;
    auto spec = make_spec(program);
    spec.settle = 500ms;
    auto process = SupervisedProcess::start(std::move(spec), stop.get_token(), ec);

    REQUIRE(process == nullptr);
    REQUIRE(ec == make_error_code(Errc::exited_during_settle));
}

TEST_CASE("Supervised process missing program", "[core][process]") {
    std::stop_source stop;
    std::error_code ec;

    SECTION("name not on PATH") {
        auto process =
            SupervisedProcess::start(make_spec("rotor-no-such-program"), stop.get_token(), ec);
        REQUIRE(process == nullptr);
        REQUIRE(ec == make_error_code(Errc::missing_executable));
    }

    SECTION("path that does not exist") {
        auto process =
            SupervisedProcess::start(make_spec("/nonexistent/tor"), stop.get_token(), ec);
        REQUIRE(process == nullptr);
        REQUIRE(ec == make_error_code(Errc::missing_executable));
    }
}

TEST_CASE("Supervised process exec failure", "[core][process]") {
    TempDir dir;
    // Executable bit set but no valid interpreter
    auto program = write_script(dir.path(), "broken", "");
    {
        std::ofstream out(program, std::ios::trunc);
        out << "#!/nonexistent/interpreter\n";
    }

    std::stop_source stop;
    std::error_code ec;
    auto process = SupervisedProcess::start(make_spec(program), stop.get_token(), ec);
    REQUIRE(process == nullptr);
    REQUIRE(ec == make_error_code(Errc::launch_failed));
}

TEST_CASE("Supervised process start cancelled during settle", "[core][process]") {
    TempDir dir;
    auto program = write_script(dir.path(), "long-running", rotor::testing::LONG_RUNNING_BODY);

    std::stop_source stop;
    stop.request_stop();

    std::error_code ec;
    auto spec = make_spec(program);
    spec.settle = 5s;
    auto started = std::chrono::steady_clock::now();
    auto process = SupervisedProcess::start(std::move(spec), stop.get_token(), ec);

    REQUIRE(process == nullptr);
    REQUIRE(ec == make_error_code(Errc::shutting_down));
    REQUIRE(std::chrono::steady_clock::now() - started < 2s);
}

TEST_CASE("Supervised process output is classified line by line", "[core][process]") {
    TempDir dir;
    auto program = write_script(dir.path(), "chatty",
                                "echo 'one'\necho 'two' >&2\nprintf 'three\\r\\n'\n"
                                "printf 'partial'\nexec sleep 600");

    std::mutex mutex;
    std::vector<std::string> lines;

    auto spec = make_spec(program);
    spec.classifier = [&mutex, &lines](std::string_view line) {
        std::lock_guard<std::mutex> lock(mutex);
        lines.emplace_back(line);
        return ClassifiedLine{rotor::logging::Severity::Debug, std::string(line)};
    };

    std::stop_source stop;
    std::error_code ec;
    auto process = SupervisedProcess::start(std::move(spec), stop.get_token(), ec);
    REQUIRE(process != nullptr);
    process->wait_async();

    REQUIRE(wait_until(
        [&] {
            std::lock_guard<std::mutex> lock(mutex);
            return lines.size() >= 3;
        },
        2s));

    REQUIRE_FALSE(process->terminate());
    process->exited().wait();

    // The unterminated tail is flushed at EOF
    REQUIRE(wait_until(
        [&] {
            std::lock_guard<std::mutex> lock(mutex);
            return lines.size() == 4;
        },
        2s));

    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(lines[0] == "one");
    REQUIRE(lines[1] == "two");
    REQUIRE(lines[2] == "three");
    REQUIRE(lines[3] == "partial");
}

TEST_CASE("Supervised process destructor kills the child", "[core][process]") {
    TempDir dir;
    auto program = write_script(dir.path(), "long-running", rotor::testing::LONG_RUNNING_BODY);

    std::stop_source stop;
    std::error_code ec;
    int pid = -1;
    {
        auto process = SupervisedProcess::start(make_spec(program), stop.get_token(), ec);
        REQUIRE(process != nullptr);
        process->wait_async();
        pid = process->pid();
    }

    // Reaped by the destructor, so the pid no longer refers to our child
    REQUIRE(::waitpid(pid, nullptr, WNOHANG) == -1);
}

TEST_CASE("Exit status descriptions", "[core][process]") {
    REQUIRE(describe_exit(3 << 8) == "exit status 3");
    REQUIRE(describe_exit(SIGKILL) == "killed by signal 9");
}
