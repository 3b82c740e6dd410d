#include <cassert>
#include <cerrno>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <vector>

#include <sys/wait.h>
#include <sysexits.h>
#include <unistd.h>

#include "execution/dispatcher.hpp"
#include "execution/process_status.hpp"
#include "test_support.hpp"

extern char **environ;

using pylauncher::DispatchStrategy;
using pylauncher::Dispatcher;
using test_support::FdCapture;
using test_support::TempDir;

namespace {

namespace fs = std::filesystem;

void test_spawn_returns_exit_code() {
    TempDir dir;
    const fs::path script = dir.path() / "python3.11";
    test_support::make_executable_script(script, "#!/bin/sh\nexit 7\n");

    const Dispatcher dispatcher(DispatchStrategy::Spawn);
    const std::vector<std::string> args;
    const auto result = dispatcher.dispatch(script, args, environ);
    assert(result.has_value());
    assert(*result == 7);
}

void test_spawn_forwards_arguments_and_streams() {
    TempDir dir;
    const fs::path script = dir.path() / "python3.11";
    test_support::make_fake_python(script, "3.11.6");

    const Dispatcher dispatcher(DispatchStrategy::Spawn);
    const std::vector<std::string> args{"app.py", "--flag", "two words"};

    FdCapture capture(STDOUT_FILENO);
    const auto result = dispatcher.dispatch(script, args, environ);
    const std::string output = capture.content();

    assert(result.has_value());
    assert(*result == 0);
    assert(output == "ran 3.11.6 app.py --flag two words\n");
}

void test_spawn_passes_environment_through() {
    TempDir dir;
    const fs::path script = dir.path() / "python3";
    test_support::make_executable_script(script, "#!/bin/sh\nprintf '%s' \"$PYLAUNCH_TEST_MARKER\"\n");

    std::string assignment = "PYLAUNCH_TEST_MARKER=carried";
    std::vector<char *> envp{assignment.data(), nullptr};

    const Dispatcher dispatcher(DispatchStrategy::Spawn);
    FdCapture capture(STDOUT_FILENO);
    const auto result = dispatcher.dispatch(script, {}, envp.data());
    const std::string output = capture.content();

    assert(result.has_value());
    assert(output == "carried");
}

void test_spawn_reports_signal_death() {
    TempDir dir;
    const fs::path script = dir.path() / "python3";
    test_support::make_executable_script(script, "#!/bin/sh\nkill -TERM $$\n");

    const Dispatcher dispatcher(DispatchStrategy::Spawn);
    const auto result = dispatcher.dispatch(script, {}, environ);
    assert(result.has_value());
    assert(*result == 128 + 15);
}

void test_missing_executable_is_a_dispatch_error() {
    TempDir dir;
    const fs::path script = dir.path() / "python3.11";
    test_support::make_fake_python(script, "3.11.6");
    fs::remove(script);

    for (const auto strategy : {DispatchStrategy::Spawn, DispatchStrategy::Replace}) {
        const Dispatcher dispatcher(strategy);
        const auto result = dispatcher.dispatch(script, {}, environ);
        assert(!result.has_value());
        assert(result.error().error_number == ENOENT);
        assert(result.error().executable == script.string());
        assert(result.error().exit_code() == EX_OSERR);
        assert(result.error().message.find(script.string()) != std::string::npos);
    }
}

void test_non_executable_file_is_a_dispatch_error() {
    TempDir dir;
    const fs::path script = dir.path() / "python3";
    test_support::write_file(script, "not a program\n");

    const Dispatcher dispatcher(DispatchStrategy::Spawn);
    const auto result = dispatcher.dispatch(script, {}, environ);
    assert(!result.has_value());
    assert(result.error().error_number == EACCES);
}

void test_replace_mode_hands_over_the_process() {
    TempDir dir;
    const fs::path script = dir.path() / "python3.12";
    test_support::make_executable_script(script, "#!/bin/sh\nexit 42\n");

    const pid_t pid = fork();
    assert(pid != -1);

    if (pid == 0) {
        const Dispatcher dispatcher(DispatchStrategy::Replace);
        const auto result = dispatcher.dispatch(script, {}, environ);
        _exit(result.has_value() ? 1 : 2);
    }

    const auto exit_code = pylauncher::wait_for_process(pid);
    assert(exit_code.has_value());
    assert(*exit_code == 42);
}

void test_wait_status_translation() {
    const pid_t pid = fork();
    assert(pid != -1);
    if (pid == 0) {
        _exit(3);
    }

    int status = 0;
    assert(waitpid(pid, &status, 0) == pid);
    assert(pylauncher::wait_status_to_exit_code(status) == 3);
}

} // namespace

int main() {
    test_spawn_returns_exit_code();
    test_spawn_forwards_arguments_and_streams();
    test_spawn_passes_environment_through();
    test_spawn_reports_signal_death();
    test_missing_executable_is_a_dispatch_error();
    test_non_executable_file_is_a_dispatch_error();
    test_replace_mode_hands_over_the_process();
    test_wait_status_translation();

    return 0;
}
