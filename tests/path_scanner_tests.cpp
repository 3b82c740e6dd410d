#include <algorithm>
#include <cassert>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include "discovery/interpreter_inspector.hpp"
#include "discovery/interpreter_probe.hpp"
#include "discovery/path_scanner.hpp"
#include "test_support.hpp"

using pylauncher::ExactVersion;
using pylauncher::Interpreter;
using pylauncher::InterpreterInspector;
using pylauncher::InterpreterProbe;
using pylauncher::OriginTier;
using pylauncher::PathScanner;
using pylauncher::PathSource;
using test_support::TempDir;

namespace {

namespace fs = std::filesystem;

bool contains_path(const std::vector<fs::path> &paths, const fs::path &wanted) {
    return std::find(paths.begin(), paths.end(), wanted) != paths.end();
}

const Interpreter *find_version(const std::vector<Interpreter> &interpreters, int major, int minor) {
    for (const auto &interpreter : interpreters) {
        if (interpreter.version.major == major && interpreter.version.minor == minor) {
            return &interpreter;
        }
    }

    return nullptr;
}

void test_empty_search_path_finds_nothing() {
    InterpreterProbe probe;
    InterpreterInspector inspector(probe);

    PathScanner scanner("", inspector);
    assert(scanner.python_executables().empty());
    assert(scanner.interpreters().empty());

    PathScanner missing("/definitely/missing/path::", inspector);
    assert(missing.interpreters().empty());
}

void test_only_python_executables_are_found() {
    TempDir dir;
    test_support::make_fake_python(dir.path() / "python3.11", "3.11.0");
    test_support::make_fake_python(dir.path() / "python3.9", "3.9.0");
    test_support::make_executable_script(dir.path() / "python3.11-config", "#!/bin/sh\n");
    test_support::make_executable_script(dir.path() / "pip3", "#!/bin/sh\n");
    test_support::write_file(dir.path() / "python3.8", "not executable");

    std::error_code ec;
    fs::permissions(dir.path() / "python3.8", fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    assert(!ec);
    fs::create_directory(dir.path() / "python3.7", ec);
    assert(!ec);

    InterpreterProbe probe;
    InterpreterInspector inspector(probe);
    PathScanner scanner(dir.path().string(), inspector);

    const auto executables = scanner.python_executables();
    assert(executables.size() == 2);
    assert(contains_path(executables, dir.path() / "python3.11"));
    assert(contains_path(executables, dir.path() / "python3.9"));

    const auto &interpreters = scanner.interpreters();
    assert(interpreters.size() == 2);
    for (const auto &interpreter : interpreters) {
        assert(interpreter.origin_tier == OriginTier::Path);
    }
    assert(find_version(interpreters, 3, 11) != nullptr);
    assert(find_version(interpreters, 3, 9) != nullptr);
}

void test_symlink_aliases_count_once() {
    TempDir dir;
    const fs::path target = dir.path() / "python3.12";
    test_support::make_fake_python(target, "3.12.1");

    std::error_code ec;
    fs::create_symlink(target, dir.path() / "python3", ec);
    assert(!ec);
    fs::create_symlink(target, dir.path() / "python", ec);
    assert(!ec);

    InterpreterProbe probe;
    InterpreterInspector inspector(probe);
    PathScanner scanner(dir.path().string(), inspector);

    const auto executables = scanner.python_executables();
    assert(executables.size() == 1);

    const auto &interpreters = scanner.interpreters();
    assert(interpreters.size() == 1);
    assert(interpreters.front().version.major == 3);
    assert(interpreters.front().version.minor == 12);
}

void test_path_order_and_unversioned_names() {
    TempDir first;
    TempDir second;

    test_support::make_fake_python(first.path() / "python3.10", "3.10.0");
    test_support::make_fake_python(second.path() / "python3.10", "3.10.0");
    test_support::make_fake_python(second.path() / "python3", "3.13.2");

    const std::string search_path = first.path().string() + ":/definitely/missing/path::" + second.path().string();

    InterpreterProbe probe;
    InterpreterInspector inspector(probe);
    PathScanner scanner(search_path, inspector);

    const auto executables = scanner.python_executables();
    assert(executables.size() == 3);
    assert(executables.front() == first.path() / "python3.10");

    const auto &interpreters = scanner.interpreters();
    assert(interpreters.size() == 3);

    // Unversioned names are probed for their version.
    const auto *probed = find_version(interpreters, 3, 13);
    assert(probed != nullptr);
    assert(probed->version == (ExactVersion{.major = 3, .minor = 13, .patch = 2}));
    assert(probed->executable_path == second.path() / "python3");
}

void test_scan_is_memoized_and_source_yields_it() {
    TempDir dir;
    const fs::path python = dir.path() / "python3.11";
    test_support::make_fake_python(python, "3.11.0");

    InterpreterProbe probe;
    InterpreterInspector inspector(probe);
    PathScanner scanner(dir.path().string(), inspector);

    const auto *first_call = &scanner.interpreters();
    assert(first_call->size() == 1);

    std::error_code ec;
    fs::remove(python, ec);
    assert(!ec);

    assert(&scanner.interpreters() == first_call);
    assert(scanner.interpreters().size() == 1);

    PathSource source(scanner);
    assert(source.tier() == OriginTier::Path);
    assert(!source.short_circuits());
    assert(source.yield_candidates().size() == 1);
}

} // namespace

int main() {
    test_empty_search_path_finds_nothing();
    test_only_python_executables_are_found();
    test_symlink_aliases_count_once();
    test_path_order_and_unversioned_names();
    test_scan_is_memoized_and_source_yields_it();

    return 0;
}
