#include <cassert>
#include <filesystem>
#include <string>

#include "discovery/discovery_coordinator.hpp"
#include "discovery/interpreter_inspector.hpp"
#include "discovery/interpreter_probe.hpp"
#include "selection/selector.hpp"
#include "support/launcher_config.hpp"
#include "test_support.hpp"

using pylauncher::Architecture;
using pylauncher::DiscoveryCoordinator;
using pylauncher::DiscoveryRequest;
using pylauncher::InterpreterInspector;
using pylauncher::InterpreterProbe;
using pylauncher::LauncherConfig;
using pylauncher::OriginTier;
using pylauncher::RequestOrigin;
using pylauncher::ResolutionErrorKind;
using pylauncher::Selector;
using pylauncher::VersionSpec;
using test_support::TempDir;

namespace {

namespace fs = std::filesystem;

// PATH with python3.9 and python3.11, no venv, and a working directory with
// no .python-version of its own.
struct Fixture {
    TempDir bin;
    TempDir work;
    LauncherConfig config;
    InterpreterProbe probe;
    InterpreterInspector inspector{probe};

    Fixture() {
        test_support::make_fake_python(bin.path() / "python3.9", "3.9.18");
        test_support::make_fake_python(bin.path() / "python3.11", "3.11.6");

        config.search_path = bin.path().string();
        config.working_directory = work.path();
    }

    [[nodiscard]] DiscoveryCoordinator coordinator() const { return DiscoveryCoordinator(config, inspector); }
};

void test_path_only_resolution() {
    Fixture fixture;
    const auto coordinator = fixture.coordinator();
    Selector selector;

    const auto any = coordinator.discover(DiscoveryRequest{});
    assert(any.origin == RequestOrigin::Default);
    assert(any.candidates.size() == 2);
    const auto newest = selector.select(any.spec, any.candidates);
    assert(newest.has_value());
    assert(newest->executable_path == fixture.bin.path() / "python3.11");

    const auto wants_39 = coordinator.discover(DiscoveryRequest{.command_line_version = VersionSpec::exact(3, 9), .script = {}});
    assert(wants_39.origin == RequestOrigin::CommandLine);
    const auto py39 = selector.select(wants_39.spec, wants_39.candidates);
    assert(py39.has_value());
    assert(py39->executable_path == fixture.bin.path() / "python3.9");

    const auto wants_312 = coordinator.discover(DiscoveryRequest{.command_line_version = VersionSpec::exact(3, 12), .script = {}});
    const auto missing = selector.select(wants_312.spec, wants_312.candidates);
    assert(!missing.has_value());
    assert(missing.error().kind == ResolutionErrorKind::NoVersionMatch);
}

void test_version_file_drives_the_request() {
    Fixture fixture;
    test_support::make_fake_python(fixture.bin.path() / "python3.8", "3.8.18");
    test_support::write_file(fixture.work.path() / ".python-version", "3.8\n");

    const auto discovery = fixture.coordinator().discover(DiscoveryRequest{});
    assert(discovery.origin == RequestOrigin::VersionFile);
    assert(discovery.spec == VersionSpec::exact(3, 8));
    assert(discovery.candidates.size() == 3);
    assert(discovery.candidates[0].origin_tier == OriginTier::VersionFile);

    const auto chosen = Selector().select(discovery.spec, discovery.candidates);
    assert(chosen.has_value());
    assert(chosen->version.minor == 8);
    assert(chosen->origin_tier == OriginTier::VersionFile);
}

void test_command_line_outranks_version_file() {
    Fixture fixture;
    test_support::write_file(fixture.work.path() / ".python-version", "3.9\n");

    const auto discovery =
        fixture.coordinator().discover(DiscoveryRequest{.command_line_version = VersionSpec::exact(3, 11), .script = {}});
    assert(discovery.origin == RequestOrigin::CommandLine);
    for (const auto &candidate : discovery.candidates) {
        assert(candidate.origin_tier == OriginTier::Path);
    }

    const auto chosen = Selector().select(discovery.spec, discovery.candidates);
    assert(chosen.has_value());
    assert(chosen->version.minor == 11);
}

void test_shebang_token_overrides_command_line() {
    Fixture fixture;
    const fs::path script = fixture.work.path() / "tool.py";
    test_support::write_file(script, "#!/usr/bin/env py -3.9\nprint('hi')\n");

    const auto discovery =
        fixture.coordinator().discover(DiscoveryRequest{.command_line_version = VersionSpec::exact(3, 11), .script = script});
    assert(discovery.origin == RequestOrigin::ShebangToken);
    assert(discovery.spec == VersionSpec::exact(3, 9));

    const auto chosen = Selector().select(discovery.spec, discovery.candidates);
    assert(chosen.has_value());
    assert(chosen->executable_path == fixture.bin.path() / "python3.9");
}

void test_shebang_path_short_circuits_everything() {
    Fixture fixture;
    TempDir venv;
    test_support::make_fake_python(venv.path() / "bin" / "python", "3.11.6");
    test_support::write_file(venv.path() / "pyvenv.cfg", "version = 3.11.6\n");
    fixture.config.virtual_env = venv.path();

    TempDir elsewhere;
    const fs::path pinned = elsewhere.path() / "python3.7";
    test_support::make_fake_python(pinned, "3.7.17");

    const fs::path script = fixture.work.path() / "pinned.py";
    test_support::write_file(script, "#!" + pinned.string() + "\n");

    const auto discovery =
        fixture.coordinator().discover(DiscoveryRequest{.command_line_version = VersionSpec::exact(3, 11), .script = script});
    assert(discovery.origin == RequestOrigin::ShebangPath);
    assert(discovery.candidates.size() == 1);
    assert(discovery.candidates[0].origin_tier == OriginTier::Shebang);

    const auto chosen = Selector().select(discovery.spec, discovery.candidates);
    assert(chosen.has_value());
    assert(chosen->executable_path == pinned);
}

void test_unreadable_script_falls_through() {
    Fixture fixture;
    const auto discovery = fixture.coordinator().discover(
        DiscoveryRequest{.command_line_version = VersionSpec::exact(3, 9), .script = fixture.work.path() / "missing.py"});
    assert(discovery.origin == RequestOrigin::CommandLine);
    assert(discovery.candidates.size() == 2);
}

void test_virtual_env_wins_unconstrained_requests() {
    Fixture fixture;
    TempDir venv;
    test_support::make_fake_python(venv.path() / "bin" / "python", "3.6.15");
    test_support::write_file(venv.path() / "pyvenv.cfg", "version = 3.6.15\n");
    fixture.config.virtual_env = venv.path();

    // A stale .python-version must not hide the active environment.
    test_support::write_file(fixture.work.path() / ".python-version", "3.11\n");

    const auto coordinator = fixture.coordinator();
    const auto discovery = coordinator.discover(DiscoveryRequest{});
    assert(discovery.origin == RequestOrigin::VirtualEnv);
    assert(discovery.candidates.size() == 1);

    const auto chosen = Selector().select(discovery.spec, discovery.candidates);
    assert(chosen.has_value());
    assert(chosen->executable_path == venv.path() / "bin" / "python");
    assert(chosen->origin_tier == OriginTier::VirtualEnv);

    const auto matching = coordinator.discover(DiscoveryRequest{.command_line_version = VersionSpec::major_only(3), .script = {}});
    assert(matching.origin == RequestOrigin::VirtualEnv);

    const auto incompatible = coordinator.discover(DiscoveryRequest{.command_line_version = VersionSpec::exact(3, 11), .script = {}});
    assert(incompatible.origin == RequestOrigin::CommandLine);
    const auto fallback = Selector().select(incompatible.spec, incompatible.candidates);
    assert(fallback.has_value());
    assert(fallback->executable_path == fixture.bin.path() / "python3.11");
}

void test_environment_defaults() {
    Fixture fixture;
    fixture.config.default_version = "3.9";

    const auto from_default = fixture.coordinator().discover(DiscoveryRequest{});
    assert(from_default.origin == RequestOrigin::Environment);
    assert(from_default.spec == VersionSpec::exact(3, 9));

    fixture.config.default_version = "3";
    fixture.config.major_defaults[3] = "3.9";
    const auto refined = fixture.coordinator().discover(DiscoveryRequest{});
    assert(refined.spec == VersionSpec::exact(3, 9));

    const auto from_flag =
        fixture.coordinator().discover(DiscoveryRequest{.command_line_version = VersionSpec::major_only(3, Architecture::Bits64), .script = {}});
    assert(from_flag.spec == VersionSpec::exact(3, 9, Architecture::Bits64));

    fixture.config.major_defaults[3] = "2.7";
    const auto wrong_major =
        fixture.coordinator().discover(DiscoveryRequest{.command_line_version = VersionSpec::major_only(3), .script = {}});
    assert(wrong_major.spec == VersionSpec::major_only(3));

    fixture.config.default_version = "not-a-version";
    fixture.config.major_defaults.clear();
    const auto ignored = fixture.coordinator().discover(DiscoveryRequest{});
    assert(ignored.origin == RequestOrigin::Default);
    assert(ignored.spec.is_any());
}

void test_listing_and_resolving_with_nothing_installed() {
    TempDir empty_bin;
    TempDir work;
    LauncherConfig config;
    config.search_path = empty_bin.path().string();
    config.working_directory = work.path();

    InterpreterProbe probe;
    InterpreterInspector inspector(probe);
    DiscoveryCoordinator coordinator(config, inspector);

    assert(coordinator.collect_all().empty());

    const auto discovery = coordinator.discover(DiscoveryRequest{});
    const auto result = Selector().select(discovery.spec, discovery.candidates);
    assert(!result.has_value());
    assert(result.error().kind == ResolutionErrorKind::NoInterpreterFound);
}

void test_collect_all_merges_tiers_without_short_circuit() {
    Fixture fixture;
    TempDir venv;
    test_support::make_fake_python(venv.path() / "bin" / "python", "3.12.1");
    test_support::write_file(venv.path() / "pyvenv.cfg", "version = 3.12.1\n");
    fixture.config.virtual_env = venv.path();
    test_support::write_file(fixture.work.path() / ".python-version", "3.9\n");

    const auto all = fixture.coordinator().collect_all();
    assert(all.size() == 3);
    assert(all[0].origin_tier == OriginTier::VirtualEnv);
    assert(all[1].origin_tier == OriginTier::VersionFile);
    assert(all[1].version.minor == 9);
    assert(all[2].origin_tier == OriginTier::Path);
    assert(all[2].version.minor == 11);
}

} // namespace

int main() {
    test_path_only_resolution();
    test_version_file_drives_the_request();
    test_command_line_outranks_version_file();
    test_shebang_token_overrides_command_line();
    test_shebang_path_short_circuits_everything();
    test_unreadable_script_falls_through();
    test_virtual_env_wins_unconstrained_requests();
    test_environment_defaults();
    test_listing_and_resolving_with_nothing_installed();
    test_collect_all_merges_tiers_without_short_circuit();

    return 0;
}
