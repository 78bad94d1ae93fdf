#include <catch2/catch_test_macros.hpp>

#include <ccpm/recovery/error_recovery.hpp>
#include <ccpm/state/deployment_tracker.hpp>
#include <ccpm/state/schema_migrator.hpp>
#include <ccpm/state/state_store.hpp>

#include "../../test/mocks/temp_workspace.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

using namespace ccpm;
using ccpm::testing::TempWorkspace;
using nlohmann::json;

namespace fs = std::filesystem;

namespace {

// Components wired against one temporary workspace.
struct TrackerFixture {
    TempWorkspace ws;
    StateStore store{ws.Ctx()};
    SchemaMigrator migrator{ws.Ctx()};
    ErrorRecovery recovery{ws.Ctx(), store, migrator};
    DeploymentTracker tracker{ws.Ctx(), store, migrator, recovery};

    DeployedFile File(const std::string& relative, TargetType type = TargetType::Commands) const {
        DeployedFile f;
        f.source = relative;
        f.target = (ws.ExtensionRoot() / relative).string();
        f.hash = "h-" + relative;
        f.deployed_at = Iso8601Now();
        f.type = type;
        f.path = ".claude/" + relative;
        return f;
    }

    void Register(const std::string& id) {
        RepositorySummary repo;
        repo.id = id;
        repo.name = id;
        repo.url = "https://example.com/" + id + ".git";
        REQUIRE(tracker.RegisterRepository(repo).IsOk());
    }

    DeploymentState Require(const std::string& id) {
        auto ds = tracker.GetDeploymentState(id);
        REQUIRE(ds.IsOk());
        REQUIRE(ds.Value().has_value());
        return *ds.Value();
    }
};

std::string SnapshotFor(const std::string& id) {
    json snapshot = {
        {"version", 2},
        {"exportedAt", "2024-05-01T00:00:00.000Z"},
        {"state",
         {{"version", 2},
          {"repositories", json::array({{{"id", id}, {"name", id}, {"url", ""}}})},
          {"deploymentStates", {{id, {{"repositoryId", id},
                                      {"installationStatus", "uninstalled"},
                                      {"deployedFiles", json::array()}}}}},
          {"installationHistory", json::array()},
          {"metadata", {{"lastUpdated", "2024-05-01T00:00:00.000Z"}}}}},
    };
    return snapshot.dump();
}

} // anonymous namespace

// ===========================================================================
// Lifecycle
// ===========================================================================

TEST_CASE("DeploymentTracker: track installation", "[state][tracker]") {
    TrackerFixture f;
    TrackOptions options;
    options.commit_hash = "abc123";
    options.options = json{{"interactive", false}};

    REQUIRE(f.tracker.TrackInstallation("repo-1", {f.File("commands/a.md"),
                                                   f.File("agents/b.md", TargetType::Agents)},
                                        options).IsOk());

    auto ds = f.Require("repo-1");
    CHECK(ds.installation_status == InstallationStatus::Installed);
    CHECK(ds.deployed_files.size() == 2);
    CHECK(ds.last_installed.has_value());
    REQUIRE(ds.metadata.has_value());
    CHECK(ds.metadata->total_installations == 1);
    CHECK(ds.metadata->last_commit_hash == std::optional<std::string>("abc123"));

    auto history = f.tracker.GetInstallationHistory();
    REQUIRE(history.IsOk());
    REQUIRE(history.Value().size() == 1);
    const auto& rec = history.Value()[0];
    CHECK(rec.operation == InstallationOperation::Install);
    CHECK(rec.files_affected == 2);
    CHECK(rec.success);
    CHECK(rec.id.size() == 32);
    CHECK(rec.options == json{{"interactive", false}});
}

TEST_CASE("DeploymentTracker: reinstall replaces files by target", "[state][tracker]") {
    TrackerFixture f;
    REQUIRE(f.tracker.TrackInstallation("repo-1", {f.File("commands/a.md")}).IsOk());
    auto updated = f.File("commands/a.md");
    updated.hash = "new-hash";
    REQUIRE(f.tracker.TrackInstallation("repo-1", {updated, f.File("commands/b.md")}).IsOk());

    auto ds = f.Require("repo-1");
    REQUIRE(ds.deployed_files.size() == 2);
    CHECK(ds.deployed_files[0].hash == "new-hash");
    CHECK(ds.metadata->total_installations == 2);
    CHECK(ds.metadata->first_installed.has_value());
}

TEST_CASE("DeploymentTracker: TrackDeployment status rules", "[state][tracker]") {
    TrackerFixture f;

    SECTION("all deployed") {
        DeploymentResult r;
        r.deployed = {f.File("commands/a.md")};
        auto status = f.tracker.TrackDeployment("repo", r);
        REQUIRE(status.IsOk());
        CHECK(status.Value() == InstallationStatus::Installed);
    }
    SECTION("deployed with failures is partial") {
        DeploymentResult r;
        r.deployed = {f.File("commands/a.md")};
        r.failed = {"commands/b.md"};
        auto status = f.tracker.TrackDeployment("repo", r);
        REQUIRE(status.IsOk());
        CHECK(status.Value() == InstallationStatus::Partial);
        auto ds = f.Require("repo");
        CHECK(ds.errors == std::vector<std::string>{"Failed to deploy: commands/b.md"});
        auto history = f.tracker.GetInstallationHistory().Value();
        CHECK_FALSE(history[0].success);
        CHECK(history[0].error == std::optional<std::string>("1 files failed to deploy"));
    }
    SECTION("deployed with skips is partial") {
        DeploymentResult r;
        r.deployed = {f.File("commands/a.md")};
        r.skipped = {"commands/b.md"};
        CHECK(f.tracker.TrackDeployment("repo", r).Value() == InstallationStatus::Partial);
    }
    SECTION("nothing deployed and failures is error") {
        DeploymentResult r;
        r.failed = {"commands/b.md"};
        CHECK(f.tracker.TrackDeployment("repo", r).Value() == InstallationStatus::Error);
    }
    SECTION("only skips keeps previous files installed") {
        DeploymentResult first;
        first.deployed = {f.File("commands/a.md")};
        REQUIRE(f.tracker.TrackDeployment("repo", first).IsOk());
        DeploymentResult second;
        second.skipped = {"commands/a.md"};
        CHECK(f.tracker.TrackDeployment("repo", second).Value() == InstallationStatus::Installed);
    }
    SECTION("empty deployment is uninstalled") {
        CHECK(f.tracker.TrackDeployment("repo", DeploymentResult{}).Value() ==
              InstallationStatus::Uninstalled);
    }
}

TEST_CASE("DeploymentTracker: failed installation", "[state][tracker]") {
    TrackerFixture f;
    REQUIRE(f.tracker.TrackFailedInstallation("repo", "clone failed").IsOk());

    auto ds = f.Require("repo");
    CHECK(ds.installation_status == InstallationStatus::Error);
    CHECK(ds.errors == std::vector<std::string>{"clone failed"});
    auto history = f.tracker.GetInstallationHistory().Value();
    REQUIRE(history.size() == 1);
    CHECK_FALSE(history[0].success);
    CHECK(history[0].error == std::optional<std::string>("clone failed"));
}

TEST_CASE("DeploymentTracker: uninstall full and partial", "[state][tracker]") {
    TrackerFixture f;
    const auto a = f.File("commands/a.md");
    const auto b = f.File("commands/b.md");
    REQUIRE(f.tracker.TrackInstallation("repo", {a, b}).IsOk());

    SECTION("partial by display path") {
        REQUIRE(f.tracker.TrackUninstallation("repo", {a.path}).IsOk());
        auto ds = f.Require("repo");
        CHECK(ds.installation_status == InstallationStatus::Partial);
        CHECK(ds.deployed_files.size() == 1);
        CHECK(ds.metadata->total_uninstallations == 1);
    }
    SECTION("full by target") {
        REQUIRE(f.tracker.TrackUninstallation("repo", {a.target, b.target}).IsOk());
        auto ds = f.Require("repo");
        CHECK(ds.installation_status == InstallationStatus::Uninstalled);
        CHECK(ds.deployed_files.empty());
        CHECK(ds.last_uninstalled.has_value());

        HistoryFilter filter;
        filter.operation = InstallationOperation::Uninstall;
        auto history = f.tracker.GetInstallationHistory(filter).Value();
        REQUIRE(history.size() == 1);
        CHECK(history[0].files_affected == 2);
    }
}

TEST_CASE("DeploymentTracker: unregistration drops state but keeps history", "[state][tracker]") {
    TrackerFixture f;
    f.Register("repo");
    REQUIRE(f.tracker.TrackInstallation("repo", {f.File("commands/a.md")}).IsOk());
    REQUIRE(f.tracker.TrackUnregistration("repo").IsOk());

    auto ds = f.tracker.GetDeploymentState("repo");
    REQUIRE(ds.IsOk());
    CHECK_FALSE(ds.Value().has_value());
    // Files on disk are not the tracker's business.
    auto history = f.tracker.GetInstallationHistory().Value();
    REQUIRE(history.size() == 2);
    CHECK(history[0].operation == InstallationOperation::Unregister);
}

TEST_CASE("DeploymentTracker: update and remove deployment state", "[state][tracker]") {
    TrackerFixture f;

    DeploymentState bad;
    bad.repository_id = "other";
    auto rejected = f.tracker.UpdateDeploymentState("repo", bad);
    REQUIRE(rejected.IsErr());
    CHECK(rejected.Error().category == ErrorCategory::Validation);

    DeploymentState installed_without_files;
    installed_without_files.repository_id = "repo";
    installed_without_files.installation_status = InstallationStatus::Installed;
    CHECK(f.tracker.UpdateDeploymentState("repo", installed_without_files).IsErr());

    DeploymentState good;
    good.repository_id = "repo";
    good.installation_status = InstallationStatus::Uninstalled;
    REQUIRE(f.tracker.UpdateDeploymentState("repo", good).IsOk());
    CHECK(f.Require("repo").installation_status == InstallationStatus::Uninstalled);

    REQUIRE(f.tracker.RemoveDeploymentState("repo").IsOk());
    CHECK_FALSE(f.tracker.GetDeploymentState("repo").Value().has_value());
}

// ===========================================================================
// Repository summaries
// ===========================================================================

TEST_CASE("DeploymentTracker: register is an upsert", "[state][tracker]") {
    TrackerFixture f;
    f.Register("repo");

    RepositorySummary update;
    update.id = "repo";
    update.name = "Renamed";
    update.status = "error";
    REQUIRE(f.tracker.RegisterRepository(update).IsOk());

    auto loaded = f.store.Load();
    REQUIRE(loaded.IsOk());
    REQUIRE(loaded.Value().repositories.size() == 1);
    const auto& r = loaded.Value().repositories[0];
    CHECK(r.name == "Renamed");
    CHECK(r.status == "error");
    CHECK(r.url == "https://example.com/repo.git");
    CHECK_FALSE(r.registered_at.empty());

    RepositorySummary blank;
    CHECK(f.tracker.RegisterRepository(blank).IsErr());
}

TEST_CASE("DeploymentTracker: unregister and filter by status", "[state][tracker]") {
    TrackerFixture f;
    f.Register("a");
    f.Register("b");
    REQUIRE(f.tracker.TrackInstallation("a", {f.File("commands/a.md")}).IsOk());
    REQUIRE(f.tracker.TrackFailedInstallation("b", "boom").IsOk());

    auto installed = f.tracker.GetRepositoriesByStatus(InstallationStatus::Installed);
    REQUIRE(installed.IsOk());
    REQUIRE(installed.Value().size() == 1);
    CHECK(installed.Value()[0].id == "a");

    CHECK(f.tracker.UnregisterRepository("b").Value());
    CHECK_FALSE(f.tracker.UnregisterRepository("b").Value());
}

// ===========================================================================
// History
// ===========================================================================

TEST_CASE("DeploymentTracker: history is newest first with filters", "[state][tracker]") {
    TrackerFixture f;
    REQUIRE(f.tracker.TrackInstallation("a", {f.File("commands/a.md")}).IsOk());
    REQUIRE(f.tracker.TrackInstallation("b", {f.File("commands/b.md")}).IsOk());
    REQUIRE(f.tracker.TrackUninstallation("a", {}).IsOk());

    auto all = f.tracker.GetInstallationHistory().Value();
    REQUIRE(all.size() == 3);
    CHECK(all[0].repository_id == "a");
    CHECK(all[0].operation == InstallationOperation::Uninstall);
    CHECK(all[2].repository_id == "a");
    CHECK(all[2].operation == InstallationOperation::Install);

    HistoryFilter by_repo;
    by_repo.repository_id = "b";
    CHECK(f.tracker.GetInstallationHistory(by_repo).Value().size() == 1);

    HistoryFilter limited;
    limited.limit = 2;
    auto two = f.tracker.GetInstallationHistory(limited).Value();
    REQUIRE(two.size() == 2);
    CHECK(two[0].id == all[0].id);

    HistoryFilter future;
    future.start = std::chrono::system_clock::now() + std::chrono::hours(1);
    CHECK(f.tracker.GetInstallationHistory(future).Value().empty());
}

TEST_CASE("DeploymentTracker: clear history", "[state][tracker]") {
    TrackerFixture f;
    REQUIRE(f.tracker.TrackInstallation("a", {f.File("commands/a.md")}).IsOk());
    REQUIRE(f.tracker.TrackInstallation("b", {f.File("commands/b.md")}).IsOk());

    ClearHistoryFilter only_a;
    only_a.repository_id = "a";
    REQUIRE(f.tracker.ClearInstallationHistory(only_a).IsOk());
    auto remaining = f.tracker.GetInstallationHistory().Value();
    REQUIRE(remaining.size() == 1);
    CHECK(remaining[0].repository_id == "b");

    REQUIRE(f.tracker.ClearInstallationHistory().IsOk());
    CHECK(f.tracker.GetInstallationHistory().Value().empty());
}

// ===========================================================================
// Queries
// ===========================================================================

TEST_CASE("DeploymentTracker: deployed files and statistics", "[state][tracker]") {
    TrackerFixture f;
    f.Register("a");
    f.Register("b");
    f.Register("c");
    REQUIRE(f.tracker.TrackInstallation("a", {f.File("commands/x.md"),
                                              f.File("agents/y.md", TargetType::Agents)}).IsOk());
    DeploymentResult partial;
    partial.deployed = {f.File("hooks/z.js", TargetType::Hooks)};
    partial.failed = {"hooks/w.js"};
    REQUIRE(f.tracker.TrackDeployment("b", partial).IsOk());

    CHECK(f.tracker.GetDeployedFiles("a").Value().size() == 2);
    CHECK(f.tracker.GetDeployedFiles("nope").Value().empty());
    CHECK(f.tracker.IsFileDeployed("a", ".claude/commands/x.md").Value());
    CHECK(f.tracker.IsFileDeployed("a", (f.ws.ExtensionRoot() / "agents/y.md").string()).Value());
    CHECK_FALSE(f.tracker.IsFileDeployed("a", ".claude/commands/zzz.md").Value());

    auto stats = f.tracker.GetDeploymentStatistics();
    REQUIRE(stats.IsOk());
    const auto& s = stats.Value();
    CHECK(s.total_repositories == 3);
    CHECK(s.installed_repositories == 1);
    CHECK(s.partially_installed_repositories == 1);
    CHECK(s.uninstalled_repositories == 1);
    CHECK(s.total_deployed_files == 3);
    CHECK(s.commands == 1);
    CHECK(s.agents == 1);
    CHECK(s.hooks == 1);
    CHECK(ToJson(s)["deploymentsByType"]["hooks"] == 1);
}

// ===========================================================================
// Bulk
// ===========================================================================

TEST_CASE("DeploymentTracker: bulk update is all-or-nothing", "[state][tracker]") {
    TrackerFixture f;

    DeploymentState ok;
    ok.repository_id = "a";
    ok.installation_status = InstallationStatus::Uninstalled;
    DeploymentState bad;
    bad.repository_id = "mismatch";
    bad.installation_status = InstallationStatus::Uninstalled;

    auto rejected = f.tracker.BulkUpdateDeploymentStates({{"a", ok}, {"b", bad}});
    REQUIRE(rejected.IsErr());
    CHECK_FALSE(f.tracker.GetDeploymentState("a").Value().has_value());

    DeploymentState ok_b = ok;
    ok_b.repository_id = "b";
    REQUIRE(f.tracker.BulkUpdateDeploymentStates({{"a", ok}, {"b", ok_b}}).IsOk());
    CHECK(f.tracker.GetDeploymentState("a").Value().has_value());
    CHECK(f.tracker.GetDeploymentState("b").Value().has_value());
}

TEST_CASE("DeploymentTracker: bulk track installations", "[state][tracker]") {
    TrackerFixture f;
    REQUIRE(f.tracker.BulkTrackInstallations({{"a", {f.File("commands/a.md")}},
                                              {"b", {}}}).IsOk());
    CHECK(f.Require("a").installation_status == InstallationStatus::Installed);
    CHECK(f.Require("b").installation_status == InstallationStatus::Uninstalled);
    CHECK(f.tracker.GetInstallationHistory().Value().size() == 2);
}

// ===========================================================================
// Integrity
// ===========================================================================

TEST_CASE("DeploymentTracker: validate reports every issue kind", "[state][tracker]") {
    TrackerFixture f;
    f.Register("missing-state");
    REQUIRE(f.tracker.TrackInstallation("orphan", {f.File("commands/o.md")}).IsOk());
    f.Register("bad-paths");
    auto bad = f.File("commands/p.md");
    bad.path = "commands/p.md";
    REQUIRE(f.tracker.TrackInstallation("bad-paths", {bad}).IsOk());

    auto report = f.tracker.ValidateState();
    REQUIRE(report.IsOk());
    CHECK_FALSE(report.Value().valid);

    auto has = [&report](ValidationIssueType type, const std::string& id) {
        const auto& errors = report.Value().errors;
        return std::any_of(errors.begin(), errors.end(), [&](const ValidationIssue& i) {
            return i.type == type && i.repository_id == id;
        });
    };
    CHECK(has(ValidationIssueType::MissingDeploymentState, "missing-state"));
    CHECK(has(ValidationIssueType::OrphanedDeploymentState, "orphan"));
    CHECK(has(ValidationIssueType::InvalidFilePath, "bad-paths"));
    CHECK(ToJson(report.Value())["errors"][0].contains("type"));
}

TEST_CASE("DeploymentTracker: repair fixes what validate reports", "[state][tracker]") {
    TrackerFixture f;
    f.Register("missing-state");
    REQUIRE(f.tracker.TrackInstallation("orphan", {f.File("commands/o.md")}).IsOk());
    f.Register("bad-paths");
    auto relative = f.File("commands/p.md");
    relative.path = "commands/p.md";
    auto rooted = f.File("agents/q.md", TargetType::Agents);
    rooted.path = "/agents/q.md";
    REQUIRE(f.tracker.TrackInstallation("bad-paths", {relative, rooted}).IsOk());

    auto repaired = f.tracker.RepairState();
    REQUIRE(repaired.IsOk());
    CHECK(repaired.Value().repaired);
    CHECK(repaired.Value().changes.size() == 3);

    auto after = f.tracker.ValidateState();
    REQUIRE(after.IsOk());
    CHECK(after.Value().valid);

    CHECK(f.Require("missing-state").installation_status == InstallationStatus::Uninstalled);
    CHECK_FALSE(f.tracker.GetDeploymentState("orphan").Value().has_value());
    auto files = f.Require("bad-paths").deployed_files;
    REQUIRE(files.size() == 2);
    CHECK(files[0].path == ".claude/commands/p.md");
    CHECK(files[1].path == ".claude/agents/q.md");

    auto clean = f.tracker.RepairState();
    REQUIRE(clean.IsOk());
    CHECK_FALSE(clean.Value().repaired);
}

// ===========================================================================
// Snapshots
// ===========================================================================

TEST_CASE("DeploymentTracker: export filters by repository", "[state][tracker]") {
    TrackerFixture f;
    f.Register("a");
    f.Register("b");
    REQUIRE(f.tracker.TrackInstallation("a", {f.File("commands/a.md")}).IsOk());
    REQUIRE(f.tracker.TrackInstallation("b", {f.File("commands/b.md")}).IsOk());

    auto all = f.tracker.ExportState();
    REQUIRE(all.IsOk());
    CHECK(all.Value().state.repositories.size() == 2);
    CHECK(all.Value().version == 2);

    auto only_a = f.tracker.ExportState(std::vector<std::string>{"a"});
    REQUIRE(only_a.IsOk());
    const auto& s = only_a.Value().state;
    REQUIRE(s.repositories.size() == 1);
    CHECK(s.repositories[0].id == "a");
    CHECK(s.deployment_states.count("b") == 0);
    CHECK(s.installation_history.size() == 1);

    auto j = ToJson(only_a.Value());
    CHECK(j["version"] == 2);
    CHECK(j.contains("exportedAt"));
}

TEST_CASE("DeploymentTracker: import rejects other versions untouched", "[state][tracker]") {
    TrackerFixture f;
    f.Register("a");
    const auto before = TempWorkspace::ReadFile(f.ws.StatePath());

    for (const auto& payload : {json{{"version", 1}, {"state", json::object()}},
                                json{{"version", "2"}, {"state", json::object()}},
                                json{{"state", json::object()}}}) {
        auto r = f.tracker.ImportState(payload);
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::VersionMismatch);
    }
    CHECK(TempWorkspace::ReadFile(f.ws.StatePath()) == before);

    auto no_state = f.tracker.ImportState(json{{"version", 2}});
    REQUIRE(no_state.IsErr());
    CHECK(no_state.Error().category == ErrorCategory::Validation);

    auto bad_state = f.tracker.ImportState(json{{"version", 2}, {"state", {{"version", 2},
                                                                           {"repositories", 5}}}});
    REQUIRE(bad_state.IsErr());
    CHECK(bad_state.Error().category == ErrorCategory::Validation);
}

TEST_CASE("DeploymentTracker: import merge and replace", "[state][tracker]") {
    TrackerFixture f;
    f.Register("local");
    REQUIRE(f.tracker.TrackInstallation("local", {f.File("commands/l.md")}).IsOk());
    const auto snapshot = json::parse(SnapshotFor("remote"));

    SECTION("merge keeps local and adds imported") {
        REQUIRE(f.tracker.ImportState(snapshot).IsOk());
        auto state = f.store.Load().Value();
        CHECK(state.HasRepository("local"));
        CHECK(state.HasRepository("remote"));
        CHECK(state.deployment_states.count("local") == 1);
        CHECK(state.deployment_states.count("remote") == 1);
        CHECK(state.installation_history.size() == 1);
    }
    SECTION("replace drops local") {
        REQUIRE(f.tracker.ImportState(snapshot, ImportOptions{false}).IsOk());
        auto state = f.store.Load().Value();
        CHECK_FALSE(state.HasRepository("local"));
        CHECK(state.HasRepository("remote"));
        CHECK(state.installation_history.empty());
    }
}

TEST_CASE("DeploymentTracker: import with a wrong-typed field is Validation", "[state][tracker]") {
    TrackerFixture f;
    f.Register("a");
    const auto before = TempWorkspace::ReadFile(f.ws.StatePath());

    auto snapshot = json::parse(SnapshotFor("remote"));
    snapshot["state"]["deploymentStates"]["remote"]["deployedFiles"] =
        json::array({{{"target", "/x/a.md"}, {"hash", 42}}});

    auto r = f.tracker.ImportState(snapshot);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Validation);
    CHECK(r.Error().operation == "ImportState");
    CHECK(TempWorkspace::ReadFile(f.ws.StatePath()) == before);
}

// ===========================================================================
// Concurrent writers
// ===========================================================================

TEST_CASE("DeploymentTracker: mutations apply to the on-disk document", "[state][tracker]") {
    TrackerFixture f;
    f.ws.Config().state.cache_ttl_ms = 60000;
    StateStore other_store(f.ws.Ctx());
    DeploymentTracker other(f.ws.Ctx(), other_store, f.migrator, f.recovery);

    f.Register("a");
    REQUIRE(f.tracker.GetRepositoriesByStatus(InstallationStatus::Installed).IsOk());

    RepositorySummary b;
    b.id = "b";
    b.name = "b";
    REQUIRE(other.RegisterRepository(b).IsOk());
    REQUIRE(f.tracker.TrackInstallation("a", {f.File("commands/a.md")}).IsOk());

    auto state = f.store.Load().Value();
    CHECK(state.HasRepository("a"));
    CHECK(state.HasRepository("b"));
    CHECK(state.deployment_states.count("a") == 1);
}

TEST_CASE("DeploymentTracker: a held lock blocks mutations", "[state][tracker]") {
    TrackerFixture f;
    f.Register("a");
    const auto before = TempWorkspace::ReadFile(f.ws.StatePath());

    auto held = LockFile::Acquire(f.store.LockPath(), 1, std::chrono::milliseconds(1));
    REQUIRE(held.IsOk());

    auto r = f.tracker.TrackInstallation("a", {f.File("commands/a.md")});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::LockConflict);
    CHECK(TempWorkspace::ReadFile(f.ws.StatePath()) == before);

    held.Value().Release();
    REQUIRE(f.tracker.TrackInstallation("a", {f.File("commands/a.md")}).IsOk());
    CHECK_FALSE(fs::exists(f.store.LockPath()));
}

// ===========================================================================
// Loading, cache and recovery
// ===========================================================================

TEST_CASE("DeploymentTracker: reads are cached until a mutation", "[state][tracker]") {
    TrackerFixture f;
    f.ws.Config().state.cache_ttl_ms = 60000;
    REQUIRE(f.tracker.TrackInstallation("a", {f.File("commands/a.md")}).IsOk());
    REQUIRE(f.tracker.GetDeploymentState("a").Value().has_value());

    // Out-of-band change is invisible through the cache.
    auto raw = f.store.Load().Value();
    raw.deployment_states.erase("a");
    REQUIRE(f.store.Save(raw).IsOk());
    CHECK(f.tracker.GetDeploymentState("a").Value().has_value());

    f.tracker.InvalidateCache();
    CHECK_FALSE(f.tracker.GetDeploymentState("a").Value().has_value());
}

TEST_CASE("DeploymentTracker: zero TTL always reads from disk", "[state][tracker]") {
    TrackerFixture f;
    f.ws.Config().state.cache_ttl_ms = 0;
    REQUIRE(f.tracker.TrackInstallation("a", {f.File("commands/a.md")}).IsOk());
    REQUIRE(f.tracker.GetDeploymentState("a").Value().has_value());

    auto raw = f.store.Load().Value();
    raw.deployment_states.erase("a");
    REQUIRE(f.store.Save(raw).IsOk());
    CHECK_FALSE(f.tracker.GetDeploymentState("a").Value().has_value());
}

TEST_CASE("DeploymentTracker: legacy state is migrated on first use", "[state][tracker]") {
    TrackerFixture f;
    TempWorkspace::WriteFile(
        f.ws.StatePath(),
        TempWorkspace::ReadFile(std::string(CCPM_TESTDATA_DIR) + "/state_v1.json"));

    auto ds = f.tracker.GetDeploymentState("repo-a");
    REQUIRE(ds.IsOk());
    REQUIRE(ds.Value().has_value());
    CHECK(ds.Value()->deployed_files.size() == 2);
    CHECK(f.migrator.FindLatestBackup(f.ws.StatePath()).has_value());
}

TEST_CASE("DeploymentTracker: corrupt state is restored from the latest backup", "[state][tracker]") {
    TrackerFixture f;
    f.Register("backed-up");
    const auto dir = f.ws.StatePath().parent_path();
    fs::copy_file(f.ws.StatePath(), dir / "state.backup.2024-01-01T00-00-00-000Z.json");

    TempWorkspace::WriteFile(f.ws.StatePath(), "{ corrupted");
    f.tracker.InvalidateCache();

    auto stats = f.tracker.GetDeploymentStatistics();
    REQUIRE(stats.IsOk());
    CHECK(stats.Value().total_repositories == 1);

    REQUIRE(f.tracker.LastRecovery().has_value());
    CHECK(f.tracker.LastRecovery()->success);
    CHECK(f.tracker.LastRecovery()->strategy == RecoveryStrategy::RestoreBackup);
}

TEST_CASE("DeploymentTracker: corrupt state without backup starts over", "[state][tracker]") {
    TrackerFixture f;
    TempWorkspace::WriteFile(f.ws.StatePath(), "[1,2,");

    auto stats = f.tracker.GetDeploymentStatistics();
    REQUIRE(stats.IsOk());
    CHECK(stats.Value().total_repositories == 0);
    REQUIRE(f.tracker.LastRecovery().has_value());
    CHECK(f.tracker.LastRecovery()->strategy == RecoveryStrategy::RecreateState);
}
