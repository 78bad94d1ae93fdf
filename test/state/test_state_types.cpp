#include <catch2/catch_test_macros.hpp>

#include <ccpm/state/state_types.hpp>

using namespace ccpm;
using nlohmann::json;

namespace {

StateFile SampleState() {
    StateFile state = StateFile::Empty();

    RepositorySummary repo;
    repo.id = "repo-1";
    repo.name = "Repo One";
    repo.url = "https://example.com/repo-1.git";
    repo.local_path = "/src/repo-1";
    repo.registered_at = "2024-05-01T12:00:00.000Z";
    repo.type = TargetType::Agents;
    repo.deployment_mode = kTypeBasedMode;
    state.repositories.push_back(repo);

    DeployedFile file;
    file.source = "planner.md";
    file.target = "/home/u/.claude/agents/planner.md";
    file.hash = "abc";
    file.deployed_at = "2024-05-01T12:00:01.000Z";
    file.type = TargetType::Agents;
    file.path = ".claude/agents/planner.md";

    DeploymentState ds;
    ds.repository_id = "repo-1";
    ds.deployed_files.push_back(file);
    ds.installation_status = InstallationStatus::Partial;
    ds.last_installed = "2024-05-01T12:00:01.000Z";
    ds.errors.push_back("Failed to deploy: coder.md");
    ds.metadata = DeploymentMetadata{2, 1, std::string("2024-04-01T00:00:00.000Z"),
                                     std::string("deadbeef")};
    state.deployment_states.emplace("repo-1", ds);

    InstallationRecord rec;
    rec.id = "r1";
    rec.repository_id = "repo-1";
    rec.operation = InstallationOperation::Install;
    rec.timestamp = "2024-05-01T12:00:01.000Z";
    rec.files_affected = 1;
    rec.success = false;
    rec.error = "partial";
    rec.options = json{{"interactive", false}};
    rec.metadata = RecordMetadata{std::string("deadbeef"), std::nullopt};
    state.installation_history.push_back(rec);
    return state;
}

} // anonymous namespace

TEST_CASE("StateFile: Empty is current version and stamped", "[state][types]") {
    auto state = StateFile::Empty();
    CHECK(state.version == kCurrentStateVersion);
    CHECK(state.repositories.empty());
    CHECK_FALSE(state.metadata.last_updated.empty());
    CHECK_FALSE(state.metadata.last_migration.has_value());
}

TEST_CASE("StateFile: FindRepository", "[state][types]") {
    auto state = SampleState();
    REQUIRE(state.FindRepository("repo-1") != nullptr);
    CHECK(state.FindRepository("repo-1")->name == "Repo One");
    CHECK_FALSE(state.HasRepository("repo-2"));
}

TEST_CASE("ToJson: camelCase keys and omitted optionals", "[state][types]") {
    auto j = ToJson(SampleState());

    CHECK(j["version"] == 2);
    CHECK(j["metadata"]["lastMigration"].is_null());
    CHECK(j["repositories"][0]["localPath"] == "/src/repo-1");
    CHECK(j["repositories"][0]["deploymentMode"] == "type-based");
    CHECK(j["repositories"][0]["type"] == "agents");

    const auto& ds = j["deploymentStates"]["repo-1"];
    CHECK(ds["installationStatus"] == "partial");
    CHECK(ds["deployedFiles"][0]["deployedAt"] == "2024-05-01T12:00:01.000Z");
    CHECK(ds["metadata"]["totalInstallations"] == 2);
    CHECK(ds["metadata"]["lastCommitHash"] == "deadbeef");
    CHECK_FALSE(ds.contains("lastUninstalled"));

    const auto& rec = j["installationHistory"][0];
    CHECK(rec["operation"] == "install");
    CHECK(rec["filesAffected"] == 1);
    CHECK(rec["metadata"]["commitHash"] == "deadbeef");
    CHECK_FALSE(rec["metadata"].contains("userAgent"));
}

TEST_CASE("StateFileFromJson: decodes an encoded document", "[state][types]") {
    auto original = SampleState();
    auto decoded = StateFileFromJson(ToJson(original));
    REQUIRE(decoded.IsOk());
    const auto& s = decoded.Value();

    REQUIRE(s.repositories.size() == 1);
    CHECK(s.repositories[0].type == TargetType::Agents);
    const auto& ds = s.deployment_states.at("repo-1");
    CHECK(ds.deployed_files == original.deployment_states.at("repo-1").deployed_files);
    CHECK(ds.errors == std::vector<std::string>{"Failed to deploy: coder.md"});
    REQUIRE(ds.metadata.has_value());
    CHECK(ds.metadata->total_uninstallations == 1);
    REQUIRE(s.installation_history.size() == 1);
    CHECK(s.installation_history[0].error == std::optional<std::string>("partial"));
    CHECK(s.installation_history[0].options == json{{"interactive", false}});
}

TEST_CASE("StateFileFromJson: tolerant defaults", "[state][types]") {
    json j = {
        {"version", 2},
        {"repositories", json::array({{{"id", "r"}}})},
        {"deploymentStates",
         {{"r", {{"deployedFiles", json::array({{{"path", "/x/commands/a.md"},
                                                 {"type", "command"}}})}}}}},
    };
    auto decoded = StateFileFromJson(j);
    REQUIRE(decoded.IsOk());
    const auto& s = decoded.Value();
    CHECK(s.repositories[0].name == "r");
    CHECK(s.repositories[0].status == "active");
    const auto& ds = s.deployment_states.at("r");
    CHECK(ds.repository_id == "r");
    CHECK(ds.installation_status == InstallationStatus::Installed);
    CHECK(ds.deployed_files[0].target == "/x/commands/a.md");
    CHECK(ds.deployed_files[0].type == TargetType::Commands);
}

TEST_CASE("StateFileFromJson: structural errors are StateCorruption", "[state][types]") {
    SECTION("not an object") {
        auto r = StateFileFromJson(json::array());
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::StateCorruption);
    }
    SECTION("no version") {
        auto r = StateFileFromJson(json{{"repositories", json::array()}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::StateCorruption);
    }
    SECTION("repositories not an array") {
        auto r = StateFileFromJson(json{{"version", 2}, {"repositories", "x"}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::StateCorruption);
    }
    SECTION("repository without id") {
        auto r = StateFileFromJson(
            json{{"version", 2}, {"repositories", json::array({{{"name", "x"}}})}});
        REQUIRE(r.IsErr());
    }
    SECTION("unknown status") {
        auto r = StateFileFromJson(json{
            {"version", 2},
            {"deploymentStates", {{"r", {{"installationStatus", "exploded"}}}}}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::StateCorruption);
    }
}

TEST_CASE("StateFileFromJson: other numeric versions are VersionMismatch", "[state][types]") {
    auto r = StateFileFromJson(json{{"version", 3}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::VersionMismatch);
}

TEST_CASE("StateFileFromJson: wrong-typed fields are StateCorruption", "[state][types]") {
    SECTION("hash is a number") {
        auto r = StateFileFromJson(json{
            {"version", 2},
            {"deploymentStates",
             {{"r", {{"deployedFiles", json::array({{{"target", "/x/a.md"}, {"hash", 42}}})}}}}}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::StateCorruption);
        CHECK(r.Error().message.find("'hash'") != std::string::npos);
    }
    SECTION("repository name is an object") {
        auto r = StateFileFromJson(json{
            {"version", 2},
            {"repositories", json::array({{{"id", "r"}, {"name", {{"x", 1}}}}})}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::StateCorruption);
    }
    SECTION("filesAffected is a string") {
        auto r = StateFileFromJson(json{
            {"version", 2},
            {"installationHistory",
             json::array({{{"id", "h"}, {"operation", "install"}, {"filesAffected", "3"}}})}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::StateCorruption);
    }
    SECTION("errors holds a number") {
        auto r = StateFileFromJson(json{
            {"version", 2},
            {"deploymentStates",
             {{"r", {{"installationStatus", "error"}, {"errors", json::array({"a", 7})}}}}}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::StateCorruption);
    }
    SECTION("version object with a numeric format") {
        auto r = StateFileFromJson(json{{"version", {{"format", 2}}}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::StateCorruption);
    }
}

TEST_CASE("StateFileFromJson: null fields take their defaults", "[state][types]") {
    json j = {
        {"version", 2},
        {"deploymentStates",
         {{"r", {{"deployedFiles", json::array({{{"target", "/x/a.md"}, {"hash", nullptr}}})},
                 {"lastInstalled", nullptr},
                 {"errors", nullptr}}}}},
        {"metadata", {{"lastUpdated", "2024-05-01T12:00:00.000Z"}, {"lastMigration", nullptr}}},
    };
    auto decoded = StateFileFromJson(j);
    REQUIRE(decoded.IsOk());
    const auto& ds = decoded.Value().deployment_states.at("r");
    CHECK(ds.deployed_files[0].hash.empty());
    CHECK_FALSE(ds.last_installed.has_value());
    CHECK(ds.errors.empty());
    CHECK_FALSE(decoded.Value().metadata.last_migration.has_value());
}

TEST_CASE("JsonFieldReader: records the first mismatch only", "[state][types]") {
    json j = {{"a", 1}, {"b", true}, {"c", "ok"}};
    JsonFieldReader fields(j, "sample");
    CHECK(fields.String("a", "fallback") == "fallback");
    CHECK(fields.Int("b", 5) == 5);
    CHECK(fields.String("c") == "ok");
    CHECK(fields.String("missing", "dflt") == "dflt");
    REQUIRE(fields.Mismatch().has_value());
    CHECK(*fields.Mismatch() == "sample: field 'a' must be a string, got number");
}
