// =============================================================================
// End-to-end tests for plan execution (src/core/executor.hpp)
// A freshly generated Vapor project is cleaned, extended and rolled back
// =============================================================================
#include <gtest/gtest.h>
#include <algorithm>
#include "core/executor.hpp"
#include "test_helpers.hpp"

using namespace scaffix;

namespace {

const char* kPackageSwift =
    "// swift-tools-version:5.9\n"
    "import PackageDescription\n"
    "\n"
    "let package = Package(\n"
    "    name: \"App\",\n"
    "    dependencies: [\n"
    "        .package(url: \"https://github.com/vapor/vapor.git\", from: \"4.89.0\"),\n"
    "        .package(url: \"https://github.com/vapor/fluent.git\", from: \"4.8.0\"),\n"
    "    ],\n"
    "    targets: [\n"
    "        .executableTarget(\n"
    "            name: \"App\",\n"
    "            dependencies: [\n"
    "                .product(name: \"Fluent\", package: \"fluent\"),\n"
    "                .product(name: \"Vapor\", package: \"vapor\"),\n"
    "            ],\n"
    "            resources: [\n"
    "                .copy(\"Public\"),\n"
    "            ]\n"
    "        ),\n"
    "    ]\n"
    ")\n";

const char* kConfigureSwift =
    "import Fluent\n"
    "import Vapor\n"
    "\n"
    "// configures your application\n"
    "public func configure(_ app: Application) async throws {\n"
    "    app.migrations.add(CreateTodo())\n"
    "\n"
    "    // register routes\n"
    "    try routes(app)\n"
    "}\n";

const char* kRoutesSwift =
    "import Vapor\n"
    "\n"
    "func routes(_ app: Application) throws {\n"
    "    app.get { req async in\n"
    "        \"It works!\"\n"
    "    }\n"
    "\n"
    "    try app.register(collection: TodoController())\n"
    "}\n";

const char* kCleanPlan =
    "[plan]\n"
    "name = clean\n"
    "\n"
    "[file Sources/App/routes.swift]\n"
    "remove = TodoController\n"
    "remove = register(collection:\n"
    "\n"
    "[file Sources/App/configure.swift]\n"
    "remove = CreateTodo\n"
    "remove = app.migrations.add\n"
    "\n"
    "[prune Sources/App/Controllers]\n"
    "name_contains = Todo\n"
    "\n"
    "[prune Sources/App/Migrations]\n"
    "name_contains = Todo\n";

const char* kRedocPlan =
    "[plan]\n"
    "name = redoc\n"
    "\n"
    "[mkdir]\n"
    "path = Resources/Views\n"
    "path = Public/redoc\n"
    "\n"
    "[create Resources/Views/redoc.leaf]\n"
    "content = <redoc spec-url=\"/openapi.yml\"></redoc>\\n\n"
    "\n"
    "[create Resources/OpenAPI/openapi.yml]\n"
    "content = openapi: 3.0.0\\n\n"
    "\n"
    "[file Sources/App/configure.swift]\n"
    "insert_after = import Vapor\n"
    "insert = import Leaf\n"
    "insert_after = public func configure\n"
    "insert = \"    app.views.use(.leaf)\"\n"
    "\n"
    "[file Sources/App/routes.swift]\n"
    "insert_after = func routes\n"
    "insert = \"    app.get(\"docs\") { req in req.view.render(\"redoc\") }\"\n"
    "\n"
    "[file Package.swift]\n"
    "list = resources: [\n"
    "entry = .copy(\"Resources/Views\"),\n"
    "\n"
    "[expect]\n"
    "dir = Resources/Views\n"
    "file = Resources/Views/redoc.leaf\n"
    "file = Resources/OpenAPI/openapi.yml\n"
    "marker = Sources/App/routes.swift | app.get(\"docs\")\n"
    "marker = Sources/App/configure.swift | app.views.use(.leaf)\n"
    "entry = Package.swift | resources: [ | .copy(\"Resources/Views\"),\n";

const char* kRollbackPlan =
    "[remove Resources/OpenAPI]\n"
    "[remove Resources/Views/redoc.leaf]\n"
    "[remove Public/redoc]\n"
    "\n"
    "[file Sources/App/routes.swift]\n"
    "remove = openapi.yml\n"
    "remove = docs\n"
    "\n"
    "[file Sources/App/configure.swift]\n"
    "remove = import Leaf\n"
    "remove = .leaf\n"
    "\n"
    "[expect]\n"
    "absent = Resources/OpenAPI\n"
    "absent = Resources/Views/redoc.leaf\n"
    "absent_marker = Sources/App/routes.swift | docs\n"
    "absent_marker = Sources/App/configure.swift | import Leaf\n"
    "absent_marker = Sources/App/configure.swift | .leaf\n";

bool has_path(const std::vector<fs::path>& paths, const fs::path& p) {
    return std::find(paths.begin(), paths.end(), p) != paths.end();
}

}  // namespace

class ExecutorTest : public scaffix_test::TempProjectTest {
protected:
    Config config_;

    void SetUp() override {
        TempProjectTest::SetUp();
        config_.root = root_;
        write("Package.swift", kPackageSwift);
        write("Sources/App/configure.swift", kConfigureSwift);
        write("Sources/App/routes.swift", kRoutesSwift);
        write("Sources/App/Controllers/TodoController.swift", "struct TodoController {}\n");
        write("Sources/App/Controllers/HealthController.swift", "struct HealthController {}\n");
        write("Sources/App/Migrations/CreateTodo.swift", "struct CreateTodo {}\n");
    }

    MigrationPlan plan(const std::string& text) {
        return MigrationPlan::from_string(text, root_, "test.plan");
    }
};

// ---------------------------------------------------------------------------
// Removing the template's sample code
// ---------------------------------------------------------------------------
TEST_F(ExecutorTest, CleanVaporProject) {
    auto result = execute_plan(plan(kCleanPlan), config_);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.changed_files.size(), 2u);
    EXPECT_EQ(result.removed_paths.size(), 2u);

    EXPECT_EQ(read("Sources/App/routes.swift"),
              "import Vapor\n"
              "\n"
              "func routes(_ app: Application) throws {\n"
              "    app.get { req async in\n"
              "        \"It works!\"\n"
              "    }\n"
              "\n"
              "}\n");
    EXPECT_EQ(read("Sources/App/configure.swift").find("CreateTodo"), std::string::npos);
    EXPECT_FALSE(exists("Sources/App/Controllers/TodoController.swift"));
    EXPECT_FALSE(exists("Sources/App/Migrations/CreateTodo.swift"));
    EXPECT_TRUE(exists("Sources/App/Controllers/HealthController.swift"));
}

TEST_F(ExecutorTest, CleanTwiceChangesNothing) {
    execute_plan(plan(kCleanPlan), config_);
    std::string routes = read("Sources/App/routes.swift");

    auto second = execute_plan(plan(kCleanPlan), config_);
    EXPECT_TRUE(second.ok());
    EXPECT_TRUE(second.changed_files.empty());
    EXPECT_TRUE(second.removed_paths.empty());
    EXPECT_EQ(read("Sources/App/routes.swift"), routes);
}

// ---------------------------------------------------------------------------
// Adding ReDoc, twice, then validating
// ---------------------------------------------------------------------------
TEST_F(ExecutorTest, SetupIsIdempotent) {
    MigrationPlan redoc = plan(kRedocPlan);

    auto first = execute_plan(redoc, config_);
    EXPECT_TRUE(first.ok());
    EXPECT_EQ(first.changed_files.size(), 3u);
    EXPECT_TRUE(has_path(first.created_paths, root_ / "Resources/Views/redoc.leaf"));

    std::string configure = read("Sources/App/configure.swift");
    std::string routes = read("Sources/App/routes.swift");
    std::string package = read("Package.swift");

    auto second = execute_plan(redoc, config_);
    EXPECT_TRUE(second.ok());
    EXPECT_TRUE(second.changed_files.empty());
    EXPECT_TRUE(second.created_paths.empty());

    EXPECT_EQ(read("Sources/App/configure.swift"), configure);
    EXPECT_EQ(read("Sources/App/routes.swift"), routes);
    EXPECT_EQ(read("Package.swift"), package);

    EXPECT_TRUE(validate_plan(redoc, config_).empty());
}

TEST_F(ExecutorTest, SetupEditsInPlace) {
    execute_plan(plan(kRedocPlan), config_);

    EXPECT_EQ(read("Sources/App/configure.swift"),
              "import Fluent\n"
              "import Vapor\n"
              "import Leaf\n"
              "\n"
              "// configures your application\n"
              "public func configure(_ app: Application) async throws {\n"
              "    app.views.use(.leaf)\n"
              "    app.migrations.add(CreateTodo())\n"
              "\n"
              "    // register routes\n"
              "    try routes(app)\n"
              "}\n");
    EXPECT_NE(read("Package.swift").find("                .copy(\"Resources/Views\"),\n"
                                         "                .copy(\"Public\"),\n"),
              std::string::npos);
    EXPECT_EQ(read("Resources/Views/redoc.leaf"), "<redoc spec-url=\"/openapi.yml\"></redoc>\n");
}

TEST_F(ExecutorTest, ValidationNamesTheDeletedFile) {
    MigrationPlan redoc = plan(kRedocPlan);
    execute_plan(redoc, config_);
    fs::remove(root_ / "Resources/OpenAPI/openapi.yml");

    auto found = validate_plan(redoc, config_);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].path, root_ / "Resources/OpenAPI/openapi.yml");
}

TEST_F(ExecutorTest, RollbackThenValidate) {
    execute_plan(plan(kRedocPlan), config_);

    MigrationPlan rollback = plan(kRollbackPlan);
    EXPECT_FALSE(validate_plan(rollback, config_).empty());

    auto result = execute_plan(rollback, config_);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.removed_paths.size(), 3u);
    EXPECT_TRUE(validate_plan(rollback, config_).empty());

    // Already rolled back
    auto again = execute_plan(rollback, config_);
    EXPECT_TRUE(again.ok());
    EXPECT_TRUE(again.removed_paths.empty());
    EXPECT_TRUE(again.changed_files.empty());
}

// ---------------------------------------------------------------------------
// Fixing a resource folder copied into itself
// ---------------------------------------------------------------------------
TEST_F(ExecutorTest, FixNestedResources) {
    write("Sources/App/Resources/Views/index.leaf", "index");
    write("Sources/App/Resources/Sources/App/Resources/Views/redoc.leaf", "redoc");
    write("Package.swift",
          "            resources: [\n"
          "                .process(\"Sources/App/Resources/Sources/App/Resources/Views\"),\n"
          "            ]\n");

    auto result = execute_plan(plan("[merge]\n"
                                    "source = Sources/App/Resources/Sources/App/Resources\n"
                                    "destination = Sources/App/Resources\n"
                                    "[file Package.swift]\n"
                                    "drop_entry = Resources/Sources/App\n"
                                    "list = resources: [\n"
                                    "entry = .process(\"Resources/Views\"),\n"
                                    "indent = \"                \"\n"),
                               config_);
    EXPECT_TRUE(result.ok());
    ASSERT_EQ(result.merges.size(), 1u);
    EXPECT_EQ(result.merges[0].status, MergeStatus::Merged);
    EXPECT_EQ(read("Sources/App/Resources/Views/redoc.leaf"), "redoc");
    EXPECT_FALSE(exists("Sources/App/Resources/Sources"));
    EXPECT_EQ(read("Package.swift"),
              "            resources: [\n"
              "                .process(\"Resources/Views\"),\n"
              "            ]\n");
}

TEST_F(ExecutorTest, MergeConflictFailsResult) {
    write("old/a.txt", "old");
    write("new/a.txt", "new");
    auto result = execute_plan(plan("[merge]\nsource = old\ndestination = new\n"), config_);
    EXPECT_FALSE(result.ok());
    ASSERT_EQ(result.merges.size(), 1u);
    EXPECT_EQ(result.merges[0].status, MergeStatus::Partial);
    EXPECT_EQ(read("new/a.txt"), "new");
}

// ---------------------------------------------------------------------------
// One file is one transaction
// ---------------------------------------------------------------------------
TEST_F(ExecutorTest, FailedStepLeavesFileUntouched) {
    auto result = execute_plan(plan("[file Package.swift]\n"
                                    "remove = fluent\n"
                                    "list = exclude: [\n"
                                    "entry = \"Tests\",\n"
                                    "[file Sources/App/routes.swift]\n"
                                    "remove = TodoController\n"),
                               config_);
    EXPECT_FALSE(result.ok());
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].kind, ErrorKind::BlockNotFound);
    EXPECT_EQ(result.failures[0].path, root_ / "Package.swift");

    EXPECT_EQ(read("Package.swift"), kPackageSwift);
    EXPECT_EQ(read("Sources/App/routes.swift").find("TodoController"), std::string::npos);
}

TEST_F(ExecutorTest, MissingFileIsWarningUnlessCreated) {
    auto result = execute_plan(plan("[file Sources/App/Absent.swift]\n"
                                    "remove = x\n"
                                    "[file Sources/App/New.swift]\n"
                                    "create_missing = true\n"
                                    "insert = import Vapor\n"),
                               config_);
    EXPECT_TRUE(result.ok());
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].kind, ErrorKind::NotFound);
    EXPECT_FALSE(exists("Sources/App/Absent.swift"));
    EXPECT_EQ(read("Sources/App/New.swift"), "import Vapor\n");
    EXPECT_TRUE(has_path(result.created_paths, root_ / "Sources/App/New.swift"));
}

TEST_F(ExecutorTest, ReplaceRewritesOutdatedFile) {
    write("Resources/OpenAPI/openapi.yml", "openapi: 2.0\n");
    MigrationPlan p = plan("[create Resources/OpenAPI/openapi.yml]\n"
                           "content = openapi: 3.0.0\\n\n");
    execute_plan(p, config_);
    EXPECT_EQ(read("Resources/OpenAPI/openapi.yml"), "openapi: 2.0\n");

    p.creates[0].replace = true;
    auto result = execute_plan(p, config_);
    EXPECT_EQ(read("Resources/OpenAPI/openapi.yml"), "openapi: 3.0.0\n");
    EXPECT_EQ(result.changed_files.size(), 1u);
}

TEST_F(ExecutorTest, DryRunWritesNothing) {
    config_.dry_run = true;
    auto result = execute_plan(plan(kRedocPlan), config_);
    EXPECT_TRUE(result.ok());
    EXPECT_FALSE(result.created_paths.empty());
    EXPECT_EQ(result.changed_files.size(), 3u);

    EXPECT_FALSE(exists("Resources"));
    EXPECT_EQ(read("Sources/App/configure.swift"), kConfigureSwift);
    EXPECT_EQ(read("Package.swift"), kPackageSwift);
}

// ---------------------------------------------------------------------------
// apply_steps
// ---------------------------------------------------------------------------
TEST(ApplyStepsTest, InsertWithoutMarkerAppends) {
    PatchStep step;
    step.kind = StepKind::Insert;
    step.content = "tail";

    Config config;
    auto out = apply_steps(TextDocument::from_string("head\n"), {step}, config);
    ASSERT_TRUE(out);
    std::vector<std::string> expected = {"head", "tail"};
    EXPECT_EQ(out.value().lines, expected);
}

TEST(ApplyStepsTest, EnsureFallsBackToConfiguredIndent) {
    PatchStep step;
    step.kind = StepKind::EnsureEntries;
    step.opener = "deps: [";
    step.entries = {"a,"};

    Config config;
    config.default_indent = "\t";
    auto out = apply_steps(TextDocument::from_string("deps: [\n]\n"), {step}, config);
    ASSERT_TRUE(out);
    EXPECT_EQ(out.value().lines[1], "\ta,");
}

// ---------------------------------------------------------------------------
// Plans shipped in plans/
// ---------------------------------------------------------------------------
class ShippedPlanTest : public ExecutorTest {
protected:
    MigrationPlan shipped(const std::string& name) {
        return MigrationPlan::from_file(fs::path(SCAFFIX_PLANS_DIR) / name);
    }
};

TEST_F(ShippedPlanTest, AllParse) {
    for (const auto& entry : fs::directory_iterator(SCAFFIX_PLANS_DIR)) {
        if (entry.path().extension() == ".plan") {
            EXPECT_NO_THROW(MigrationPlan::from_file(entry.path())) << entry.path();
        }
    }
}

TEST_F(ShippedPlanTest, CleanThenSetupThenRollback) {
    MigrationPlan clean = shipped("clean_vapor.plan");
    EXPECT_TRUE(execute_plan(clean, config_).ok());
    EXPECT_TRUE(validate_plan(clean, config_).empty());

    std::string configure = read("Sources/App/configure.swift");
    std::string routes = read("Sources/App/routes.swift");

    MigrationPlan setup = shipped("redoc_setup.plan");
    EXPECT_TRUE(execute_plan(setup, config_).ok());
    EXPECT_TRUE(validate_plan(setup, config_).empty());
    EXPECT_NE(read("Resources/Views/redoc.leaf").find("redoc.standalone.js"), std::string::npos);
    EXPECT_NE(read("Sources/App/configure.swift").find("import Leaf"), std::string::npos);

    MigrationPlan rollback = shipped("redoc_rollback.plan");
    EXPECT_TRUE(execute_plan(rollback, config_).ok());
    EXPECT_TRUE(validate_plan(rollback, config_).empty());
    EXPECT_EQ(read("Sources/App/configure.swift"), configure);
    EXPECT_EQ(read("Sources/App/routes.swift"), routes);
}

TEST_F(ShippedPlanTest, SetupRefreshesOutdatedOpenApiDocument) {
    write("Resources/OpenAPI/openapi.yml", "openapi: 2.0\n");
    EXPECT_TRUE(execute_plan(shipped("redoc_setup.plan"), config_).ok());
    EXPECT_EQ(read("Resources/OpenAPI/openapi.yml"),
              read(fs::path(SCAFFIX_PLANS_DIR) / "templates/openapi.yml"));
}

TEST_F(ShippedPlanTest, FixNestedResources) {
    write("Sources/App/Resources/Sources/App/Resources/Views/redoc.leaf", "redoc");
    write("Package.swift",
          "        .executableTarget(\n"
          "            name: \"App\",\n"
          "            exclude: [],\n"
          "            resources: [\n"
          "                .process(\"Sources/App/Sources/App/Resources/Views\"),\n"
          "            ]\n"
          "        ),\n");

    MigrationPlan fix = shipped("fix_nested_resources.plan");
    auto result = execute_plan(fix, config_);
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(validate_plan(fix, config_).empty());
    EXPECT_EQ(read("Sources/App/Resources/Views/redoc.leaf"), "redoc");

    std::string package = read("Package.swift");
    auto second = execute_plan(fix, config_);
    EXPECT_TRUE(second.ok());
    EXPECT_TRUE(second.changed_files.empty());
    EXPECT_EQ(read("Package.swift"), package);
}
