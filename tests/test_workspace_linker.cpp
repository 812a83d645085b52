// EN: Unit tests for WorkspaceLinker - claim naming, claim creation, resource paths and task workspaces
// FR: Tests unitaires de WorkspaceLinker - nommage des claims, création, chemins de ressources et workspaces

#include <gtest/gtest.h>
#include "reconciler/workspace_linker.hpp"
#include "infrastructure/logging/logger.hpp"
#include "test_helpers.hpp"

using namespace PRR;
using namespace PRR::Reconciler;
using namespace PRR::Testing;

class WorkspaceLinkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        linker_ = std::make_unique<WorkspaceLinker>(store_, config_);
    }

    void TearDown() override {
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }

    static Api::WorkspaceBinding templateBinding(const std::string& name, const std::string& template_name = "") {
        Api::PersistentVolumeClaim claim;
        claim.metadata.name = template_name;
        claim.metadata.resource_version = 42;
        claim.spec.access_modes = {"ReadWriteMany"};
        claim.spec.storage = "1Gi";

        Api::WorkspaceBinding binding;
        binding.name = name;
        binding.volume_claim_template = claim;
        return binding;
    }

    Store::InMemoryObjectStore store_;
    ReconcilerConfig config_;
    std::unique_ptr<WorkspaceLinker> linker_;
};

TEST_F(WorkspaceLinkerTest, ClaimNames) {
    EXPECT_EQ(WorkspaceLinker::resourceClaimName("pr"), "pr-pvc");
    EXPECT_EQ(WorkspaceLinker::templateClaimName(templateBinding("source"), "pr"), "pvc-source-pr");
    EXPECT_EQ(WorkspaceLinker::templateClaimName(templateBinding("source", "scratch"), "pr"), "scratch-source-pr");
}

TEST_F(WorkspaceLinkerTest, JoinSubPaths) {
    EXPECT_EQ(WorkspaceLinker::joinSubPaths("", ""), "");
    EXPECT_EQ(WorkspaceLinker::joinSubPaths("run", ""), "run");
    EXPECT_EQ(WorkspaceLinker::joinSubPaths("", "task"), "task");
    EXPECT_EQ(WorkspaceLinker::joinSubPaths("run", "task"), "run/task");
}

TEST_F(WorkspaceLinkerTest, ResourceClaimIsNeededOnlyForFromInputs) {
    Api::PipelineSpec spec;
    Api::PipelineTask consumer = pipelineTask("deploy", "deploy");
    consumer.input_resources.push_back({"image", "img", {}});
    spec.tasks = {pipelineTask("build", "build"), consumer};
    EXPECT_FALSE(WorkspaceLinker::needsResourceClaim(spec));

    spec.tasks[1].input_resources[0].from = {"build"};
    EXPECT_TRUE(WorkspaceLinker::needsResourceClaim(spec));
}

TEST_F(WorkspaceLinkerTest, ConditionFromInputNeedsResourceClaim) {
    Api::PipelineSpec spec;
    Api::PipelineTask guarded = pipelineTask("deploy", "deploy");
    Api::PipelineTaskCondition gate;
    gate.condition_ref = "image-signed";
    gate.resources.push_back({"image", "img", {"build"}});
    guarded.conditions.push_back(gate);
    spec.tasks = {pipelineTask("build", "build"), guarded};

    EXPECT_TRUE(WorkspaceLinker::needsResourceClaim(spec));
}

TEST_F(WorkspaceLinkerTest, ResourceClaimIsCreatedOnce) {
    Api::PipelineRun run = makeRun("pr", "pipe");

    EXPECT_TRUE(linker_->ensureResourceClaim(run));
    EXPECT_FALSE(linker_->ensureResourceClaim(run));

    Api::PersistentVolumeClaim claim = store_.getPersistentVolumeClaim(NS, "pr-pvc");
    EXPECT_EQ(claim.spec.access_modes, (std::vector<std::string>{"ReadWriteOnce"}));
    EXPECT_EQ(claim.spec.storage, "5Gi");
    ASSERT_EQ(claim.metadata.owner_references.size(), 1u);
    EXPECT_EQ(claim.metadata.owner_references[0].kind, "PipelineRun");
    EXPECT_EQ(claim.metadata.owner_references[0].name, "pr");
    EXPECT_TRUE(claim.metadata.owner_references[0].controller);
    EXPECT_EQ(countActions(store_.getActions(), "create", Store::ObjectKind::PERSISTENT_VOLUME_CLAIM), 1u);
}

TEST_F(WorkspaceLinkerTest, ResourceClaimFollowsConfiguredSize) {
    config_.pvc_storage_size = "20Gi";
    config_.pvc_access_mode = "ReadWriteMany";

    linker_->ensureResourceClaim(makeRun("pr", "pipe"));

    Api::PersistentVolumeClaim claim = store_.getPersistentVolumeClaim(NS, "pr-pvc");
    EXPECT_EQ(claim.spec.storage, "20Gi");
    EXPECT_EQ(claim.spec.access_modes[0], "ReadWriteMany");
}

TEST_F(WorkspaceLinkerTest, TemplateClaimsAreCreatedPerBinding) {
    Api::PipelineRun run = makeRun("pr", "pipe");
    run.spec.workspaces.push_back(templateBinding("source"));
    run.spec.workspaces.push_back(templateBinding("cache", "scratch"));
    Api::WorkspaceBinding shared;
    shared.name = "shared";
    shared.persistent_volume_claim = "existing";
    run.spec.workspaces.push_back(shared);

    Api::PipelineSpec spec;
    Api::PipelineTask build = pipelineTask("build", "build");
    build.workspaces.push_back({"src", "source", ""});
    build.workspaces.push_back({"shared", "shared", ""});
    Api::PipelineTask test = pipelineTask("test", "build");
    test.workspaces.push_back({"cache", "cache", ""});
    spec.tasks = {build, test};

    EXPECT_EQ(linker_->ensureWorkspaceClaims(run, spec), 2u);
    EXPECT_EQ(linker_->ensureWorkspaceClaims(run, spec), 0u);

    Api::PersistentVolumeClaim claim = store_.getPersistentVolumeClaim(NS, "pvc-source-pr");
    EXPECT_EQ(claim.spec.storage, "1Gi");
    EXPECT_EQ(claim.metadata.owner_references[0].name, "pr");
    EXPECT_NO_THROW(store_.getPersistentVolumeClaim(NS, "scratch-cache-pr"));
    EXPECT_THROW(store_.getPersistentVolumeClaim(NS, "existing"), Store::NotFoundError);
}

TEST_F(WorkspaceLinkerTest, TemplateForUnusedWorkspaceIsNotProvisioned) {
    Api::PipelineRun run = makeRun("pr", "pipe");
    run.spec.workspaces.push_back(templateBinding("source"));
    run.spec.workspaces.push_back(templateBinding("unused"));

    Api::PipelineSpec spec;
    Api::PipelineTask build = pipelineTask("build", "build");
    build.workspaces.push_back({"src", "source", ""});
    spec.tasks = {build};

    EXPECT_TRUE(WorkspaceLinker::isWorkspaceUsed(spec, "source"));
    EXPECT_FALSE(WorkspaceLinker::isWorkspaceUsed(spec, "unused"));
    EXPECT_EQ(linker_->ensureWorkspaceClaims(run, spec), 1u);
    EXPECT_NO_THROW(store_.getPersistentVolumeClaim(NS, "pvc-source-pr"));
    EXPECT_THROW(store_.getPersistentVolumeClaim(NS, "pvc-unused-pr"), Store::NotFoundError);
}

TEST_F(WorkspaceLinkerTest, TaskWorkspacesResolveToClaims) {
    Api::PipelineRun run = makeRun("pr", "pipe");
    Api::WorkspaceBinding source = templateBinding("source");
    source.sub_path = "run";
    run.spec.workspaces.push_back(source);
    Api::WorkspaceBinding scratch;
    scratch.name = "scratch";
    scratch.empty_dir = true;
    run.spec.workspaces.push_back(scratch);

    Api::PipelineTask task = pipelineTask("build", "build");
    task.workspaces.push_back({"src", "source", "task"});
    task.workspaces.push_back({"tmp", "scratch", ""});
    task.workspaces.push_back({"cache", "unbound", ""});

    auto bindings = linker_->workspacesFor(run, task);

    ASSERT_EQ(bindings.size(), 2u);
    EXPECT_EQ(bindings[0].name, "src");
    EXPECT_EQ(bindings[0].persistent_volume_claim, std::optional<std::string>("pvc-source-pr"));
    EXPECT_FALSE(bindings[0].volume_claim_template.has_value());
    EXPECT_EQ(bindings[0].sub_path, "run/task");
    EXPECT_EQ(bindings[1].name, "tmp");
    EXPECT_TRUE(bindings[1].empty_dir);
    EXPECT_FALSE(bindings[1].persistent_volume_claim.has_value());
}

TEST_F(WorkspaceLinkerTest, ResourcePathsFollowFromTasks) {
    ResolvedPipeline pipeline;

    ResolvedNode build;
    build.task = pipelineTask("build", "build");
    build.output_resources.push_back({"image", std::string("img"), std::nullopt, {}});
    pipeline.nodes.push_back(build);

    ResolvedNode deploy;
    deploy.task = pipelineTask("deploy", "deploy");
    deploy.task.input_resources.push_back({"image", "img", {"build"}});
    deploy.task.input_resources.push_back({"config", "cfg", {}});
    deploy.input_resources.push_back({"image", std::string("img"), std::nullopt, {}});
    deploy.input_resources.push_back({"config", std::string("cfg"), std::nullopt, {}});
    pipeline.nodes.push_back(deploy);

    WorkspaceLinker::assignResourcePaths(pipeline);

    EXPECT_EQ(pipeline.nodes[0].output_resources[0].paths, (std::vector<std::string>{"/pvc/build/image"}));
    EXPECT_EQ(pipeline.nodes[1].input_resources[0].paths, (std::vector<std::string>{"/pvc/build/image"}));
    EXPECT_TRUE(pipeline.nodes[1].input_resources[1].paths.empty());
}

TEST_F(WorkspaceLinkerTest, ConditionCheckInputsGetFromPaths) {
    ResolvedPipeline pipeline;

    ResolvedNode build;
    build.task = pipelineTask("build", "build");
    build.output_resources.push_back({"image", std::string("img"), std::nullopt, {}});
    pipeline.nodes.push_back(build);

    ResolvedNode deploy;
    deploy.task = pipelineTask("deploy", "deploy");
    Api::PipelineTaskCondition plain;
    plain.condition_ref = "always";
    Api::PipelineTaskCondition gate;
    gate.condition_ref = "image-signed";
    gate.resources.push_back({"image", "img", {"build"}});
    deploy.task.conditions = {plain, gate};

    ConditionCheckPlan plain_plan;
    plain_plan.register_name = "always-0";
    ConditionCheckPlan gate_plan;
    gate_plan.register_name = "image-signed-1";
    gate_plan.resources.push_back({"image", std::string("img"), std::nullopt, {}});
    deploy.condition_checks = {plain_plan, gate_plan};
    pipeline.nodes.push_back(deploy);

    WorkspaceLinker::assignResourcePaths(pipeline);

    const auto& checks = pipeline.nodes[1].condition_checks;
    EXPECT_TRUE(checks[0].resources.empty());
    ASSERT_EQ(checks[1].resources.size(), 1u);
    EXPECT_EQ(checks[1].resources[0].paths, (std::vector<std::string>{"/pvc/build/image"}));
}
