// EN: Unit tests for RunScheduler - timeouts, starting ready tasks, retries, condition gating and cancellation
// FR: Tests unitaires de RunScheduler - timeouts, démarrage des tâches prêtes, relances, gardes et annulation

#include <gtest/gtest.h>
#include "reconciler/run_scheduler.hpp"
#include "infrastructure/logging/logger.hpp"
#include "test_helpers.hpp"

using namespace PRR;
using namespace PRR::Reconciler;
using namespace PRR::Testing;
using namespace std::chrono_literals;

class RunSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        store_.seed(makeTask("build"));
        store_.seed(makeCondition("file-exists", {stringParam("path")}));
        run_ = makeRun("pr", "pipe");
        run_.status.start_time = fixedTime();
        now_ = fixedTime();
    }

    void TearDown() override {
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }

    std::map<std::string, Api::TaskRun> liveChildren() const {
        std::map<std::string, Api::TaskRun> children;
        for (const auto& child : store_.listTaskRuns(NS, {{Api::Labels::PIPELINE_RUN, run_.metadata.name}})) {
            children[child.metadata.name] = child;
        }
        return children;
    }

    // EN: One scheduling step the way the reconciler drives it.
    // FR: Une étape d'ordonnancement telle que le réconciliateur la pilote.
    ScheduleResult scheduleOnce(const Api::PipelineSpec& spec) {
        ResolvedPipeline pipeline = resolver_.resolve(run_, spec, liveChildren());
        PipelineGraph graph = PipelineGraph::build(spec);
        WorkspaceLinker::assignResourcePaths(pipeline);
        return scheduler_.schedule(run_, pipeline, graph, spec, now_);
    }

    static Api::PipelineSpec specOf(std::vector<Api::PipelineTask> tasks) {
        Api::PipelineSpec spec;
        spec.tasks = std::move(tasks);
        return spec;
    }

    static Api::PipelineTask guarded(const std::string& name, std::vector<std::string> run_after = {}) {
        Api::PipelineTask task = pipelineTask(name, "build", std::move(run_after));
        Api::PipelineTaskCondition check;
        check.condition_ref = "file-exists";
        check.params.push_back({"path", Api::ParamValue("README.md")});
        task.conditions.push_back(check);
        return task;
    }

    Store::InMemoryObjectStore store_;
    ReconcilerConfig config_;
    SequentialNameGenerator names_;
    BindingResolver resolver_{store_, names_};
    WorkspaceLinker linker_{store_, config_};
    RunScheduler scheduler_{store_, linker_, config_};
    Api::PipelineRun run_;
    Api::Timestamp now_;
};

TEST_F(RunSchedulerTest, TaskRunTimeoutIsTheSmallerOfTaskAndRemainingRunTime) {
    Api::PipelineTask task = pipelineTask("a", "build");
    run_.spec.timeout = Api::Duration(1h);
    Api::Timestamp later = fixedTime() + 10min;

    EXPECT_EQ(RunScheduler::computeTaskRunTimeout(run_, task, later, 60min), Api::Duration(50min));

    task.timeout = Api::Duration(5min);
    EXPECT_EQ(RunScheduler::computeTaskRunTimeout(run_, task, later, 60min), Api::Duration(5min));

    task.timeout = Api::Duration(2h);
    EXPECT_EQ(RunScheduler::computeTaskRunTimeout(run_, task, later, 60min), Api::Duration(50min));

    EXPECT_EQ(RunScheduler::computeTaskRunTimeout(run_, task, fixedTime() + 2h, 60min), Api::Duration(1s));
}

TEST_F(RunSchedulerTest, ZeroRunTimeoutLeavesTaskTimeout) {
    Api::PipelineTask task = pipelineTask("a", "build");
    run_.spec.timeout = Api::Duration(0);

    EXPECT_EQ(RunScheduler::computeTaskRunTimeout(run_, task, now_, 60min), Api::Duration(0));
    task.timeout = Api::Duration(3min);
    EXPECT_EQ(RunScheduler::computeTaskRunTimeout(run_, task, now_, 60min), Api::Duration(3min));

    EXPECT_FALSE(RunScheduler::isTimedOut(run_, now_ + 24h, 60min));
}

TEST_F(RunSchedulerTest, RunTimeoutFallsBackToDefault) {
    EXPECT_EQ(RunScheduler::effectiveRunTimeout(run_, 60min), Api::Duration(60min));
    EXPECT_FALSE(RunScheduler::isTimedOut(run_, now_ + 59min, 60min));
    EXPECT_TRUE(RunScheduler::isTimedOut(run_, now_ + 60min, 60min));

    run_.status.start_time.reset();
    EXPECT_FALSE(RunScheduler::isTimedOut(run_, now_ + 2h, 60min));
}

TEST_F(RunSchedulerTest, StartsRootsAndRecordsThem) {
    Api::PipelineSpec spec = specOf({pipelineTask("a", "build"), pipelineTask("b", "build", {"a"})});

    ScheduleResult result = scheduleOnce(spec);

    EXPECT_EQ(result.created_task_runs, (std::vector<std::string>{"pr-a-00001"}));
    EXPECT_FALSE(result.empty());
    ASSERT_EQ(run_.status.task_runs.count("pr-a-00001"), 1u);
    EXPECT_EQ(run_.status.task_runs.at("pr-a-00001").pipeline_task_name, "a");

    Api::TaskRun created = store_.getTaskRun(NS, "pr-a-00001");
    EXPECT_EQ(created.spec.task_ref->name, "build");
    EXPECT_EQ(created.spec.service_account_name, "default");
    EXPECT_EQ(created.spec.timeout, std::optional<Api::Duration>(Api::Duration(60min)));
    EXPECT_EQ(created.metadata.labels.at(Api::Labels::PIPELINE_TASK), "a");
    EXPECT_EQ(created.metadata.labels.at(Api::Labels::PIPELINE), "pr");
    EXPECT_EQ(created.metadata.owner_references[0].name, "pr");
}

TEST_F(RunSchedulerTest, NothingNewWhileTasksRun) {
    Api::PipelineSpec spec = specOf({pipelineTask("a", "build"), pipelineTask("b", "build", {"a"})});
    scheduleOnce(spec);
    startTaskRun(store_, "pr-a-00001");

    EXPECT_TRUE(scheduleOnce(spec).empty());

    finishTaskRun(store_, "pr-a-00001", true);
    EXPECT_EQ(scheduleOnce(spec).created_task_runs.size(), 1u);
    EXPECT_EQ(countActions(store_.getActions(), "create", Store::ObjectKind::TASK_RUN), 2u);
}

TEST_F(RunSchedulerTest, FailedTaskIsRetriedInPlace) {
    Api::PipelineTask flaky = pipelineTask("a", "build");
    flaky.retries = 1;
    Api::PipelineSpec spec = specOf({flaky, pipelineTask("b", "build", {"a"})});
    scheduleOnce(spec);
    finishTaskRun(store_, "pr-a-00001", false);

    ScheduleResult retried = scheduleOnce(spec);

    EXPECT_EQ(retried.retried_task_runs, (std::vector<std::string>{"pr-a-00001"}));
    EXPECT_TRUE(retried.created_task_runs.empty());
    Api::TaskRun task_run = store_.getTaskRun(NS, "pr-a-00001");
    ASSERT_EQ(task_run.status.retries_status.size(), 1u);
    EXPECT_TRUE(task_run.status.retries_status[0].condition->isFalse());
    EXPECT_EQ(task_run.status.retries_status[0].pod_name, "pr-a-00001-pod");
    EXPECT_TRUE(task_run.status.condition->isUnknown());
    EXPECT_TRUE(task_run.status.pod_name.empty());

    finishTaskRun(store_, "pr-a-00001", false);
    EXPECT_TRUE(scheduleOnce(spec).empty());
    EXPECT_EQ(countActions(store_.getActions(), "create", Store::ObjectKind::TASK_RUN), 1u);
}

TEST_F(RunSchedulerTest, FailureStopsNewTasks) {
    Api::PipelineSpec spec = specOf({pipelineTask("a", "build"), pipelineTask("slow", "build"),
                                     pipelineTask("b", "build", {"slow"})});
    scheduleOnce(spec);
    finishTaskRun(store_, "pr-a-00001", false);
    finishTaskRun(store_, "pr-slow-00002", true);

    EXPECT_TRUE(scheduleOnce(spec).empty());
}

TEST_F(RunSchedulerTest, CancelledTaskIsNeverRetried) {
    Api::PipelineTask flaky = pipelineTask("a", "build");
    flaky.retries = 3;
    Api::PipelineSpec spec = specOf({flaky});
    scheduleOnce(spec);
    store_.cancelTaskRun(NS, "pr-a-00001");
    finishTaskRun(store_, "pr-a-00001", false);

    EXPECT_TRUE(scheduleOnce(spec).empty());
}

TEST_F(RunSchedulerTest, ServiceAccountPerTask) {
    run_.spec.service_account_name = "builder";
    run_.spec.service_account_names.push_back({"b", "deployer"});
    Api::PipelineSpec spec = specOf({pipelineTask("a", "build"), pipelineTask("b", "build")});

    scheduleOnce(spec);

    EXPECT_EQ(store_.getTaskRun(NS, "pr-a-00001").spec.service_account_name, "builder");
    EXPECT_EQ(store_.getTaskRun(NS, "pr-b-00002").spec.service_account_name, "deployer");
}

TEST_F(RunSchedulerTest, ConditionCheckGatesTask) {
    Api::PipelineSpec spec = specOf({guarded("a")});

    ScheduleResult first = scheduleOnce(spec);

    const std::string check_name = "pr-a-00001-file-exists-0-00002";
    EXPECT_EQ(first.created_condition_checks, (std::vector<std::string>{check_name}));
    EXPECT_TRUE(first.created_task_runs.empty());
    EXPECT_EQ(run_.status.task_runs.at("pr-a-00001").condition_checks.at(check_name).condition_name,
              "file-exists-0");

    Api::TaskRun check = store_.getTaskRun(NS, check_name);
    EXPECT_EQ(check.metadata.labels.at(Api::Labels::CONDITION_CHECK), check_name);
    EXPECT_EQ(check.metadata.labels.at(Api::Labels::CONDITION_NAME), "file-exists");
    EXPECT_EQ(check.metadata.labels.at(Api::Labels::CONDITION_REGISTER_NAME), "file-exists-0");
    ASSERT_TRUE(check.spec.task_spec.has_value());
    EXPECT_EQ(check.spec.task_spec->steps[0].name, "condition-check-file-exists");
    EXPECT_EQ(check.spec.task_spec->steps[0].args, (std::vector<std::string>{"test", "-n", "README.md"}));

    EXPECT_TRUE(scheduleOnce(spec).empty());

    finishTaskRun(store_, check_name, true);
    EXPECT_EQ(scheduleOnce(spec).created_task_runs, (std::vector<std::string>{"pr-a-00001"}));
}

TEST_F(RunSchedulerTest, FailedCheckSkipsNodeAndDescendants) {
    Api::PipelineSpec spec = specOf({guarded("a"), pipelineTask("b", "build", {"a"}), pipelineTask("c", "build")});
    scheduleOnce(spec);
    finishTaskRun(store_, "pr-a-00001-file-exists-0-00002", false);
    finishTaskRun(store_, "pr-c-00004", true);

    ResolvedPipeline pipeline = resolver_.resolve(run_, spec, liveChildren());
    PipelineGraph graph = PipelineGraph::build(spec);
    EXPECT_TRUE(RunScheduler::hasFailedConditionCheck(*pipeline.find("a")));
    EXPECT_EQ(RunScheduler::skippedNodes(pipeline, graph), (std::set<std::string>{"a", "b"}));
    EXPECT_FALSE(RunScheduler::isFailure(*pipeline.find("a")));

    EXPECT_TRUE(scheduleOnce(spec).empty());
}

TEST_F(RunSchedulerTest, FromInputsCreateTheResourceClaimOnce) {
    store_.seed(makeTask("fetch"));
    Api::PipelineResource repo;
    repo.metadata.name = "my-repo";
    repo.metadata.namespace_name = NS;
    store_.seed(repo);

    Api::PipelineSpec spec;
    spec.resources.push_back({"repo", "git", false});
    Api::PipelineTask producer = pipelineTask("a", "fetch");
    producer.output_resources.push_back({"out", "repo"});
    Api::PipelineTask consumer = pipelineTask("b", "fetch");
    consumer.input_resources.push_back({"in", "repo", {"a"}});
    spec.tasks = {producer, consumer};
    run_.spec.resources.push_back({"repo", std::string("my-repo"), std::nullopt});

    scheduleOnce(spec);
    finishTaskRun(store_, "pr-a-00001", true);
    scheduleOnce(spec);

    EXPECT_NO_THROW(store_.getPersistentVolumeClaim(NS, "pr-pvc"));
    EXPECT_EQ(countActions(store_.getActions(), "create", Store::ObjectKind::PERSISTENT_VOLUME_CLAIM), 1u);
    Api::TaskRun consumer_run = store_.getTaskRun(NS, "pr-b-00003");
    EXPECT_EQ(consumer_run.spec.input_resources[0].paths, (std::vector<std::string>{"/pvc/a/in"}));
    EXPECT_EQ(store_.getTaskRun(NS, "pr-a-00001").spec.output_resources[0].paths,
              (std::vector<std::string>{"/pvc/a/out"}));
}

TEST_F(RunSchedulerTest, CancelInFlightSkipsFinishedAndReportsFailures) {
    Api::PipelineSpec spec = specOf({pipelineTask("a", "build"), pipelineTask("b", "build"), pipelineTask("c", "build")});
    scheduleOnce(spec);
    finishTaskRun(store_, "pr-a-00001", true);
    store_.cancelTaskRun(NS, "pr-b-00002");
    store_.clearActions();

    auto children = liveChildren();
    Api::TaskRun vanished;
    vanished.metadata.name = "pr-gone";
    vanished.metadata.namespace_name = NS;
    children["pr-gone"] = vanished;

    std::vector<std::string> failed = scheduler_.cancelInFlight(children);

    EXPECT_EQ(failed, (std::vector<std::string>{"pr-gone"}));
    EXPECT_EQ(store_.getTaskRun(NS, "pr-c-00003").spec.status, Api::TASK_RUN_SPEC_STATUS_CANCELLED);
    EXPECT_TRUE(store_.getTaskRun(NS, "pr-a-00001").spec.status.empty());
    EXPECT_EQ(countActions(store_.getActions(), "patch", Store::ObjectKind::TASK_RUN), 2u);
}
