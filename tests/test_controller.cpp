// EN: Unit tests for the Controller work queue - events, coalescing, requeue and backoff
// FR: Tests unitaires de la file de travail du Controller - événements, fusion, remise en file et backoff

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "reconciler/controller.hpp"
#include "reconciler/pipeline_run_reconciler.hpp"
#include "infrastructure/logging/logger.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace PRR;
using namespace PRR::Reconciler;
using namespace PRR::Testing;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::AtLeast;
using ::testing::Return;
using ::testing::Throw;

class MockKeyReconciler : public Reconciler::detail::IKeyReconciler {
public:
    MOCK_METHOD(ReconcileResult, reconcile, (const std::string& key), (override));
};

// EN: Records how many passes overlap for the same key.
// FR: Enregistre combien de passes se chevauchent pour une même clé.
class SlowKeyReconciler : public Reconciler::detail::IKeyReconciler {
public:
    ReconcileResult reconcile(const std::string&) override {
        int now_active = ++active_;
        int seen = max_active_.load();
        while (now_active > seen && !max_active_.compare_exchange_weak(seen, now_active)) {
        }
        std::this_thread::sleep_for(15ms);
        --active_;
        ++calls_;
        return ReconcileResult::success();
    }

    int maxActive() const { return max_active_.load(); }
    int calls() const { return calls_.load(); }

private:
    std::atomic<int> active_{0};
    std::atomic<int> max_active_{0};
    std::atomic<int> calls_{0};
};

class ControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
        config_.workers = 4;
        config_.retry_initial_delay = 10ms;
        config_.retry_max_delay = 50ms;
    }

    void TearDown() override {
        Logger::getInstance().setLogLevel(LogLevel::INFO);
    }

    std::unique_ptr<Controller> makeController(Reconciler::detail::IKeyReconciler& reconciler) {
        return std::make_unique<Controller>(store_, reconciler, config_);
    }

    static bool waitForReconciles(const Controller& controller, size_t count,
                                  std::chrono::milliseconds timeout = 5s) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (controller.getStats().reconciles >= count) {
                return true;
            }
            std::this_thread::sleep_for(5ms);
        }
        return false;
    }

    Store::InMemoryObjectStore store_;
    ReconcilerConfig config_;
};

TEST_F(ControllerTest, ReconcilesEnqueuedKey) {
    ::testing::StrictMock<MockKeyReconciler> reconciler;
    EXPECT_CALL(reconciler, reconcile("foo/pr")).WillOnce(Return(ReconcileResult::success()));
    auto controller = makeController(reconciler);

    controller->start();
    EXPECT_TRUE(controller->isRunning());
    controller->enqueue("foo/pr");

    EXPECT_TRUE(controller->waitForIdle(5s));
    ControllerStats stats = controller->getStats();
    EXPECT_EQ(stats.reconciles, 1u);
    EXPECT_EQ(stats.successes, 1u);
    EXPECT_EQ(stats.retries, 0u);
    EXPECT_EQ(stats.pending, 0u);
    controller->stop();
}

TEST_F(ControllerTest, DuplicateKeysAreCoalesced) {
    ::testing::StrictMock<MockKeyReconciler> reconciler;
    EXPECT_CALL(reconciler, reconcile("foo/pr")).Times(1).WillOnce(Return(ReconcileResult::success()));
    auto controller = makeController(reconciler);

    // EN: Queued before start, so all three land in the same ready slot
    // FR: Mises en file avant le démarrage, les trois tombent dans la même place
    controller->enqueue("foo/pr");
    controller->enqueue("foo/pr");
    controller->enqueue("foo/pr");
    controller->start();

    EXPECT_TRUE(controller->waitForIdle(5s));
    EXPECT_EQ(controller->getStats().reconciles, 1u);
}

TEST_F(ControllerTest, StoreEventsEnqueueOwningRun) {
    ::testing::NiceMock<MockKeyReconciler> reconciler;
    EXPECT_CALL(reconciler, reconcile(_)).Times(0);
    EXPECT_CALL(reconciler, reconcile("foo/pr")).Times(AtLeast(1)).WillRepeatedly(Return(ReconcileResult::success()));
    EXPECT_CALL(reconciler, reconcile("foo/pr2")).Times(AtLeast(1)).WillRepeatedly(Return(ReconcileResult::success()));
    store_.seed(makeRun("pr2", "pipe"));
    auto controller = makeController(reconciler);
    controller->start();

    Api::TaskRun owned;
    owned.metadata.name = "pr-a-00001";
    owned.metadata.namespace_name = NS;
    owned.metadata.labels[Api::Labels::PIPELINE_RUN] = "pr";
    store_.createTaskRun(owned);

    Api::TaskRun unowned;
    unowned.metadata.name = "standalone";
    unowned.metadata.namespace_name = NS;
    store_.createTaskRun(unowned);

    Api::PersistentVolumeClaim claim;
    claim.metadata.name = "pvc";
    claim.metadata.namespace_name = NS;
    store_.createPersistentVolumeClaim(claim);

    store_.updatePipelineRun(store_.getPipelineRun(NS, "pr2"));

    EXPECT_TRUE(controller->waitForIdle(5s));
    controller->stop();
}

TEST_F(ControllerTest, RetryableErrorIsRequeuedWithBackoff) {
    ::testing::StrictMock<MockKeyReconciler> reconciler;
    EXPECT_CALL(reconciler, reconcile("foo/pr"))
        .WillOnce(Return(ReconcileResult::retry("transient")))
        .WillOnce(Return(ReconcileResult::success()));
    auto controller = makeController(reconciler);
    controller->start();

    controller->enqueue("foo/pr");

    ASSERT_TRUE(waitForReconciles(*controller, 2));
    EXPECT_TRUE(controller->waitForIdle(5s));
    ControllerStats stats = controller->getStats();
    EXPECT_EQ(stats.retries, 1u);
    EXPECT_EQ(stats.successes, 1u);
    controller->stop();
}

TEST_F(ControllerTest, ThrowingReconcilerCountsAsRetry) {
    ::testing::StrictMock<MockKeyReconciler> reconciler;
    EXPECT_CALL(reconciler, reconcile("foo/pr"))
        .WillOnce(Throw(std::runtime_error("kaboom")))
        .WillOnce(Return(ReconcileResult::success()));
    auto controller = makeController(reconciler);
    controller->start();

    controller->enqueue("foo/pr");

    ASSERT_TRUE(waitForReconciles(*controller, 2));
    EXPECT_EQ(controller->getStats().retries, 1u);
    controller->stop();
}

TEST_F(ControllerTest, RequestedRequeueComesBack) {
    ::testing::StrictMock<MockKeyReconciler> reconciler;
    EXPECT_CALL(reconciler, reconcile("foo/pr"))
        .WillOnce(Return(ReconcileResult::success(20ms)))
        .WillOnce(Return(ReconcileResult::success()));
    auto controller = makeController(reconciler);
    controller->start();

    controller->enqueue("foo/pr");

    ASSERT_TRUE(waitForReconciles(*controller, 2));
    ControllerStats stats = controller->getStats();
    EXPECT_EQ(stats.requeues, 1u);
    EXPECT_EQ(stats.successes, 2u);
    controller->stop();
}

TEST_F(ControllerTest, DelayedKeyIsNotDueYet) {
    ::testing::StrictMock<MockKeyReconciler> reconciler;
    auto controller = makeController(reconciler);
    controller->start();

    controller->enqueueAfter("foo/pr", 1h);

    EXPECT_TRUE(controller->waitForIdle(1s));
    ControllerStats stats = controller->getStats();
    EXPECT_EQ(stats.reconciles, 0u);
    EXPECT_EQ(stats.pending, 1u);
    controller->stop();
}

// EN: Each pass asks for a resync; the timers must not pile up per key.
// FR: Chaque passe demande une resynchro ; les minuteries ne s'empilent pas par clé.
TEST_F(ControllerTest, RepeatedResyncKeepsOneDeadlinePerKey) {
    ::testing::StrictMock<MockKeyReconciler> reconciler;
    EXPECT_CALL(reconciler, reconcile("foo/pr")).Times(20).WillRepeatedly(Return(ReconcileResult::success(1h)));
    auto controller = makeController(reconciler);
    controller->start();

    for (int i = 0; i < 20; ++i) {
        controller->enqueue("foo/pr");
        ASSERT_TRUE(controller->waitForIdle(5s));
    }

    ControllerStats stats = controller->getStats();
    EXPECT_EQ(stats.reconciles, 20u);
    EXPECT_EQ(stats.requeues, 20u);
    EXPECT_LE(stats.pending, 1u);
    controller->stop();
}

TEST_F(ControllerTest, EarlierDeadlineReplacesLaterOne) {
    ::testing::StrictMock<MockKeyReconciler> reconciler;
    EXPECT_CALL(reconciler, reconcile("foo/pr")).WillOnce(Return(ReconcileResult::success()));
    auto controller = makeController(reconciler);
    controller->start();

    controller->enqueueAfter("foo/pr", 1h);
    controller->enqueueAfter("foo/pr", 20ms);
    controller->enqueueAfter("foo/pr", 2h);
    EXPECT_EQ(controller->getStats().pending, 1u);

    ASSERT_TRUE(waitForReconciles(*controller, 1));
    EXPECT_TRUE(controller->waitForIdle(5s));
    EXPECT_EQ(controller->getStats().pending, 0u);
    controller->stop();
}

TEST_F(ControllerTest, SameKeyIsNeverReconciledConcurrently) {
    SlowKeyReconciler reconciler;
    auto controller = makeController(reconciler);
    controller->start();

    for (int i = 0; i < 10; ++i) {
        controller->enqueue("foo/pr");
        std::this_thread::sleep_for(3ms);
    }

    EXPECT_TRUE(controller->waitForIdle(5s));
    EXPECT_EQ(reconciler.maxActive(), 1);
    EXPECT_GE(reconciler.calls(), 2);
    controller->stop();
}

TEST_F(ControllerTest, StopIsIdempotent) {
    ::testing::StrictMock<MockKeyReconciler> reconciler;
    auto controller = makeController(reconciler);
    controller->start();
    controller->stop();
    controller->stop();

    EXPECT_FALSE(controller->isRunning());

    // EN: Work queued after stop is never processed
    // FR: Le travail mis en file après l'arrêt n'est jamais traité
    controller->enqueue("foo/pr");
    EXPECT_FALSE(controller->waitForIdle(50ms));
}

// EN: The real reconciler driven by store events until the run completes.
// FR: Le vrai réconciliateur piloté par les événements du store jusqu'à la fin du run.
TEST_F(ControllerTest, DrivesPipelineRunToCompletion) {
    store_.seed(makeTask("build"));
    store_.seed(makePipeline("pipe", {pipelineTask("a", "build"), pipelineTask("b", "build", {"a"})}));
    store_.seed(makeRun("pr", "pipe"));

    PipelineRunReconciler reconciler(store_, config_, std::make_shared<SequentialNameGenerator>(),
                                     [] { return fixedTime(); });
    auto controller = makeController(reconciler);
    controller->start();
    controller->enqueue("foo/pr");
    ASSERT_TRUE(controller->waitForIdle(5s));

    for (const char* task : {"a", "b"}) {
        auto children = childrenByPipelineTask(store_, "pr");
        ASSERT_EQ(children.count(task), 1u) << "task " << task;
        finishTaskRun(store_, children.at(task).metadata.name, true);
        ASSERT_TRUE(controller->waitForIdle(5s));
    }

    Api::PipelineRun done = store_.getPipelineRun(NS, "pr");
    ASSERT_TRUE(done.isDone());
    EXPECT_TRUE(done.status.condition->isTrue());
    EXPECT_EQ(countActions(store_.getActions(), "create", Store::ObjectKind::TASK_RUN), 2u);
    controller->stop();
}
