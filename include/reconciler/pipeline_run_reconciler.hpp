// EN: PipelineRun reconciler - one idempotent pass that drives a run towards a terminal state
// FR: Réconciliateur PipelineRun - une passe idempotente qui mène un run vers un état terminal

#pragma once

#include "api/pipeline_types.hpp"
#include "reconciler/binding_resolver.hpp"
#include "reconciler/name_generator.hpp"
#include "reconciler/reconciler_config.hpp"
#include "reconciler/run_scheduler.hpp"
#include "reconciler/status_aggregator.hpp"
#include "reconciler/workspace_linker.hpp"
#include "store/object_store.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace PRR::Reconciler {

// EN: Outcome of one pass. Errors never escape reconcile(); they become RETRYABLE_ERROR.
// FR: Résultat d'une passe. Les erreurs ne sortent jamais de reconcile() ; elles deviennent RETRYABLE_ERROR.
struct ReconcileResult {
    enum class Outcome {
        SUCCESS,
        RETRYABLE_ERROR
    };

    Outcome outcome = Outcome::SUCCESS;
    std::string message;
    std::optional<std::chrono::milliseconds> requeue_after;

    static ReconcileResult success(std::optional<std::chrono::milliseconds> requeue_after = std::nullopt) {
        ReconcileResult result;
        result.requeue_after = requeue_after;
        return result;
    }

    static ReconcileResult retry(const std::string& message) {
        ReconcileResult result;
        result.outcome = Outcome::RETRYABLE_ERROR;
        result.message = message;
        return result;
    }

    bool isSuccess() const { return outcome == Outcome::SUCCESS; }
};

namespace detail {

// EN: Anything that reconciles "namespace/name" keys; the controller drives it.
// FR: Tout ce qui réconcilie des clés "namespace/nom" ; le contrôleur le pilote.
class IKeyReconciler {
public:
    virtual ~IKeyReconciler() = default;
    virtual ReconcileResult reconcile(const std::string& key) = 0;
};

} // namespace detail

class PipelineRunReconciler : public detail::IKeyReconciler {
public:
    using Clock = std::function<Api::Timestamp()>;

    PipelineRunReconciler(Store::IObjectStore& store, ReconcilerConfig config,
                          std::shared_ptr<detail::INameGenerator> names = std::make_shared<RandomNameGenerator>(),
                          Clock clock = [] { return std::chrono::system_clock::now(); });

    // EN: Reconcile the PipelineRun named by "namespace/name". A malformed key or a run that no
    // EN: longer exists is a success without requeue.
    // FR: Réconcilie le PipelineRun désigné par "namespace/nom". Une clé mal formée ou un run qui
    // FR: n'existe plus est un succès sans remise en file.
    ReconcileResult reconcile(const std::string& key) override;

    const ReconcilerConfig& getConfig() const { return config_; }

private:
    ReconcileResult reconcileKey(const std::string& key);

    // EN: Mutates `run` in memory; the caller performs the single write.
    // FR: Modifie `run` en mémoire ; l'appelant effectue l'unique écriture.
    void reconcileRun(Api::PipelineRun& run, Api::Timestamp now);

    Api::PipelineSpec resolvePipelineSpec(Api::PipelineRun& run) const;
    std::map<std::string, Api::TaskRun> listChildren(const Api::PipelineRun& run) const;

    void cancelRun(Api::PipelineRun& run, const std::map<std::string, Api::TaskRun>& children, Api::Timestamp now);
    void timeoutRun(Api::PipelineRun& run, const std::map<std::string, Api::TaskRun>& children, Api::Timestamp now);

    // EN: Write the run if it differs from what was read. Returns an error message on failure.
    // FR: Écrit le run s'il diffère de ce qui a été lu. Retourne un message d'erreur en cas d'échec.
    std::optional<std::string> persist(const Api::PipelineRun& run, const nlohmann::json& original);

    Store::IObjectStore& store_;
    ReconcilerConfig config_;
    std::shared_ptr<detail::INameGenerator> names_;
    Clock clock_;

    BindingResolver resolver_;
    WorkspaceLinker linker_;
    RunScheduler scheduler_;
    StatusAggregator aggregator_;
};

} // namespace PRR::Reconciler
