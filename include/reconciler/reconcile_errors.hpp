// EN: Reconciler error types and the reason codes written into the Succeeded condition
// FR: Types d'erreur du réconciliateur et codes de raison écrits dans la condition Succeeded

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace PRR::Reconciler {

namespace Reasons {
    // EN: Overall outcomes
    // FR: Résultats globaux
    inline constexpr const char* STARTED = "Started";
    inline constexpr const char* RUNNING = "Running";
    inline constexpr const char* SUCCEEDED = "Succeeded";
    inline constexpr const char* FAILED = "Failed";
    inline constexpr const char* CANCELLED = "Cancelled";
    inline constexpr const char* TIMED_OUT = "TimedOut";
    inline constexpr const char* COULDNT_CANCEL = "CouldntCancel";

    // EN: Definition lookups
    // FR: Recherches de définitions
    inline constexpr const char* COULDNT_GET_PIPELINE = "CouldntGetPipeline";
    inline constexpr const char* COULDNT_GET_TASK = "CouldntGetTask";
    inline constexpr const char* COULDNT_GET_CONDITION = "CouldntGetCondition";
    inline constexpr const char* COULDNT_GET_RESOURCE = "CouldntGetResource";

    // EN: Validation
    // FR: Validation
    inline constexpr const char* FAILED_VALIDATION = "FailedValidation";
    inline constexpr const char* INVALID_BINDINGS = "InvalidBindings";
    inline constexpr const char* INVALID_WORKSPACE_BINDINGS = "InvalidWorkspaceBindings";
    inline constexpr const char* PARAMETER_TYPE_MISMATCH = "ParameterTypeMismatch";
    inline constexpr const char* INVALID_GRAPH = "InvalidGraph";
    inline constexpr const char* INVALID_TASK_RESULT_REFERENCE = "InvalidTaskResultReference";

    inline constexpr const char* CONDITION_CHECK_FAILED = "ConditionCheckFailed";
}

// EN: Base reconciler error. Thrown on its own it means "retry the pass later".
// FR: Erreur de base du réconciliateur. Levée seule, elle signifie "réessayer la passe plus tard".
class ReconcileError : public std::runtime_error {
public:
    explicit ReconcileError(const std::string& message) : std::runtime_error(message) {}
};

// EN: Permanent failure of the run; the reason goes into the Succeeded condition.
// FR: Échec permanent du run ; la raison va dans la condition Succeeded.
class TerminalReconcileError : public ReconcileError {
public:
    TerminalReconcileError(const std::string& reason, const std::string& message)
        : ReconcileError(message), reason_(reason) {}

    const std::string& getReason() const { return reason_; }

private:
    std::string reason_;
};

class GraphCycleError : public TerminalReconcileError {
public:
    GraphCycleError(const std::string& message, std::vector<std::string> cycle)
        : TerminalReconcileError(Reasons::INVALID_GRAPH, message), cycle_(std::move(cycle)) {}

    // EN: Node names along the cycle, first node repeated at the end.
    // FR: Noms des nœuds le long du cycle, premier nœud répété à la fin.
    const std::vector<std::string>& getCycle() const { return cycle_; }

private:
    std::vector<std::string> cycle_;
};

} // namespace PRR::Reconciler
