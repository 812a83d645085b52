// EN: Variable substitution for $(params.*) and $(tasks.*.results.*) expressions
// FR: Substitution de variables pour les expressions $(params.*) et $(tasks.*.results.*)

#pragma once

#include "api/pipeline_types.hpp"

#include <map>
#include <string>
#include <vector>

namespace PRR::Reconciler {

// EN: A "$(tasks.<task>.results.<result>)" reference found in a string.
// FR: Une référence "$(tasks.<tâche>.results.<résultat>)" trouvée dans une chaîne.
struct ResultReference {
    std::string task;
    std::string result;

    // EN: Key in a replacement map, without the "$(" and ")".
    // FR: Clé dans une table de remplacement, sans "$(" ni ")".
    std::string key() const { return "tasks." + task + ".results." + result; }

    bool operator<(const ResultReference& other) const {
        return task != other.task ? task < other.task : result < other.result;
    }
    bool operator==(const ResultReference& other) const {
        return task == other.task && result == other.result;
    }
};

// EN: String and array replacements keyed by expression body ("params.revision").
// FR: Remplacements chaîne et tableau indexés par le corps de l'expression ("params.revision").
struct Replacements {
    std::map<std::string, std::string> strings;
    std::map<std::string, std::vector<std::string>> arrays;
};

namespace Substitution {

    // EN: Replace known "$(key)" expressions, innermost first, so that
    // EN: "$(inputs.workspace.$(params.rev))" becomes "$(inputs.workspace.revision)".
    // FR: Remplace les expressions "$(clé)" connues, la plus interne d'abord, pour que
    // FR: "$(inputs.workspace.$(params.rev))" devienne "$(inputs.workspace.revision)".
    std::string applyStringReplacements(const std::string& input,
                                        const std::map<std::string, std::string>& replacements);

    // EN: An element that is exactly "$(key)" of an array replacement expands in place.
    // FR: Un élément valant exactement "$(clé)" d'un remplacement tableau s'étend sur place.
    std::vector<std::string> applyArrayReplacements(const std::vector<std::string>& input,
                                                    const Replacements& replacements);

    Api::ParamValue applyToValue(const Api::ParamValue& value, const Replacements& replacements);
    std::vector<Api::Param> applyToParams(const std::vector<Api::Param>& params, const Replacements& replacements);
    Api::Step applyToStep(const Api::Step& step, const Replacements& replacements);

    // EN: "params.<name>" replacements from declarations (defaults) overridden by provided values.
    // FR: Remplacements "params.<nom>" depuis les déclarations (défauts) surchargées par les valeurs fournies.
    Replacements paramReplacements(const std::vector<Api::ParamSpec>& declared,
                                   const std::vector<Api::Param>& provided);

    std::vector<ResultReference> extractResultReferences(const std::string& input);
    std::vector<ResultReference> extractResultReferences(const Api::ParamValue& value);

    bool containsExpression(const std::string& input, const std::string& prefix);

} // namespace Substitution

} // namespace PRR::Reconciler
