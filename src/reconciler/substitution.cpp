// EN: Variable substitution implementation
// FR: Implémentation de la substitution de variables

#include "reconciler/substitution.hpp"

#include <algorithm>
#include <regex>
#include <set>

namespace PRR::Reconciler {

namespace Substitution {

std::string applyStringReplacements(const std::string& input,
                                    const std::map<std::string, std::string>& replacements) {
    if (replacements.empty() || input.find("$(") == std::string::npos) {
        return input;
    }

    std::string result = input;
    size_t search_from = result.size();
    while (search_from > 0) {
        size_t open = result.rfind("$(", search_from - 1);
        if (open == std::string::npos) {
            break;
        }
        size_t close = result.find(')', open + 2);
        if (close != std::string::npos) {
            std::string key = result.substr(open + 2, close - open - 2);
            auto it = replacements.find(key);
            if (it != replacements.end()) {
                result.replace(open, close - open + 1, it->second);
            }
        }
        if (open == 0) {
            break;
        }
        search_from = open;
    }
    return result;
}

std::vector<std::string> applyArrayReplacements(const std::vector<std::string>& input,
                                                const Replacements& replacements) {
    std::vector<std::string> result;
    result.reserve(input.size());
    for (const auto& element : input) {
        if (element.size() > 3 && element.compare(0, 2, "$(") == 0 && element.back() == ')') {
            auto it = replacements.arrays.find(element.substr(2, element.size() - 3));
            if (it != replacements.arrays.end()) {
                result.insert(result.end(), it->second.begin(), it->second.end());
                continue;
            }
        }
        result.push_back(applyStringReplacements(element, replacements.strings));
    }
    return result;
}

Api::ParamValue applyToValue(const Api::ParamValue& value, const Replacements& replacements) {
    if (value.type == Api::ParamType::ARRAY) {
        return Api::ParamValue(applyArrayReplacements(value.array_val, replacements));
    }
    return Api::ParamValue(applyStringReplacements(value.string_val, replacements.strings));
}

std::vector<Api::Param> applyToParams(const std::vector<Api::Param>& params, const Replacements& replacements) {
    std::vector<Api::Param> result;
    result.reserve(params.size());
    for (const auto& param : params) {
        result.push_back(Api::Param{param.name, applyToValue(param.value, replacements)});
    }
    return result;
}

Api::Step applyToStep(const Api::Step& step, const Replacements& replacements) {
    Api::Step result = step;
    result.image = applyStringReplacements(step.image, replacements.strings);
    result.command = applyArrayReplacements(step.command, replacements);
    result.args = applyArrayReplacements(step.args, replacements);
    result.script = applyStringReplacements(step.script, replacements.strings);
    return result;
}

Replacements paramReplacements(const std::vector<Api::ParamSpec>& declared,
                               const std::vector<Api::Param>& provided) {
    std::map<std::string, Api::ParamValue> values;
    for (const auto& spec : declared) {
        if (spec.default_value) {
            values[spec.name] = *spec.default_value;
        }
    }
    for (const auto& param : provided) {
        values[param.name] = param.value;
    }

    Replacements replacements;
    for (const auto& [name, value] : values) {
        const std::string key = "params." + name;
        if (value.type == Api::ParamType::ARRAY) {
            replacements.arrays[key] = value.array_val;
        } else {
            replacements.strings[key] = value.string_val;
        }
    }
    return replacements;
}

std::vector<ResultReference> extractResultReferences(const std::string& input) {
    static const std::regex pattern(R"(\$\(tasks\.([^.)]+)\.results\.([^)]+)\))");

    std::vector<ResultReference> references;
    std::set<ResultReference> seen;
    for (auto it = std::sregex_iterator(input.begin(), input.end(), pattern); it != std::sregex_iterator(); ++it) {
        ResultReference reference{(*it)[1].str(), (*it)[2].str()};
        if (seen.insert(reference).second) {
            references.push_back(reference);
        }
    }
    return references;
}

std::vector<ResultReference> extractResultReferences(const Api::ParamValue& value) {
    if (value.type == Api::ParamType::STRING) {
        return extractResultReferences(value.string_val);
    }
    std::vector<ResultReference> references;
    for (const auto& element : value.array_val) {
        for (const auto& reference : extractResultReferences(element)) {
            if (std::find(references.begin(), references.end(), reference) == references.end()) {
                references.push_back(reference);
            }
        }
    }
    return references;
}

bool containsExpression(const std::string& input, const std::string& prefix) {
    return input.find("$(" + prefix) != std::string::npos;
}

} // namespace Substitution

} // namespace PRR::Reconciler
