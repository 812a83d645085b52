// EN: Helpers shared by the API model - time and duration formats, name rules, YAML bridge
// FR: Utilitaires partagés par le modèle d'API - formats de temps et durée, règles de nommage, pont YAML

#pragma once

#include "api/pipeline_types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

// Forward declaration
namespace YAML { class Node; }

namespace PRR::Api {

namespace ApiUtils {

    // EN: RFC3339 UTC timestamp with second precision ("2026-01-02T03:04:05Z").
    // FR: Horodatage RFC3339 UTC à la seconde ("2026-01-02T03:04:05Z").
    std::string formatTimestamp(const Timestamp& tp);
    std::optional<Timestamp> parseTimestamp(const std::string& text);

    // EN: Durations in the "1h30m0s" / "500ms" notation.
    // FR: Durées au format "1h30m0s" / "500ms".
    std::string formatDuration(Duration duration);
    std::optional<Duration> parseDuration(const std::string& text);

    // EN: Lowercase RFC 1123 label: [a-z0-9]([-a-z0-9]*[a-z0-9])?, at most 63 characters.
    // FR: Label RFC 1123 en minuscules : [a-z0-9]([-a-z0-9]*[a-z0-9])?, au plus 63 caractères.
    bool isValidDnsLabel(const std::string& name);

    // EN: "namespace/name" key of an object.
    // FR: Clé "namespace/nom" d'un objet.
    std::string objectKey(const std::string& namespace_name, const std::string& name);

    // EN: Split a "namespace/name" key; nullopt unless exactly two non-empty parts.
    // FR: Découpe une clé "namespace/nom" ; nullopt sauf deux parties non vides exactement.
    std::optional<std::pair<std::string, std::string>> splitObjectKey(const std::string& key);

    std::string conditionStatusToString(ConditionStatus status);

    // EN: Convert a YAML document into JSON so YAML snapshots share the JSON decoders.
    // FR: Convertit un document YAML en JSON pour que les instantanés YAML partagent les décodeurs JSON.
    nlohmann::json yamlToJson(const YAML::Node& node);

    // EN: Load a JSON or YAML file (chosen by extension) as JSON.
    // FR: Charge un fichier JSON ou YAML (selon l'extension) en JSON.
    nlohmann::json loadDocument(const std::string& path);

} // namespace ApiUtils

} // namespace PRR::Api
