#include "kube/resources.hpp"

#include <fmt/core.h>

using nlohmann::json;

namespace d8::kube {

bool TransferStatus::conditionTrue(const std::string& type) const {
    const auto c = condition(type);
    return c && c->status == "True";
}

std::optional<Condition> TransferStatus::condition(const std::string& type) const {
    for (const auto& c : conditions)
        if (c.type == type) return c;
    return std::nullopt;
}

void to_json(json& j, const Condition& c) {
    j = json{{"type", c.type}, {"status", c.status}, {"reason", c.reason}, {"message", c.message}};
}

void from_json(const json& j, Condition& c) {
    c.type = j.value("type", "");
    c.status = j.value("status", "");
    c.reason = j.value("reason", "");
    c.message = j.value("message", "");
}

void from_json(const json& j, TransferStatus& s) {
    s.url = j.value("url", "");
    s.publicURL = j.value("publicURL", "");
    s.ca = j.value("ca", "");
    s.volumeMode = j.value("volumeMode", "");
    if (j.contains("conditions") && j["conditions"].is_array())
        s.conditions = j["conditions"].get<std::vector<Condition>>();
}

static void readMeta(const json& j, std::string& name, std::string& ns) {
    if (!j.contains("metadata")) return;
    const auto& meta = j["metadata"];
    name = meta.value("name", "");
    ns = meta.value("namespace", "");
}

void to_json(json& j, const DataExport& e) {
    j = {
        {"apiVersion", API_GROUP_VERSION},
        {"kind", "DataExport"},
        {"metadata", {{"name", e.name}, {"namespace", e.namespace_}}},
        {"spec", {
            {"ttl", e.ttl},
            {"publish", e.publish},
            {"targetRef", {{"kind", e.targetKind}, {"name", e.targetName}}},
        }},
    };
}

void from_json(const json& j, DataExport& e) {
    readMeta(j, e.name, e.namespace_);
    if (j.contains("spec")) {
        const auto& spec = j["spec"];
        e.ttl = spec.value("ttl", "");
        e.publish = spec.value("publish", false);
        if (spec.contains("targetRef")) {
            e.targetKind = spec["targetRef"].value("kind", "");
            e.targetName = spec["targetRef"].value("name", "");
        }
    }
    if (j.contains("status") && j["status"].is_object()) e.status = j["status"].get<TransferStatus>();
}

void to_json(json& j, const DataImport& i) {
    json targetRef{{"kind", "PersistentVolumeClaim"}};
    if (!i.pvcTemplate.is_null()) targetRef["pvcTemplate"] = i.pvcTemplate;

    json spec{{"ttl", i.ttl}, {"targetRef", targetRef}};
    if (i.publish) spec["publish"] = true;
    if (i.waitForFirstConsumer) spec["waitForFirstConsumer"] = true;

    j = {
        {"apiVersion", API_GROUP_VERSION},
        {"kind", "DataImport"},
        {"metadata", {{"name", i.name}, {"namespace", i.namespace_}}},
        {"spec", spec},
    };
}

void from_json(const json& j, DataImport& i) {
    readMeta(j, i.name, i.namespace_);
    if (j.contains("spec")) {
        const auto& spec = j["spec"];
        i.ttl = spec.value("ttl", "");
        i.publish = spec.value("publish", false);
        i.waitForFirstConsumer = spec.value("waitForFirstConsumer", false);
        if (spec.contains("targetRef") && spec["targetRef"].contains("pvcTemplate"))
            i.pvcTemplate = spec["targetRef"]["pvcTemplate"];
    }
    if (j.contains("status") && j["status"].is_object()) i.status = j["status"].get<TransferStatus>();
}

std::string dataExportsPath(const std::string& ns) {
    return fmt::format("/apis/{}/namespaces/{}/dataexports", API_GROUP_VERSION, ns);
}

std::string dataImportsPath(const std::string& ns) {
    return fmt::format("/apis/{}/namespaces/{}/dataimports", API_GROUP_VERSION, ns);
}

}
