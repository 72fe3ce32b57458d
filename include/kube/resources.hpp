#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace d8::kube {

inline constexpr const char* API_GROUP_VERSION = "deckhouse.io/v1alpha1";

struct Condition {
    std::string type;
    std::string status;
    std::string reason;
    std::string message;
};

struct TransferStatus {
    std::string url;
    std::string publicURL;
    std::string ca;
    std::string volumeMode;
    std::vector<Condition> conditions;

    [[nodiscard]] bool conditionTrue(const std::string& type) const;
    [[nodiscard]] std::optional<Condition> condition(const std::string& type) const;
};

struct DataExport {
    std::string name;
    std::string namespace_;
    std::string ttl;
    bool publish = false;
    std::string targetKind;
    std::string targetName;
    TransferStatus status;
};

struct DataImport {
    std::string name;
    std::string namespace_;
    std::string ttl;
    bool publish = false;
    bool waitForFirstConsumer = false;
    nlohmann::json pvcTemplate; // {metadata, spec}
    TransferStatus status;
};

void to_json(nlohmann::json& j, const Condition& c);
void from_json(const nlohmann::json& j, Condition& c);
void from_json(const nlohmann::json& j, TransferStatus& s);
void to_json(nlohmann::json& j, const DataExport& e);
void from_json(const nlohmann::json& j, DataExport& e);
void to_json(nlohmann::json& j, const DataImport& i);
void from_json(const nlohmann::json& j, DataImport& i);

std::string dataExportsPath(const std::string& ns);
std::string dataImportsPath(const std::string& ns);

}
