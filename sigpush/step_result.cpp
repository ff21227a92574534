#include "step_result.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <filesystem>
#include <fstream>

StepResult::StepResult(const std::string& step_name, const std::string& sub_step_name)
    : step_name_(step_name), sub_step_name_(sub_step_name) {}

void StepResult::AddArtifact(const std::string& name, const std::string& value) {
    artifacts_[name] = value;
}

std::optional<std::string> StepResult::GetArtifact(const std::string& name) const {
    auto it = artifacts_.find(name);
    if (it == artifacts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

nlohmann::json StepResult::ToJson() const {
    nlohmann::json j;
    j["step-name"] = step_name_;
    j["sub-step-name"] = sub_step_name_;
    j["success"] = success_;
    j["message"] = message_;
    j["artifacts"] = artifacts_;
    return j;
}

StepResult StepResult::FromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("step result must be a JSON object");
    }
    try {
        StepResult result(j.at("step-name").get<std::string>(), j.value("sub-step-name", ""));
        result.success_ = j.value("success", true);
        result.message_ = j.value("message", "");
        if (j.contains("artifacts")) {
            result.artifacts_ = j.at("artifacts").get<std::map<std::string, std::string>>();
        }
        return result;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid step result: ") + e.what());
    }
}

WorkflowResults WorkflowResults::Load(const std::string& path) {
    WorkflowResults workflow;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::Info("No previous step results at " + path, "Results");
        return workflow;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("failed to parse " + path + ": " + e.what());
    }

    if (!j.is_object() || !j.contains("step-results") || !j["step-results"].is_array()) {
        throw ConfigError(path + " has no 'step-results' array");
    }
    for (const auto& entry : j["step-results"]) {
        workflow.results_.push_back(StepResult::FromJson(entry));
    }

    Logger::Debug("Loaded " + std::to_string(workflow.results_.size()) + " step results from " + path, "Results");
    return workflow;
}

void WorkflowResults::Save(const std::string& path) const {
    nlohmann::json j;
    j["step-results"] = nlohmann::json::array();
    for (const auto& result : results_) {
        j["step-results"].push_back(result.ToJson());
    }

    // Messages can carry server error text that is not valid UTF-8.
    std::string text = j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

    // Write next to the target and rename so readers never see a partial file.
    std::string temp_path = path + ".tmp";
    std::error_code ec;
    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file.is_open()) {
            throw ConfigError("failed to open " + temp_path + " for writing");
        }
        file << text << std::endl;
        if (!file) {
            file.close();
            std::filesystem::remove(temp_path, ec);
            throw ConfigError("failed to write " + temp_path);
        }
    }

    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::string reason = ec.message();
        std::filesystem::remove(temp_path, ec);
        throw ConfigError("failed to replace " + path + ": " + reason);
    }
}

void WorkflowResults::Append(const StepResult& result) {
    results_.push_back(result);
}

std::optional<std::string> WorkflowResults::GetResultValue(const std::string& name) const {
    for (auto it = results_.rbegin(); it != results_.rend(); ++it) {
        auto value = it->GetArtifact(name);
        if (value) {
            return value;
        }
    }
    return std::nullopt;
}
