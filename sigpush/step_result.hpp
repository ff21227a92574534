#ifndef STEP_RESULT_HPP
#define STEP_RESULT_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Outcome of one pipeline step, as exchanged through the results file.
class StepResult {
public:
    StepResult(const std::string& step_name, const std::string& sub_step_name);

    const std::string& step_name() const { return step_name_; }
    const std::string& sub_step_name() const { return sub_step_name_; }

    bool success() const { return success_; }
    void set_success(bool success) { success_ = success; }

    const std::string& message() const { return message_; }
    void set_message(const std::string& message) { message_ = message; }

    void AddArtifact(const std::string& name, const std::string& value);
    std::optional<std::string> GetArtifact(const std::string& name) const;
    const std::map<std::string, std::string>& artifacts() const { return artifacts_; }

    nlohmann::json ToJson() const;
    // Throws ConfigError on a malformed entry.
    static StepResult FromJson(const nlohmann::json& j);

private:
    std::string step_name_;
    std::string sub_step_name_;
    bool success_ = true;
    std::string message_;
    std::map<std::string, std::string> artifacts_;
};

// Results of every step run so far in the workflow, oldest first.
class WorkflowResults {
public:
    // A missing file yields an empty result set. Throws ConfigError on
    // malformed content.
    static WorkflowResults Load(const std::string& path);

    // Writes {"step-results": [...]}. Throws ConfigError if the file cannot
    // be written.
    void Save(const std::string& path) const;

    void Append(const StepResult& result);

    // Artifact value from the most recent step that produced `name`.
    std::optional<std::string> GetResultValue(const std::string& name) const;

    const std::vector<StepResult>& results() const { return results_; }

private:
    std::vector<StepResult> results_;
};

#endif // STEP_RESULT_HPP
