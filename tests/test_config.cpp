#include <gtest/gtest.h>

#include "config.hpp"
#include "errors.hpp"
#include "step_result.hpp"
#include "testing.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>

namespace {

TEST(ConfigTest, ParsesStepConfig) {
    auto j = nlohmann::json::parse(R"({
        "log_level": "DEBUG",
        "verbose": true,
        "step-config": {
            "container-image-signature-server-url": "https://sig.example.com",
            "container-image-signature-server-username": "user",
            "container-image-signature-server-password": "pass"
        }
    })");

    Config::ServerConfig config = Config::FromJson(j);

    EXPECT_EQ(config.log_level, "DEBUG");
    EXPECT_TRUE(config.verbose);
    EXPECT_EQ(config.step_config.Get(kServerUrlKey), "https://sig.example.com");
    EXPECT_TRUE(config.step_config.MissingKeys({kServerUrlKey, kServerUsernameKey, kServerPasswordKey}).empty());
}

TEST(ConfigTest, NonStringValueIsRejected) {
    auto j = nlohmann::json::parse(R"({"step-config": {"container-image-signature-server-url": 42}})");
    EXPECT_THROW(Config::FromJson(j), ConfigError);
}

TEST(ConfigTest, EmptyValueCountsAsMissing) {
    StepConfig config;
    config.Set(kServerUrlKey, "");
    config.Set(kServerUsernameKey, "user");

    auto missing = config.MissingKeys({kServerUrlKey, kServerUsernameKey, kServerPasswordKey});
    ASSERT_EQ(missing.size(), 2u);
    EXPECT_EQ(missing[0], kServerUrlKey);
    EXPECT_EQ(missing[1], kServerPasswordKey);
}

TEST(ConfigTest, LoadMissingFileKeepsDefaults) {
    testutil::TemporaryDirectory dir;
    Config::Instance().Load(dir.Path() + "/absent.json");
    EXPECT_EQ(Config::Instance().Get().log_level, "INFO");
    EXPECT_FALSE(Config::Instance().Get().verbose);
}

TEST(ConfigTest, LoadMalformedFileThrows) {
    testutil::TemporaryDirectory dir;
    std::string path = dir.WriteFile("config.json", "{ not json");
    EXPECT_THROW(Config::Instance().Load(path), ConfigError);
}

TEST(ConfigTest, EnvironmentOverridesFile) {
    testutil::TemporaryDirectory dir;
    std::string path = dir.WriteFile("config.json",
        R"({"step-config": {"container-image-signature-server-password": "from-file"}})");

    ::setenv("SIGPUSH_SERVER_PASSWORD", "from-env", 1);
    Config::Instance().Load(path);
    ::unsetenv("SIGPUSH_SERVER_PASSWORD");

    EXPECT_EQ(Config::Instance().Get().step_config.Get(kServerPasswordKey), "from-env");
}

TEST(WorkflowResultsTest, MissingFileIsEmpty) {
    testutil::TemporaryDirectory dir;
    WorkflowResults results = WorkflowResults::Load(dir.Path() + "/results.json");
    EXPECT_TRUE(results.results().empty());
    EXPECT_FALSE(results.GetResultValue("anything"));
}

TEST(WorkflowResultsTest, SaveThenLoadKeepsOrderAndArtifacts) {
    testutil::TemporaryDirectory dir;
    std::string path = dir.Path() + "/results.json";

    WorkflowResults results;
    StepResult sign("sign-container-image", "PodmanSign");
    sign.AddArtifact("container-image-signature-name", "demo@sha256=abc/signature-1");
    results.Append(sign);
    StepResult push("push-container-signature", "CurlPush");
    push.set_success(false);
    push.set_message("Missing container-image-signature-file-path");
    results.Append(push);
    results.Save(path);

    WorkflowResults loaded = WorkflowResults::Load(path);
    ASSERT_EQ(loaded.results().size(), 2u);
    EXPECT_EQ(loaded.results()[0].step_name(), "sign-container-image");
    EXPECT_EQ(loaded.results()[1].sub_step_name(), "CurlPush");
    EXPECT_FALSE(loaded.results()[1].success());
    EXPECT_EQ(loaded.results()[1].message(), "Missing container-image-signature-file-path");
    EXPECT_EQ(loaded.GetResultValue("container-image-signature-name"), "demo@sha256=abc/signature-1");
}

TEST(WorkflowResultsTest, MalformedFileThrows) {
    testutil::TemporaryDirectory dir;
    std::string path = dir.WriteFile("results.json", R"({"steps": []})");
    EXPECT_THROW(WorkflowResults::Load(path), ConfigError);
}

TEST(WorkflowResultsTest, SavesMessageWithTruncatedUtf8) {
    testutil::TemporaryDirectory dir;
    std::string path = dir.Path() + "/results.json";

    // Server error text cut in the middle of a two-byte character.
    std::string cut = std::string(511, 'x') + "\xC3";
    StepResult push("push-container-signature", "CurlPush");
    push.set_success(false);
    push.set_message(cut);
    WorkflowResults results;
    results.Append(push);

    ASSERT_NO_THROW(results.Save(path));
    EXPECT_FALSE(std::filesystem::exists(path + ".tmp"));

    WorkflowResults loaded = WorkflowResults::Load(path);
    ASSERT_EQ(loaded.results().size(), 1u);
    EXPECT_FALSE(loaded.results()[0].success());
    EXPECT_EQ(loaded.results()[0].message(), std::string(511, 'x') + "\xEF\xBF\xBD");
}

} // namespace
