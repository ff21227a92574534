#include <cstdio>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <getopt.h>

#include "curl_push_step.hpp"
#include "curl_transport.hpp"
#include "logger.hpp"
#include "step_result.hpp"

namespace {

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s -c <config.json> -r <results.json> [--verbose]\n"
        "\n"
        "Options:\n"
        "  -c, --config     Step configuration file\n"
        "  -r, --results    Workflow results file, read for previous step results\n"
        "                   and updated with this step's result\n"
        "  -v, --verbose    Log the HTTP exchange at DEBUG level\n"
        "  -h, --help       Show this help\n",
        argv0);
}

// Records the step outcome for later steps. Failures here are logged only,
// the step outcome decides the exit code.
void RecordResult(WorkflowResults& results, const StepResult& step_result, const std::string& path) {
    results.Append(step_result);
    try {
        results.Save(path);
        Logger::Info("Step results written to " + path);
    } catch (const std::exception& e) {
        Logger::Error(std::string("Failed to write step results: ") + e.what());
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string results_path;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"results", required_argument, nullptr, 'r'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:r:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                break;

            case 'r':
                results_path = optarg;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (config_path.empty() || results_path.empty()) {
        PrintUsage(argv[0]);
        return 2;
    }

    // Results are loaded first so any later failure can still be recorded.
    WorkflowResults results;
    try {
        results = WorkflowResults::Load(results_path);
    } catch (const std::exception& e) {
        Logger::Fatal(e.what());
        return 1;
    }

    std::unique_ptr<CurlGlobal> curl_global;
    try {
        curl_global = std::make_unique<CurlGlobal>();
    } catch (const std::exception& e) {
        Logger::Fatal(e.what());
        return 1;
    }

    StepResult step_result = RunPushStep(config_path, results, verbose, [](bool trace) {
        return std::unique_ptr<HttpTransport>(new CurlTransport(trace));
    });

    RecordResult(results, step_result, results_path);

    if (!step_result.success()) {
        Logger::Error("Step " + step_result.step_name() + " failed: " + step_result.message());
        return 1;
    }

    Logger::Info("Step " + step_result.step_name() + " succeeded");
    return 0;
}
