#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "shipkit/builtin_providers.hpp"
#include "shipkit/checklist_report.hpp"
#include "shipkit/diagnostics.hpp"
#include "shipkit/evaluator.hpp"
#include "shipkit/orchestrator.hpp"
#include "shipkit/state_store.hpp"
#include "shipkit/toolkit_config.hpp"
#include "shipkit/workflow_report.hpp"

using shipkit::DiagnosticSink;
using shipkit::readiness::Evaluator;
using shipkit::report::ReportFormat;
using shipkit::report::ReportWriter;
using shipkit::workflow::Orchestrator;
using shipkit::workflow::StateStore;
using shipkit::workflow::WorkflowConfig;
using shipkit::workflow::WorkflowStep;

namespace {

enum class Mode {
    workflow,
    checklist,
    history,
    clear_state,
};

struct Args {
    std::filesystem::path project_root{"."};
    Mode mode{Mode::workflow};
    bool resume{false};
    std::optional<ReportFormat> report{};
    std::filesystem::path output{};
    bool skip_assets{false};
    bool skip_seo{false};
    bool skip_perf{false};
    bool deploy{false};
    bool production{false};
    std::optional<int> target_score{};
    bool verbose{false};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "shipkit - launch readiness and ship workflow\n"
        << "Usage:\n"
        << "  " << argv0 << " [--project <dir>] [--checklist | --history | --clear-state] [--resume]\n"
        << "                 [--report <html|json|md>] [--output <path>] [--skip-assets] [--skip-seo]\n"
        << "                 [--skip-perf] [--deploy] [--production] [--target-score <n>] [--verbose]\n"
        << "\n"
        << "Options:\n"
        << "  --project       Project root to inspect (default: current directory).\n"
        << "  --checklist     Run the launch readiness checklist only.\n"
        << "  --history       Print the last workflow runs and exit.\n"
        << "  --clear-state   Remove the persisted workflow state and exit.\n"
        << "  --resume        Continue an interrupted workflow when possible.\n"
        << "  --report        Write a report: html|json|md for the checklist, json|md for the workflow.\n"
        << "  --output        Checklist report path (default: <project>/.ship-toolkit/launch-report.<ext>).\n"
        << "  --skip-assets   Leave out the asset step.\n"
        << "  --skip-seo      Leave out the SEO step.\n"
        << "  --skip-perf     Leave out the performance step.\n"
        << "  --deploy        Plan the deployment step (runs only when ready to launch).\n"
        << "  --production    Target the production environment when deploying.\n"
        << "  --target-score  Performance target 0..100 (default: config file or 90).\n"
        << "  --verbose       Print debug and informational diagnostics.\n"
        << "  -h, --help      Show this help message.\n"
        << "\n"
        << "Exit codes: 0 ready, 1 not ready or failed, 2 configuration error, 3 internal error.\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

std::string_view expect_value(int& i, int argc, char** argv, std::string_view flag) {
    if (i + 1 >= argc) {
        throw std::runtime_error(std::string(flag) + " expects a value");
    }
    return argv[++i];
}

int parse_score(std::string_view text) {
    std::size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(std::string(text), &consumed);
    } catch (const std::exception&) {
        throw std::runtime_error("--target-score expects an integer, got '" + std::string(text) + "'");
    }
    if (consumed != text.size()) {
        throw std::runtime_error("--target-score expects an integer, got '" + std::string(text) + "'");
    }
    return value;
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            break;
        } else if (arg_eq(tok, "--project")) {
            args.project_root = std::filesystem::path(expect_value(i, argc, argv, tok));
        } else if (arg_eq(tok, "--checklist")) {
            args.mode = Mode::checklist;
        } else if (arg_eq(tok, "--history")) {
            args.mode = Mode::history;
        } else if (arg_eq(tok, "--clear-state")) {
            args.mode = Mode::clear_state;
        } else if (arg_eq(tok, "--resume")) {
            args.resume = true;
        } else if (arg_eq(tok, "--report")) {
            args.report = shipkit::report::parse_report_format(expect_value(i, argc, argv, tok));
        } else if (arg_eq(tok, "--output")) {
            args.output = std::filesystem::path(expect_value(i, argc, argv, tok));
        } else if (arg_eq(tok, "--skip-assets")) {
            args.skip_assets = true;
        } else if (arg_eq(tok, "--skip-seo")) {
            args.skip_seo = true;
        } else if (arg_eq(tok, "--skip-perf")) {
            args.skip_perf = true;
        } else if (arg_eq(tok, "--deploy")) {
            args.deploy = true;
        } else if (arg_eq(tok, "--production")) {
            args.production = true;
        } else if (arg_eq(tok, "--target-score")) {
            args.target_score = parse_score(expect_value(i, argc, argv, tok));
        } else if (arg_eq(tok, "--verbose")) {
            args.verbose = true;
        } else {
            throw std::runtime_error("Unknown argument: " + std::string(tok));
        }
    }

    if (!std::filesystem::is_directory(args.project_root)) {
        throw std::runtime_error("Project directory not found: " + args.project_root.string());
    }
    if (args.mode == Mode::workflow && args.report == ReportFormat::html) {
        throw std::runtime_error("Workflow reports are written as json or md");
    }
    return args;
}

WorkflowConfig workflow_config(const Args& args, const DiagnosticSink& sink) {
    const auto file_config = shipkit::load_toolkit_config(args.project_root, sink);

    WorkflowConfig config;
    config.skip_assets = args.skip_assets;
    config.skip_seo = args.skip_seo;
    config.skip_perf = args.skip_perf;
    config.skip_deploy = !args.deploy;
    config.production = args.production;
    config.target_score = args.target_score.value_or(file_config.target_score);
    config.deploy_platform = file_config.deploy_platform;
    config.validate();
    return config;
}

int run_checklist(const Args& args, const DiagnosticSink& sink) {
    const Evaluator evaluator(Evaluator::Config{.sink = sink});
    const auto checklist = evaluator.run(shipkit::readiness::default_providers(), args.project_root);

    shipkit::report::render_console(checklist, std::cout);

    if (args.report) {
        auto destination = args.output;
        if (destination.empty()) {
            destination = shipkit::tool_dir(args.project_root) /
                          (std::string("launch-report.") + shipkit::report::to_string(*args.report));
        }
        ReportWriter writer;
        writer.write_checklist(destination, *args.report, checklist);
        std::cout << "\nReport: " << destination.string() << "\n";
    }
    return checklist.ready_to_launch ? 0 : 1;
}

int run_workflow(const Args& args, const DiagnosticSink& sink) {
    Orchestrator::Config config;
    config.project_root = args.project_root;
    config.workflow = workflow_config(args, sink);
    config.resume = args.resume;
    config.sink = sink;
    config.on_step_started = [](const WorkflowStep& step, std::size_t index, std::size_t total) {
        std::cout << "Step " << (index + 1) << "/" << total << ": " << step.name << "\n";
    };
    config.on_step_finished = [](const WorkflowStep& step, std::size_t index, std::size_t total) {
        std::cout << "  " << shipkit::workflow::to_string(step.status) << "  "
                  << shipkit::report::progress_bar(static_cast<int>(index + 1), static_cast<int>(total)) << "\n";
    };

    Orchestrator orchestrator(std::move(config), shipkit::workflow::default_plan_factory(
                                                     Evaluator::Config{.sink = sink}));
    const auto result = orchestrator.run();
    if (orchestrator.resumed()) {
        std::cout << "Resumed workflow " << orchestrator.state()->id << "\n";
    }

    shipkit::report::render_workflow_console(result, std::cout);
    if (result.launch_checklist) {
        std::cout << "\nNext steps:\n";
        const auto steps = shipkit::report::next_steps(*result.launch_checklist);
        for (std::size_t index = 0; index < steps.size(); ++index) {
            std::cout << (index + 1) << ". " << steps[index] << "\n";
        }
    }

    if (args.report) {
        const auto path =
            shipkit::report::export_workflow_report(args.project_root, result, *args.report, shipkit::now_ms());
        std::cout << "\nReport: " << path.string() << "\n";
    }
    return result.overall_success && result.summary.ready_to_launch ? 0 : 1;
}

int show_history(const Args& args, const DiagnosticSink& sink) {
    const StateStore store(StateStore::Config{.project_root = args.project_root, .sink = sink});
    shipkit::report::render_history(store.load_history(), std::cout);
    return 0;
}

int clear_state(const Args& args, const DiagnosticSink& sink) {
    const StateStore store(StateStore::Config{.project_root = args.project_root, .sink = sink});
    if (!store.clear()) {
        return 2;
    }
    std::cout << "Workflow state cleared\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        const auto sink = shipkit::stderr_sink(shipkit::console_threshold(args.verbose));
        switch (args.mode) {
            case Mode::checklist:
                return run_checklist(args, sink);
            case Mode::history:
                return show_history(args, sink);
            case Mode::clear_state:
                return clear_state(args, sink);
            case Mode::workflow:
                return run_workflow(args, sink);
        }
        return 3;
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2;  // configuration/environment issue
    } catch (...) {
        std::cerr << "ERROR: Unknown exception\n";
        return 3;  // internal error
    }
}
