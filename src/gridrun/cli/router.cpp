#include "gridrun/cli/router.hpp"

#include "artifacts/report_writer.hpp"
#include "artifacts/summary_writer.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/json_dom.hpp"
#include "core/schema/run_contract.hpp"
#include "core/time_utils.hpp"
#include "events/emitter.hpp"
#include "events/jsonl_writer.hpp"
#include "execution/cancellation.hpp"
#include "execution/dry_run_action_runner.hpp"
#include "execution/pipeline_runner.hpp"
#include "execution/shell_action_runner.hpp"
#include "matrix/matrix_resolver.hpp"
#include "pipeline/model.hpp"
#include "pipeline/validator.hpp"
#include "planner/job_planner.hpp"

#include <algorithm>
#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace gridrun::cli {

namespace {

constexpr std::string_view kVersion = "0.1.0";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitSchemaInvalid = core::errors::ToInt(core::errors::ExitCode::kSchemaInvalid);
constexpr int kExitJobsFailed = core::errors::ToInt(core::errors::ExitCode::kJobsFailed);
constexpr int kExitCancelled = core::errors::ToInt(core::errors::ExitCode::kCancelled);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  gridrun validate <pipeline.json>\n"
      << "  gridrun matrix <pipeline.json> [--job <template>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  gridrun plan <pipeline.json> [--job <template>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  gridrun run <pipeline.json> [--out <dir>] [--jobs <n>] "
         "[--fail-fast|--no-fail-fast] [--dry-run] [--job <template>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  gridrun version\n"
      << "  gridrun help\n";
}

// Pipeline-wide abort token reachable from the signal handler. Only the
// lock-free flag flip happens inside the handler.
std::atomic<execution::CancellationToken*> g_abort_token{nullptr};

extern "C" void HandleAbortSignal(int signal_number) {
  (void)signal_number;
  if (execution::CancellationToken* token = g_abort_token.load(); token != nullptr) {
    (void)token->Cancel();
  }
}

// Routes SIGINT/SIGTERM to `token` for the lifetime of a run.
class ScopedAbortSignals {
public:
  explicit ScopedAbortSignals(execution::CancellationToken& token) {
    g_abort_token.store(&token);
    previous_int_ = std::signal(SIGINT, HandleAbortSignal);
    previous_term_ = std::signal(SIGTERM, HandleAbortSignal);
  }

  ~ScopedAbortSignals() {
    (void)std::signal(SIGINT, previous_int_ == SIG_ERR ? SIG_DFL : previous_int_);
    (void)std::signal(SIGTERM, previous_term_ == SIG_ERR ? SIG_DFL : previous_term_);
    g_abort_token.store(nullptr);
  }

  ScopedAbortSignals(const ScopedAbortSignals&) = delete;
  ScopedAbortSignals& operator=(const ScopedAbortSignals&) = delete;

private:
  void (*previous_int_)(int) = SIG_DFL;
  void (*previous_term_)(int) = SIG_DFL;
};

// Filesystem preflight checks run before schema validation. This keeps path and
// file-type failures separate from field-level schema issues.
bool ValidatePipelinePath(const std::string& pipeline_path, std::string& error) {
  if (pipeline_path.empty()) {
    error = "pipeline path cannot be empty";
    return false;
  }

  const fs::path path(pipeline_path);
  std::error_code ec;
  if (!fs::exists(path, ec) || ec) {
    error = "pipeline file not found: " + pipeline_path;
    return false;
  }
  if (!fs::is_regular_file(path, ec) || ec) {
    error = "pipeline path must point to a regular file: " + pipeline_path;
    return false;
  }
  if (path.extension() != ".json") {
    error = "pipeline file must use .json extension: " + pipeline_path;
    return false;
  }

  std::ifstream file(path);
  if (!file) {
    error = "unable to open pipeline file: " + pipeline_path;
    return false;
  }
  if (file.peek() == std::ifstream::traits_type::eof()) {
    error = "pipeline file is empty: " + pipeline_path;
    return false;
  }
  return true;
}

void PrintValidationIssues(const std::string& pipeline_path,
                           const pipeline::ValidationReport& report) {
  std::cerr << "invalid pipeline: " << pipeline_path << '\n';
  for (const auto& issue : report.issues) {
    std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

// Preflight, strict validation, then lenient model load. Returns an exit code;
// kExitSuccess means `model` is ready.
int LoadValidatedPipeline(const std::string& pipeline_path, const core::logging::Logger& logger,
                          pipeline::PipelineModel& model) {
  std::string error;
  if (!ValidatePipelinePath(pipeline_path, error)) {
    logger.Error("pipeline path validation failed",
                 {{"pipeline_path", pipeline_path}, {"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  pipeline::ValidationReport report;
  if (!pipeline::ValidatePipelineFile(pipeline_path, report, error)) {
    logger.Error("pipeline validation failed to run", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!report.valid) {
    logger.Error("pipeline document is invalid",
                 {{"pipeline_path", pipeline_path},
                  {"issue_count", std::to_string(report.issues.size())}});
    PrintValidationIssues(pipeline_path, report);
    return kExitSchemaInvalid;
  }

  if (!pipeline::LoadPipelineModelFile(pipeline_path, model, error)) {
    logger.Error("failed to load pipeline model", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitSchemaInvalid;
  }
  return kExitSuccess;
}

// Templates selected by `--job`, in document order.
bool SelectTemplates(const pipeline::PipelineModel& model,
                     const std::optional<std::string>& job_filter,
                     std::vector<const pipeline::JobTemplate*>& selected, std::string& error) {
  selected.clear();
  if (!job_filter.has_value()) {
    for (const auto& job : model.jobs) {
      selected.push_back(&job);
    }
    return true;
  }
  const pipeline::JobTemplate* job = model.FindJob(job_filter.value());
  if (job == nullptr) {
    error = "unknown job template '" + job_filter.value() + "'";
    return false;
  }
  selected.push_back(job);
  return true;
}

void LogPlanFindings(const planner::JobPlan& plan, const core::logging::Logger& logger) {
  for (const auto& diagnostic : plan.diagnostics) {
    logger.Debug("matrix resolution diagnostic", {{"template", plan.template_name},
                                                  {"kind", matrix::ToString(diagnostic.kind)},
                                                  {"source", diagnostic.source},
                                                  {"detail", diagnostic.message}});
  }
  for (const auto& job : plan.unplannable) {
    logger.Warn("job is unplannable", {{"job_id", job.id}, {"reason", job.reason}});
  }
  for (const auto& job : plan.jobs) {
    for (const auto& diagnostic : job.diagnostics) {
      logger.Warn("job planning note", {{"job_id", job.id}, {"detail", diagnostic}});
    }
  }
}

bool ParseJobsValue(std::string_view raw, std::size_t& value, std::string& error) {
  std::size_t parsed = 0;
  const auto [end, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
  if (ec != std::errc{} || end != raw.data() + raw.size() || parsed == 0U) {
    error = "invalid --jobs '" + std::string(raw) + "' (expected a positive integer)";
    return false;
  }
  value = parsed;
  return true;
}

// Shared parser for `matrix` and `plan`: one path, `--job`, `--log-level`.
bool ParseInspectOptions(std::string_view command, const std::vector<std::string_view>& args,
                         RunOptions& options, std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--job" || token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(token);
        return false;
      }
      if (token == "--job") {
        options.job_filter = std::string(args[i + 1]);
      } else if (!core::logging::ParseLogLevel(args[i + 1], options.log_level, error)) {
        return false;
      }
      ++i;
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.pipeline_path.empty()) {
      error = std::string(command) + " accepts exactly 1 pipeline path";
      return false;
    }
    options.pipeline_path = std::string(token);
  }

  if (options.pipeline_path.empty()) {
    error = std::string(command) + " requires exactly 1 argument: <pipeline.json>";
    return false;
  }
  return true;
}

// Parse `run` args with an explicit contract:
// - one pipeline path
// - optional `--out <dir>`, `--jobs <n>`, `--job <template>`, `--log-level <lvl>`
// - `--fail-fast` / `--no-fail-fast` override every template's strategy
// Unknown flags and duplicate positional args are usage errors.
bool ParseRunOptions(const std::vector<std::string_view>& args, RunOptions& options,
                     std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--dry-run") {
      options.dry_run = true;
      continue;
    }
    if (token == "--fail-fast" || token == "--no-fail-fast") {
      const bool enabled = token == "--fail-fast";
      if (options.fail_fast_override.has_value() && options.fail_fast_override.value() != enabled) {
        error = "--fail-fast and --no-fail-fast are mutually exclusive";
        return false;
      }
      options.fail_fast_override = enabled;
      continue;
    }
    if (token == "--out" || token == "--jobs" || token == "--job" || token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(token);
        return false;
      }
      const std::string_view value = args[i + 1];
      ++i;
      if (token == "--out") {
        options.output_dir = fs::path(value);
      } else if (token == "--jobs") {
        if (!ParseJobsValue(value, options.max_parallel, error)) {
          return false;
        }
      } else if (token == "--job") {
        options.job_filter = std::string(value);
      } else if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.pipeline_path.empty()) {
      error = "run accepts exactly 1 pipeline path";
      return false;
    }
    options.pipeline_path = std::string(token);
  }

  if (options.pipeline_path.empty()) {
    error = "run requires exactly 1 argument: <pipeline.json>";
    return false;
  }
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "gridrun " << kVersion << '\n';
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate requires exactly 1 argument: <pipeline.json>\n";
    return kExitUsage;
  }

  std::string error;
  const std::string pipeline_path(args.front());
  if (!ValidatePipelinePath(pipeline_path, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  pipeline::ValidationReport report;
  if (!pipeline::ValidatePipelineFile(pipeline_path, report, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  if (!report.valid) {
    PrintValidationIssues(pipeline_path, report);
    return kExitSchemaInvalid;
  }

  std::cout << "valid: " << pipeline_path << '\n';
  return kExitSuccess;
}

int CommandMatrix(const std::vector<std::string_view>& args) {
  RunOptions options;
  std::string error;
  if (!ParseInspectOptions("matrix", args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  pipeline::PipelineModel model;
  if (const int code = LoadValidatedPipeline(options.pipeline_path, logger, model);
      code != kExitSuccess) {
    return code;
  }

  std::vector<const pipeline::JobTemplate*> templates;
  if (!SelectTemplates(model, options.job_filter, templates, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  for (const pipeline::JobTemplate* job : templates) {
    const matrix::ResolvedMatrix resolved = matrix::ResolveMatrix(job->matrix);
    std::cout << job->name << ": " << resolved.combinations.size() << " combination(s)\n";
    for (const auto& combination : resolved.combinations) {
      std::cout << "  " << core::json::Serialize(combination.ToObject());
      if (combination.synthesized) {
        std::cout << " [include]";
      }
      std::cout << '\n';
    }
    for (const auto& diagnostic : resolved.diagnostics) {
      logger.Debug("matrix resolution diagnostic", {{"template", job->name},
                                                    {"kind", matrix::ToString(diagnostic.kind)},
                                                    {"source", diagnostic.source},
                                                    {"detail", diagnostic.message}});
      std::cout << "  note: " << matrix::ToString(diagnostic.kind) << " at " << diagnostic.source
                << ": " << diagnostic.message << '\n';
    }
  }
  return kExitSuccess;
}

int CommandPlan(const std::vector<std::string_view>& args) {
  RunOptions options;
  std::string error;
  if (!ParseInspectOptions("plan", args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  pipeline::PipelineModel model;
  if (const int code = LoadValidatedPipeline(options.pipeline_path, logger, model);
      code != kExitSuccess) {
    return code;
  }

  std::vector<const pipeline::JobTemplate*> templates;
  if (!SelectTemplates(model, options.job_filter, templates, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  for (const pipeline::JobTemplate* job_template : templates) {
    const planner::JobPlan plan = planner::PlanTemplate(model, *job_template);
    LogPlanFindings(plan, logger);
    std::cout << plan.template_name << ": " << plan.jobs.size() << " job(s), "
              << plan.unplannable.size() << " unplannable, fail-fast="
              << (plan.fail_fast ? "true" : "false") << '\n';
    for (const auto& job : plan.jobs) {
      std::cout << "  " << job.id << "  " << job.display_name << "  runs-on=" << job.runner_label
                << " os=" << job.runner.os << '\n';
      for (const auto& step : job.steps) {
        std::cout << "    [" << step.index + 1U << "] " << step.display_name << " ("
                  << planner::ToString(step.policy);
        if (step.condition.has_value()) {
          std::cout << ", if: " << step.condition.value();
        }
        std::cout << ")\n";
      }
    }
    for (const auto& job : plan.unplannable) {
      std::cout << "  " << job.id << "  " << job.display_name << "  UNPLANNABLE: " << job.reason
                << '\n';
    }
  }
  return kExitSuccess;
}

int ExecutePipelineRunInternal(const RunOptions& options, PipelineRunResult* run_result) {
  core::logging::Logger logger(options.log_level);
  if (run_result != nullptr) {
    *run_result = PipelineRunResult{};
  }

  logger.Info("run execution requested",
              {{"pipeline_path", options.pipeline_path},
               {"output_root", options.output_dir.string()},
               {"dry_run", options.dry_run ? "true" : "false"}});

  pipeline::PipelineModel model;
  if (const int code = LoadValidatedPipeline(options.pipeline_path, logger, model);
      code != kExitSuccess) {
    return code;
  }

  std::string error;
  std::vector<const pipeline::JobTemplate*> templates;
  if (!SelectTemplates(model, options.job_filter, templates, error)) {
    logger.Error("job selection failed", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  std::vector<planner::JobPlan> plans;
  std::size_t planned_count = 0;
  std::size_t unplannable_count = 0;
  for (const pipeline::JobTemplate* job_template : templates) {
    plans.push_back(planner::PlanTemplate(model, *job_template));
    LogPlanFindings(plans.back(), logger);
    planned_count += plans.back().jobs.size();
    unplannable_count += plans.back().unplannable.size();
  }

  core::schema::RunInfo run_info;
  run_info.timestamps.created_at = std::chrono::system_clock::now();
  run_info.run_id = core::MakeRunId(run_info.timestamps.created_at);
  run_info.config.pipeline_id = model.pipeline_id;
  run_info.config.pipeline_path = options.pipeline_path;
  run_info.config.fail_fast_override = options.fail_fast_override;
  run_info.config.job_filter = options.job_filter;
  run_info.config.max_parallel =
      options.max_parallel != 0U
          ? options.max_parallel
          : std::max<std::size_t>(1U, std::thread::hardware_concurrency());
  logger.SetRunId(run_info.run_id);

  const fs::path run_dir = options.output_dir / run_info.run_id;
  std::unique_ptr<execution::IActionRunner> runner;
  fs::path log_dir;
  const fs::path scratch_dir = run_dir / "scratch";
  if (options.dry_run) {
    runner = std::make_unique<execution::DryRunActionRunner>();
  } else {
    runner = std::make_unique<execution::ShellActionRunner>(scratch_dir);
    log_dir = run_dir / "logs";
  }
  run_info.config.action_runner = runner->Name();

  events::JsonlEventWriter event_writer;
  if (!event_writer.Open(run_dir, error)) {
    logger.Error("failed to open event log", {{"run_dir", run_dir.string()}, {"error", error}});
    std::cerr << "error: failed to open event log: " << error << '\n';
    return kExitFailure;
  }
  events::Emitter emitter(event_writer, run_info.run_id, &logger);
  if (run_result != nullptr) {
    run_result->run_id = run_info.run_id;
    run_result->run_dir = run_dir;
    run_result->events_jsonl_path = event_writer.path();
  }

  logger.Info("run initialized", {{"pipeline_id", model.pipeline_id},
                                  {"run_dir", run_dir.string()},
                                  {"action_runner", runner->Name()},
                                  {"planned_jobs", std::to_string(planned_count)},
                                  {"unplannable_jobs", std::to_string(unplannable_count)}});

  if (!emitter.EmitPipelineStarted(model.pipeline_id, runner->Name(), planned_count,
                                   unplannable_count, error)) {
    logger.Error("failed to write pipeline_started event", {{"error", error}});
    std::cerr << "error: failed to write events: " << error << '\n';
    return kExitFailure;
  }
  for (const auto& plan : plans) {
    for (const auto& job : plan.jobs) {
      if (!emitter.EmitJobPlanned(job, error)) {
        logger.Warn("failed to write job_planned event", {{"error", error}});
      }
    }
    for (const auto& job : plan.unplannable) {
      if (!emitter.EmitJobUnplannable(job, error)) {
        logger.Warn("failed to write job_unplannable event", {{"error", error}});
      }
    }
  }

  execution::CancellationToken abort_token;
  execution::PipelineRunOptions run_options;
  run_options.max_parallel = options.max_parallel;
  run_options.fail_fast_override = options.fail_fast_override;
  run_options.log_dir = log_dir;
  run_options.logger = &logger;
  run_options.observer = &emitter;
  run_options.on_cancel_requested = [&emitter, &logger](std::string_view scope,
                                                        std::string_view reason) {
    std::string emit_error;
    if (!emitter.EmitCancelRequested(scope, reason, emit_error)) {
      logger.Warn("failed to write cancel_requested event", {{"error", emit_error}});
    }
  };

  run_info.timestamps.started_at = std::chrono::system_clock::now();
  execution::PipelineResult result;
  {
    ScopedAbortSignals signals(abort_token);
    result = execution::RunPipeline(plans, *runner, abort_token, run_options);
  }
  run_info.timestamps.finished_at = std::chrono::system_clock::now();

  if (!options.dry_run) {
    std::error_code ec;
    (void)fs::remove_all(scratch_dir, ec);
  }

  if (!emitter.EmitPipelineFinished(result, error)) {
    logger.Warn("failed to write pipeline_finished event", {{"error", error}});
  }
  if (const std::string event_error = emitter.first_error(); !event_error.empty()) {
    std::cerr << "warning: some events were not written: " << event_error << '\n';
  }

  fs::path report_path;
  if (!artifacts::WriteReportJson(run_info, result, plans, run_dir, report_path, error)) {
    logger.Error("failed to write report.json", {{"error", error}});
    std::cerr << "error: failed to write report.json: " << error << '\n';
    return kExitFailure;
  }
  fs::path summary_path;
  if (!artifacts::WriteSummaryMarkdown(run_info, result, run_dir, summary_path, error)) {
    logger.Error("failed to write summary.md", {{"error", error}});
    std::cerr << "error: failed to write summary.md: " << error << '\n';
    return kExitFailure;
  }

  if (run_result != nullptr) {
    run_result->report_json_path = report_path;
    run_result->summary_md_path = summary_path;
    run_result->success = result.success;
    run_result->cancelled = result.cancelled;
  }

  std::cout << "run: " << run_info.run_id << '\n';
  std::cout << "artifact: " << report_path.string() << '\n';
  std::cout << "summary: " << summary_path.string() << '\n';
  std::cout << "events: " << event_writer.path().string() << '\n';
  for (const auto& job : result.jobs) {
    std::cout << "job " << job.job_id << " " << execution::ToString(job.status) << ": "
              << job.display_name << '\n';
  }
  for (const auto& job : result.unplannable) {
    std::cout << "job " << job.id << " unplannable: " << job.reason << '\n';
  }
  std::cout << "jobs: total=" << result.jobs.size() << " succeeded=" << result.succeeded_count
            << " failed=" << result.failed_count << " cancelled=" << result.cancelled_count
            << " unplannable=" << result.unplannable.size() << '\n';

  if (!result.success) {
    logger.Warn("run completed with failed jobs",
                {{"failed_jobs", std::to_string(result.failed_count)}});
    std::cout << "result: failure\n";
    return kExitJobsFailed;
  }
  if (result.cancelled) {
    logger.Warn("run cancelled", {{"cancelled_jobs", std::to_string(result.cancelled_count)}});
    std::cout << "result: cancelled\n";
    return kExitCancelled;
  }
  logger.Info("run completed", {{"succeeded_jobs", std::to_string(result.succeeded_count)}});
  std::cout << "result: success\n";
  return kExitSuccess;
}

int CommandRun(const std::vector<std::string_view>& args) {
  RunOptions options;
  std::string error;
  if (!ParseRunOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  return ExecutePipelineRunInternal(options, nullptr);
}

} // namespace

int ExecutePipelineRun(const RunOptions& options, PipelineRunResult* run_result) {
  return ExecutePipelineRunInternal(options, run_result);
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "validate") {
    return CommandValidate(args);
  }
  if (command == "matrix") {
    return CommandMatrix(args);
  }
  if (command == "plan") {
    return CommandPlan(args);
  }
  if (command == "run") {
    return CommandRun(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace gridrun::cli
