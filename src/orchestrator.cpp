/**
 * @file orchestrator.cpp
 * @brief Pass state machine and plan execution
 */

#include "adaptive_encoder/orchestrator.hpp"

#include <chrono>

#include <fmt/core.h>

#include "adaptive_encoder/config.hpp"
#include "adaptive_encoder/run_context.hpp"

namespace adaptive_encoder {

const char *to_string(PassState state) {
  switch (state) {
  case PassState::Idle:
    return "Idle";
  case PassState::Pass1Running:
    return "Pass1Running";
  case PassState::Pass1Complete:
    return "Pass1Complete";
  case PassState::Pass2Running:
    return "Pass2Running";
  case PassState::SinglePassRunning:
    return "SinglePassRunning";
  case PassState::Complete:
    return "Complete";
  case PassState::Failed:
    return "Failed";
  }
  return "Idle";
}

bool is_legal_transition(PassState from, PassState to) {
  switch (from) {
  case PassState::Idle:
    return to == PassState::Pass1Running || to == PassState::SinglePassRunning;
  case PassState::Pass1Running:
    return to == PassState::Pass1Complete || to == PassState::Failed;
  case PassState::Pass1Complete:
    return to == PassState::Pass2Running;
  case PassState::Pass2Running:
  case PassState::SinglePassRunning:
    return to == PassState::Complete || to == PassState::Failed;
  case PassState::Complete:
  case PassState::Failed:
    return false;
  }
  return false;
}

bool PassStateMachine::transition(PassState next) {
  if (!is_legal_transition(state_, next))
    return false;
  state_ = next;
  return true;
}

// **---- Execution ----**

namespace {

PassState running_state(const PassSpec &pass) {
  switch (pass.purpose) {
  case PassPurpose::Single:
    return PassState::SinglePassRunning;
  case PassPurpose::Analysis:
    return PassState::Pass1Running;
  case PassPurpose::Final:
    return PassState::Pass2Running;
  }
  return PassState::SinglePassRunning;
}

PassState finished_state(const PassSpec &pass) {
  return pass.purpose == PassPurpose::Analysis ? PassState::Pass1Complete
                                               : PassState::Complete;
}

} // anonymous namespace

OrchestratorResult PassOrchestrator::execute(PassPlan &plan,
                                             const MonitorOptions &monitor) {
  OrchestratorResult result;
  PassStateMachine machine;

  int interval_s = update_interval(monitor.width, monitor.height, plan.mode(),
                                   monitor.complexity_score);
  int interval_ms = monitor.interval_override_ms > 0 ? monitor.interval_override_ms
                                                     : interval_s * 1000;
  ctx_.session_note(fmt::format("Progress update interval: {} ms", interval_ms));

  auto fail = [&](const PassSpec &pass, int exit_status,
                  std::vector<std::string> tail) {
    machine.transition(PassState::Failed);
    result.success = false;
    result.exit_status = exit_status;
    result.failed_pass = pass.index;
    result.diagnostic_tail = std::move(tail);
    plan.release_stats();

    ctx_.log_error(fmt::format("{} failed with exit status {}", pass.label,
                               exit_status));
    for (const auto &line : result.diagnostic_tail)
      ctx_.log_error(fmt::format("  {}", line));
    result.final_state = machine.state();
    return result;
  };

  for (const auto &pass : plan.passes()) {
    if (!machine.transition(running_state(pass))) {
      ctx_.log_error(fmt::format("Illegal pass transition {} -> {}",
                                 to_string(machine.state()),
                                 to_string(running_state(pass))));
      plan.release_stats();
      result.final_state = machine.state();
      result.exit_status = -1;
      result.failed_pass = pass.index;
      return result;
    }

    ctx_.log_phase(fmt::format("Starting {}", pass.label));
    ctx_.session_note(fmt::format("Pass {} ({}) command: {}", pass.index,
                                  to_string(pass.purpose),
                                  render_command(Config::encoder_bin(), pass.args)));

    auto started = std::chrono::high_resolution_clock::now();
    std::unique_ptr<RunningPass> running = backend_.start(pass, ctx_);
    if (!running)
      return fail(pass, -1, {});

    ProgressMonitor::Settings settings;
    settings.target = monitor.target;
    settings.interval_ms = interval_ms;
    settings.label = pass.label;
    settings.display = Config::progress_display() && ctx_.stream_id() < 0;

    std::future<PassOutcome> watched =
        ProgressMonitor::launch(*running, std::move(settings), &ctx_);
    PassOutcome outcome = watched.get();

    long us = static_cast<long>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::high_resolution_clock::now() - started)
            .count());
    ctx_.timings().record(fmt::format("pass{}_{}", pass.index,
                                      to_string(pass.purpose)),
                          us);

    if (outcome.exit_code != 0)
      return fail(pass, outcome.exit_code, std::move(outcome.diagnostic_tail));

    machine.transition(finished_state(pass));
    ctx_.log_success(fmt::format("{} completed", pass.label));
    ctx_.session_note(fmt::format("Pass {} finished in {:.1f}s", pass.index,
                                  us / 1e6));
  }

  plan.release_stats();
  result.success = machine.state() == PassState::Complete;
  result.final_state = machine.state();
  result.exit_status = 0;
  return result;
}

} // namespace adaptive_encoder
