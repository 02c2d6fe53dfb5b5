/**
 * @file orchestrator.hpp
 * @brief Pass state machine and plan execution
 *
 * @details Legal transitions:
 *
 *          Idle -> Pass1Running -> Pass1Complete -> Pass2Running -> Complete
 *
 *          Idle -> SinglePassRunning -> Complete
 *
 *          Pass1Running | Pass2Running | SinglePassRunning -> Failed
 *
 *          Each pass runs as an encoder subprocess watched by one
 *          ProgressMonitor task; the orchestrator waits on that task's
 *          future before deciding the next transition.
 *
 * @attention A failed pass ends the plan. Pass 2 never starts after a pass 1
 *            failure and nothing is retried.
 */

#ifndef ADAPTIVE_ENCODER_ORCHESTRATOR_HPP
#define ADAPTIVE_ENCODER_ORCHESTRATOR_HPP

#include <string>
#include <vector>

#include "encoder_backend.hpp"
#include "pass_plan.hpp"
#include "progress.hpp"

namespace adaptive_encoder {

class RunContext;

enum class PassState {
  Idle,
  Pass1Running,
  Pass1Complete,
  Pass2Running,
  SinglePassRunning,
  Complete,
  Failed
};

const char *to_string(PassState state);

bool is_legal_transition(PassState from, PassState to);

/**
 * @class PassStateMachine
 * @brief Current PassState; rejects illegal transitions.
 */
class PassStateMachine {
  PassState state_ = PassState::Idle;

public:
  PassState state() const { return state_; }

  /// @return false (state unchanged) when the transition is illegal
  bool transition(PassState next);
};

/**
 * @struct MonitorOptions
 * @brief Inputs for progress estimation and the poll interval.
 */
struct MonitorOptions {
  ProgressTarget target;
  int width = 0;
  int height = 0;
  double complexity_score = NEUTRAL_COMPLEXITY_SCORE;
  int interval_override_ms = 0; //< >0 replaces update_interval()
};

/**
 * @struct OrchestratorResult
 */
struct OrchestratorResult {
  bool success = false;
  PassState final_state = PassState::Idle;
  int exit_status = 0;
  int failed_pass = 0; //< 1-based index, 0 when none failed
  std::vector<std::string> diagnostic_tail;
};

/**
 * @class PassOrchestrator
 * @brief Runs a PassPlan against an EncoderBackend.
 */
class PassOrchestrator {
  EncoderBackend &backend_;
  RunContext &ctx_;

public:
  PassOrchestrator(EncoderBackend &backend, RunContext &ctx)
      : backend_(backend), ctx_(ctx) {}

  /**
   * @brief Execute every pass in order.
   * @details The plan's stats artifacts are released before returning,
   *          on success and on failure.
   */
  OrchestratorResult execute(PassPlan &plan, const MonitorOptions &monitor);
};

} // namespace adaptive_encoder

#endif // ADAPTIVE_ENCODER_ORCHESTRATOR_HPP
