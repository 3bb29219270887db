#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "result_monad.hpp"
#include "workflows/step.hpp"
#include "workflows/steps/command_runner.hpp"

namespace kubeplane::workflows::steps {

// Step backed by an external command. argv and env values are templates;
// "{name}" is resolved through StepConfig::lookup when the step runs, e.g.
//
//   {"doctl", "compute", "droplet", "delete", "{node_name}", "--force"}
//
// An unresolved placeholder fails the step before anything is executed.
class ShellCommandStep : public IStep {
public:
  static constexpr std::chrono::seconds kDefaultTimeout{30};

  struct Definition {
    std::string name;
    std::string description;
    std::vector<std::string> argv;
    std::map<std::string, std::string> env;
    std::chrono::seconds timeout{0}; // 0: kDefaultTimeout
  };

  ShellCommandStep(Definition definition,
                   std::shared_ptr<CommandRunner> runner);

  std::string name() const override { return definition_.name; }
  std::string description() const override {
    return definition_.description;
  }

  monad::IO<void> run(RunContext::Ptr ctx, const StepConfig &config,
                      ILogSink::Ptr sink) override;

  // Template expansion against `config`; VALIDATION_FAILED lists every
  // placeholder that could not be resolved.
  monad::MyResult<CommandSpec> render(const StepConfig &config) const;

  const Definition &definition() const { return definition_; }

private:
  Definition definition_;
  std::shared_ptr<CommandRunner> runner_;
};

} // namespace kubeplane::workflows::steps
