#include "workflows/steps/shell_command_step.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "my_error_codes.hpp"
#include "util/string_util.hpp"

namespace kubeplane::workflows::steps {

ShellCommandStep::ShellCommandStep(Definition definition,
                                   std::shared_ptr<CommandRunner> runner)
    : definition_(std::move(definition)), runner_(std::move(runner)) {}

monad::MyResult<CommandSpec>
ShellCommandStep::render(const StepConfig &config) const {
  std::vector<std::string> missing;
  auto lookup = [&config](const std::string &key) { return config.lookup(key); };

  CommandSpec spec;
  for (const auto &arg : definition_.argv) {
    spec.argv.push_back(stringutil::expand_placeholders(arg, lookup, missing));
  }
  for (const auto &[key, value] : definition_.env) {
    spec.env[key] = stringutil::expand_placeholders(value, lookup, missing);
  }
  spec.timeout = definition_.timeout.count() > 0 ? definition_.timeout
                                                 : kDefaultTimeout;

  if (!missing.empty()) {
    std::string names;
    for (const auto &m : missing) {
      if (!names.empty()) {
        names += ", ";
      }
      names += "{" + m + "}";
    }
    return monad::MyResult<CommandSpec>::Err(monad::make_error(
        my_errors::WORKFLOW::VALIDATION_FAILED,
        fmt::format("step {}: unresolved {}", definition_.name, names)));
  }
  if (spec.argv.empty() || spec.argv.front().empty()) {
    return monad::MyResult<CommandSpec>::Err(
        monad::make_error(my_errors::WORKFLOW::VALIDATION_FAILED,
                          fmt::format("step {}: empty command", definition_.name)));
  }
  return monad::MyResult<CommandSpec>::Ok(std::move(spec));
}

monad::IO<void> ShellCommandStep::run(RunContext::Ptr ctx,
                                      const StepConfig &config,
                                      ILogSink::Ptr sink) {
  using ReturnIO = monad::IO<void>;
  if (!runner_) {
    return ReturnIO::fail(monad::make_error(
        my_errors::GENERAL::POINTER_IS_NULL,
        fmt::format("step {} has no command runner", definition_.name)));
  }
  auto spec = render(config);
  if (spec.is_err()) {
    return ReturnIO::fail(std::move(spec).error());
  }
  // env values may carry credentials; only argv is echoed
  sink->write(fmt::format("$ {}", fmt::join(spec.value().argv, " ")));
  return runner_->run(std::move(spec).value(), std::move(ctx),
                      std::move(sink));
}

} // namespace kubeplane::workflows::steps
