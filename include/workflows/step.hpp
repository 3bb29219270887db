#pragma once

#include <memory>
#include <string>

#include "io_monad.hpp"
#include "workflows/log_sink.hpp"
#include "workflows/run_context.hpp"
#include "workflows/step_config.hpp"

namespace kubeplane::workflows {

// Unit of provider work. Implementations must honour `ctx`: once it is
// cancelled the engine stops waiting and any late result is ignored.
//
// `config` is only valid for the duration of the call, so copy what the
// returned IO needs. `sink` may already be closed when a late step writes.
class IStep {
public:
  using Ptr = std::shared_ptr<IStep>;

  virtual ~IStep() = default;
  virtual std::string name() const = 0;
  virtual std::string description() const = 0;
  virtual monad::IO<void> run(RunContext::Ptr ctx, const StepConfig &config,
                              ILogSink::Ptr sink) = 0;
};

} // namespace kubeplane::workflows
