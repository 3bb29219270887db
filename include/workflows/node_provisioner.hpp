#pragma once

#include <memory>
#include <string>
#include <vector>

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include "customio/console_output.hpp"
#include "model/cluster.hpp"
#include "model/node.hpp"
#include "result_monad.hpp"
#include "workflows/log_sink.hpp"
#include "workflows/run_context.hpp"
#include "workflows/step_config.hpp"
#include "workflows/task_completion.hpp"
#include "workflows/task_engine.hpp"

namespace kubeplane::workflows {

// Fans a list of node profiles out into one ProvisionNode task per node.
class NodeProvisioner {
public:
  NodeProvisioner(std::shared_ptr<TaskEngine> engine,
                  ILogSinkFactory &sink_factory,
                  customio::ConsoleOutput &output);

  // Returns the ids of the started tasks in profile order as soon as every
  // task is running. Stops at the first failure; tasks started before it
  // keep running. `on_node_done` is attached to each started task.
  monad::MyResult<std::vector<std::string>>
  provision_nodes(RunContext::Ptr ctx,
                  const std::vector<model::NodeProfile> &profiles,
                  const model::Cluster &cluster, const StepConfig &config,
                  TaskCompletion::Continuation on_node_done = {});

  // "<cluster>-<role>-<8 hex>"
  static std::string generate_node_name(const std::string &cluster_name,
                                        model::NodeRole role);

private:
  std::shared_ptr<TaskEngine> engine_;
  ILogSinkFactory &sink_factory_;
  customio::ConsoleOutput &output_;
  src::severity_logger<trivial::severity_level> lg_;
};

} // namespace kubeplane::workflows
