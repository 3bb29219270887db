#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/json.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include "accounts/account_getter.hpp"
#include "conf/kubeplane_config.hpp"
#include "customio/console_output.hpp"
#include "model/cluster.hpp"
#include "result_monad.hpp"
#include "storage/cluster_store.hpp"
#include "workflows/log_sink.hpp"
#include "workflows/node_provisioner.hpp"
#include "workflows/run_context.hpp"
#include "workflows/task_completion.hpp"
#include "workflows/task_engine.hpp"
#include "workflows/task_repository.hpp"

namespace kubeplane::cluster {

namespace json = boost::json;
namespace src = boost::log::sources;
namespace trivial = boost::log::trivial;

// Follow-up work attached to a task completion is retried this many times,
// `retry_delay` apart, and then given up.
struct CleanupPolicy {
  int max_attempts{3};
  std::chrono::milliseconds retry_delay{500};
};

// Reported once per finished task. A task that failed is reported with
// `attempts` 0 and the task error; its reaction never runs.
struct CleanupOutcome {
  std::string reaction; // "remove cluster", "remove node", "add node"
  std::string cluster_name;
  std::string task_id;
  bool succeeded{false};
  int attempts{0};
  std::optional<monad::Error> last_error;
};

// Listing row of `cluster tasks`.
struct TaskView {
  std::string id;
  std::string type;
  workflows::TaskStatus status{workflows::TaskStatus::Pending};
  std::vector<workflows::StepStatus> steps_statuses;

  static TaskView from(const workflows::Task &task);
};

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const TaskView &view);

struct Submitted {
  std::string task_id;
  workflows::TaskCompletion::Ptr completion;
};

// Cluster level operations: start the provider workflow and, once it has
// finished, bring the stored cluster record in line with the result.
class ClusterOperations
    : public std::enable_shared_from_this<ClusterOperations> {
public:
  using CleanupObserver = std::function<void(const CleanupOutcome &)>;

  ClusterOperations(std::shared_ptr<workflows::TaskEngine> engine,
                    workflows::NodeProvisioner &provisioner,
                    storage::ClusterStore &clusters,
                    workflows::TaskRepository &tasks,
                    accounts::IAccountGetter &accounts,
                    workflows::ILogSinkFactory &sink_factory,
                    IKubeplaneConfigProvider &config_provider,
                    customio::ConsoleOutput &output);

  void set_cleanup_observer(CleanupObserver observer);
  void set_cleanup_policy(CleanupPolicy policy);
  const CleanupPolicy &cleanup_policy() const { return policy_; }

  // DeleteCluster workflow. On success the cluster record and every task of
  // the cluster are removed.
  monad::MyResult<Submitted> delete_cluster(const std::string &name,
                                            workflows::RunContext::Ptr ctx = nullptr);

  // DeleteNode workflow for a worker node. Masters are refused. On success
  // the node is dropped from the cluster record.
  monad::MyResult<Submitted> delete_node(const std::string &cluster_name,
                                         const std::string &node_name,
                                         workflows::RunContext::Ptr ctx = nullptr);

  // ProvisionNode workflow per profile; each provisioned node is added to
  // the cluster record when its task succeeds.
  monad::MyResult<std::vector<std::string>>
  add_nodes(const std::string &cluster_name,
            const std::vector<model::NodeProfile> &profiles,
            workflows::RunContext::Ptr ctx = nullptr);

  // NOT_FOUND when the cluster has no tasks.
  monad::MyResult<std::vector<TaskView>>
  cluster_tasks(const std::string &cluster_name);

  monad::MyResult<std::size_t>
  purge_cluster_tasks(const std::string &cluster_name);

private:
  struct CleanupState {
    CleanupOutcome outcome;
    std::function<monad::MyVoidResult()> action;
  };

  struct Prepared {
    model::Cluster cluster;
    workflows::StepConfig config;
  };

  monad::MyResult<Prepared> prepare(const std::string &cluster_name);
  monad::MyResult<Submitted> start(const std::string &kind,
                                   workflows::StepConfig config,
                                   workflows::RunContext::Ptr ctx);

  void schedule_cleanup(std::string reaction, std::string cluster_name,
                        std::string task_id,
                        std::function<monad::MyVoidResult()> action);
  void attempt_cleanup(std::shared_ptr<CleanupState> state);
  void report_task_failure(const std::string &reaction,
                           const std::string &cluster_name,
                           const std::string &task_id,
                           const monad::Error &error);
  void report(const CleanupOutcome &outcome);

  std::shared_ptr<workflows::TaskEngine> engine_;
  workflows::NodeProvisioner &provisioner_;
  storage::ClusterStore &clusters_;
  workflows::TaskRepository &tasks_;
  accounts::IAccountGetter &accounts_;
  workflows::ILogSinkFactory &sink_factory_;
  IKubeplaneConfigProvider &config_provider_;
  customio::ConsoleOutput &output_;
  CleanupPolicy policy_;
  std::mutex observer_mutex_;
  CleanupObserver observer_;
  src::severity_logger<trivial::severity_level> lg_;
};

} // namespace kubeplane::cluster
