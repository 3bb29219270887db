#include "cluster/cluster_operations.hpp"

#include <iterator>
#include <map>
#include <random>

#include <boost/log/sources/record_ostream.hpp>
#include <fmt/format.h>

#include "io_monad.hpp"
#include "my_error_codes.hpp"

namespace kubeplane::cluster {

namespace {

const model::Node &random_master(const std::map<std::string, model::Node> &masters) {
  static thread_local std::mt19937 gen{std::random_device{}()};
  std::uniform_int_distribution<std::size_t> dist(0, masters.size() - 1);
  auto it = masters.begin();
  std::advance(it, dist(gen));
  return it->second;
}

bool is_not_found(const monad::Error &err) {
  return err.code == my_errors::GENERAL::NOT_FOUND;
}

} // namespace

TaskView TaskView::from(const workflows::Task &task) {
  return TaskView{task.id, task.type, task.status, task.steps_statuses};
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const TaskView &view) {
  json::array steps;
  for (const auto &status : view.steps_statuses) {
    steps.push_back(json::value_from(status));
  }
  jv = json::object{{"id", view.id},
                    {"type", view.type},
                    {"status", workflows::to_string(view.status)},
                    {"stepsStatuses", std::move(steps)}};
}

ClusterOperations::ClusterOperations(
    std::shared_ptr<workflows::TaskEngine> engine,
    workflows::NodeProvisioner &provisioner, storage::ClusterStore &clusters,
    workflows::TaskRepository &tasks, accounts::IAccountGetter &accounts,
    workflows::ILogSinkFactory &sink_factory,
    IKubeplaneConfigProvider &config_provider, customio::ConsoleOutput &output)
    : engine_(std::move(engine)), provisioner_(provisioner),
      clusters_(clusters), tasks_(tasks), accounts_(accounts),
      sink_factory_(sink_factory), config_provider_(config_provider),
      output_(output) {
  const auto &config = config_provider_.get();
  CleanupPolicy policy;
  policy.max_attempts = config.cleanup_max_attempts;
  policy.retry_delay =
      std::chrono::milliseconds(config.cleanup_retry_delay_ms);
  set_cleanup_policy(policy);
}

void ClusterOperations::set_cleanup_observer(CleanupObserver observer) {
  std::lock_guard<std::mutex> lock(observer_mutex_);
  observer_ = std::move(observer);
}

void ClusterOperations::set_cleanup_policy(CleanupPolicy policy) {
  if (policy.max_attempts < 1) {
    policy.max_attempts = 1;
  }
  if (policy.retry_delay < std::chrono::milliseconds::zero()) {
    policy.retry_delay = std::chrono::milliseconds::zero();
  }
  policy_ = policy;
}

monad::MyResult<ClusterOperations::Prepared>
ClusterOperations::prepare(const std::string &cluster_name) {
  using ReturnType = monad::MyResult<Prepared>;
  auto cluster = clusters_.get(cluster_name);
  if (cluster.is_err()) {
    return ReturnType::Err(std::move(cluster).error());
  }
  auto account = accounts_.get(cluster.value().account_name);
  if (account.is_err()) {
    return ReturnType::Err(std::move(account).error());
  }
  auto config =
      workflows::step_config_from_cluster(cluster.value(), account.value());
  if (auto filled =
          accounts::fill_cloud_account_credentials(account.value(), config);
      filled.is_err()) {
    return ReturnType::Err(std::move(filled).error());
  }
  config.timeout_seconds = config_provider_.get().task_timeout_seconds;
  return ReturnType::Ok(
      Prepared{std::move(cluster).value(), std::move(config)});
}

monad::MyResult<Submitted>
ClusterOperations::start(const std::string &kind, workflows::StepConfig config,
                         workflows::RunContext::Ptr ctx) {
  using ReturnType = monad::MyResult<Submitted>;
  auto task = engine_->create(kind);
  if (task.is_err()) {
    return ReturnType::Err(std::move(task).error());
  }
  auto task_id = task.value().id;
  auto sink = sink_factory_.open(task_id);
  if (sink.is_err()) {
    return ReturnType::Err(std::move(sink).error());
  }
  workflows::ILogSink::Ptr task_sink = std::move(sink).value();
  auto completion = engine_->run(std::move(task).value(), std::move(config),
                                 task_sink, std::move(ctx));
  if (completion.is_err()) {
    task_sink->close();
    return ReturnType::Err(std::move(completion).error());
  }
  return ReturnType::Ok(Submitted{task_id, std::move(completion).value()});
}

monad::MyResult<Submitted>
ClusterOperations::delete_cluster(const std::string &name,
                                  workflows::RunContext::Ptr ctx) {
  using ReturnType = monad::MyResult<Submitted>;
  auto prepared = prepare(name);
  if (prepared.is_err()) {
    return ReturnType::Err(std::move(prepared).error());
  }
  auto config = std::move(prepared).value().config;
  auto kind = engine_->registry().resolve(config.provider,
                                          workflows::WorkflowIntent::DeleteCluster);
  if (kind.is_err()) {
    return ReturnType::Err(std::move(kind).error());
  }
  auto submitted = start(kind.value(), std::move(config), std::move(ctx));
  if (submitted.is_err()) {
    return submitted;
  }

  auto self = shared_from_this();
  submitted.value().completion->on_complete(
      [self, name](const workflows::Task &task,
                   const workflows::TaskCompletion::RunResult &result) {
        if (result.is_err()) {
          self->output_.logger().warning()
              << "Cluster " << name << " was not deleted, task " << task.id
              << " failed: " << result.error().what << std::endl;
          self->report_task_failure("remove cluster", name, task.id,
                                    result.error());
          return;
        }
        self->schedule_cleanup(
            "remove cluster", name, task.id, [self, name]() {
              auto removed = self->clusters_.remove(name);
              if (removed.is_err() && !is_not_found(removed.error())) {
                return removed;
              }
              auto purged = self->tasks_.delete_by_cluster(name);
              if (purged.is_err()) {
                return monad::MyVoidResult::Err(std::move(purged).error());
              }
              BOOST_LOG_SEV(self->lg_, trivial::info)
                  << "cluster " << name << " removed with "
                  << purged.value() << " tasks";
              return monad::MyVoidResult::Ok();
            });
      });
  output_.logger().info() << "Deleting cluster " << name << " (task "
                          << submitted.value().task_id << ")" << std::endl;
  return submitted;
}

monad::MyResult<Submitted>
ClusterOperations::delete_node(const std::string &cluster_name,
                               const std::string &node_name,
                               workflows::RunContext::Ptr ctx) {
  using ReturnType = monad::MyResult<Submitted>;
  auto prepared = prepare(cluster_name);
  if (prepared.is_err()) {
    return ReturnType::Err(std::move(prepared).error());
  }
  auto [cluster, config] = std::move(prepared).value();
  if (cluster.is_master(node_name)) {
    return ReturnType::Err(
        monad::make_error(my_errors::WORKFLOW::VALIDATION_FAILED,
                          "delete master node not allowed"));
  }
  auto node_it = cluster.nodes.find(node_name);
  if (node_it == cluster.nodes.end()) {
    return ReturnType::Err(monad::make_error(
        my_errors::GENERAL::NOT_FOUND,
        fmt::format("node {} not found in cluster {}", node_name,
                    cluster_name)));
  }
  config.node = node_it->second;

  auto kind = engine_->registry().resolve(config.provider,
                                          workflows::WorkflowIntent::DeleteNode);
  if (kind.is_err()) {
    return ReturnType::Err(std::move(kind).error());
  }
  auto submitted = start(kind.value(), std::move(config), std::move(ctx));
  if (submitted.is_err()) {
    return submitted;
  }

  auto self = shared_from_this();
  submitted.value().completion->on_complete(
      [self, cluster_name,
       node_name](const workflows::Task &task,
                  const workflows::TaskCompletion::RunResult &result) {
        if (result.is_err()) {
          self->output_.logger().warning()
              << "Node " << node_name << " of cluster " << cluster_name
              << " was not deleted, task " << task.id
              << " failed: " << result.error().what << std::endl;
          self->report_task_failure("remove node", cluster_name, task.id,
                                    result.error());
          return;
        }
        self->schedule_cleanup(
            "remove node", cluster_name, task.id,
            [self, cluster_name, node_name]() {
              auto mutated = self->clusters_.mutate(
                  cluster_name, [&node_name](model::Cluster &c) {
                    c.nodes.erase(node_name);
                    return monad::MyVoidResult::Ok();
                  });
              if (mutated.is_err() && !is_not_found(mutated.error())) {
                return monad::MyVoidResult::Err(std::move(mutated).error());
              }
              return monad::MyVoidResult::Ok();
            });
      });
  output_.logger().info() << "Deleting node " << node_name << " of cluster "
                          << cluster_name << " (task "
                          << submitted.value().task_id << ")" << std::endl;
  return submitted;
}

monad::MyResult<std::vector<std::string>>
ClusterOperations::add_nodes(const std::string &cluster_name,
                             const std::vector<model::NodeProfile> &profiles,
                             workflows::RunContext::Ptr ctx) {
  using ReturnType = monad::MyResult<std::vector<std::string>>;
  auto prepared = prepare(cluster_name);
  if (prepared.is_err()) {
    return ReturnType::Err(std::move(prepared).error());
  }
  auto [cluster, config] = std::move(prepared).value();
  if (cluster.masters.empty()) {
    return ReturnType::Err(
        monad::make_error(my_errors::GENERAL::NOT_FOUND, "no master found"));
  }
  config.add_master(random_master(cluster.masters));

  auto self = shared_from_this();
  auto on_node_done =
      [self, cluster_name](const workflows::Task &task,
                           const workflows::TaskCompletion::RunResult &result) {
        if (!task.config.node) {
          return;
        }
        const auto node = *task.config.node;
        if (result.is_err()) {
          self->output_.logger().warning()
              << "Node " << node.name << " of cluster " << cluster_name
              << " was not provisioned, task " << task.id
              << " failed: " << result.error().what << std::endl;
          self->report_task_failure("add node", cluster_name, task.id,
                                    result.error());
          return;
        }
        self->schedule_cleanup(
            "add node", cluster_name, task.id, [self, cluster_name, node]() {
              auto mutated = self->clusters_.mutate(
                  cluster_name, [&node](model::Cluster &c) {
                    if (node.role == model::NodeRole::Master) {
                      c.masters[node.name] = node;
                    } else {
                      c.nodes[node.name] = node;
                    }
                    return monad::MyVoidResult::Ok();
                  });
              if (mutated.is_err()) {
                return monad::MyVoidResult::Err(std::move(mutated).error());
              }
              return monad::MyVoidResult::Ok();
            });
      };

  return provisioner_.provision_nodes(std::move(ctx), profiles, cluster, config,
                                      std::move(on_node_done));
}

monad::MyResult<std::vector<TaskView>>
ClusterOperations::cluster_tasks(const std::string &cluster_name) {
  using ReturnType = monad::MyResult<std::vector<TaskView>>;
  auto tasks = tasks_.list_by_cluster(cluster_name);
  if (tasks.is_err()) {
    return ReturnType::Err(std::move(tasks).error());
  }
  if (tasks.value().empty()) {
    return ReturnType::Err(monad::make_error(
        my_errors::GENERAL::NOT_FOUND,
        fmt::format("no tasks found for cluster {}", cluster_name)));
  }
  std::vector<TaskView> views;
  for (const auto &task : tasks.value()) {
    views.push_back(TaskView::from(task));
  }
  return ReturnType::Ok(std::move(views));
}

monad::MyResult<std::size_t>
ClusterOperations::purge_cluster_tasks(const std::string &cluster_name) {
  return tasks_.delete_by_cluster(cluster_name);
}

void ClusterOperations::schedule_cleanup(
    std::string reaction, std::string cluster_name, std::string task_id,
    std::function<monad::MyVoidResult()> action) {
  auto state = std::make_shared<CleanupState>();
  state->outcome.reaction = std::move(reaction);
  state->outcome.cluster_name = std::move(cluster_name);
  state->outcome.task_id = std::move(task_id);
  state->action = std::move(action);
  attempt_cleanup(std::move(state));
}

void ClusterOperations::attempt_cleanup(std::shared_ptr<CleanupState> state) {
  auto &outcome = state->outcome;
  ++outcome.attempts;
  auto r = state->action();
  if (r.is_ok()) {
    outcome.succeeded = true;
    outcome.last_error.reset();
    report(outcome);
    return;
  }

  outcome.last_error = r.error();
  BOOST_LOG_SEV(lg_, trivial::warning)
      << outcome.reaction << " for cluster " << outcome.cluster_name
      << " (task " << outcome.task_id << ") attempt " << outcome.attempts
      << "/" << policy_.max_attempts << " failed: " << r.error().what;
  output_.logger().warning()
      << "Cleanup '" << outcome.reaction << "' for cluster "
      << outcome.cluster_name << " failed: " << r.error().what << std::endl;

  if (outcome.attempts >= policy_.max_attempts) {
    report(outcome);
    return;
  }

  auto self = shared_from_this();
  monad::delay_for<void>(engine_->ioc(), policy_.retry_delay)
      .run([self, state](auto) { self->attempt_cleanup(state); });
}

void ClusterOperations::report_task_failure(const std::string &reaction,
                                            const std::string &cluster_name,
                                            const std::string &task_id,
                                            const monad::Error &error) {
  CleanupOutcome outcome;
  outcome.reaction = reaction;
  outcome.cluster_name = cluster_name;
  outcome.task_id = task_id;
  outcome.last_error = error;
  report(outcome);
}

void ClusterOperations::report(const CleanupOutcome &outcome) {
  if (!outcome.succeeded && outcome.attempts > 0) {
    output_.logger().error()
        << "Giving up cleanup '" << outcome.reaction << "' for cluster "
        << outcome.cluster_name << " after " << outcome.attempts
        << " attempts" << std::endl;
  }
  CleanupObserver observer;
  {
    std::lock_guard<std::mutex> lock(observer_mutex_);
    observer = observer_;
  }
  if (observer) {
    observer(outcome);
  }
}

} // namespace kubeplane::cluster
