#include "handlers/cluster_handler.hpp"

#include <fstream>
#include <map>
#include <mutex>
#include <sstream>

#include <boost/json.hpp>
#include <fmt/format.h>

namespace kubeplane {

namespace {

monad::MyResult<boost::json::value> read_json_file(const std::string &path) {
  using ReturnType = monad::MyResult<boost::json::value>;
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs.is_open()) {
    return ReturnType::Err(monad::make_error(
        my_errors::GENERAL::NOT_FOUND, fmt::format("cannot open {}", path)));
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  boost::system::error_code ec;
  auto jv = boost::json::parse(oss.str(), ec);
  if (ec) {
    return ReturnType::Err(monad::make_error(
        my_errors::JSON::DECODE_ERROR,
        fmt::format("{} is not valid JSON: {}", path, ec.message())));
  }
  return ReturnType::Ok(std::move(jv));
}

} // namespace

// Collects cleanup outcomes of the tasks started by one action and completes
// once `expected` of them have arrived.
class ClusterHandler::OutcomeWaiter
    : public std::enable_shared_from_this<OutcomeWaiter> {
public:
  explicit OutcomeWaiter(customio::ConsoleOutput &output) : output_(output) {}

  void record(const cluster::CleanupOutcome &outcome) {
    if (outcome.succeeded) {
      output_.logger().info() << "Task " << outcome.task_id << ": "
                              << outcome.reaction << " done" << std::endl;
    } else if (outcome.last_error) {
      output_.logger().error() << "Task " << outcome.task_id << ": "
                               << outcome.reaction << " failed: "
                               << outcome.last_error->what << std::endl;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    outcomes_.push_back(outcome);
    try_finish(lock);
  }

  monad::IO<void> wait(std::size_t expected) {
    auto self = shared_from_this();
    return monad::IO<void>([self, expected](monad::IO<void>::Callback cb) {
      std::unique_lock<std::mutex> lock(self->mutex_);
      self->expected_ = expected;
      self->cb_ = std::move(cb);
      self->try_finish(lock);
    });
  }

private:
  void try_finish(std::unique_lock<std::mutex> &lock) {
    if (!cb_ || outcomes_.size() < expected_) {
      return;
    }
    auto cb = std::move(*cb_);
    cb_.reset();
    std::optional<monad::Error> failure;
    std::size_t failed = 0;
    for (const auto &outcome : outcomes_) {
      if (!outcome.succeeded) {
        ++failed;
        if (!failure && outcome.last_error) {
          failure = outcome.last_error;
        }
      }
    }
    lock.unlock();
    if (failed == 0) {
      cb(monad::MyVoidResult::Ok());
      return;
    }
    auto err = failure.value_or(monad::make_error(
        my_errors::WORKFLOW::STEP_FAILED, "task failed"));
    err.what = fmt::format("{} of {} tasks failed: {}", failed,
                           outcomes_.size(), err.what);
    cb(monad::MyVoidResult::Err(std::move(err)));
  }

  customio::ConsoleOutput &output_;
  std::mutex mutex_;
  std::vector<cluster::CleanupOutcome> outcomes_;
  std::size_t expected_{0};
  std::optional<monad::IO<void>::Callback> cb_;
};

ClusterHandler::ClusterHandler(
    CliCtx &cli_ctx, customio::ConsoleOutput &output,
    std::shared_ptr<cluster::ClusterOperations> operations,
    storage::ClusterStore &clusters,
    std::shared_ptr<workflows::RunContext> session_ctx)
    : cli_ctx_(cli_ctx), output_(output), operations_(std::move(operations)),
      clusters_(clusters), session_ctx_(std::move(session_ctx)) {}

monad::IO<void> ClusterHandler::start() {
  const std::string action = cli_ctx_.action();
  if (action == "import") {
    return handle_import();
  }
  if (action == "list") {
    return handle_list();
  }
  if (action == "show") {
    return handle_show();
  }
  if (action == "delete") {
    return handle_delete();
  }
  if (action == "delete-node") {
    return handle_delete_node();
  }
  if (action == "add-nodes") {
    return handle_add_nodes();
  }
  if (action == "tasks") {
    return handle_tasks();
  }
  return monad::IO<void>::fail(monad::make_error(
      my_errors::GENERAL::SHOW_OPT_DESC,
      "Usage: kubeplane cluster <import <file>|list|show <name>|delete "
      "<name>|delete-node <name> <node>|add-nodes <name> [--profiles-file "
      "<file>|--role --size --image --count]|tasks <name>> [--json]"));
}

std::shared_ptr<ClusterHandler::OutcomeWaiter>
ClusterHandler::watch_outcomes() {
  auto waiter = std::make_shared<OutcomeWaiter>(output_);
  operations_->set_cleanup_observer(
      [waiter](const cluster::CleanupOutcome &outcome) {
        waiter->record(outcome);
      });
  return waiter;
}

monad::IO<void> ClusterHandler::handle_import() {
  auto path = cli_ctx_.argument(0, "Cluster file");
  if (path.is_err()) {
    return monad::IO<void>::fail(std::move(path).error());
  }
  auto jv = read_json_file(path.value());
  if (jv.is_err()) {
    return monad::IO<void>::fail(std::move(jv).error());
  }
  model::Cluster cluster;
  try {
    cluster = boost::json::value_to<model::Cluster>(jv.value());
  } catch (const std::exception &ex) {
    return monad::IO<void>::fail(monad::make_error(
        my_errors::JSON::DECODE_ERROR,
        fmt::format("{}: {}", path.value(), ex.what())));
  }
  if (cluster.name.empty() || cluster.account_name.empty()) {
    return monad::IO<void>::fail(
        monad::make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                          "cluster needs a name and an accountName"));
  }
  auto name = cluster.name;
  if (auto created = clusters_.create(std::move(cluster)); created.is_err()) {
    return monad::IO<void>::fail(std::move(created).error());
  }
  output_.logger().info() << "Imported cluster " << name << std::endl;
  return monad::IO<void>::pure();
}

monad::IO<void> ClusterHandler::handle_list() {
  auto clusters = clusters_.list();
  if (clusters.is_err()) {
    return monad::IO<void>::fail(std::move(clusters).error());
  }
  if (cli_ctx_.params.json) {
    boost::json::array arr;
    for (const auto &c : clusters.value()) {
      arr.push_back(boost::json::value_from(c));
    }
    output_.out() << boost::json::serialize(arr) << std::endl;
    return monad::IO<void>::pure();
  }
  if (clusters.value().empty()) {
    output_.logger().info() << "No clusters found." << std::endl;
    return monad::IO<void>::pure();
  }
  output_.out() << fmt::format("{:<24} {:<20} {:<10} {:>7} {:>5} {:>8}\n",
                               "NAME", "ACCOUNT", "REGION", "MASTERS",
                               "NODES", "REVISION");
  for (const auto &c : clusters.value()) {
    output_.out() << fmt::format("{:<24} {:<20} {:<10} {:>7} {:>5} {:>8}\n",
                                 c.name, c.account_name, c.region,
                                 c.masters.size(), c.nodes.size(),
                                 c.revision);
  }
  output_.out().flush();
  return monad::IO<void>::pure();
}

monad::IO<void> ClusterHandler::handle_show() {
  auto name = cli_ctx_.argument(0, "Cluster name");
  if (name.is_err()) {
    return monad::IO<void>::fail(std::move(name).error());
  }
  auto cluster = clusters_.get(name.value());
  if (cluster.is_err()) {
    return monad::IO<void>::fail(std::move(cluster).error());
  }
  if (cli_ctx_.params.json) {
    output_.out() << boost::json::serialize(
                         boost::json::value_from(cluster.value()))
                  << std::endl;
    return monad::IO<void>::pure();
  }
  const auto &c = cluster.value();
  auto &out = output_.out();
  out << "Cluster " << c.name << " (revision " << c.revision << ")\n";
  out << "  Account: " << c.account_name << "\n";
  out << "  Region: " << c.region << "\n";
  out << "  Kubernetes: " << c.k8s_version << "\n";
  auto print_nodes = [&out](const char *title,
                            const std::map<std::string, model::Node> &nodes) {
    out << "  " << title << ":\n";
    for (const auto &[node_name, node] : nodes) {
      out << fmt::format("    {:<32} {:<10} {:<16} {}\n", node_name, node.size,
                         node.public_ip, node.state);
    }
  };
  print_nodes("Masters", c.masters);
  print_nodes("Nodes", c.nodes);
  out.flush();
  return monad::IO<void>::pure();
}

monad::IO<void> ClusterHandler::handle_delete() {
  auto name = cli_ctx_.argument(0, "Cluster name");
  if (name.is_err()) {
    return monad::IO<void>::fail(std::move(name).error());
  }
  auto waiter = watch_outcomes();
  auto submitted = operations_->delete_cluster(name.value(), session_ctx_);
  if (submitted.is_err()) {
    return monad::IO<void>::fail(std::move(submitted).error());
  }
  return waiter->wait(1);
}

monad::IO<void> ClusterHandler::handle_delete_node() {
  auto name = cli_ctx_.argument(0, "Cluster name");
  if (name.is_err()) {
    return monad::IO<void>::fail(std::move(name).error());
  }
  auto node = cli_ctx_.argument(1, "Node name");
  if (node.is_err()) {
    return monad::IO<void>::fail(std::move(node).error());
  }
  auto waiter = watch_outcomes();
  auto submitted = operations_->delete_node(name.value(), node.value(),
                                            session_ctx_);
  if (submitted.is_err()) {
    return monad::IO<void>::fail(std::move(submitted).error());
  }
  return waiter->wait(1);
}

ClusterHandler::AddNodesOptions ClusterHandler::parse_add_nodes_options() {
  AddNodesOptions opts;
  po::options_description desc("cluster add-nodes options");
  desc.add_options()                                                   //
      ("profiles-file", po::value<std::string>(),                      //
       "JSON array of node profiles")                                  //
      ("role", po::value<std::string>(&opts.role)->default_value("node"),
       "master or node")                                               //
      ("size", po::value<std::string>(&opts.size), "Machine size")     //
      ("image", po::value<std::string>(&opts.image), "Machine image")  //
      ("count", po::value<int>(&opts.count)->default_value(1),         //
       "Number of nodes");
  try {
    auto args = filter_tokens(cli_ctx_.unrecognized,
                              std::vector<std::string>{command(), "add-nodes"});
    po::variables_map vm;
    po::store(po::command_line_parser(args)
                  .options(desc)
                  .allow_unregistered()
                  .run(),
              vm);
    po::notify(vm);
    if (vm.count("profiles-file")) {
      opts.profiles_file = vm["profiles-file"].as<std::string>();
    }
  } catch (const std::exception &ex) {
    output_.logger().warning()
        << "Failed to parse cluster add-nodes options: " << ex.what()
        << std::endl;
  }
  return opts;
}

monad::MyResult<std::vector<model::NodeProfile>>
ClusterHandler::load_profiles(const AddNodesOptions &options) {
  using ReturnType = monad::MyResult<std::vector<model::NodeProfile>>;
  std::vector<model::NodeProfile> profiles;
  if (options.profiles_file) {
    auto jv = read_json_file(*options.profiles_file);
    if (jv.is_err()) {
      return ReturnType::Err(std::move(jv).error());
    }
    auto *arr = jv.value().if_array();
    if (!arr) {
      return ReturnType::Err(monad::make_error(
          my_errors::JSON::DECODE_ERROR,
          fmt::format("{} must hold an array of profiles",
                      *options.profiles_file)));
    }
    for (const auto &entry : *arr) {
      profiles.push_back(boost::json::value_to<model::NodeProfile>(entry));
    }
    return ReturnType::Ok(std::move(profiles));
  }

  auto role = model::parse_node_role(options.role);
  if (!role) {
    return ReturnType::Err(
        monad::make_error(my_errors::GENERAL::INVALID_ARGUMENT,
                          fmt::format("unknown role {}", options.role)));
  }
  if (options.count < 1) {
    return ReturnType::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ARGUMENT, "--count must be at least 1"));
  }
  model::NodeProfile profile;
  profile.role = *role;
  profile.size = options.size;
  profile.image = options.image;
  profiles.assign(static_cast<std::size_t>(options.count), profile);
  return ReturnType::Ok(std::move(profiles));
}

monad::IO<void> ClusterHandler::handle_add_nodes() {
  auto name = cli_ctx_.argument(0, "Cluster name");
  if (name.is_err()) {
    return monad::IO<void>::fail(std::move(name).error());
  }
  auto profiles = load_profiles(parse_add_nodes_options());
  if (profiles.is_err()) {
    return monad::IO<void>::fail(std::move(profiles).error());
  }
  auto waiter = watch_outcomes();
  auto task_ids = operations_->add_nodes(name.value(), profiles.value(),
                                         session_ctx_);
  if (task_ids.is_err()) {
    return monad::IO<void>::fail(std::move(task_ids).error());
  }
  return waiter->wait(task_ids.value().size());
}

monad::IO<void> ClusterHandler::handle_tasks() {
  auto name = cli_ctx_.argument(0, "Cluster name");
  if (name.is_err()) {
    return monad::IO<void>::fail(std::move(name).error());
  }
  auto views = operations_->cluster_tasks(name.value());
  if (views.is_err()) {
    return monad::IO<void>::fail(std::move(views).error());
  }
  if (cli_ctx_.params.json) {
    output_.out() << boost::json::serialize(
                         boost::json::value_from(views.value()))
                  << std::endl;
    return monad::IO<void>::pure();
  }
  output_.out() << fmt::format("{:<40} {:<32} {}\n", "ID", "TYPE", "STATUS");
  for (const auto &view : views.value()) {
    output_.out() << fmt::format("{:<40} {:<32} {}\n", view.id, view.type,
                                 workflows::to_string(view.status));
  }
  output_.out().flush();
  return monad::IO<void>::pure();
}

} // namespace kubeplane
