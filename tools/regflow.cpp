#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>

#include "config/settings.hpp"
#include "flow/walkthrough.hpp"
#include "rpc/client.hpp"
#include "rpc/node_client.hpp"
#include "util/logging.hpp"

namespace {

void ConfigureLogging(const regflow::config::Settings& settings) {
  auto& logger = regflow::util::GetLogger();
  logger.SetThreshold(regflow::util::ParseLogLevelString(settings.log_level));
  if (!settings.debug_log_path.empty()) {
    logger.EnableFile(settings.debug_log_path);
  }
}

regflow::rpc::RpcEndpoint EndpointFrom(const regflow::config::Settings& settings) {
  regflow::rpc::RpcEndpoint endpoint;
  endpoint.host = settings.rpc_host;
  endpoint.port = regflow::config::EffectiveRpcPort(settings);
  endpoint.user = settings.rpc_user;
  endpoint.password = settings.rpc_pass;
  endpoint.timeout_ms = settings.rpc_timeout_ms;
  return endpoint;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    bool show_help = false;
    const auto settings = regflow::config::ParseCommandLine(argc, argv, &show_help);
    if (show_help) {
      regflow::config::PrintUsage(std::cout);
      return 0;
    }
    ConfigureLogging(settings);

    regflow::rpc::NodeClient node(
        std::make_unique<regflow::rpc::JsonRpcClient>(EndpointFrom(settings)));
    regflow::flow::RunWalkthrough(node, settings);
  } catch (const std::exception& ex) {
    std::cerr << "regflow: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
