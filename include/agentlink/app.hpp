#pragma once

#include "agentlink/bridge.hpp"
#include "agentlink/clock.hpp"
#include "agentlink/config.hpp"

#include <string>

namespace agentlink {

/// Command-line driver. Loads the config, connects, logs server events and
/// reads commands from stdin:
///
///   <text>                send input
///   /allow <id>           approve a permission request
///   /always <id>          approve and remember
///   /deny <id>            deny a permission request
///   /mode <mode>          set the session permission mode
///   /model <name>         switch model
///   /interrupt, /stop, /ping, /cancel
///   /offline, /online     simulate connectivity changes
///   /flush                replay the offline queue
///   /quit
class App {
  public:
    App();
    ~App();

    /// Run until /quit or end of input. Returns exit code (0 = success).
    int run(int argc, char *argv[]);

  private:
    /// Handle one input line. Returns false to quit.
    bool handle_command(Bridge &bridge, const std::string &line);

    void log_message(const protocol::ServerMessage &message);

    BridgeConfig config_;
    StaticConnectivity connectivity_{true};
};

} // namespace agentlink
