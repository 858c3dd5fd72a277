#include <chrono>

#include "../../capability/capability_store.hpp"
#include "../../connection/connection_registry.hpp"
#include "../../invocation/pending_invocations.hpp"
#include "../../rpc/dispatcher.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace nodegate {
namespace http {

//=============================================================================
// GET /v0/runtime/status
//=============================================================================
void HttpServer::handle_get_runtime_status(const httplib::Request &, httplib::Response &res) {
    auto now = std::chrono::steady_clock::now();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - start_time_).count();

    const auto &invoke_config = dispatcher_.config();

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"name", runtime_name_},
                               {"instance_tag", dispatcher_.instance_tag()},
                               {"uptime_seconds", uptime},
                               {"connection_count", connections_.count()},
                               {"node_count", capabilities_.connection_count()},
                               {"device_count", capabilities_.device_count()},
                               {"pending_invocations", invocations_.size()},
                               {"default_timeout_ms", invoke_config.default_timeout_ms},
                               {"max_timeout_ms", invoke_config.max_timeout_ms}};

    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace nodegate
