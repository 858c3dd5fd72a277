#include "../../capability/capability_store.hpp"
#include "../../rpc/json_rpc.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace nodegate {
namespace http {

//=============================================================================
// GET /v0/nodes
//=============================================================================
void HttpServer::handle_get_nodes(const httplib::Request &, httplib::Response &res) {
    auto entries = capabilities_.get_all();

    nlohmann::json nodes_json = nlohmann::json::array();
    for (const auto &entry : entries) {
        nodes_json.push_back(rpc::encode_connection_capabilities(entry));
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"nodes", nodes_json},
                               {"node_count", entries.size()}};

    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace nodegate
