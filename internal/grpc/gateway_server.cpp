#include "gateway_server.hpp"
#include "grpc_error.hpp"

namespace fieldsync::grpc {

GatewayServer::GatewayServer(std::shared_ptr<fieldsync::api::FieldApi> api)
    : api_(std::move(api)) {}

::grpc::Status GatewayServer::Handle(::grpc::ServerContext*,
                                     const fieldsync::v1::HttpRequest* req,
                                     fieldsync::v1::HttpResponse* resp) {
  try {
    transport::Request request;
    request.method = req->method();
    request.url = req->url();
    request.body = req->body();
    for (const auto& header : req->headers()) {
      request.headers.push_back({header.name(), header.value()});
    }

    auto response = api_->Handle(request);

    resp->set_status(response.status);
    resp->set_body(std::move(response.body));
    for (const auto& header : response.headers) {
      auto* out = resp->add_headers();
      out->set_name(header.name);
      out->set_value(header.value);
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
