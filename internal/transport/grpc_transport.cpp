#include "grpc_transport.hpp"

#include "internal/grpc/grpc_error.hpp"

namespace fieldsync::transport {

GrpcTransport::GrpcTransport(std::shared_ptr<::grpc::Channel> channel)
    : stub_(fieldsync::v1::FieldGateway::NewStub(std::move(channel))) {
}

std::shared_ptr<GrpcTransport> GrpcTransport::Connect(const std::string& address) {
  return std::make_shared<GrpcTransport>(::grpc::CreateChannel(address, ::grpc::InsecureChannelCredentials()));
}

Response GrpcTransport::Send(const Request& request, std::chrono::milliseconds timeout) {
  fieldsync::v1::HttpRequest req;
  req.set_method(request.method);
  req.set_url(request.url);
  req.set_body(request.body);
  for (const auto& header : request.headers) {
    auto* out = req.add_headers();
    out->set_name(header.name);
    out->set_value(header.value);
  }

  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + timeout);

  fieldsync::v1::HttpResponse resp;
  fieldsync::grpc::ThrowIfError(stub_->Handle(&ctx, req, &resp));

  Response response;
  response.status = resp.status();
  response.body   = resp.body();
  for (const auto& header : resp.headers()) {
    response.headers.push_back({header.name(), header.value()});
  }
  return response;
}

} // namespace fieldsync::transport
