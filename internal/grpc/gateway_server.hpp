#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "fieldsync/v1.hpp"
#include "internal/api/field_api.hpp"

namespace fieldsync::grpc {

/*
  Carries tunnelled HTTP requests into the field endpoints. The HTTP
  status travels in the response message; the gRPC status is only
  non-OK when the request could not be handled at all.
*/
class GatewayServer final : public fieldsync::v1::FieldGateway::Service {
public:
  explicit GatewayServer(std::shared_ptr<fieldsync::api::FieldApi> api);

  ::grpc::Status Handle(::grpc::ServerContext* ctx,
                        const fieldsync::v1::HttpRequest* req,
                        fieldsync::v1::HttpResponse* resp) override;

private:
  std::shared_ptr<fieldsync::api::FieldApi> api_;
};

}
