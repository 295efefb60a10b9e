#pragma once

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "fieldsync/v1.hpp"
#include "internal/transport/transport.hpp"

namespace fieldsync::transport {

/*
  Transport over the FieldGateway tunnel.

  An unreachable server or an expired deadline surfaces as
  util::Unavailable / util::DeadlineExceeded, exactly like a dropped
  HTTP connection.
*/
class GrpcTransport final : public Transport {
 public:
  explicit GrpcTransport(std::shared_ptr<::grpc::Channel> channel);

  static std::shared_ptr<GrpcTransport> Connect(const std::string& address);

  Response Send(const Request& request, std::chrono::milliseconds timeout) override;

 private:
  std::unique_ptr<fieldsync::v1::FieldGateway::Stub> stub_;
};

} // namespace fieldsync::transport
