#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/api/field_api.hpp"
#include "internal/grpc/gateway_server.hpp"

namespace fieldsync::runtime {

/*
  Hosts the FieldGateway over gRPC.

  Inbound messages may carry a whole multipart photo, so the receive
  limit follows server.max_photo_bytes instead of the gRPC default.
*/
class GatewayHost {
public:
  GatewayHost(const fieldsync::runtime::config::ServerConfig& config, std::shared_ptr<api::FieldApi> api);
  ~GatewayHost();

  GatewayHost(const GatewayHost&)            = delete;
  GatewayHost& operator=(const GatewayHost&) = delete;

  void Start();
  void Wait();
  void Stop();

  // port actually bound; differs from the configured one for ":0"
  int Port() const { return selected_port_; }

  static int ReceiveLimit(std::uint64_t max_photo_bytes);

private:
  std::string                     bind_address_;
  int                             max_receive_bytes_;
  grpc::GatewayServer             gateway_;
  std::unique_ptr<::grpc::Server> grpc_server_;
  int                             selected_port_ = 0;
};

} // namespace fieldsync::runtime
