#include "server.hpp"

#include <limits>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace fieldsync::runtime {

namespace {

// multipart boundaries, form fields and tunnelled headers
constexpr std::uint64_t kEnvelopeBytes = 1 << 20;

} // namespace

int GatewayHost::ReceiveLimit(std::uint64_t max_photo_bytes) {
  const auto wanted = max_photo_bytes + kEnvelopeBytes;
  if (wanted > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
    return std::numeric_limits<int>::max();
  }
  return static_cast<int>(wanted);
}

GatewayHost::GatewayHost(const fieldsync::runtime::config::ServerConfig& config, std::shared_ptr<api::FieldApi> api)
    : bind_address_(config.bind_address()),
      max_receive_bytes_(ReceiveLimit(config.max_photo_bytes())),
      gateway_(std::move(api)) {}

GatewayHost::~GatewayHost() {
  Stop();
}

void GatewayHost::Start() {
  if (grpc_server_) return;

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &selected_port_);
  builder.SetMaxReceiveMessageSize(max_receive_bytes_);
  builder.RegisterService(&gateway_);

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || selected_port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("field gateway could not bind " + bind_address_);
  }

  FIELDSYNC_LOG_INFO("field gateway listening", {observability::StringField("address", bind_address_),
                                                 observability::IntField("port", selected_port_),
                                                 observability::IntField("max_receive_bytes", max_receive_bytes_)});
}

void GatewayHost::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void GatewayHost::Stop() {
  if (!grpc_server_) return;
  grpc_server_->Shutdown();
  grpc_server_.reset();
  FIELDSYNC_LOG_INFO("field gateway stopped", {observability::StringField("address", bind_address_)});
}

} // namespace fieldsync::runtime
