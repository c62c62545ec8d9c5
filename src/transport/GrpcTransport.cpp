#include "GrpcTransport.hpp"

namespace st {
GrpcTransportChannel::GrpcTransportChannel(sshx::SshxService::Stub* stub,
                                           shared_ptr<CancellationToken> _token)
    : token(_token) {
  stream = stub->Channel(&context);
  readerThread = std::thread(&GrpcTransportChannel::readLoop, this);
  writerThread = std::thread(&GrpcTransportChannel::writeLoop, this);
}

GrpcTransportChannel::~GrpcTransportChannel() {
  context.TryCancel();
  clientMessages->close();
  serverMessages->close();
  writerThread.join();
  readerThread.join();
  grpc::Status status = stream->Finish();
  if (!status.ok() && status.error_code() != grpc::StatusCode::CANCELLED) {
    VLOG(1) << "Channel finished with status " << status.error_code() << ": "
            << status.error_message();
  }
}

void GrpcTransportChannel::readLoop() {
  el::Helpers::setThreadName("grpc-reader");
  sshx::ServerUpdate update;
  while (stream->Read(&update)) {
    if (!serverMessages->push(update, token)) {
      break;
    }
  }
  VLOG(1) << "Server stream ended";
  serverMessages->close();
}

void GrpcTransportChannel::writeLoop() {
  el::Helpers::setThreadName("grpc-writer");
  sshx::ClientUpdate update;
  while (clientMessages->pop(&update, token)) {
    if (!stream->Write(update)) {
      LOG(WARNING) << "Failed to send client update, stream is broken";
      break;
    }
  }
  if (token->isCancelled()) {
    context.TryCancel();
  } else if (!stream->WritesDone()) {
    VLOG(1) << "WritesDone failed";
  }
}

GrpcTransport::GrpcTransport(const string& origin,
                             std::chrono::milliseconds _timeout)
    : target(parseTarget(origin)), timeout(_timeout) {
  std::shared_ptr<grpc::ChannelCredentials> credentials;
  if (target.useTls) {
    credentials = grpc::SslCredentials(grpc::SslCredentialsOptions());
  } else {
    credentials = grpc::InsecureChannelCredentials();
  }
  grpcChannel = grpc::CreateChannel(target.address, credentials);
  stub = sshx::SshxService::NewStub(grpcChannel);
}

void GrpcTransport::connect() {
  if (!grpcChannel) {
    throw runtime_error("gRPC transport was cleaned up");
  }
  auto deadline = std::chrono::system_clock::now() + timeout;
  if (!grpcChannel->WaitForConnected(deadline)) {
    throw runtime_error("Could not reach gRPC server at " + target.address);
  }
}

sshx::OpenResponse GrpcTransport::open(const sshx::OpenRequest& request) {
  if (!stub) {
    throw runtime_error("gRPC transport was cleaned up");
  }
  grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + timeout);
  sshx::OpenResponse response;
  grpc::Status status = stub->Open(&context, request, &response);
  if (!status.ok()) {
    throw runtime_error("gRPC open request failed: " +
                        status.error_message());
  }
  return response;
}

shared_ptr<TransportChannel> GrpcTransport::channel(
    shared_ptr<CancellationToken> token) {
  if (!stub) {
    throw runtime_error("gRPC transport was cleaned up");
  }
  return shared_ptr<TransportChannel>(
      new GrpcTransportChannel(stub.get(), token));
}

void GrpcTransport::close(const sshx::CloseRequest& request,
                          std::chrono::milliseconds closeTimeout) {
  if (!stub) {
    throw runtime_error("gRPC transport was cleaned up");
  }
  grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + closeTimeout);
  sshx::CloseResponse response;
  grpc::Status status = stub->Close(&context, request, &response);
  if (!status.ok()) {
    throw runtime_error("gRPC close request failed: " +
                        status.error_message());
  }
}

void GrpcTransport::cleanup() {
  stub.reset();
  grpcChannel.reset();
}

GrpcTarget GrpcTransport::parseTarget(const string& origin) {
  GrpcTarget result;
  string address = origin;
  result.useTls = false;
  if (startsWith(address, "https://")) {
    address = address.substr(8);
    result.useTls = true;
  } else if (startsWith(address, "http://")) {
    address = address.substr(7);
  }
  size_t slash = address.find('/');
  if (slash != string::npos) {
    address = address.substr(0, slash);
  }
  if (address.find(':') == string::npos) {
    if (address.find("localhost") != string::npos ||
        address.find("127.0.0.1") != string::npos) {
      address += ":8051";
    } else {
      address += ":443";
    }
  }
  result.address = address;
  return result;
}
}  // namespace st
