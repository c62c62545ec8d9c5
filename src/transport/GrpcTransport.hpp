#ifndef __ST_GRPC_TRANSPORT__
#define __ST_GRPC_TRANSPORT__

#include <grpcpp/grpcpp.h>

#include "Transport.hpp"
#include "sshx.grpc.pb.h"

namespace st {
struct GrpcTarget {
  string address;
  bool useTls;
};

/**
 * @brief Bridges a bidirectional Channel stream to the two queues.
 *
 * A writer thread forwards clientMessages to the stream and a reader thread
 * forwards the stream to serverMessages. Destroying the channel cancels the
 * call and joins both threads.
 */
class GrpcTransportChannel : public TransportChannel {
 public:
  GrpcTransportChannel(sshx::SshxService::Stub* stub,
                       shared_ptr<CancellationToken> _token);
  virtual ~GrpcTransportChannel();

 protected:
  void readLoop();
  void writeLoop();

  grpc::ClientContext context;
  unique_ptr<grpc::ClientReaderWriter<sshx::ClientUpdate, sshx::ServerUpdate>>
      stream;
  shared_ptr<CancellationToken> token;
  std::thread readerThread;
  std::thread writerThread;
};

class GrpcTransport : public Transport {
 public:
  /**
   * @param origin Server URL such as https://sshx.io.
   * @param _timeout Bound for connecting and for the Open call.
   */
  GrpcTransport(const string& origin, std::chrono::milliseconds _timeout);
  virtual ~GrpcTransport() { cleanup(); }

  /**
   * @brief Waits for the underlying connection to become ready.
   * @throws runtime_error if it is not ready within the timeout.
   */
  void connect();

  virtual sshx::OpenResponse open(const sshx::OpenRequest& request);
  virtual shared_ptr<TransportChannel> channel(
      shared_ptr<CancellationToken> token);
  virtual void close(const sshx::CloseRequest& request,
                     std::chrono::milliseconds closeTimeout);
  virtual ConnectionMethod connectionType() const {
    return ConnectionMethod::GRPC;
  }
  virtual void cleanup();

  const GrpcTarget& getTarget() const { return target; }

  /**
   * @brief Strips scheme and path from `origin` and fills in the port.
   *
   * Local servers default to 8051, everything else to 443. TLS is used only
   * for https origins.
   */
  static GrpcTarget parseTarget(const string& origin);

 protected:
  GrpcTarget target;
  std::chrono::milliseconds timeout;
  std::shared_ptr<grpc::Channel> grpcChannel;
  unique_ptr<sshx::SshxService::Stub> stub;
};
}  // namespace st

#endif  // __ST_GRPC_TRANSPORT__
