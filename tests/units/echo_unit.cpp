// Test unit: provisions a database and answers every TCP connection with the
// database connection payload.

#include "service.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>

namespace {

class echo_service : public berth::service {
 public:
  static std::unique_ptr<echo_service> construct(berth::resource_factory &factory) {
    return std::make_unique<echo_service>(factory.provision("database", {}).payload);
  }

  explicit echo_service(std::string payload) : payload_{ std::move(payload) } {}

  void serve(berth::bound_address const &address, berth::cancel_token const &cancel) override {
    int const fd{ ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0) };
    if (fd < 0) { throw berth::serve_error(std::string{ "socket: " } + std::strerror(errno)); }
    fd_closer closer{ fd };

    int const one{ 1 };
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof one);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(address.port);
    if (::inet_pton(AF_INET, address.host.c_str(), &addr.sin_addr) != 1) {
      throw berth::serve_error("not an IPv4 address: " + address.host);
    }
    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof addr) != 0 ||
        ::listen(fd, 16) != 0) {
      throw berth::serve_error("bind " + address.to_string() + ": " + std::strerror(errno));
    }

    std::string const reply{ payload_ + "\n" };
    while (!cancel.stop_requested()) {
      pollfd pfd{ .fd = fd, .events = POLLIN, .revents = 0 };
      int const ready{ ::poll(&pfd, 1, 20) };
      if (ready < 0 && errno != EINTR) {
        throw berth::serve_error(std::string{ "poll: " } + std::strerror(errno));
      }
      if (ready <= 0) { continue; }

      int const client{ ::accept4(fd, nullptr, nullptr, SOCK_CLOEXEC) };
      if (client < 0) { continue; }
      fd_closer client_closer{ client };
      (void)::send(client, reply.data(), reply.size(), MSG_NOSIGNAL);
    }
  }

 private:
  struct fd_closer {
    int fd;
    ~fd_closer() { ::close(fd); }
  };

  std::string payload_;
};

}  // namespace

BERTH_SERVICE(echo_service)
