// Minimal HTTP unit: answers every request with a greeting from its secrets and the
// database it was given.

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

class hello_service : public berth::service {
 public:
  static std::unique_ptr<hello_service> construct(berth::resource_factory &factory) {
    auto const db{ factory.provision("database", {}) };
    auto const secrets{ factory.provision("secrets", {}) };
    return std::make_unique<hello_service>(secrets.payload + "\n" + db.payload + "\n");
  }

  explicit hello_service(std::string body) : body_{ std::move(body) } {}

  void serve(berth::bound_address const &address, berth::cancel_token const &cancel) override {
    int const fd{ ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0) };
    if (fd < 0) { throw berth::serve_error(std::string{ "socket: " } + std::strerror(errno)); }
    closer listen_closer{ fd };

    int const one{ 1 };
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof one);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(address.port);
    if (::inet_pton(AF_INET, address.host.c_str(), &addr.sin_addr) != 1) {
      throw berth::serve_error("not an IPv4 address: " + address.host);
    }
    if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof addr) != 0 ||
        ::listen(fd, 64) != 0) {
      throw berth::serve_error("bind " + address.to_string() + ": " + std::strerror(errno));
    }

    std::string const response{ "HTTP/1.1 200 OK\r\nContent-Type: text/plain\r\n"
                                "Connection: close\r\nContent-Length: " +
                                std::to_string(body_.size()) + "\r\n\r\n" + body_ };

    while (!cancel.stop_requested()) {
      pollfd pfd{ .fd = fd, .events = POLLIN, .revents = 0 };
      int const ready{ ::poll(&pfd, 1, 50) };
      if (ready < 0 && errno != EINTR) {
        throw berth::serve_error(std::string{ "poll: " } + std::strerror(errno));
      }
      if (ready <= 0) { continue; }

      int const client{ ::accept4(fd, nullptr, nullptr, SOCK_CLOEXEC) };
      if (client < 0) { continue; }
      closer client_closer{ client };

      char request[4096];
      (void)::recv(client, request, sizeof request, 0);
      (void)::send(client, response.data(), response.size(), MSG_NOSIGNAL);
    }
  }

 private:
  struct closer {
    int fd;
    ~closer() { ::close(fd); }
  };

  std::string body_;
};

}  // namespace

BERTH_SERVICE(hello_service)
