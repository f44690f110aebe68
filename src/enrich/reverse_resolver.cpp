#include "reverse_resolver.hpp"

#include "logger.hpp"
#include "net/address.hpp"
#include "util.hpp"
#include <array>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace whohas::enrich {

namespace {

Status status_from_gai(int code) {
  switch (code) {
  case EAI_NONAME:
  case EAI_NODATA:
    return Status::NoRecord;
  case EAI_AGAIN:
    return Status::Timeout;
  case EAI_SYSTEM:
    return Status::Socket;
  default:
    return Status::Unknown;
  }
}

} // namespace

Result<std::string> dns_reverse_lookup(std::string_view address) {
  auto ip = net::parse_ipv4(address);
  if (!ip) {
    return Result<std::string>::failure(Status::NoRecord);
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = util::hton(*ip);

  std::array<char, NI_MAXHOST> host{};
  // NI_NAMEREQD turns "no PTR record" into an error instead of echoing the
  // numeric address back
  int status = getnameinfo(reinterpret_cast<const sockaddr *>(&addr),
                           sizeof(addr), host.data(),
                           static_cast<socklen_t>(host.size()), nullptr, 0,
                           NI_NAMEREQD);
  if (status != 0) {
    LOG_DEBUG("Reverse lookup of {} failed: {}", address, gai_strerror(status));
    return Result<std::string>::failure(status_from_gai(status));
  }

  return Result<std::string>::success(std::string(host.data()));
}

} // namespace whohas::enrich
