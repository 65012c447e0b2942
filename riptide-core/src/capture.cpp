#include "capture.hpp"

#include <pcap.h>
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <iostream>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <sys/socket.h>
#endif

namespace riptide {

namespace {

constexpr int SNAPLEN         = 256;
constexpr int READ_TIMEOUT_MS = 100;

constexpr uint8_t PROTO_ICMP   = 1;
constexpr uint8_t PROTO_TCP    = 6;
constexpr uint8_t PROTO_UDP    = 17;
constexpr uint8_t PROTO_ICMPV6 = 58;

constexpr uint16_t ETH_TYPE_IP   = 0x0800;
constexpr uint16_t ETH_TYPE_IPV6 = 0x86DD;
constexpr uint16_t ETH_TYPE_VLAN = 0x8100; // 802.1Q VLAN tag
constexpr uint16_t ETH_TYPE_QINQ = 0x88A8; // 802.1ad QinQ

constexpr size_t ETH_HEADER_LEN  = 14;
constexpr size_t SLL_HEADER_LEN  = 16;
constexpr size_t NULL_HEADER_LEN = 4;
constexpr size_t IPV4_MIN_LEN    = 20;
constexpr size_t IPV6_HEADER_LEN = 40;
constexpr size_t TCP_MIN_LEN     = 20;
constexpr size_t UDP_HEADER_LEN  = 8;

uint16_t load_be16(const uint8_t* p) {
  return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

std::string format_address(int family, const uint8_t* addr) {
  char buf[INET6_ADDRSTRLEN] = {0};
  if (!inet_ntop(family, addr, buf, sizeof(buf))) {
    return "";
  }
  return std::string(buf);
}

std::string build_summary(const PacketEvent& pkt) {
  char buf[256];
  int len;
  // Port 0 is rendered like an absent port.
  if (pkt.source_port && pkt.dest_port && *pkt.source_port != 0 && *pkt.dest_port != 0) {
    len = snprintf(buf, sizeof(buf), "%s %s:%u -> %s:%u len=%u",
      pkt.protocol.c_str(), pkt.source_addr.c_str(), static_cast<unsigned>(*pkt.source_port),
      pkt.dest_addr.c_str(), static_cast<unsigned>(*pkt.dest_port), pkt.length);
  } else {
    len = snprintf(buf, sizeof(buf), "%s %s -> %s len=%u",
      pkt.protocol.c_str(), pkt.source_addr.c_str(), pkt.dest_addr.c_str(), pkt.length);
  }
  if (len < 0) return "";
  return std::string(buf, std::min(static_cast<size_t>(len), sizeof(buf) - 1));
}

// Reads TCP/UDP ports at `l4_offset` if the header was captured in full.
void read_ports(PacketEvent& pkt, uint8_t protocol, const uint8_t* data,
                uint32_t caplen, size_t l4_offset) {
  if (protocol == PROTO_TCP && caplen >= l4_offset + TCP_MIN_LEN) {
    pkt.source_port = load_be16(data + l4_offset);
    pkt.dest_port = load_be16(data + l4_offset + 2);
  } else if (protocol == PROTO_UDP && caplen >= l4_offset + UDP_HEADER_LEN) {
    pkt.source_port = load_be16(data + l4_offset);
    pkt.dest_port = load_be16(data + l4_offset + 2);
  }
}

}

CaptureEngine::~CaptureEngine() {
  stop();
}

std::vector<NetworkInterface> CaptureEngine::list_interfaces() {
  std::vector<NetworkInterface> result;
  pcap_if_t* alldevs = nullptr;
  char errbuf[PCAP_ERRBUF_SIZE];

  if (pcap_findalldevs(&alldevs, errbuf) == -1) {
    std::cerr << "[Riptide] pcap_findalldevs failed: " << errbuf << std::endl;
    return result;
  }

  for (pcap_if_t* d = alldevs; d != nullptr; d = d->next) {
    NetworkInterface iface;
    iface.name = d->name;
    iface.description = d->description ? d->description : "";
    iface.is_loopback = (d->flags & PCAP_IF_LOOPBACK) != 0;
    iface.is_up = (d->flags & PCAP_IF_UP) != 0;

    iface.has_ipv4 = false;
    for (pcap_addr_t* a = d->addresses; a != nullptr; a = a->next) {
      if (a->addr && a->addr->sa_family == AF_INET) {
        iface.has_ipv4 = true;
        break;
      }
    }

    result.push_back(std::move(iface));
  }

  pcap_freealldevs(alldevs);
  return result;
}

std::string CaptureEngine::auto_detect_interface() {
  auto interfaces = list_interfaces();

  for (const auto& iface : interfaces) {
    if (!iface.is_loopback && iface.is_up && iface.has_ipv4) {
      std::cout << "[Riptide] Auto-detected interface: " << iface.name;
      if (!iface.description.empty()) {
        std::cout << " (" << iface.description << ")";
      }
      std::cout << std::endl;
      return iface.name;
    }
  }

  for (const auto& iface : interfaces) {
    if (!iface.is_loopback && iface.is_up) {
      std::cout << "[Riptide] Fallback interface: " << iface.name << std::endl;
      return iface.name;
    }
  }

  if (!interfaces.empty()) {
    std::cerr << "[Riptide] Warning: using first available interface: "
              << interfaces[0].name << std::endl;
    return interfaces[0].name;
  }

  std::cerr << "[Riptide] Error: no network interfaces found!" << std::endl;
  return "";
}

std::optional<std::string> CaptureEngine::validate_bpf_filter(const std::string& expression) {
  if (expression.empty()) return std::nullopt;

  pcap_t* dead = pcap_open_dead(DLT_EN10MB, 65535);
  if (!dead) {
    return std::string("unable to allocate filter compiler");
  }

  std::optional<std::string> error;
  struct bpf_program program;
  if (pcap_compile(dead, &program, expression.c_str(), 1, PCAP_NETMASK_UNKNOWN) == -1) {
    error = std::string(pcap_geterr(dead));
  } else {
    pcap_freecode(&program);
  }

  pcap_close(dead);
  return error;
}

bool CaptureEngine::start(const std::string& interface_name, const std::string& bpf_filter) {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);

  if (running_.load(std::memory_order_acquire)) {
    std::cerr << "[Riptide] Packet capture already running on " << interface_ << std::endl;
    return false;
  }
  stop_locked();

  std::string iface = interface_name.empty() ? auto_detect_interface() : interface_name;
  if (iface.empty()) {
    std::cerr << "[Riptide] Cannot start capture: no interface configured" << std::endl;
    return false;
  }

  char errbuf[PCAP_ERRBUF_SIZE];
  pcap_t* handle = pcap_open_live(iface.c_str(), SNAPLEN, 0, READ_TIMEOUT_MS, errbuf);
  if (!handle) {
    std::cerr << "[Riptide] pcap_open_live failed: " << errbuf << std::endl;
    std::cerr << "[Riptide] Tip: run with elevated permissions (sudo / Administrator)" << std::endl;
    return false;
  }

  if (!bpf_filter.empty()) {
    bpf_u_int32 net = 0;
    bpf_u_int32 mask = PCAP_NETMASK_UNKNOWN;
    if (pcap_lookupnet(iface.c_str(), &net, &mask, errbuf) == -1) {
      mask = PCAP_NETMASK_UNKNOWN;
    }

    struct bpf_program program;
    if (pcap_compile(handle, &program, bpf_filter.c_str(), 1, mask) == -1) {
      std::cerr << "[Riptide] Invalid BPF filter '" << bpf_filter << "': "
                << pcap_geterr(handle) << std::endl;
      pcap_close(handle);
      return false;
    }

    int rc = pcap_setfilter(handle, &program);
    pcap_freecode(&program);
    if (rc == -1) {
      std::cerr << "[Riptide] pcap_setfilter failed: " << pcap_geterr(handle) << std::endl;
      pcap_close(handle);
      return false;
    }
  }

  int link_type = pcap_datalink(handle);
  if (link_type != DLT_EN10MB && link_type != DLT_LINUX_SLL &&
      link_type != DLT_NULL && link_type != DLT_RAW) {
    std::cerr << "[Riptide] Warning: unusual link type " << link_type
              << ", parsing may be incomplete" << std::endl;
  }

  handle_ = handle;
  interface_ = iface;
  bpf_filter_ = bpf_filter;
  running_.store(true, std::memory_order_release);
  thread_ = std::thread([this, link_type]() { capture_loop(link_type); });

  std::cout << "[Riptide] Capture started on " << interface_;
  if (!bpf_filter_.empty()) {
    std::cout << " (filter: " << bpf_filter_ << ")";
  }
  std::cout << std::endl;
  return true;
}

void CaptureEngine::stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  stop_locked();
}

void CaptureEngine::stop_locked() {
  const bool was_running = running_.exchange(false, std::memory_order_acq_rel);
  if (handle_) {
    pcap_breakloop(handle_);
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  if (handle_) {
    pcap_close(handle_);
    handle_ = nullptr;
  }
  interface_.clear();
  bpf_filter_.clear();

  if (was_running) {
    std::cout << "[Riptide] Capture stopped" << std::endl;
  }
}

bool CaptureEngine::restart(const std::string& interface_name, const std::string& bpf_filter) {
  std::cout << "[Riptide] Restarting capture with interface="
            << (interface_name.empty() ? "default" : interface_name)
            << ", filter=" << (bpf_filter.empty() ? "none" : bpf_filter) << std::endl;
  stop();
  return start(interface_name, bpf_filter);
}

std::optional<PacketEvent> CaptureEngine::pull(std::chrono::milliseconds timeout) {
  if (!running_.load(std::memory_order_acquire) && queue_.empty()) {
    throw SourceUnavailable("packet capture is not running");
  }
  return queue_.pop_for(timeout);
}

CaptureStatus CaptureEngine::status() const {
  CaptureStatus s;
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    s.interface_name = interface_;
    s.bpf_filter = bpf_filter_;
  }
  s.running = is_running();
  s.queue_size = queue_.size();
  s.queue_capacity = PacketQueue::capacity();
  s.queue_drops = queue_.drops();
  s.packets_captured = packets_captured();
  return s;
}

void CaptureEngine::capture_loop(int link_type) {
  struct pcap_pkthdr* header;
  const uint8_t* data;

  while (running_.load(std::memory_order_acquire)) {
    int result = pcap_next_ex(handle_, &header, &data);

    if (result == 1) {
      const double ts = static_cast<double>(header->ts.tv_sec) +
                        static_cast<double>(header->ts.tv_usec) / 1e6;
      auto pkt = parse_frame(data, header->caplen, header->len, link_type, ts);
      if (pkt) {
        queue_.push(std::move(*pkt));
        packets_captured_.fetch_add(1, std::memory_order_relaxed);
      }

    } else if (result == 0) {
      continue;

    } else if (result == -1) {
      std::cerr << "[Riptide] pcap_next_ex error: " << pcap_geterr(handle_) << std::endl;
      break;

    } else if (result == -2) {
      break;
    }
  }

  running_.store(false, std::memory_order_release);
  std::cout << "[Riptide] Capture loop ended" << std::endl;
}

std::optional<PacketEvent> CaptureEngine::parse_frame(
  const uint8_t* data, uint32_t caplen, uint32_t wirelen, int link_type, double timestamp
) {
  size_t l3_offset = 0;
  uint16_t eth_type = 0;

  if (link_type == DLT_EN10MB) {
    if (caplen < ETH_HEADER_LEN) return std::nullopt;
    eth_type = load_be16(data + 12);
    l3_offset = ETH_HEADER_LEN;
  }
#ifdef DLT_LINUX_SLL
  else if (link_type == DLT_LINUX_SLL) {
    if (caplen < SLL_HEADER_LEN) return std::nullopt;
    eth_type = load_be16(data + 14);
    l3_offset = SLL_HEADER_LEN;
  }
#endif
  else if (link_type == DLT_NULL) {
    if (caplen < NULL_HEADER_LEN) return std::nullopt;
    // Address family in the capturing host's byte order
    uint32_t family;
    std::memcpy(&family, data, sizeof(family));
    if (family & 0xFFFF0000u) {
      family = ((family >> 24) & 0xFF) | ((family >> 8) & 0xFF00);
    }
    eth_type = (family == 2) ? ETH_TYPE_IP : ETH_TYPE_IPV6;
    l3_offset = NULL_HEADER_LEN;
  }
  else if (link_type == DLT_RAW) {
    if (caplen < 1) return std::nullopt;
    eth_type = ((data[0] >> 4) == 6) ? ETH_TYPE_IPV6 : ETH_TYPE_IP;
  }
  else {
    return std::nullopt;
  }

  // Strip 802.1Q/QinQ VLAN tags (4 bytes each)
  for (int vlan_layers = 0; vlan_layers < 2; vlan_layers++) {
    if (eth_type != ETH_TYPE_VLAN && eth_type != ETH_TYPE_QINQ) break;
    if (caplen < l3_offset + 4) return std::nullopt;
    eth_type = load_be16(data + l3_offset + 2);
    l3_offset += 4;
  }

  PacketEvent pkt;
  pkt.timestamp = timestamp;
  pkt.length = wirelen;

  if (eth_type == ETH_TYPE_IP) {
    if (caplen < l3_offset + IPV4_MIN_LEN) return std::nullopt;
    const uint8_t* ip = data + l3_offset;
    if ((ip[0] >> 4) != 4) return std::nullopt;

    const size_t ihl_bytes = static_cast<size_t>(ip[0] & 0x0F) * 4;
    if (ihl_bytes < IPV4_MIN_LEN || caplen < l3_offset + ihl_bytes) return std::nullopt;

    const uint8_t protocol = ip[9];
    pkt.source_addr = format_address(AF_INET, ip + 12);
    pkt.dest_addr = format_address(AF_INET, ip + 16);

    switch (protocol) {
      case PROTO_TCP:  pkt.protocol = "TCP"; break;
      case PROTO_UDP:  pkt.protocol = "UDP"; break;
      case PROTO_ICMP: pkt.protocol = "ICMP"; break;
      default:         pkt.protocol = "IP(" + std::to_string(protocol) + ")"; break;
    }

    // Only the first fragment carries the transport header
    const bool first_fragment = (load_be16(ip + 6) & 0x1FFF) == 0;
    if (first_fragment) {
      read_ports(pkt, protocol, data, caplen, l3_offset + ihl_bytes);
    }

  } else if (eth_type == ETH_TYPE_IPV6) {
    if (caplen < l3_offset + IPV6_HEADER_LEN) return std::nullopt;
    const uint8_t* ip6 = data + l3_offset;
    if ((ip6[0] >> 4) != 6) return std::nullopt;

    pkt.source_addr = format_address(AF_INET6, ip6 + 8);
    pkt.dest_addr = format_address(AF_INET6, ip6 + 24);

    // Walk IPv6 extension header chain to find the transport protocol
    uint8_t next_header = ip6[6];
    size_t l4_offset = l3_offset + IPV6_HEADER_LEN;
    bool fragmented = false;
    constexpr int MAX_EXT_HEADERS = 8; // guard against malformed chains

    for (int ext = 0; ext < MAX_EXT_HEADERS; ext++) {
      bool is_extension = (next_header == 0  ||  // Hop-by-Hop
                           next_header == 43 ||  // Routing
                           next_header == 44 ||  // Fragment
                           next_header == 60);   // Destination Options
      if (!is_extension) break;
      if (caplen < l4_offset + 2) break;

      uint8_t ext_next = data[l4_offset];
      size_t ext_len = static_cast<size_t>(data[l4_offset + 1]) * 8 + 8;
      if (next_header == 44) {
        // Fragment header is fixed 8 bytes; non-zero offset means no L4 header
        ext_len = 8;
        if (caplen >= l4_offset + 4 && (load_be16(data + l4_offset + 2) & 0xFFF8) != 0) {
          fragmented = true;
        }
      }

      l4_offset += ext_len;
      next_header = ext_next;
    }

    switch (next_header) {
      case PROTO_TCP:    pkt.protocol = "TCP"; break;
      case PROTO_UDP:    pkt.protocol = "UDP"; break;
      case PROTO_ICMPV6: pkt.protocol = "ICMPv6"; break;
      default:           pkt.protocol = "IPv6(" + std::to_string(next_header) + ")"; break;
    }

    if (!fragmented) {
      read_ports(pkt, next_header, data, caplen, l4_offset);
    }

  } else {
    return std::nullopt;
  }

  if (pkt.source_addr.empty() || pkt.dest_addr.empty()) return std::nullopt;

  pkt.summary = build_summary(pkt);
  return pkt;
}

}
