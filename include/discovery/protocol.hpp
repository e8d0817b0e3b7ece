#ifndef BRIDGESCOUT_DISCOVERY_PROTOCOL_HPP
#define BRIDGESCOUT_DISCOVERY_PROTOCOL_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace bridgescout {
namespace protocol {

// SSDP multicast group used for M-SEARCH
constexpr const char *SSDP_MULTICAST_ADDRESS = "239.255.255.250";
constexpr uint16_t SSDP_PORT = 1900;

// M-SEARCH request, CRLF line endings, terminated by an empty line.
// MX asks responders to spread their replies over 2 seconds.
constexpr const char *SSDP_SEARCH_REQUEST =
    "M-SEARCH * HTTP/1.1\r\n"
    "HOST: 239.255.255.250:1900\r\n"
    "ST: ssdp:all\r\n"
    "MAN: ssdp:discover\r\n"
    "MX: 2\r\n"
    "\r\n";

// Largest datagram we accept from a responder
constexpr size_t SSDP_MAX_DATAGRAM = 8192;

// Bridges announce "IpBridge" in their SERVER header, e.g.
// SERVER: FreeRTOS/7.4.2 UPnP/1.0 IpBridge/1.10.0
constexpr const char *BRIDGE_SERVER_TOKEN = "ipbridge";

// Vendor directory of bridges registered from the caller's network
constexpr const char *CLOUD_REGISTRY_URL = "https://discovery.meethue.com/";

// UPnP device description served by every bridge
constexpr const char *DESCRIPTION_PATH = "/description.xml";

namespace fingerprint {
constexpr const char *DEVICE_TYPE =
    "<deviceType>urn:schemas-upnp-org:device:Basic:1</deviceType>";
constexpr const char *MANUFACTURER =
    "<manufacturer>Royal Philips Electronics</manufacturer>";
constexpr const char *MODEL_URL = "<modelURL>http://www.meethue.com</modelURL>";
} // namespace fingerprint

namespace timeouts {
// Bounded wait of the orchestrator, re-armed after each event
constexpr std::chrono::milliseconds DISCOVERY_WAIT{3000};
// Receive window of the multicast probe
constexpr std::chrono::milliseconds SSDP_RECEIVE{3000};
// Per request HTTP deadline (resolve + connect + handshake + exchange)
constexpr std::chrono::milliseconds HTTP_REQUEST{2000};
// Per attempt connect deadline of the subnet scan
constexpr std::chrono::milliseconds SCAN_CONNECT{2000};
} // namespace timeouts

namespace scan {
constexpr uint16_t DEFAULT_PORT = 80;
constexpr size_t DEFAULT_CONCURRENCY = 20;
// Subnets wider than this prefix are narrowed to the surrounding /24
constexpr int MIN_PREFIX_LENGTH = 22;
} // namespace scan

} // namespace protocol
} // namespace bridgescout

#endif // BRIDGESCOUT_DISCOVERY_PROTOCOL_HPP
