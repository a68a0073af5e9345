#ifndef UDP_TRANSPORT_HPP
#define UDP_TRANSPORT_HPP

#include <array>
#include <cstdint>
#include <string>
#include <netinet/in.h>

constexpr uint8_t PACKET_HEADER_PRIORITY = 0xE0;
constexpr uint8_t PACKET_HEADER_NORMAL = 0x60;
constexpr size_t PACKET_SIZE = 5;

// header, id high, id low, value, xor of the first four bytes
std::array<uint8_t, PACKET_SIZE> encode_packet(uint16_t function_id, int value, bool high_priority);

class Transport {
public:
    virtual ~Transport() = default;
    virtual bool send(uint16_t function_id, uint8_t value, bool high_priority) = 0;
};

class UdpTransport : public Transport {
public:
    UdpTransport(const std::string& ip, uint16_t port);
    ~UdpTransport() override;

    UdpTransport(const UdpTransport&) = delete;
    UdpTransport& operator=(const UdpTransport&) = delete;

    bool initialize();
    void cleanup();

    bool is_ready() const { return ready; }

    bool send(uint16_t function_id, uint8_t value, bool high_priority) override;

private:
    std::string ip;
    uint16_t port;
    int sock_fd;
    bool ready;
    struct sockaddr_in dest;
};

#endif // UDP_TRANSPORT_HPP
