#include "udp_transport.hpp"
#include "bindings.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sys/socket.h>
#include <unistd.h>

std::array<uint8_t, PACKET_SIZE> encode_packet(uint16_t function_id, int value, bool high_priority) {
    std::array<uint8_t, PACKET_SIZE> packet;
    packet[0] = high_priority ? PACKET_HEADER_PRIORITY : PACKET_HEADER_NORMAL;
    packet[1] = static_cast<uint8_t>((function_id >> 8) & 0xFF);
    packet[2] = static_cast<uint8_t>(function_id & 0xFF);
    packet[3] = static_cast<uint8_t>(std::clamp(value, 0, 255));
    packet[4] = packet[0] ^ packet[1] ^ packet[2] ^ packet[3];
    return packet;
}

UdpTransport::UdpTransport(const std::string& ip, uint16_t port)
    : ip(ip), port(port), sock_fd(-1), ready(false) {
    memset(&dest, 0, sizeof(dest));
}

UdpTransport::~UdpTransport() {
    cleanup();
}

bool UdpTransport::initialize() {
    if (ready) {
        return true;
    }

    memset(&dest, 0, sizeof(dest));
    dest.sin_family = AF_INET;
    dest.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &dest.sin_addr) != 1) {
        std::cerr << "Invalid destination address: " << ip << "\n";
        return false;
    }

    sock_fd = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock_fd < 0) {
        perror("Failed to create UDP socket");
        return false;
    }

    // The send tick must never stall the poll tick
    int flags = fcntl(sock_fd, F_GETFL, 0);
    if (flags < 0 || fcntl(sock_fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        perror("Failed to make UDP socket non-blocking");
        cleanup();
        return false;
    }

    ready = true;
    return true;
}

void UdpTransport::cleanup() {
    if (sock_fd >= 0) {
        close(sock_fd);
        sock_fd = -1;
    }
    ready = false;
}

bool UdpTransport::send(uint16_t function_id, uint8_t value, bool high_priority) {
    if (!ready) {
        return false;
    }

    auto packet = encode_packet(function_id, value, high_priority);
    ssize_t sent = sendto(sock_fd, packet.data(), packet.size(), 0,
                          reinterpret_cast<const struct sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        perror("Failed to send UDP packet");
        return false;
    }
    if (static_cast<size_t>(sent) != packet.size()) {
        std::cerr << "Short UDP write: " << sent << " of " << packet.size() << " bytes\n";
        return false;
    }

    DEBUG_LOG("[udp] %02X %02X %02X %02X %02X\n", packet[0], packet[1], packet[2], packet[3], packet[4]);
    return true;
}
