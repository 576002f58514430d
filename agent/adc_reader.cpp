// agent/adc_reader.cpp
#include "adc_reader.hpp"
#include "logger.hpp"
#include "../common/protocol.hpp"
#include <linux/spi/spidev.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

Mcp3008Reader::Mcp3008Reader(int b, int d, uint32_t speed)
    : bus(b), device(d), speed_hz(speed) {}

Mcp3008Reader::~Mcp3008Reader() {
    close();
}

std::string Mcp3008Reader::device_path() const {
    return "/dev/spidev" + std::to_string(bus) + "." + std::to_string(device);
}

bool Mcp3008Reader::open() {
    if (spi_fd != -1) return true;

    std::string path = device_path();
    spi_fd = ::open(path.c_str(), O_RDWR);
    if (spi_fd < 0) {
        Logger::error("Cannot open " + path + ": " + std::strerror(errno));
        spi_fd = -1;
        return false;
    }

    uint8_t mode = SPI_MODE_0;
    uint8_t bits = 8;
    if (ioctl(spi_fd, SPI_IOC_WR_MODE, &mode) < 0 ||
        ioctl(spi_fd, SPI_IOC_WR_BITS_PER_WORD, &bits) < 0 ||
        ioctl(spi_fd, SPI_IOC_WR_MAX_SPEED_HZ, &speed_hz) < 0) {
        Logger::error("SPI configuration failed on " + path + ": " + std::strerror(errno));
        close();
        return false;
    }

    Logger::success("SPI initialized on " + path + " at " + std::to_string(speed_hz) + " Hz");
    return true;
}

void Mcp3008Reader::close() {
    if (spi_fd != -1) {
        ::close(spi_fd);
        spi_fd = -1;
    }
}

std::array<uint8_t, 3> Mcp3008Reader::encode_request(int channel) {
    // start bit, single-ended, channel select in the high nibble
    return {0x01, static_cast<uint8_t>((8 + channel) << 4), 0x00};
}

int Mcp3008Reader::decode_response(const std::array<uint8_t, 3>& rx) {
    return ((rx[1] & 0x03) << 8) | rx[2];
}

int Mcp3008Reader::read(int channel) {
    if (channel < MIN_CHANNEL || channel > MAX_CHANNEL || spi_fd == -1) {
        return ADC_FAULT;
    }

    auto tx = encode_request(channel);
    std::array<uint8_t, 3> rx{};

    struct spi_ioc_transfer transfer{};
    transfer.tx_buf = reinterpret_cast<uintptr_t>(tx.data());
    transfer.rx_buf = reinterpret_cast<uintptr_t>(rx.data());
    transfer.len = static_cast<uint32_t>(tx.size());
    transfer.speed_hz = speed_hz;
    transfer.bits_per_word = 8;

    if (ioctl(spi_fd, SPI_IOC_MESSAGE(1), &transfer) < 0) {
        return ADC_FAULT;
    }
    return decode_response(rx);
}
