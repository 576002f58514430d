// agent/adc_reader.hpp
#pragma once
#include <array>
#include <cstdint>
#include <string>

// One raw acquisition per call. Faults are returned as ADC_FAULT, never thrown.
class ChannelReader {
public:
    virtual ~ChannelReader() = default;

    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;
    virtual int read(int channel) = 0;
};

// MCP3008 10-bit ADC on a Linux spidev node.
class Mcp3008Reader : public ChannelReader {
private:
    int spi_fd{-1};
    int bus;
    int device;
    uint32_t speed_hz;

public:
    static constexpr int MIN_CHANNEL = 0;
    static constexpr int MAX_CHANNEL = 7;
    static constexpr int FULL_SCALE = 1024;

    Mcp3008Reader(int bus, int device, uint32_t speed_hz);
    ~Mcp3008Reader() override;

    Mcp3008Reader(const Mcp3008Reader&) = delete;
    Mcp3008Reader& operator=(const Mcp3008Reader&) = delete;

    bool open() override;
    void close() override;
    bool is_open() const override { return spi_fd != -1; }
    int read(int channel) override;

    std::string device_path() const;

    static std::array<uint8_t, 3> encode_request(int channel);
    static int decode_response(const std::array<uint8_t, 3>& rx);
};
