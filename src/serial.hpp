#pragma once

#include <termios.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

// One open line-oriented link to a device
class SerialConnection {
public:
    virtual ~SerialConnection() = default;

    virtual void write(std::string_view data) = 0;
    // Next line without its "\n"; nullopt when nothing complete arrived within timeout
    virtual std::optional<std::string> read_line(std::chrono::milliseconds timeout) = 0;
    virtual std::string name() const = 0;
};

// termios raw mode, restored and closed on destruction
class PosixSerialPort : public SerialConnection {
public:
    explicit PosixSerialPort(const std::string& device, int baud_rate = 115200);
    ~PosixSerialPort() override;
    PosixSerialPort(const PosixSerialPort&) = delete;
    PosixSerialPort& operator=(const PosixSerialPort&) = delete;

    void write(std::string_view data) override;
    std::optional<std::string> read_line(std::chrono::milliseconds timeout) override;
    std::string name() const override { return device_; }

private:
    std::string device_;
    int fd_ = -1;
    bool attrs_saved_ = false;
    termios saved_attrs_{};
    std::string buffer_;
};

// Removes ANSI/VT escape sequences and carriage returns
std::string strip_terminal_escapes(std::string_view line);
