#include "serial.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace {

speed_t to_speed(int baud_rate) {
    switch (baud_rate) {
        case 9600: return B9600;
        case 19200: return B19200;
        case 38400: return B38400;
        case 57600: return B57600;
        case 115200: return B115200;
        case 230400: return B230400;
        case 460800: return B460800;
        case 921600: return B921600;
        default:
            throw PipkinException(string_format("error.serial_bad_baud", baud_rate));
    }
}

} // anonymous namespace

PosixSerialPort::PosixSerialPort(const std::string& device, int baud_rate) : device_(device) {
    const speed_t speed = to_speed(baud_rate);

    fd_ = ::open(device_.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
    if (fd_ < 0) {
        throw TargetIOError("open", device_, std::strerror(errno));
    }

    if (tcgetattr(fd_, &saved_attrs_) != 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw TargetIOError("open", device_, std::strerror(err));
    }
    attrs_saved_ = true;

    termios raw = saved_attrs_;
    cfmakeraw(&raw);
    raw.c_cflag |= (CLOCAL | CREAD);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    cfsetispeed(&raw, speed);
    cfsetospeed(&raw, speed);
    if (tcsetattr(fd_, TCSANOW, &raw) != 0) {
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw TargetIOError("open", device_, std::strerror(err));
    }
    tcflush(fd_, TCIOFLUSH);
    log_debug(string_format("debug.serial_opened", device_, baud_rate));
}

PosixSerialPort::~PosixSerialPort() {
    if (fd_ >= 0) {
        if (attrs_saved_) {
            tcsetattr(fd_, TCSANOW, &saved_attrs_);
        }
        ::close(fd_);
    }
}

void PosixSerialPort::write(std::string_view data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw TargetIOError("write", device_, std::strerror(errno));
        }
        written += static_cast<size_t>(n);
    }
    if (tcdrain(fd_) != 0) {
        throw TargetIOError("write", device_, std::strerror(errno));
    }
}

std::optional<std::string> PosixSerialPort::read_line(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (const auto pos = buffer_.find('\n'); pos != std::string::npos) {
            std::string line = buffer_.substr(0, pos);
            buffer_.erase(0, pos + 1);
            return line;
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return std::nullopt;
        }

        pollfd pfd{fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw TargetIOError("read", device_, std::strerror(errno));
        }
        if (rc == 0) {
            return std::nullopt;
        }
        if (pfd.revents & (POLLERR | POLLHUP)) {
            throw TargetIOError("read", device_, get_string("error.serial_disconnected"));
        }

        char chunk[512];
        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw TargetIOError("read", device_, std::strerror(errno));
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

std::string strip_terminal_escapes(std::string_view line) {
    std::string out;
    out.reserve(line.size());
    size_t i = 0;
    while (i < line.size()) {
        const char c = line[i];
        if (c == '\r') {
            ++i;
            continue;
        }
        if (c != '\033') {
            out += c;
            ++i;
            continue;
        }

        ++i;
        if (i >= line.size()) break;
        const char kind = line[i++];
        if (kind == '[') {
            // CSI: parameters then one final byte in 0x40-0x7E
            while (i < line.size() && !(line[i] >= 0x40 && line[i] <= 0x7E)) ++i;
            if (i < line.size()) ++i;
        } else if (kind == ']') {
            // OSC: terminated by BEL or ESC backslash
            while (i < line.size()) {
                if (line[i] == '\a') {
                    ++i;
                    break;
                }
                if (line[i] == '\033' && i + 1 < line.size() && line[i + 1] == '\\') {
                    i += 2;
                    break;
                }
                ++i;
            }
        }
        // any other escape is a two-byte sequence, already consumed
    }
    return out;
}
