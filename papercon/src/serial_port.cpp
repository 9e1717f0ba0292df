#include "serial_port.hpp"
#include "log.hpp"

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>
#include <sys/stat.h>

#include <cerrno>
#include <cstring>

const std::vector<std::string> kSerialCandidates = {
  "/dev/serial0", "/dev/ttyUSB0", "/dev/ttyUSB1", "/dev/ttyACM0", "/dev/ttyACM1"
};

std::string detect_serial_port(const std::vector<std::string>& candidates){
  for (const auto& p : candidates){
    struct stat st{};
    if (::stat(p.c_str(), &st) == 0) return p;
  }
  return candidates.empty() ? std::string("/dev/serial0") : candidates.front();
}

static speed_t to_speed(unsigned baud){
  switch (baud){
    case 1200:   return B1200;
    case 2400:   return B2400;
    case 4800:   return B4800;
    case 9600:   return B9600;
    case 19200:  return B19200;
    case 38400:  return B38400;
    case 57600:  return B57600;
    case 115200: return B115200;
    default:     return 0;
  }
}

SerialPort::SerialPort(SerialConfig cfg)
    : path_(cfg.path.empty() ? detect_serial_port() : cfg.path) {
  if (!open_port(cfg.baud))
    log_warn("serial") << "printer port " << path_ << " unavailable, output is discarded";
}

SerialPort::~SerialPort(){
  if (fd_ >= 0) ::close(fd_);
}

bool SerialPort::open_port(unsigned baud){
  speed_t sp = to_speed(baud);
  if (sp == 0){
    log_error("serial") << "unsupported baud rate " << baud;
    return false;
  }

  int fd = ::open(path_.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
  if (fd < 0){
    log_warn("serial") << "open " << path_ << ": " << std::strerror(errno);
    return false;
  }

  termios tio{};
  if (tcgetattr(fd, &tio) < 0){
    log_warn("serial") << "tcgetattr " << path_ << ": " << std::strerror(errno);
    ::close(fd);
    return false;
  }
  cfmakeraw(&tio);
  tio.c_cflag &= ~(PARENB | CSTOPB | CSIZE | CRTSCTS);
  tio.c_cflag |= CS8 | CLOCAL | CREAD;
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;
  cfsetispeed(&tio, sp);
  cfsetospeed(&tio, sp);
  if (tcsetattr(fd, TCSANOW, &tio) < 0){
    log_warn("serial") << "tcsetattr " << path_ << ": " << std::strerror(errno);
    ::close(fd);
    return false;
  }
  tcflush(fd, TCIOFLUSH);

  fd_ = fd;
  log_info("serial") << "opened " << path_ << " at " << baud << " baud";
  return true;
}

bool SerialPort::write(const std::vector<uint8_t>& bytes){
  if (fd_ < 0) return false;
  size_t off = 0;
  while (off < bytes.size()){
    ssize_t n = ::write(fd_, bytes.data() + off, bytes.size() - off);
    if (n < 0){
      if (errno == EINTR) continue;
      if (errno == EAGAIN){
        pollfd p{fd_, POLLOUT, 0};
        ::poll(&p, 1, 100);
        continue;
      }
      log_warn("serial") << "write: " << std::strerror(errno);
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

std::optional<uint8_t> SerialPort::read_byte(std::chrono::milliseconds timeout){
  if (fd_ < 0) return std::nullopt;
  pollfd p{fd_, POLLIN, 0};
  int rc;
  do {
    rc = ::poll(&p, 1, static_cast<int>(timeout.count()));
  } while (rc < 0 && errno == EINTR);
  if (rc <= 0 || !(p.revents & POLLIN)) return std::nullopt;

  uint8_t b = 0;
  ssize_t n = ::read(fd_, &b, 1);
  if (n != 1) return std::nullopt;
  return b;
}

void SerialPort::drain(){
  if (fd_ >= 0 && tcdrain(fd_) < 0)
    log_warn("serial") << "tcdrain: " << std::strerror(errno);
}

void SerialPort::discard_input(){
  if (fd_ >= 0) tcflush(fd_, TCIFLUSH);
}
