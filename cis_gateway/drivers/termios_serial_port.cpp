#include "serial_port.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <thread>
#include <unistd.h>

namespace cis {

static bool baud_constant(int baud, speed_t& out){
  switch(baud){
    case 2400:   out=B2400; return true;
    case 4800:   out=B4800; return true;
    case 9600:   out=B9600; return true;
    case 19200:  out=B19200; return true;
    case 38400:  out=B38400; return true;
    case 57600:  out=B57600; return true;
    case 115200: out=B115200; return true;
  }
  return false;
}

TermiosSerialPort::~TermiosSerialPort(){ close(); }

bool TermiosSerialPort::open(const std::string& device, int baud, Error& err){
  close();
  speed_t speed;
  if(!baud_constant(baud, speed)){
    err.set(ErrorKind::Validation, "unsupported baud rate "+std::to_string(baud));
    return false;
  }
  fd_ = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
  if(fd_<0){
    err.set(ErrorKind::Transport, "cannot open "+device+": "+std::strerror(errno));
    return false;
  }
  termios tio;
  if(tcgetattr(fd_, &tio)<0){
    err.set(ErrorKind::Transport, "tcgetattr "+device+": "+std::strerror(errno));
    close();
    return false;
  }
  cfmakeraw(&tio);
  tio.c_cflag |= CLOCAL | CREAD;
  tio.c_cflag &= ~(CSTOPB | PARENB | CRTSCTS);
  tio.c_cc[VMIN]=0;
  tio.c_cc[VTIME]=0;
  cfsetispeed(&tio, speed);
  cfsetospeed(&tio, speed);
  if(tcsetattr(fd_, TCSANOW, &tio)<0){
    err.set(ErrorKind::Transport, "tcsetattr "+device+": "+std::strerror(errno));
    close();
    return false;
  }
  device_=device;
  return true;
}

void TermiosSerialPort::close(){
  if(fd_>=0){ ::close(fd_); fd_=-1; }
}

bool TermiosSerialPort::write(const uint8_t* data, size_t n, Error& err){
  if(fd_<0){ err.set(ErrorKind::Transport, "serial port not open"); return false; }
  size_t off=0;
  while(off<n){
    ssize_t w = ::write(fd_, data+off, n-off);
    if(w<0){
      if(errno==EAGAIN || errno==EINTR){
        pollfd p{fd_, POLLOUT, 0};
        if(poll(&p, 1, 100)<=0){ err.set(ErrorKind::Transport, "serial write stalled"); return false; }
        continue;
      }
      err.set(ErrorKind::Transport, std::string("serial write: ")+std::strerror(errno));
      return false;
    }
    off += (size_t)w;
  }
  if(tcdrain(fd_)<0){
    err.set(ErrorKind::Transport, std::string("tcdrain: ")+std::strerror(errno));
    return false;
  }
  return true;
}

bool TermiosSerialPort::send_break(std::chrono::microseconds d, Error& err){
  if(fd_<0){ err.set(ErrorKind::Transport, "serial port not open"); return false; }
  if(ioctl(fd_, TIOCSBRK)<0){
    err.set(ErrorKind::Transport, std::string("TIOCSBRK: ")+std::strerror(errno));
    return false;
  }
  std::this_thread::sleep_for(d);
  if(ioctl(fd_, TIOCCBRK)<0){
    err.set(ErrorKind::Transport, std::string("TIOCCBRK: ")+std::strerror(errno));
    return false;
  }
  // break delimiter before the sync byte
  std::this_thread::sleep_for(std::chrono::microseconds(100));
  return true;
}

long TermiosSerialPort::read(uint8_t* buf, size_t max, std::chrono::milliseconds timeout, Error& err){
  if(fd_<0){ err.set(ErrorKind::Transport, "serial port not open"); return -1; }
  pollfd p{fd_, POLLIN, 0};
  int rc = poll(&p, 1, (int)timeout.count());
  if(rc<0){
    if(errno==EINTR) return 0;
    err.set(ErrorKind::Transport, std::string("serial poll: ")+std::strerror(errno));
    return -1;
  }
  if(rc==0) return 0;
  if(p.revents & (POLLERR | POLLHUP | POLLNVAL)){
    err.set(ErrorKind::Transport, "serial device "+device_+" went away");
    return -1;
  }
  ssize_t n = ::read(fd_, buf, max);
  if(n<0){
    if(errno==EAGAIN || errno==EINTR) return 0;
    err.set(ErrorKind::Transport, std::string("serial read: ")+std::strerror(errno));
    return -1;
  }
  return (long)n;
}

void TermiosSerialPort::flush_input(){
  if(fd_>=0) tcflush(fd_, TCIFLUSH);
}

} // namespace cis
