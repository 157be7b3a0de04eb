#include "spi_bus.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/spi/spidev.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace cis {

SpidevBus::~SpidevBus(){ close(); }

bool SpidevBus::open(const std::string& device, uint32_t speed_hz, uint8_t mode, Error& err){
  close();
  fd_ = ::open(device.c_str(), O_RDWR | O_CLOEXEC);
  if(fd_<0){
    err.set(ErrorKind::Transport, "cannot open "+device+": "+std::strerror(errno));
    return false;
  }
  uint8_t bits=8;
  if(ioctl(fd_, SPI_IOC_WR_MODE, &mode)<0 ||
     ioctl(fd_, SPI_IOC_WR_BITS_PER_WORD, &bits)<0 ||
     ioctl(fd_, SPI_IOC_WR_MAX_SPEED_HZ, &speed_hz)<0){
    err.set(ErrorKind::Transport, "cannot configure "+device+": "+std::strerror(errno));
    close();
    return false;
  }
  speed_hz_=speed_hz;
  return true;
}

void SpidevBus::close(){
  if(fd_>=0){ ::close(fd_); fd_=-1; }
}

bool SpidevBus::transfer(const uint8_t* tx, uint8_t* rx, size_t n, Error& err){
  if(fd_<0){ err.set(ErrorKind::Transport, "spi device not open"); return false; }
  spi_ioc_transfer xfer;
  std::memset(&xfer, 0, sizeof(xfer));
  xfer.tx_buf = (unsigned long)tx;
  xfer.rx_buf = (unsigned long)rx;
  xfer.len = (uint32_t)n;
  xfer.speed_hz = speed_hz_;
  xfer.bits_per_word = 8;
  if(ioctl(fd_, SPI_IOC_MESSAGE(1), &xfer)<0){
    err.set(ErrorKind::Transport, std::string("spi transfer failed: ")+std::strerror(errno));
    return false;
  }
  return true;
}

} // namespace cis
