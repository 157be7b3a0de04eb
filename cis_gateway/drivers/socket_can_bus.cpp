#include "can_bus.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <linux/can.h>
#include <linux/can/error.h>
#include <linux/can/raw.h>
#include <net/if.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace cis {

SocketCanBus::~SocketCanBus(){ close(); }

bool SocketCanBus::open(const std::string& iface, Error& err){
  close();
  sock_ = socket(PF_CAN, SOCK_RAW | SOCK_CLOEXEC, CAN_RAW);
  if(sock_<0){
    err.set(ErrorKind::Transport, "cannot open CAN socket: "+std::string(std::strerror(errno)));
    return false;
  }
  struct ifreq ifr {};
  std::snprintf(ifr.ifr_name, IFNAMSIZ, "%s", iface.c_str());
  if(ioctl(sock_, SIOCGIFINDEX, &ifr)<0){
    err.set(ErrorKind::Transport, "CAN interface not found: "+iface);
    close();
    return false;
  }
  sockaddr_can addr {};
  addr.can_family = AF_CAN;
  addr.can_ifindex = ifr.ifr_ifindex;
  if(bind(sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr))<0){
    err.set(ErrorKind::Transport, "cannot bind CAN socket on "+iface+": "+std::strerror(errno));
    close();
    return false;
  }
  const can_err_mask_t err_mask = CAN_ERR_BUSOFF | CAN_ERR_RESTARTED | CAN_ERR_CRTL;
  if(setsockopt(sock_, SOL_CAN_RAW, CAN_RAW_ERR_FILTER, &err_mask, sizeof(err_mask))<0){
    err.set(ErrorKind::Transport, "cannot set CAN error filter: "+std::string(std::strerror(errno)));
    close();
    return false;
  }
  iface_=iface;
  return true;
}

void SocketCanBus::close(){
  if(sock_>=0){ ::close(sock_); sock_=-1; }
}

bool SocketCanBus::send(const CanFrame& f, Error& err){
  if(sock_<0){ err.set(ErrorKind::Transport, "CAN socket not open"); return false; }
  struct can_frame frame {};
  frame.can_id = f.extended ? ((f.id & CAN_EFF_MASK) | CAN_EFF_FLAG) : (f.id & CAN_SFF_MASK);
  frame.can_dlc = std::min<uint8_t>(f.dlc, 8);
  std::memcpy(frame.data, f.data, frame.can_dlc);
  for(int attempt=0; attempt<3; ++attempt){
    const auto written = ::write(sock_, &frame, sizeof(frame));
    if(written==(ssize_t)sizeof(frame)) return true;
    if(errno==ENOBUFS || errno==EAGAIN){
      std::this_thread::sleep_for(std::chrono::milliseconds(5*(attempt+1)));
      continue;
    }
    break;
  }
  char id[16]; std::snprintf(id, sizeof(id), "0x%X", (unsigned)f.id);
  err.set(ErrorKind::Transport, std::string("CAN write failed (id=")+id+"): "+std::strerror(errno));
  return false;
}

int SocketCanBus::receive(CanFrame& f, std::chrono::milliseconds timeout, Error& err){
  if(sock_<0){ err.set(ErrorKind::Transport, "CAN socket not open"); return -1; }
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for(;;){
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline-std::chrono::steady_clock::now());
    if(left.count()<0) left=std::chrono::milliseconds(0);
    pollfd p{sock_, POLLIN, 0};
    int rc = poll(&p, 1, (int)left.count());
    if(rc<0){
      if(errno==EINTR) continue;
      err.set(ErrorKind::Transport, std::string("CAN poll: ")+std::strerror(errno));
      return -1;
    }
    if(rc==0) return 0;
    struct can_frame frame {};
    const auto n = ::read(sock_, &frame, sizeof(frame));
    if(n!=(ssize_t)sizeof(frame)){
      err.set(ErrorKind::Transport, "short CAN read on "+iface_);
      return -1;
    }
    if(frame.can_id & CAN_ERR_FLAG){
      if(frame.can_id & CAN_ERR_BUSOFF){
        err.set(ErrorKind::Transport, "CAN bus-off on "+iface_);
        return -1;
      }
      continue; // controller warnings do not carry data
    }
    if(frame.can_id & CAN_RTR_FLAG) continue;
    f.extended = (frame.can_id & CAN_EFF_FLAG)!=0;
    f.id = f.extended ? (frame.can_id & CAN_EFF_MASK) : (frame.can_id & CAN_SFF_MASK);
    f.dlc = std::min<uint8_t>(frame.can_dlc, 8);
    std::memset(f.data, 0, sizeof(f.data));
    std::memcpy(f.data, frame.data, f.dlc);
    return 1;
  }
}

} // namespace cis
