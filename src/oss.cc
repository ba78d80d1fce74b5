#include "mediadup/oss.hh"

#include <atomic>
#include <streambuf>

namespace mediadup {

inline namespace detail_v1 {

namespace {

// swallows every character
class null_buf_t : public std::streambuf {
 protected:
  int overflow(int c) override { return traits_type::not_eof(c); }
};

null_buf_t null_buf;
std::ostream null_os(&null_buf);
std::atomic<std::ostream *> sink{&std::cerr};

}  // namespace

std::ostream &log_stream() noexcept { return *sink.load(); }

void set_log_stream(std::ostream *os) noexcept {
  sink.store(os == nullptr ? &null_os : os);
}

}  // namespace detail_v1

}  // namespace mediadup
