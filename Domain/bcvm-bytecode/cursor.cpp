#include "cursor.hpp"
#include "../bcvm-core/errors.hpp"
#include <cstring>
#include <fmt/core.h>

namespace bcvm {

  void Cursor::require(std::size_t n) const {
    if (n > data_.size() - pos_)
      throw CorruptBytecode(fmt::format("read of {} bytes at offset {} overruns buffer of {} bytes", n, pos_, data_.size()));
  }

  uint8_t Cursor::readByte() {
    require(1);
    return (uint8_t)data_[pos_++];
  }

  uint32_t Cursor::readWord() {
    require(4);
    const auto *p = (const uint8_t *)data_.data() + pos_;
    uint32_t v    = (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
    pos_ += 4;
    return v;
  }

  float Cursor::readFloat() {
    uint32_t bits = readWord();
    float f;
    std::memcpy(&f, &bits, sizeof f);
    return f;
  }

  double Cursor::readDouble() {
    require(8);
    const auto *p = (const uint8_t *)data_.data() + pos_;
    uint64_t bits = 0;
    for (int i = 7; i >= 0; --i)
      bits = (bits << 8) | p[i];
    pos_ += 8;
    double d;
    std::memcpy(&d, &bits, sizeof d);
    return d;
  }

  uint32_t Cursor::readVarInt() {
    uint32_t result = 0;
    for (int i = 0; i < 5; ++i) {
      uint8_t b = readByte();
      result |= (uint32_t)(b & 0x7F) << (i * 7);
      if (!(b & 0x80))
        break;
    }
    return result;
  }

  std::string Cursor::readString() {
    uint32_t len = readVarInt();
    if (len == 0)
      return std::string();
    require(len);
    std::string s(data_.substr(pos_, len));
    pos_ += len;
    return s;
  }

  void Cursor::skip(std::size_t n) {
    require(n);
    pos_ += n;
  }

} // namespace bcvm
