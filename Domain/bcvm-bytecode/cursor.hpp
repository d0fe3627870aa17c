#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace bcvm {

  // Sequential little-endian reader over a bytecode buffer. Every read is
  // bounds checked and throws CorruptBytecode on overrun.
  class Cursor {
  public:
    explicit Cursor(std::string_view data) : data_(data) {}

    uint8_t readByte();
    uint32_t readWord();
    float readFloat();
    double readDouble();
    // base-128 groups, low group first, at most 5 groups
    uint32_t readVarInt();
    // varint length prefix followed by that many bytes
    std::string readString();
    void skip(std::size_t n);

    std::size_t position() const {
      return pos_;
    }
    std::size_t size() const {
      return data_.size();
    }
    std::size_t remaining() const {
      return data_.size() - pos_;
    }
    bool atEnd() const {
      return pos_ == data_.size();
    }

  private:
    void require(std::size_t n) const;

    std::string_view data_;
    std::size_t pos_{0};
  };

} // namespace bcvm
