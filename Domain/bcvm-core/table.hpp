#pragma once
#include "value.hpp"
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bcvm {

  // Script table: a 1-based array part plus an insertion-ordered hash part.
  class Table {
  public:
    Table() = default;
    Table(std::size_t arraySize, std::size_t hashSize);

    Value get(const Value &key) const;
    Value getInt(long long index) const;
    Value getField(const std::string &key) const {
      return get(Value(key));
    }
    // Assigning nil removes the key. Throws RuntimeFault for nil and NaN keys.
    void set(const Value &key, Value value);
    void setInt(long long index, Value value);
    void setField(const std::string &key, Value value) {
      set(Value(key), std::move(value));
    }

    // border of the array part
    std::size_t length() const;

    // Traversal in array order then insertion order; nil key starts it.
    // Returns nullopt once the traversal is exhausted.
    std::optional<std::pair<Value, Value>> next(const Value &key) const;

    void reserve(std::size_t arraySize, std::size_t hashSize);

  private:
    void migrateFromHash();

    std::vector<Value> array_;
    // entries whose value is nil are tombstones kept for traversal stability
    std::vector<std::pair<Value, Value>> entries_;
    std::unordered_map<Value, std::size_t, ValueHash> index_;
    std::size_t live_{0};
  };

} // namespace bcvm
