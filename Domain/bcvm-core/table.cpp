#include "table.hpp"
#include "errors.hpp"
#include <cmath>

namespace bcvm {

  static bool as_index(const Value &key, long long &out) {
    if (!key.isNumber())
      return false;
    double d = key.asNumber();
    if (d != std::floor(d) || d < 1 || d > 9007199254740992.0)
      return false;
    out = (long long)d;
    return true;
  }

  Table::Table(std::size_t arraySize, std::size_t hashSize) {
    reserve(arraySize, hashSize);
  }

  void Table::reserve(std::size_t arraySize, std::size_t hashSize) {
    array_.reserve(arraySize);
    entries_.reserve(hashSize);
    index_.reserve(hashSize);
  }

  Value Table::get(const Value &key) const {
    long long i = 0;
    if (as_index(key, i) && (std::size_t)i <= array_.size())
      return array_[(std::size_t)i - 1];
    if (key.isNil())
      return Value();
    auto it = index_.find(key);
    if (it == index_.end())
      return Value();
    return entries_[it->second].second;
  }

  Value Table::getInt(long long index) const {
    if (index >= 1 && (std::size_t)index <= array_.size())
      return array_[(std::size_t)index - 1];
    return get(Value((double)index));
  }

  void Table::setInt(long long index, Value value) {
    set(Value((double)index), std::move(value));
  }

  void Table::set(const Value &key, Value value) {
    if (key.isNil())
      throw RuntimeFault("table index is nil");
    if (key.isNumber() && std::isnan(key.asNumber()))
      throw RuntimeFault("table index is NaN");

    long long i = 0;
    if (as_index(key, i)) {
      std::size_t n = array_.size();
      if ((std::size_t)i <= n) {
        array_[(std::size_t)i - 1] = std::move(value);
        while (!array_.empty() && array_.back().isNil())
          array_.pop_back();
        return;
      }
      if ((std::size_t)i == n + 1 && !value.isNil()) {
        auto it = index_.find(key);
        if (it != index_.end()) {
          if (!entries_[it->second].second.isNil())
            --live_;
          entries_[it->second].second = Value();
          index_.erase(it);
        }
        array_.push_back(std::move(value));
        migrateFromHash();
        return;
      }
    }

    auto it = index_.find(key);
    if (it != index_.end()) {
      auto &slot = entries_[it->second].second;
      if (slot.isNil() && !value.isNil())
        ++live_;
      else if (!slot.isNil() && value.isNil())
        --live_;
      slot = std::move(value);
      return;
    }
    if (value.isNil())
      return;

    // only new keys may trigger compaction, so a traversal that just
    // reassigns existing fields never loses its position
    if (entries_.size() >= 16 && live_ * 2 < entries_.size()) {
      std::vector<std::pair<Value, Value>> kept;
      kept.reserve(live_ + 1);
      index_.clear();
      for (auto &e : entries_) {
        if (e.second.isNil())
          continue;
        index_[e.first] = kept.size();
        kept.push_back(std::move(e));
      }
      entries_ = std::move(kept);
    }
    index_[key] = entries_.size();
    entries_.emplace_back(key, std::move(value));
    ++live_;
  }

  void Table::migrateFromHash() {
    while (!index_.empty()) {
      Value key((double)(array_.size() + 1));
      auto it = index_.find(key);
      if (it == index_.end())
        return;
      auto &slot = entries_[it->second].second;
      if (slot.isNil())
        return;
      array_.push_back(std::move(slot));
      slot = Value();
      --live_;
      index_.erase(it);
    }
  }

  std::size_t Table::length() const {
    return array_.size();
  }

  std::optional<std::pair<Value, Value>> Table::next(const Value &key) const {
    std::size_t arrayPos = 0;
    std::size_t entryPos = 0;
    long long i          = 0;

    if (key.isNil()) {
      arrayPos = 0;
    } else if (as_index(key, i) && ((std::size_t)i <= array_.size() || index_.find(key) == index_.end())) {
      // also covers a trailing array slot cleared during the traversal
      arrayPos = (std::size_t)i;
    } else {
      auto it = index_.find(key);
      if (it == index_.end())
        throw RuntimeFault("invalid key to 'next'");
      arrayPos = array_.size();
      entryPos = it->second + 1;
    }

    for (; arrayPos < array_.size(); ++arrayPos) {
      if (!array_[arrayPos].isNil())
        return std::make_pair(Value((double)(arrayPos + 1)), array_[arrayPos]);
    }
    for (; entryPos < entries_.size(); ++entryPos) {
      if (!entries_[entryPos].second.isNil())
        return entries_[entryPos];
    }
    return std::nullopt;
  }

} // namespace bcvm
