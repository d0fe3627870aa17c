#include "iteration.hpp"
#include "../../Domain/bcvm-core/errors.hpp"
#include "../../Domain/bcvm-core/table.hpp"
#include <fmt/core.h>

namespace bcvm {

  std::optional<ValueList> IterationDriver::resume() {
    if (done())
      return std::nullopt;
    handle_.resume();
    auto &promise = handle_.promise();
    if (promise.error)
      std::rethrow_exception(std::exchange(promise.error, nullptr));
    if (handle_.done())
      return std::nullopt;
    return std::move(promise.current);
  }

  IterationDriver driveTable(TableRef table) {
    Value key;
    while (auto entry = table->next(key)) {
      key = entry->first;
      ValueList tuple{std::move(entry->first), std::move(entry->second)};
      co_yield std::move(tuple);
    }
  }

  std::optional<ValueList> IterationBridge::step() {
    if (finished_)
      return std::nullopt;
    ++resumes_;
    auto values = driver_.resume();
    if (!values) {
      finished_ = true;
      return std::nullopt;
    }
    values->resize(arity_);
    return values;
  }

  IterationBridge makeIterationBridge(const Value &iterable, uint32_t arity) {
    if (iterable.isTable())
      return IterationBridge(driveTable(iterable.asTable()), arity);
    throw RuntimeFault(fmt::format("attempt to iterate over a {} value", typeName(iterable.type())));
  }

} // namespace bcvm
