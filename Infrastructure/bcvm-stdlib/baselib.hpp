#pragma once
#include "../../Domain/bcvm-core/table.hpp"

namespace bcvm {

  // Installs print, type, tostring, tonumber, error, assert, pairs, ipairs,
  // next, select, pcall, rawequal and rawlen into env.
  void openBaseLibrary(const TableRef &env);

} // namespace bcvm
