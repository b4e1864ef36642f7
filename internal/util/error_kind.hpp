#pragma once

#include <exception>
#include <string_view>

#include "internal/util/errors.hpp"

namespace keysync::util {

/*
  Classifies an exception into a stable label for structured logs.
*/

std::string_view ErrorKind(const std::exception& e);

} // namespace keysync::util
