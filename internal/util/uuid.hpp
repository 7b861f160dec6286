#pragma once

#include <cstddef>
#include <string>

namespace asyncquery::util {

/*
  Identifier helpers

  Session and statement ids are RFC4122 v4 UUIDs in canonical text form.
*/

// Canonical text form of a fresh UUID.
std::string NewId();

// [A-Za-z0-9]{length}, drawn from a per-thread generator.
std::string RandomAlphanumeric(std::size_t length);

} // namespace asyncquery::util
