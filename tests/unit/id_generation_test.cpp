#include <cassert>
#include <cctype>
#include <iostream>
#include <set>
#include <string>

#include "internal/util/uuid.hpp"

namespace {

using asyncquery::util::NewId;
using asyncquery::util::RandomAlphanumeric;

void TestNewIdIsCanonicalV4() {
  const auto id = NewId();

  assert(id.size() == 36);
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      assert(id[i] == '-');
    } else {
      assert(std::isxdigit(static_cast<unsigned char>(id[i])));
      assert(!std::isupper(static_cast<unsigned char>(id[i])));
    }
  }
  assert(id[14] == '4');
  assert(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
}

void TestNewIdIsUnique() {
  std::set<std::string> ids;
  for (int i = 0; i < 1000; ++i) {
    ids.insert(NewId());
  }
  assert(ids.size() == 1000);
}

void TestRandomAlphanumeric() {
  assert(RandomAlphanumeric(0).empty());

  const auto value = RandomAlphanumeric(64);
  assert(value.size() == 64);
  for (char c : value) {
    assert(std::isalnum(static_cast<unsigned char>(c)));
  }
  assert(RandomAlphanumeric(64) != value);
}

} // namespace

int main() {
  TestNewIdIsCanonicalV4();
  TestNewIdIsUnique();
  TestRandomAlphanumeric();

  std::cout << "async_query_unit_id_generation: pass\n";
  return 0;
}
