#include "plugin/algorithm.hpp"
#include "utils/utils.hpp"

namespace crush {

std::string magic_to_string(const MagicNumber &magic) {
  return Utils::bytes_to_hex(magic.data(), magic.size());
}

} // namespace crush
