#pragma once
#include "zit/repo.hpp"

namespace zit::cli {

// Repository rooted at the current directory. With ZIT_TRACE=1 in the
// environment every storage mutation is echoed to stderr.
Repository open_repository();

} // namespace zit::cli
