#pragma once

#include <string>

namespace practicedb::util {

/*
  Document id helpers.

  Ids look like "<unix-millis>_<9 base-36 chars>". Unique enough for a
  single process; not collision-proof across clients with skewed clocks.
*/

std::string GenerateId();

} // namespace practicedb::util
