#include "jpx/jpx.h"

#ifndef JPX_VERSION
#define JPX_VERSION "0.0.0"
#endif

#ifndef JPX_GIT_COMMIT
#define JPX_GIT_COMMIT "unknown"
#endif

#ifndef JPX_GIT_DIRTY
#define JPX_GIT_DIRTY 0
#endif

namespace jpx {

BuildInfo build_info() {
  return BuildInfo{JPX_VERSION, JPX_GIT_COMMIT, JPX_GIT_DIRTY != 0};
}

std::string version_string() {
  const BuildInfo info = build_info();
  std::string out = info.version + " (" + info.git_commit;
  if (info.git_dirty) out += "-dirty";
  return out + ")";
}

}  // namespace jpx
