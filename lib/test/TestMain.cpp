// Shared gtest main for the guard test binaries
#include <folly/portability/GFlags.h>
#include <folly/portability/GTest.h>
#include <folly/init/Init.h>
#include <folly/synchronization/HazptrDomain.h>
#include <glog/logging.h>

/* Short collaborator waits; unknown names are ignored by binaries
 * that do not link the defining library. */
static void setTestDefaults() {
  static const char *const defaults[][2] = {
    { "retry_backoff_ms", "1" },
    { "collaborator_timeout_ms", "1000" },
    { "evidence_journal", "" },
  };
  for (const auto& kv : defaults)
    gflags::SetCommandLineOptionWithMode(kv[0], kv[1], gflags::SET_FLAGS_DEFAULT);
}

int main(int argc, char* argv[]) {
  testing::InitGoogleTest(&argc, argv);
  setTestDefaults();
  folly::Init init(&argc, &argv);
  google::InstallFailureSignalHandler();
  FLAGS_logtostderr = true;
  int status = RUN_ALL_TESTS();
  folly::hazptr_cleanup();
  return status;
}
