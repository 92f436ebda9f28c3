#include <kj/main.h>

#include "runner/main.hpp"
#include "util/version.hpp"

class QuantboxMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit QuantboxMain(kj::ProcessContext& context)
      : context(context), rm(&context), tm(&context) {}
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Quantbox (" + util::version + ")",
                           "Sandboxed execution of strategy programs")
        .addSubCommand("run", KJ_BIND_METHOD(rm, getMain), "run a program")
        .addSubCommand("tiers", KJ_BIND_METHOD(tm, getMain),
                       "list the capability tiers")
        .build();
  }

 private:
  kj::ProcessContext& context;
  runner::Main rm;
  runner::TiersMain tm;
};

KJ_MAIN(QuantboxMain);
