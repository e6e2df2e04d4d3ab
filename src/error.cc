#include "error.h"

#include <string>

namespace runbox {

namespace {

class Category : public boost::system::error_category {
 public:
  const char* name() const noexcept override { return "runbox"; }

  std::string message(int value) const override {
    switch (static_cast<Errc>(value)) {
      case Errc::kUnsupportedLanguage:
        return "Unsupported language";
      case Errc::kInvalidBundle:
        return "Invalid source bundle";
      case Errc::kProvisioningFailure:
        return "Failed to provision sandbox";
      case Errc::kNoActiveSession:
        return "No active execution found for this session";
      case Errc::kCacheWriteFailure:
        return "Failed to populate dependency cache";
      case Errc::kCancelled:
        return "Execution cancelled";
    }
    return "Unknown runbox error";
  }
};

}  // namespace

const boost::system::error_category& RunboxCategory() {
  static const Category category;
  return category;
}

}  // namespace runbox
