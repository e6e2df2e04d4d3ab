#ifndef RUNBOX_ERROR_H
#define RUNBOX_ERROR_H

#include <boost/system/error_code.hpp>
#include <type_traits>

namespace runbox {

// Engine-level failures. Failures of the sandboxed program itself are never
// reported through these codes; they reach the caller as stream events.
enum class Errc {
  kUnsupportedLanguage = 1,
  kInvalidBundle,
  kProvisioningFailure,
  kNoActiveSession,
  kCacheWriteFailure,
  kCancelled,
};

const boost::system::error_category& RunboxCategory();

inline boost::system::error_code make_error_code(Errc e) {
  return boost::system::error_code(static_cast<int>(e), RunboxCategory());
}

}  // namespace runbox

namespace boost {
namespace system {

template <>
struct is_error_code_enum<runbox::Errc> : std::true_type {};

}  // namespace system
}  // namespace boost

#endif  // RUNBOX_ERROR_H
