#include "tw/error.h"

#include <cassert>
#include <iostream>
#include <iterator>
#include <set>
#include <stdexcept>
#include <string>

#include "tw/common.h"
#include "tw/errors.h"

namespace {

void TestReservedRanges() {
  using tw::ErrorDomain;
  const int io_codes[] = {tw::errors::io::kNotFound, tw::errors::io::kNotADirectory,
                          tw::errors::io::kPermissionDenied, tw::errors::io::kDirectoryReadFailed,
                          tw::errors::io::kLogOpenFailed};
  for (int code : io_codes) {
    assert(tw::IsFrameworkErrorCode(ErrorDomain::IO, code));
    assert(!tw::IsFrameworkErrorCode(ErrorDomain::Validation, code));
  }
  const int validation_codes[] = {
      tw::errors::validation::kEmptyPath,          tw::errors::validation::kNoChildren,
      tw::errors::validation::kNullNode,           tw::errors::validation::kValueKindMismatch,
      tw::errors::validation::kSeekOutOfRange,     tw::errors::validation::kInvalidPrefixPart,
      tw::errors::validation::kInvalidPattern};
  std::set<int> unique(std::begin(validation_codes), std::end(validation_codes));
  assert(unique.size() == std::size(validation_codes) && "codes must not collide");
  for (int code : validation_codes) {
    assert(tw::IsFrameworkErrorCode(ErrorDomain::Validation, code));
  }
  assert(tw::IsFrameworkErrorCode(ErrorDomain::State, tw::errors::state::kChildrenConsumed));
  assert(tw::IsFrameworkErrorCode(ErrorDomain::Config, tw::errors::config::kInvalidValue));
  assert(!tw::IsFrameworkErrorCode(ErrorDomain::IO, 2) && "raw errno values are outside the range");
  assert(tw::ErrorDomainMax(ErrorDomain::IO) == 0x02FF);
}

void TestErrorCarriesContext() {
  tw::Error err{tw::ErrorDomain::IO, tw::errors::io::kNotFound,
                std::string(tw::errors::msg::kNoSuchDirectory), 2, tw::Retryability::kFatal,
                {"/missing"}};
  assert(std::string(err.what()) == "Failed to open directory: No such file or directory");
  assert(err.native_code == 2);
  assert(err.retryability == tw::Retryability::kFatal);
  assert(err.context.size() == 1 && err.context.front() == "/missing");

  try {
    throw err;
  } catch (const std::runtime_error& base) {
    assert(std::string(base.what()) == err.what() && "Error is a runtime_error");
  }
}

void TestPathHelpers() {
  assert(tw::IsDotName("."));
  assert(tw::IsDotName(".."));
  assert(!tw::IsDotName("..."));
  assert(!tw::IsDotName(".hidden"));
  assert(tw::StripTrailingSeparators("/tmp/dir///") == "/tmp/dir");
  assert(tw::StripTrailingSeparators("/") == "/");
  assert(tw::JoinEntryPath("/tmp", "x") == "/tmp/x");
  assert(tw::JoinEntryPath("/", "x") == "/x");
}

} // namespace

int main() {
  TestReservedRanges();
  TestErrorCarriesContext();
  TestPathHelpers();
  std::cout << "test_error_handling completed" << std::endl;
  return 0;
}
