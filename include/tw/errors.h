#pragma once

#include <string_view>

namespace tw::errors::msg {
// Centralized message catalog
inline constexpr std::string_view kPathEmpty{"Directory path cannot be empty"};
inline constexpr std::string_view kNoSuchDirectory{"Failed to open directory: No such file or directory"};
inline constexpr std::string_view kNotADirectory{"Failed to open directory: Not a directory"};
inline constexpr std::string_view kPermissionDenied{"Failed to open directory: Permission denied"};
inline constexpr std::string_view kFailedToStatDirectory{"Failed to open directory"};
inline constexpr std::string_view kFailedToReadDirectory{"Failed to read directory"};
inline constexpr std::string_view kNoChildrenAtPosition{"Cannot get children: current position has no children"};
inline constexpr std::string_view kNullRootNode{"Traversal root must be a recursive node, null given"};
inline constexpr std::string_view kNullInnerNode{"Inner node must be a recursive node, null given"};
inline constexpr std::string_view kNullPredicate{"Filter predicate must be callable"};
inline constexpr std::string_view kValueKindMismatch{"Value does not hold the requested kind"};
inline constexpr std::string_view kSeekOutOfRange{"Seek position is out of range"};
inline constexpr std::string_view kChildrenAlreadyConsumed{"Cached children were already taken for this position"};
inline constexpr std::string_view kInvalidPrefixPart{"Prefix part must be between 0 and 5"};
inline constexpr std::string_view kInvalidPattern{"Regular expression does not compile"};
inline constexpr std::string_view kUnableToOpenLog{"Unable to open log file"};
}  // namespace tw::errors::msg
