#include <charconv>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "tw/config.h"
#include "tw/diagnostics/event_bus.h"
#include "tw/error.h"
#include "tw/nodes/filesystem_node.h"
#include "tw/nodes/filter_node.h"
#include "tw/traversal/traversal_iterator.h"
#include "tw/traversal/tree_iterator.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 64;

struct Options {
  std::optional<tw::traversal::TraversalMode> mode;
  int max_depth{-1};
  bool skip_dots{false};
  bool parents_only{false};
  bool tree{false};
  bool key_as_filename{false};
  std::string directory;
};

void PrintUsage() {
  std::cerr << "Usage: treewalk [options] <directory>\n";
  std::cerr << "\nOptions:\n";
  std::cerr << "  --mode=leaves|self|child  Traversal order (default: leaves, self with --tree)\n";
  std::cerr << "  --max-depth=N             Do not descend below depth N (default: TW_MAX_DEPTH or unlimited)\n";
  std::cerr << "  --skip-dots               Omit the . and .. entries\n";
  std::cerr << "  --parents-only            Only show entries that have children\n";
  std::cerr << "  --tree                    Render the walk as an ASCII tree\n";
  std::cerr << "  --key-as-filename         Print file names instead of full paths\n";
  std::cerr << "\nEnvironment: TW_LOG_PATH, TW_LOG_LEVEL, TW_LOG_MAX_SIZE, TW_TRACE_TRAVERSAL, TW_MAX_DEPTH\n";
}

std::string_view DomainPrefix(tw::ErrorDomain domain) {
  switch (domain) {
  case tw::ErrorDomain::IO:
    return "I/O error";
  case tw::ErrorDomain::Validation:
    return "Validation error";
  case tw::ErrorDomain::Config:
    return "Configuration error";
  case tw::ErrorDomain::State:
    return "State error";
  case tw::ErrorDomain::Internal:
    return "Internal error";
  }
  return "Error";
}

void ReportError(const tw::Error& err) {
  std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';

  tw::diagnostics::Event event;
  event.category = tw::diagnostics::EventCategory::kDiagnostics;
  event.severity = tw::diagnostics::EventSeverity::kError;
  event.event_id = "cli_error";
  event.message = err.what();
  event.fields.emplace_back("domain", std::string(DomainPrefix(err.domain)));
  event.fields.emplace_back("code", std::to_string(err.code), tw::diagnostics::FieldPrivacy::kPublic,
                            true);
  tw::diagnostics::EventBus::Instance().Publish(event);
}

std::optional<tw::traversal::TraversalMode> ParseMode(std::string_view value) {
  if (value == "leaves") {
    return tw::traversal::TraversalMode::kLeavesOnly;
  }
  if (value == "self") {
    return tw::traversal::TraversalMode::kSelfFirst;
  }
  if (value == "child") {
    return tw::traversal::TraversalMode::kChildFirst;
  }
  return std::nullopt;
}

std::optional<int> ParseDepth(std::string_view value) {
  int parsed = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
    return std::nullopt;
  }
  return parsed;
}

// Returns false on a usage error.
bool ParseArguments(int argc, char** argv, Options& options) {
  std::vector<std::string_view> positional;
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg.rfind("--mode=", 0) == 0) {
      options.mode = ParseMode(arg.substr(std::string_view("--mode=").size()));
      if (!options.mode) {
        std::cerr << "Validation error: unknown traversal mode." << std::endl;
        return false;
      }
    } else if (arg.rfind("--max-depth=", 0) == 0) {
      auto depth = ParseDepth(arg.substr(std::string_view("--max-depth=").size()));
      if (!depth) {
        std::cerr << "Validation error: --max-depth expects an integer." << std::endl;
        return false;
      }
      options.max_depth = *depth;
    } else if (arg == "--skip-dots") {
      options.skip_dots = true;
    } else if (arg == "--parents-only") {
      options.parents_only = true;
    } else if (arg == "--tree") {
      options.tree = true;
    } else if (arg == "--key-as-filename") {
      options.key_as_filename = true;
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "Validation error: unknown option " << arg << std::endl;
      return false;
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.size() != 1) {
    std::cerr << "treewalk expects exactly one directory" << std::endl;
    return false;
  }
  options.directory = std::string(positional.front());
  return true;
}

tw::core::NodePtr BuildRoot(const Options& options) {
  std::uint32_t flags = 0;
  if (options.skip_dots) {
    flags |= tw::nodes::FilesystemFlags::kSkipDots;
  }
  if (options.key_as_filename || options.tree) {
    flags |= tw::nodes::FilesystemFlags::kKeyAsFilename;
  }
  tw::core::NodePtr root = std::make_unique<tw::nodes::FilesystemNode>(options.directory, flags);
  if (options.parents_only) {
    root = std::make_unique<tw::nodes::ParentFilter>(std::move(root));
  }
  return root;
}

void PrintWalk(tw::traversal::TraversalIterator& it, bool tree) {
  for (it.Rewind(); it.Valid(); it.Next()) {
    if (tree) {
      std::cout << it.Key().ToString() << '\n';
    } else {
      std::cout << it.GetDepth() << '\t' << it.Key().ToString() << '\n';
    }
  }
}

}  // namespace

int main(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage();
      return kExitOk;
    }
  }

  try {
    const auto config = tw::ActiveConfig();
    Options options;
    options.max_depth = config.max_depth;
    if (!ParseArguments(argc, argv, options)) {
      PrintUsage();
      return kExitUsage;
    }
    tw::InstallDefaultLogging(config);

    auto root = BuildRoot(options);
    if (options.tree) {
      tw::traversal::TreeIterator it(std::move(root), tw::traversal::TreeIterator::kBypassCurrent,
                                     options.mode.value_or(tw::traversal::TraversalMode::kSelfFirst));
      it.SetMaxDepth(options.max_depth);
      PrintWalk(it, true);
    } else {
      tw::traversal::TraversalIterator it(std::move(root),
                                          options.mode.value_or(tw::traversal::TraversalMode::kLeavesOnly));
      it.SetMaxDepth(options.max_depth);
      PrintWalk(it, false);
    }
    std::cout.flush();
    return kExitOk;
  } catch (const tw::Error& err) {
    ReportError(err);
    return kExitFailure;
  } catch (const std::exception& err) {
    std::cerr << "treewalk failed: " << err.what() << std::endl;
    return kExitFailure;
  }
}
