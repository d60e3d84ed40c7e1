#include "publish/distribution_stager.hpp"

#include "core/fs_utils.hpp"

#include <string>
#include <system_error>
#include <vector>

namespace relsync::publish {

namespace {

namespace fs = std::filesystem;
using core::errors::ErrorKind;
using core::errors::MakeFailure;

fs::path Normalize(const fs::path& path) {
  std::error_code ec;
  fs::path normalized = fs::weakly_canonical(path, ec);
  if (ec) {
    normalized = fs::absolute(path, ec).lexically_normal();
  }
  return normalized;
}

bool IsWithin(const fs::path& child, const fs::path& parent) {
  const fs::path relative = child.lexically_relative(parent);
  return !relative.empty() && *relative.begin() != "..";
}

bool ClearDestination(const fs::path& destination_root, StageReport& report,
                      core::errors::Failure& failure) {
  std::error_code ec;
  std::vector<fs::path> doomed;
  for (fs::directory_iterator it(destination_root, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->path().filename() == kVcsMetadataDirName) {
      continue;
    }
    doomed.push_back(it->path());
  }
  if (ec) {
    failure = MakeFailure(ErrorKind::kIoFailure,
                          "unable to list '" + destination_root.string() + "': " + ec.message());
    return false;
  }

  for (const auto& path : doomed) {
    fs::remove_all(path, ec);
    if (ec) {
      failure = MakeFailure(ErrorKind::kIoFailure,
                            "unable to remove '" + path.string() + "': " + ec.message());
      return false;
    }
    ++report.removed_entries;
  }
  return true;
}

bool CopyTree(const fs::path& source_tree, const fs::path& destination_root, StageReport& report,
              core::errors::Failure& failure) {
  std::error_code ec;
  fs::recursive_directory_iterator it(source_tree, ec);
  const fs::recursive_directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    const fs::path& source = it->path();
    if (source.filename() == kVcsMetadataDirName) {
      if (it->is_directory(ec)) {
        it.disable_recursion_pending();
      }
      continue;
    }

    const fs::path target = destination_root / source.lexically_relative(source_tree);
    if (it->is_directory(ec)) {
      fs::create_directories(target, ec);
    } else {
      fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
      if (!ec) {
        ++report.copied_files;
      }
    }
    if (ec) {
      failure = MakeFailure(ErrorKind::kIoFailure,
                            "unable to copy '" + source.string() + "': " + ec.message());
      return false;
    }
  }
  if (ec) {
    failure = MakeFailure(ErrorKind::kIoFailure,
                          "unable to walk '" + source_tree.string() + "': " + ec.message());
    return false;
  }
  return true;
}

} // namespace

bool IsVcsWorkingCopy(const fs::path& root) {
  if (!core::IsExistingDirectory(root)) {
    return false;
  }
  const fs::path metadata = root / kVcsMetadataDirName;
  return core::IsExistingDirectory(metadata) || core::IsExistingRegularFile(metadata);
}

bool StageDistribution(const fs::path& source_tree, const fs::path& destination_root,
                       StageReport& report, core::errors::Failure& failure) {
  report = StageReport{};

  if (!IsVcsWorkingCopy(destination_root)) {
    failure = MakeFailure(ErrorKind::kChannelNotFound,
                          "distribution root is not a working copy: " + destination_root.string());
    return false;
  }
  if (!core::IsExistingDirectory(source_tree)) {
    failure = MakeFailure(ErrorKind::kPreconditionFailure,
                          "index source directory not found: " + source_tree.string());
    return false;
  }

  const fs::path source = Normalize(source_tree);
  const fs::path destination = Normalize(destination_root);
  if (IsWithin(source, destination) || IsWithin(destination, source)) {
    failure = MakeFailure(ErrorKind::kPreconditionFailure,
                          "index source '" + source.string() + "' and distribution root '" +
                              destination.string() + "' overlap");
    return false;
  }

  return ClearDestination(destination, report, failure) &&
         CopyTree(source, destination, report, failure);
}

} // namespace relsync::publish
