#include "distpack/path_map.hpp"

#include "distpack/errors.hpp"

namespace distpack {

namespace {

std::filesystem::path strip_trailing_sep(const std::filesystem::path &p) {
  auto out = p.lexically_normal();
  if (out.has_relative_path() && out.filename().empty())
    out = out.parent_path();
  return out;
}

} // namespace

std::filesystem::path map_path(const std::filesystem::path &source_root,
                               const std::filesystem::path &dest_root,
                               const std::filesystem::path &absolute_path,
                               const std::optional<std::string> &destination_extension) {
  const auto root = strip_trailing_sep(source_root);
  const auto file = absolute_path.lexically_normal();
  const auto rel = file.lexically_relative(root);

  // Empty: unrelated roots. ".": the root itself. "..": escapes the root.
  if (rel.empty() || rel == "." || *rel.begin() == "..")
    throw PathOutsideRootError(absolute_path, source_root);

  auto out = strip_trailing_sep(dest_root) / rel;
  if (destination_extension)
    out.replace_extension(*destination_extension);
  return out;
}

} // namespace distpack
