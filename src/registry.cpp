#include "distpack/registry.hpp"

#include <algorithm>
#include <cctype>

namespace distpack {

std::string_view extension_text(Extension ext) {
  switch (ext) {
  case Extension::Py:
    return ".py";
  case Extension::Html:
    return ".html";
  case Extension::Htm:
    return ".htm";
  case Extension::Js:
    return ".js";
  case Extension::Css:
    return ".css";
  }
  return "";
}

std::optional<Extension> parse_extension(std::string_view text) {
  std::string lowered(text);
  std::ranges::transform(lowered, lowered.begin(),
                         [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  for (const Extension ext : kAllExtensions) {
    if (extension_text(ext) == lowered)
      return ext;
  }
  return std::nullopt;
}

std::string_view operation_name(OperationKind op) {
  switch (op) {
  case OperationKind::Compile:
    return "compile";
  case OperationKind::MinifyMarkup:
    return "minify-markup";
  case OperationKind::MinifyScript:
    return "minify-script";
  case OperationKind::MinifyStyle:
    return "minify-style";
  case OperationKind::Copy:
    return "copy-assets";
  }
  return "unknown";
}

TransformRegistry TransformRegistry::defaults() {
  TransformRegistry r;
  r.add({.match_extension = Extension::Py,
         .destination_extension = ".pyc",
         .operation = OperationKind::Compile});
  r.add({.match_extension = Extension::Html,
         .destination_extension = std::nullopt,
         .operation = OperationKind::MinifyMarkup});
  r.add({.match_extension = Extension::Htm,
         .destination_extension = std::nullopt,
         .operation = OperationKind::MinifyMarkup});
  r.add({.match_extension = Extension::Js,
         .destination_extension = std::nullopt,
         .operation = OperationKind::MinifyScript});
  r.add({.match_extension = Extension::Css,
         .destination_extension = std::nullopt,
         .operation = OperationKind::MinifyStyle});
  return r;
}

void TransformRegistry::add(const TransformSpec &spec) { table_[spec.match_extension] = spec; }

std::optional<TransformSpec> TransformRegistry::resolve(std::string_view extension) const {
  const auto ext = parse_extension(extension);
  if (!ext)
    return std::nullopt;
  return resolve(*ext);
}

std::optional<TransformSpec> TransformRegistry::resolve(Extension ext) const {
  const auto it = table_.find(ext);
  if (it == table_.end())
    return std::nullopt;
  return it->second;
}

std::vector<std::string> TransformRegistry::extensions_for(OperationKind op) const {
  std::vector<std::string> out;
  for (const auto &[ext, spec] : table_) {
    if (spec.operation == op)
      out.emplace_back(extension_text(ext));
  }
  return out;
}

std::vector<TransformSpec> TransformRegistry::specs() const {
  std::vector<TransformSpec> out;
  out.reserve(table_.size());
  for (const auto &[_, spec] : table_)
    out.push_back(spec);
  return out;
}

} // namespace distpack
