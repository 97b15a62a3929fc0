#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace distpack {

enum class OperationKind : std::uint8_t { Compile, MinifyMarkup, MinifyScript, MinifyStyle, Copy };

// Every file type the pipeline knows how to transform.
enum class Extension : std::uint8_t { Py, Html, Htm, Js, Css };

inline constexpr std::array<Extension, 5> kAllExtensions = {
    Extension::Py, Extension::Html, Extension::Htm, Extension::Js, Extension::Css};

// Stage order of the pipeline. Copy (assets) always runs last.
inline constexpr std::array<OperationKind, 5> kStageOrder = {
    OperationKind::Compile, OperationKind::MinifyMarkup, OperationKind::MinifyScript,
    OperationKind::MinifyStyle, OperationKind::Copy};

auto extension_text(Extension ext) -> std::string_view;
// Parses ".py", ".PY", ... into the enum; nullopt for anything unregistered.
auto parse_extension(std::string_view text) -> std::optional<Extension>;

auto operation_name(OperationKind op) -> std::string_view;

struct TransformSpec {
  Extension match_extension;
  std::optional<std::string> destination_extension; // nullopt keeps the source extension
  OperationKind operation;
};

class TransformRegistry {
public:
  TransformRegistry() = default;

  // The stock table: .py compiles to .pyc, markup/script/style are minified in place.
  static auto defaults() -> TransformRegistry;

  void add(const TransformSpec &spec);

  // Exact match on the lowercased extension. nullopt means "not stage-eligible".
  [[nodiscard]] auto resolve(std::string_view extension) const -> std::optional<TransformSpec>;
  [[nodiscard]] auto resolve(Extension ext) const -> std::optional<TransformSpec>;

  // Lowercased extensions (with dot) whose spec runs `op`.
  [[nodiscard]] auto extensions_for(OperationKind op) const -> std::vector<std::string>;

  [[nodiscard]] auto specs() const -> std::vector<TransformSpec>;

private:
  std::map<Extension, TransformSpec> table_;
};

} // namespace distpack
