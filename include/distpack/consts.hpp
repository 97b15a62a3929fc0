#pragma once
#include <cstddef>
#include <string_view>

namespace distpack::consts {

// Project file and default layout
inline constexpr std::string_view kConfigFile     = "distpack.conf";
inline constexpr std::string_view kDefaultSource  = "src";
inline constexpr std::string_view kDefaultDist    = "dist";
inline constexpr std::string_view kDefaultAssets  = "assets";
inline constexpr std::string_view kVersionFile    = "__init__.py";
inline constexpr std::string_view kVersionKey     = "__version__";

// Tool argv placeholders
inline constexpr std::string_view kInPlaceholder  = "{in}";
inline constexpr std::string_view kOutPlaceholder = "{out}";

// Seconds an external tool may run before it is killed (0 = unlimited)
inline constexpr int kDefaultToolTimeout = 120;
inline constexpr long kMaxToolTimeout = 86400;

// Bytes of tool output kept for the failure report
inline constexpr std::size_t kMaxToolOutput = 4096;

// ——— ustar ———
inline constexpr std::size_t kTarBlock      = 512;
inline constexpr std::size_t kTarNameLen    = 100;
inline constexpr std::size_t kTarPrefixLen  = 155;
inline constexpr std::string_view kTarMagic = "ustar";
inline constexpr char kTarTypeFile = '0';
inline constexpr char kTarTypeDir  = '5';

// ——— SHA-256 sizes ———
inline constexpr std::size_t kDigestRawLen = 32;
inline constexpr std::size_t kDigestHexLen = 64;

} // namespace distpack::consts
