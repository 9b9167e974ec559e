#include "carryover/common/fs.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <openssl/rand.h>
#include <regex>
#include <sstream>
#include <string_view>

namespace carryover::common {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\f\v";

} // namespace

std::string trim(const std::string &input) {
  const std::string_view view(input);
  const auto first = view.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = view.find_last_not_of(kWhitespace);
  return std::string(view.substr(first, last - first + 1));
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

std::string to_lower(std::string value) {
  for (auto &ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure(ErrorCode::InvalidConfig, "HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(
        ErrorCode::Io, "Failed to create directory: " + path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

std::filesystem::path normalize_path(const std::filesystem::path &path) {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    absolute = path;
  }
  auto normal = absolute.lexically_normal();
  // "/a/b/" and "/a/b" must compare equal.
  if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
    normal = normal.parent_path();
  }
  return normal;
}

std::string now_rfc3339() {
  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return out.str();
}

Result<std::string> generate_uuid() {
  std::array<unsigned char, 16> data{};
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    return Result<std::string>::failure(ErrorCode::Io, "RAND_bytes failed to produce a session id");
  }
  data[6] = static_cast<unsigned char>((data[6] & 0x0F) | 0x40);
  data[8] = static_cast<unsigned char>((data[8] & 0x3F) | 0x80);

  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < data.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out.push_back('-');
    }
    out.push_back(kHex[data[i] >> 4]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
  return Result<std::string>::success(std::move(out));
}

} // namespace carryover::common
