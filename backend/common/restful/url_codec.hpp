#pragma once
#include <map>
#include <string>
#include <string_view>

namespace common {

struct RequestTarget {
  std::string path;
  std::map<std::string, std::string> query;
};

// Splits "/a/b?x=1&y=2" into its path and decoded query parameters. The first
// occurrence of a repeated key wins. Malformed escapes are kept verbatim.
RequestTarget parseTarget(std::string_view target);

std::string percentDecode(std::string_view input, bool plus_as_space);

// RFC 5987 attr-char encoding, used for filename* parameters.
std::string percentEncodeAttrChars(std::string_view input);

// "attachment; filename=..." with an ASCII fallback and a UTF-8 extended
// parameter whenever the name is not plain printable ASCII.
std::string attachmentDisposition(std::string_view filename);

} // namespace common
